/* app.cpp - command line entry point and batch driver.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "app.hpp"
#include "constants.hpp"
#include "input_source.hpp"
#include "section_digest.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <wx/crt.h>
#include <wx/log.h>
#include <wx/mstream.h>
#include <wx/translation.h>
#include <wx/wfstream.h>

wxIMPLEMENT_APP_CONSOLE(app);

bool app::OnInit() {
	delete wxLog::SetActiveTarget(new wxLogStderr());
	if (!wxAppConsole::OnInit()) {
		return false;
	}
	if (!config_mgr.initialize(config_path)) {
		wxLogError(_("Failed to initialize configuration"));
		return false;
	}
	wxLogVerbose(_("Using configuration %s"), config_mgr.get_path());
	return true;
}

int app::OnExit() {
	config_mgr.shutdown();
	return wxAppConsole::OnExit();
}

void app::OnInitCmdLine(wxCmdLineParser& parser) {
	parser.SetLogo(wxString::Format("%s %s", APP_NAME, APP_VERSION));
	parser.AddSwitch("h", "help", _("show this help message"), wxCMD_LINE_OPTION_HELP);
	parser.AddOption("o", "output", _("write output to the given file instead of standard output"));
	parser.AddOption("m", "mode", _("output mode: tree or digest (default digest)"));
	parser.AddOption("k", "kind", _("treat inputs as html or tree instead of detecting the type"));
	parser.AddOption("l", "line-cap", _("lines kept from each child in a section digest"), wxCMD_LINE_VAL_NUMBER);
	parser.AddSwitch("p", "pretty", _("pretty-print tree output"));
	parser.AddOption("c", "config", _("read settings from the given file"));
	parser.AddSwitch("v", "verbose", _("log progress to standard error"));
	parser.AddLongSwitch("version", _("print the version and exit"));
	parser.AddParam(_("input"), wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL | wxCMD_LINE_PARAM_MULTIPLE);
}

bool app::OnCmdLineParsed(wxCmdLineParser& parser) {
	if (parser.Found("version")) {
		show_version = true;
		return true;
	}
	wxLog::SetVerbose(parser.Found("v"));
	parser.Found("o", &output_path);
	parser.Found("c", &config_path);
	pretty = parser.Found("p");
	wxString value;
	if (parser.Found("m", &value)) {
		const auto parsed = parse_output_mode(value);
		if (!parsed) {
			wxLogError(_("Unknown output mode: %s"), value);
			return false;
		}
		mode = *parsed;
	}
	if (parser.Found("k", &value)) {
		forced_kind = parse_input_kind(value);
		if (!forced_kind) {
			wxLogError(_("Unknown input kind: %s"), value);
			return false;
		}
	}
	long cap = 0;
	if (parser.Found("l", &cap)) {
		line_cap_override = parse_line_cap(cap);
		if (!line_cap_override) {
			wxLogError(_("Line cap out of range: %ld"), cap);
			return false;
		}
	}
	for (size_t i = 0; i < parser.GetParamCount(); ++i) {
		inputs.Add(parser.GetParam(i));
	}
	return true;
}

int app::OnRun() {
	if (show_version) {
		wxPrintf("%s %s\n", APP_NAME, APP_VERSION);
		return 0;
	}
	const document_processor processor{default_capabilities(), make_options()};
	std::unique_ptr<wxOutputStream> out;
	if (output_path.IsEmpty()) {
		out = std::make_unique<wxFFileOutputStream>(stdout);
	} else {
		out = std::make_unique<wxFileOutputStream>(output_path);
	}
	if (!out->IsOk()) {
		wxLogError(_("Failed to open %s for writing"), output_path);
		return 1;
	}
	size_t failures = 0;
	if (inputs.IsEmpty()) {
		failures += process_input(processor, wxEmptyString, *out) ? 0 : 1;
	}
	for (const auto& path : inputs) {
		failures += process_input(processor, path, *out) ? 0 : 1;
	}
	if (!out->Close()) {
		wxLogError(_("Failed to finish writing output"));
		return 1;
	}
	if (failures > 0) {
		wxLogWarning(_("%lu of %lu inputs failed"), static_cast<unsigned long>(failures), static_cast<unsigned long>(std::max<size_t>(inputs.GetCount(), 1)));
		return 1;
	}
	return 0;
}

processing_options app::make_options() const {
	processing_options options;
	options.root_min_text_length = static_cast<size_t>(std::max(0, config_mgr.get(config_manager::root_min_text_length)));
	options.digest_line_cap = line_cap_override.value_or(config_mgr.get(config_manager::digest_line_cap));
	options.pretty = pretty || config_mgr.get(config_manager::pretty_print);
	options.mode = mode;
	options.forced_kind = forced_kind;
	return options;
}

bool app::process_input(const document_processor& processor, const wxString& path, wxOutputStream& out) const {
	const wxString display_path = path.IsEmpty() ? wxString(_("standard input")) : path;
	try {
		std::string content;
		if (path.IsEmpty()) {
			wxFFileInputStream in(stdin);
			content = read_stream(in);
		} else {
			wxFileInputStream in(path);
			if (!in.IsOk()) {
				throw input_exception(_("Failed to open file"), path);
			}
			content = read_stream(in);
		}
		wxMemoryOutputStream buffer;
		processor.process(path, content, buffer);
		std::string rendered(buffer.GetLength(), '\0');
		buffer.CopyTo(rendered.data(), rendered.size());
		write_string(out, rendered);
		return true;
	} catch (const input_exception& e) {
		wxLogError("%s", e.get_display_message());
	} catch (const digest_error& e) {
		wxLogError(_("%s: could not hash section digest: %s"), display_path, wxString::FromUTF8(e.what()));
	} catch (const std::exception& e) {
		wxLogError(_("%s: %s"), display_path, wxString::FromUTF8(e.what()));
	}
	return false;
}
