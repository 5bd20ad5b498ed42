/* app.hpp - command line application header file.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "config_manager.hpp"
#include "pipeline.hpp"
#include <optional>
#include <wx/app.h>
#include <wx/arrstr.h>
#include <wx/cmdline.h>
#include <wx/stream.h>
#include <wx/string.h>

class app : public wxAppConsole {
public:
	app() = default;
	~app() override = default;
	app(const app&) = delete;
	app& operator=(const app&) = delete;
	app(app&&) = delete;
	app& operator=(app&&) = delete;
	bool OnInit() override;
	int OnExit() override;
	int OnRun() override;
	void OnInitCmdLine(wxCmdLineParser& parser) override;
	bool OnCmdLineParsed(wxCmdLineParser& parser) override;

private:
	config_manager config_mgr;
	wxArrayString inputs;
	wxString output_path;
	wxString config_path;
	output_mode mode{output_mode::digest};
	std::optional<input_kind> forced_kind;
	std::optional<int> line_cap_override;
	bool pretty{false};
	bool show_version{false};

	[[nodiscard]] processing_options make_options() const;
	// Reports failures through the log and returns false; one bad input never stops the batch.
	bool process_input(const document_processor& processor, const wxString& path, wxOutputStream& out) const;
};

wxDECLARE_APP(app);
