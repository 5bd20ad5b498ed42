/* test_config_manager.cpp - config manager tests.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include <gtest/gtest.h>
#include <wx/ffile.h>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/string.h>

class ConfigManagerTest : public ::testing::Test {
protected:
	wxString path;

	void SetUp() override {
		path = wxFileName::CreateTempFileName("folio");
		ASSERT_FALSE(path.IsEmpty());
	}

	void TearDown() override {
		if (wxFileExists(path)) {
			wxRemoveFile(path);
		}
	}

	void write_file(const wxString& contents) {
		wxFFile file(path, "w");
		ASSERT_TRUE(file.IsOpened());
		ASSERT_TRUE(file.Write(contents));
		file.Close();
	}
};

TEST_F(ConfigManagerTest, MissingFileUsesDefaults) {
	wxRemoveFile(path);
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	EXPECT_EQ(config.get(config_manager::root_min_text_length), DEFAULT_ROOT_MIN_TEXT_LENGTH);
	EXPECT_EQ(config.get(config_manager::digest_line_cap), DEFAULT_DIGEST_LINE_CAP);
	EXPECT_FALSE(config.get(config_manager::pretty_print));
	EXPECT_EQ(config.get(config_manager::config_version), CONFIG_VERSION_CURRENT);
	config.shutdown();
	EXPECT_FALSE(wxFileExists(path));
}

TEST_F(ConfigManagerTest, ReadsSettingsGroup) {
	write_file("[settings]\nroot_min_text_length=40\ndigest_line_cap=3\npretty_print=1\nversion=1\n");
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	EXPECT_EQ(config.get_path(), path);
	EXPECT_EQ(config.get(config_manager::root_min_text_length), 40);
	EXPECT_EQ(config.get(config_manager::digest_line_cap), 3);
	EXPECT_TRUE(config.get(config_manager::pretty_print));
}

TEST_F(ConfigManagerTest, TopLevelKeysAreIgnored) {
	write_file("digest_line_cap=5\npretty_print=1\n");
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	EXPECT_EQ(config.get(config_manager::digest_line_cap), DEFAULT_DIGEST_LINE_CAP);
	EXPECT_FALSE(config.get(config_manager::pretty_print));
	EXPECT_EQ(config.get(config_manager::config_version), CONFIG_VERSION_CURRENT);
}

TEST_F(ConfigManagerTest, FlushPersistsChanges) {
	{
		config_manager config;
		ASSERT_TRUE(config.initialize(path));
		config.set(config_manager::digest_line_cap, 4);
		config.flush();
	}
	config_manager reopened;
	ASSERT_TRUE(reopened.initialize(path));
	EXPECT_EQ(reopened.get(config_manager::digest_line_cap), 4);
}

TEST_F(ConfigManagerTest, UninitializedManagerFallsBack) {
	const config_manager config;
	EXPECT_EQ(config.get(config_manager::digest_line_cap), DEFAULT_DIGEST_LINE_CAP);
}
