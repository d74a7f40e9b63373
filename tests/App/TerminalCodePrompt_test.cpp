/*
 * Tube Uploader - App Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <sstream>

#include <TubeUploader/App/TerminalCodePrompt.hpp>

using namespace TubeUploader::App;

TEST(TerminalCodePromptTest, PrintsUrlAndReadsTrimmedCode)
{
	std::istringstream in("  4/0AbCdEf \r\n");
	std::ostringstream out;
	const TerminalCodePrompt prompt(in, out);

	EXPECT_EQ(prompt("https://accounts.google.com/o/oauth2/v2/auth?x=1"), "4/0AbCdEf");
	EXPECT_NE(out.str().find("Please visit this URL to authorize this application:"), std::string::npos);
	EXPECT_NE(out.str().find("https://accounts.google.com/o/oauth2/v2/auth?x=1"), std::string::npos);
	EXPECT_NE(out.str().find("Enter the authorization code: "), std::string::npos);
}

TEST(TerminalCodePromptTest, EndOfInputYieldsEmptyCode)
{
	std::istringstream in;
	std::ostringstream out;
	const TerminalCodePrompt prompt(in, out);

	EXPECT_EQ(prompt("https://example.com"), "");
}
