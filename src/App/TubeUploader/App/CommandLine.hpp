/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUploader App Library
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <TubeUploader/Uploader/PostUploadActions.hpp>
#include <TubeUploader/YouTubeApi/YouTubeTypes.hpp>

namespace TubeUploader::App {

struct CommandLineOptions {
	std::optional<std::filesystem::path> videoFile;
	std::string title = "Test Title";
	std::string description = "Test Description";
	std::string category = "22";
	std::string keywords;
	std::string privacyStatus = "public";
	std::optional<double> latitude;
	std::optional<double> longitude;
	std::string language = "en";
	std::optional<std::string> defaultAudioLanguage;
	std::optional<std::string> playlistId;
	std::optional<std::filesystem::path> thumbnail;
	std::string license = "youtube";
	std::optional<std::string> publishAt;
	bool publicStatsViewable = false;
	bool madeForKids = false;

	bool noUpload = false;
	bool forceRefresh = false;
	std::filesystem::path configFile = "config.json";
	bool verbose = false;
	bool help = false;
};

/**
 * Parses and validates argv. Throws UsageError. When `help` is set in the
 * result no other validation has been done.
 */
[[nodiscard]]
CommandLineOptions parseCommandLine(int argc, const char *const argv[]);

void printUsage(std::ostream &os, std::string_view programName);

[[nodiscard]]
YouTubeApi::YouTubeVideoSettings buildVideoSettings(const CommandLineOptions &options);

[[nodiscard]]
Uploader::PostUploadRequest buildPostUploadRequest(const CommandLineOptions &options);

} // namespace TubeUploader::App
