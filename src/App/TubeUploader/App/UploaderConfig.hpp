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

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace TubeUploader::App {

struct UploaderConfig {
	std::filesystem::path clientSecretsFile = "client_secrets.json";
	std::filesystem::path tokenStorageFile = "oauth2_token.json";
	std::vector<std::string> scopes = {
		"https://www.googleapis.com/auth/youtube.upload",
		"https://www.googleapis.com/auth/youtube",
	};
	int maxUploadRetries = 10;
	int maxRefreshAttempts = 3;
	int refreshMarginSeconds = 300;
	std::int64_t chunkSize = -1;
	std::string redirectUri = "urn:ietf:wg:oauth:2.0:oob";
};

void to_json(nlohmann::json &j, const UploaderConfig &p);

/** Missing keys keep their defaults. Throws UsageError on invalid values. */
void from_json(const nlohmann::json &j, UploaderConfig &p);

/**
 * Reads a JSON configuration file. Relative paths inside it are resolved
 * against the directory holding the file. Throws UsageError.
 */
[[nodiscard]]
UploaderConfig loadUploaderConfig(const std::filesystem::path &path);

} // namespace TubeUploader::App
