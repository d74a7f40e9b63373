/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUploader GoogleAuth Library
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
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace TubeUploader::GoogleAuth {

struct GoogleOAuth2ClientCredentials {
	std::string ver = "1.0";
	std::string client_id;
	std::string client_secret;
	std::string auth_uri = "https://accounts.google.com/o/oauth2/v2/auth";
	std::string token_uri = "https://oauth2.googleapis.com/token";

	bool operator==(const GoogleOAuth2ClientCredentials &) const = default;
};

void to_json(nlohmann::json &j, const GoogleOAuth2ClientCredentials &p);
void from_json(const nlohmann::json &j, GoogleOAuth2ClientCredentials &p);

/**
 * Reads a client_secrets.json as downloaded from the Google Cloud console.
 * Both the "installed" and the "web" application layouts are accepted.
 */
[[nodiscard]]
GoogleOAuth2ClientCredentials loadClientSecretsFile(const std::filesystem::path &path);

} // namespace TubeUploader::GoogleAuth
