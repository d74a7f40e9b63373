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

#include "GoogleOAuth2ClientCredentials.hpp"

#include <fstream>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace TubeUploader::GoogleAuth {

void to_json(nlohmann::json &j, const GoogleOAuth2ClientCredentials &p)
{
	j = nlohmann::json{
		{"ver", p.ver},
		{"client_id", p.client_id},
		{"client_secret", p.client_secret},
		{"auth_uri", p.auth_uri},
		{"token_uri", p.token_uri},
	};
}

void from_json(const nlohmann::json &j, GoogleOAuth2ClientCredentials &p)
{
	const GoogleOAuth2ClientCredentials defaults;

	p.ver = j.value("ver", defaults.ver);
	j.at("client_id").get_to(p.client_id);
	j.at("client_secret").get_to(p.client_secret);
	p.auth_uri = j.value("auth_uri", defaults.auth_uri);
	p.token_uri = j.value("token_uri", defaults.token_uri);
}

GoogleOAuth2ClientCredentials loadClientSecretsFile(const std::filesystem::path &path)
{
	std::ifstream ifs(path);
	if (!ifs.is_open()) {
		throw std::runtime_error(fmt::format("ClientSecretsFileOpenError(loadClientSecretsFile): {}", path.string()));
	}

	const nlohmann::json j = nlohmann::json::parse(ifs, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		throw std::runtime_error(fmt::format("ClientSecretsParseError(loadClientSecretsFile): {}", path.string()));
	}

	const nlohmann::json *section = nullptr;
	if (auto it = j.find("installed"); it != j.end()) {
		section = &*it;
	} else if (auto it = j.find("web"); it != j.end()) {
		section = &*it;
	} else {
		section = &j;
	}

	try {
		GoogleOAuth2ClientCredentials credentials = section->get<GoogleOAuth2ClientCredentials>();
		if (credentials.client_id.empty() || credentials.client_secret.empty()) {
			throw std::runtime_error(
				fmt::format("ClientSecretsIncompleteError(loadClientSecretsFile): {}", path.string()));
		}
		return credentials;
	} catch (const nlohmann::json::exception &e) {
		throw std::runtime_error(
			fmt::format("ClientSecretsFormatError(loadClientSecretsFile): {}: {}", path.string(), e.what()));
	}
}

} // namespace TubeUploader::GoogleAuth
