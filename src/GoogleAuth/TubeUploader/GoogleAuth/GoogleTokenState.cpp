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

#include "GoogleTokenState.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace TubeUploader::GoogleAuth {

std::optional<std::chrono::system_clock::time_point> GoogleTokenState::expirationTimePoint() const
{
	if (!expires_at.has_value()) {
		return std::nullopt;
	}
	return std::chrono::system_clock::time_point(std::chrono::seconds(*expires_at));
}

bool GoogleTokenState::isAuthorized() const
{
	return !refresh_token.empty();
}

bool GoogleTokenState::isExpired(std::chrono::system_clock::time_point now) const
{
	auto expiration = expirationTimePoint();
	return expiration.has_value() && now >= *expiration;
}

std::optional<std::chrono::seconds> GoogleTokenState::timeToExpiry(std::chrono::system_clock::time_point now) const
{
	auto expiration = expirationTimePoint();
	if (!expiration.has_value()) {
		return std::nullopt;
	}
	return std::chrono::duration_cast<std::chrono::seconds>(*expiration - now);
}

bool GoogleTokenState::coversScopes(std::span<const std::string> requiredScopes) const
{
	if (scopes.empty()) {
		return true;
	}
	return std::all_of(requiredScopes.begin(), requiredScopes.end(), [this](const std::string &required) {
		return std::find(scopes.begin(), scopes.end(), required) != scopes.end();
	});
}

GoogleTokenState GoogleTokenState::withUpdatedAuthResponse(const GoogleAuthResponse &response,
							   std::chrono::system_clock::time_point now,
							   std::chrono::seconds defaultLifetime) const
{
	GoogleTokenState updated = *this;

	updated.access_token = response.access_token;

	const std::chrono::seconds lifetime =
		response.expires_in.has_value() ? std::chrono::seconds(*response.expires_in) : defaultLifetime;
	updated.expires_at =
		std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count() + lifetime.count();

	if (response.scope.has_value() && !response.scope->empty()) {
		updated.scopes = splitScopes(*response.scope);
	}

	if (response.refresh_token.has_value() && !response.refresh_token->empty()) {
		updated.refresh_token = *response.refresh_token;
	}

	return updated;
}

void to_json(nlohmann::json &j, const GoogleTokenState &p)
{
	j = nlohmann::json{
		{"ver", p.ver},
		{"access_token", p.access_token},
		{"refresh_token", p.refresh_token},
		{"scopes", p.scopes},
		{"client_id", p.client_id},
		{"client_secret", p.client_secret},
		{"token_uri", p.token_uri},
	};

	if (p.expires_at.has_value())
		j["expires_at"] = *p.expires_at;
}

void from_json(const nlohmann::json &j, GoogleTokenState &p)
{
	if (auto it = j.find("ver"); it != j.end()) {
		it->get_to(p.ver);
	}

	j.at("access_token").get_to(p.access_token);

	const auto get_string_or_empty = [&j](const char *key, std::string &field) {
		if (auto it = j.find(key); it != j.end() && !it->is_null()) {
			it->get_to(field);
		} else {
			field.clear();
		}
	};

	get_string_or_empty("refresh_token", p.refresh_token);
	get_string_or_empty("client_id", p.client_id);
	get_string_or_empty("client_secret", p.client_secret);
	get_string_or_empty("token_uri", p.token_uri);

	if (auto it = j.find("scopes"); it != j.end() && !it->is_null()) {
		it->get_to(p.scopes);
	} else {
		p.scopes.clear();
	}

	if (auto it = j.find("expires_at"); it != j.end() && !it->is_null()) {
		it->get_to(p.expires_at.emplace());
	} else {
		p.expires_at = std::nullopt;
	}
}

std::vector<std::string> splitScopes(std::string_view scope)
{
	std::vector<std::string> result;
	while (!scope.empty()) {
		const std::size_t start = scope.find_first_not_of(' ');
		if (start == std::string_view::npos) {
			break;
		}
		scope.remove_prefix(start);
		const std::size_t end = scope.find(' ');
		result.emplace_back(scope.substr(0, end));
		if (end == std::string_view::npos) {
			break;
		}
		scope.remove_prefix(end);
	}
	return result;
}

std::string joinScopes(std::span<const std::string> scopes)
{
	std::string result;
	for (const std::string &scope : scopes) {
		if (!result.empty()) {
			result += ' ';
		}
		result += scope;
	}
	return result;
}

std::string redactSecret(std::string_view secret)
{
	constexpr std::size_t kVisiblePrefix = 6;
	if (secret.empty()) {
		return "<empty>";
	}
	if (secret.size() <= kVisiblePrefix) {
		return "...";
	}
	return std::string(secret.substr(0, kVisiblePrefix)) + "...";
}

} // namespace TubeUploader::GoogleAuth
