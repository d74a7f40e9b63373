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

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "GoogleAuthResponse.hpp"

namespace TubeUploader::GoogleAuth {

using Timestamp = std::int64_t;

/**
 * The persisted credential record.
 *
 * An empty refresh_token means the record is terminal: it can be used until it
 * expires but can never be refreshed silently.
 */
struct GoogleTokenState {
	std::string ver = "1.0";
	std::string access_token;
	std::string refresh_token;
	std::optional<Timestamp> expires_at;
	std::vector<std::string> scopes;
	std::string client_id;
	std::string client_secret;
	std::string token_uri;

	[[nodiscard]]
	std::optional<std::chrono::system_clock::time_point> expirationTimePoint() const;

	[[nodiscard]]
	bool isAuthorized() const;

	/** True when an expiry is known and has passed. */
	[[nodiscard]]
	bool isExpired(std::chrono::system_clock::time_point now) const;

	[[nodiscard]]
	std::optional<std::chrono::seconds> timeToExpiry(std::chrono::system_clock::time_point now) const;

	/** An empty scope list is an unknown grant and is accepted. */
	[[nodiscard]]
	bool coversScopes(std::span<const std::string> requiredScopes) const;

	[[nodiscard]]
	GoogleTokenState withUpdatedAuthResponse(const GoogleAuthResponse &response,
						 std::chrono::system_clock::time_point now,
						 std::chrono::seconds defaultLifetime) const;

	bool operator==(const GoogleTokenState &) const = default;
};

void to_json(nlohmann::json &j, const GoogleTokenState &p);
void from_json(const nlohmann::json &j, GoogleTokenState &p);

[[nodiscard]]
std::vector<std::string> splitScopes(std::string_view scope);

[[nodiscard]]
std::string joinScopes(std::span<const std::string> scopes);

/** Prefix of a secret suitable for logs. */
[[nodiscard]]
std::string redactSecret(std::string_view secret);

} // namespace TubeUploader::GoogleAuth
