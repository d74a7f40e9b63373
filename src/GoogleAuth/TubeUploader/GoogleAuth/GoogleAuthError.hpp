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

#include <stdexcept>
#include <string>
#include <string_view>

namespace TubeUploader::GoogleAuth {

enum class GoogleAuthErrorKind {
	NetworkError,
	ServerError,
	MalformedResponse,
};

[[nodiscard]]
constexpr std::string_view toString(GoogleAuthErrorKind kind) noexcept
{
	switch (kind) {
	case GoogleAuthErrorKind::NetworkError:
		return "NetworkError";
	case GoogleAuthErrorKind::ServerError:
		return "ServerError";
	case GoogleAuthErrorKind::MalformedResponse:
		return "MalformedResponse";
	}
	return "Unknown";
}

/** A failed call to the OAuth2 token endpoint. */
class GoogleAuthError : public std::runtime_error {
public:
	GoogleAuthError(GoogleAuthErrorKind kind, const std::string &what) : std::runtime_error(what), kind_(kind) {}

	[[nodiscard]]
	GoogleAuthErrorKind kind() const noexcept
	{
		return kind_;
	}

private:
	GoogleAuthErrorKind kind_;
};

} // namespace TubeUploader::GoogleAuth
