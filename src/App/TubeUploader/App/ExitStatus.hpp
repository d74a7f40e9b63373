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

#include <stdexcept>
#include <string>

#include <TubeUploader/Retry/ClassifiedError.hpp>

namespace TubeUploader::App {

namespace ExitStatus {

inline constexpr int Success = 0;
inline constexpr int Failure = 1;
inline constexpr int Usage = 2;
inline constexpr int FatalAuth = 3;
inline constexpr int FatalProtocol = 4;
inline constexpr int RetryExhausted = 5;
inline constexpr int Cancelled = 130;

} // namespace ExitStatus

/** Bad arguments, missing input files or an invalid configuration. */
class UsageError : public std::runtime_error {
public:
	explicit UsageError(const std::string &what) : std::runtime_error(what) {}
};

[[nodiscard]]
constexpr int exitStatusFor(Retry::ErrorKind kind) noexcept
{
	switch (kind) {
	case Retry::ErrorKind::FatalAuth:
		return ExitStatus::FatalAuth;
	case Retry::ErrorKind::FatalProtocol:
		return ExitStatus::FatalProtocol;
	case Retry::ErrorKind::RetryExhausted:
		return ExitStatus::RetryExhausted;
	case Retry::ErrorKind::Cancelled:
		return ExitStatus::Cancelled;
	case Retry::ErrorKind::Transient:
	case Retry::ErrorKind::DataIntegrity:
		return ExitStatus::Failure;
	}
	return ExitStatus::Failure;
}

/** One line telling the operator what to do about a failure of this kind. */
[[nodiscard]]
constexpr const char *adviceFor(Retry::ErrorKind kind) noexcept
{
	switch (kind) {
	case Retry::ErrorKind::FatalAuth:
		return "Authorization failed. Re-run to authorize again.";
	case Retry::ErrorKind::FatalProtocol:
		return "The server rejected the request. Check the video metadata and the log.";
	case Retry::ErrorKind::RetryExhausted:
		return "Gave up after repeated transient failures. Re-run later.";
	case Retry::ErrorKind::Cancelled:
		return "Cancelled.";
	case Retry::ErrorKind::Transient:
	case Retry::ErrorKind::DataIntegrity:
		return "Unexpected failure. See the log.";
	}
	return "Unexpected failure. See the log.";
}

} // namespace TubeUploader::App
