/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUploader Retry Library
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

namespace TubeUploader::Retry {

enum class ErrorKind {
	Transient,
	FatalAuth,
	FatalProtocol,
	RetryExhausted,
	DataIntegrity,
	Cancelled,
};

[[nodiscard]]
constexpr std::string_view toString(ErrorKind kind) noexcept
{
	switch (kind) {
	case ErrorKind::Transient:
		return "Transient";
	case ErrorKind::FatalAuth:
		return "FatalAuth";
	case ErrorKind::FatalProtocol:
		return "FatalProtocol";
	case ErrorKind::RetryExhausted:
		return "RetryExhausted";
	case ErrorKind::DataIntegrity:
		return "DataIntegrity";
	case ErrorKind::Cancelled:
		return "Cancelled";
	}
	return "Unknown";
}

/**
 * Failure carrying the category the outermost boundary needs to choose an exit
 * status and an operator-facing explanation.
 */
class ClassifiedError : public std::runtime_error {
public:
	ClassifiedError(ErrorKind kind, const std::string &what) : std::runtime_error(what), kind_(kind) {}

	[[nodiscard]]
	ErrorKind kind() const noexcept
	{
		return kind_;
	}

private:
	ErrorKind kind_;
};

} // namespace TubeUploader::Retry
