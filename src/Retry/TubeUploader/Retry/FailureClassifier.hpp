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

#include <string>
#include <string_view>

namespace TubeUploader::Retry {

enum class FailureClass { Retriable, NonRetriable };

/**
 * Transport-level outcome of one HTTP exchange, independent of the HTTP client.
 * `None` means the exchange completed and an HTTP status is available.
 */
enum class TransportFailureKind {
	None,
	NotConnected,
	ConnectionReset,
	IncompleteRead,
	MalformedStatusLine,
	SendFailed,
	ReceiveFailed,
	Timeout,
	ResolveFailed,
	ConnectFailed,
	TlsFailure,
	LocalReadFailed,
	Aborted,
	Other,
};

struct TransportFailure {
	TransportFailureKind kind = TransportFailureKind::None;
	std::string message;

	[[nodiscard]]
	bool occurred() const noexcept
	{
		return kind != TransportFailureKind::None;
	}
};

[[nodiscard]]
std::string_view toString(TransportFailureKind kind) noexcept;

[[nodiscard]]
FailureClass classifyTransportFailure(TransportFailureKind kind) noexcept;

[[nodiscard]]
FailureClass classifyHttpStatus(long httpStatus) noexcept;

/**
 * Classifies a failed exchange: the transport failure wins when present,
 * otherwise the HTTP status decides.
 */
[[nodiscard]]
FailureClass classifyFailure(const TransportFailure &transportFailure, long httpStatus) noexcept;

} // namespace TubeUploader::Retry
