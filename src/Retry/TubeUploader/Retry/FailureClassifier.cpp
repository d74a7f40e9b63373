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

#include "FailureClassifier.hpp"

#include <algorithm>
#include <array>

namespace TubeUploader::Retry {

namespace {

struct TransportFailureEntry {
	TransportFailureKind kind;
	std::string_view name;
	FailureClass failureClass;
};

constexpr std::array kTransportFailureTable{
	TransportFailureEntry{TransportFailureKind::None, "None", FailureClass::NonRetriable},
	TransportFailureEntry{TransportFailureKind::NotConnected, "NotConnected", FailureClass::Retriable},
	TransportFailureEntry{TransportFailureKind::ConnectionReset, "ConnectionReset", FailureClass::Retriable},
	TransportFailureEntry{TransportFailureKind::IncompleteRead, "IncompleteRead", FailureClass::Retriable},
	TransportFailureEntry{TransportFailureKind::MalformedStatusLine, "MalformedStatusLine",
			      FailureClass::Retriable},
	TransportFailureEntry{TransportFailureKind::SendFailed, "SendFailed", FailureClass::Retriable},
	TransportFailureEntry{TransportFailureKind::ReceiveFailed, "ReceiveFailed", FailureClass::Retriable},
	TransportFailureEntry{TransportFailureKind::Timeout, "Timeout", FailureClass::Retriable},
	TransportFailureEntry{TransportFailureKind::ResolveFailed, "ResolveFailed", FailureClass::Retriable},
	TransportFailureEntry{TransportFailureKind::ConnectFailed, "ConnectFailed", FailureClass::Retriable},
	TransportFailureEntry{TransportFailureKind::TlsFailure, "TlsFailure", FailureClass::Retriable},
	TransportFailureEntry{TransportFailureKind::LocalReadFailed, "LocalReadFailed", FailureClass::NonRetriable},
	TransportFailureEntry{TransportFailureKind::Aborted, "Aborted", FailureClass::NonRetriable},
	TransportFailureEntry{TransportFailureKind::Other, "Other", FailureClass::NonRetriable},
};

constexpr std::array kRetriableHttpStatuses{500L, 502L, 503L, 504L};

const TransportFailureEntry *findEntry(TransportFailureKind kind) noexcept
{
	auto it = std::find_if(kTransportFailureTable.begin(), kTransportFailureTable.end(),
			       [kind](const TransportFailureEntry &entry) { return entry.kind == kind; });
	return it == kTransportFailureTable.end() ? nullptr : &*it;
}

} // anonymous namespace

std::string_view toString(TransportFailureKind kind) noexcept
{
	const TransportFailureEntry *entry = findEntry(kind);
	return entry ? entry->name : "Unknown";
}

FailureClass classifyTransportFailure(TransportFailureKind kind) noexcept
{
	const TransportFailureEntry *entry = findEntry(kind);
	return entry ? entry->failureClass : FailureClass::NonRetriable;
}

FailureClass classifyHttpStatus(long httpStatus) noexcept
{
	const bool retriable = std::find(kRetriableHttpStatuses.begin(), kRetriableHttpStatuses.end(), httpStatus) !=
			       kRetriableHttpStatuses.end();
	return retriable ? FailureClass::Retriable : FailureClass::NonRetriable;
}

FailureClass classifyFailure(const TransportFailure &transportFailure, long httpStatus) noexcept
{
	if (transportFailure.occurred()) {
		return classifyTransportFailure(transportFailure.kind);
	}
	return classifyHttpStatus(httpStatus);
}

} // namespace TubeUploader::Retry
