/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUploader YouTubeApi Library
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

#include "CurlTransportFailure.hpp"

namespace TubeUploader::YouTubeApi {

namespace {

Retry::TransportFailureKind toTransportFailureKind(CURLcode code) noexcept
{
	using Retry::TransportFailureKind;

	switch (code) {
	case CURLE_OK:
		return TransportFailureKind::None;
	case CURLE_COULDNT_RESOLVE_HOST:
	case CURLE_COULDNT_RESOLVE_PROXY:
		return TransportFailureKind::ResolveFailed;
	case CURLE_COULDNT_CONNECT:
		return TransportFailureKind::ConnectFailed;
	case CURLE_OPERATION_TIMEDOUT:
		return TransportFailureKind::Timeout;
	case CURLE_SEND_ERROR:
		return TransportFailureKind::SendFailed;
	case CURLE_RECV_ERROR:
		return TransportFailureKind::ReceiveFailed;
	case CURLE_PARTIAL_FILE:
		return TransportFailureKind::IncompleteRead;
	case CURLE_GOT_NOTHING:
	case CURLE_HTTP2:
	case CURLE_HTTP2_STREAM:
		return TransportFailureKind::ConnectionReset;
	case CURLE_WEIRD_SERVER_REPLY:
		return TransportFailureKind::MalformedStatusLine;
	case CURLE_SSL_CONNECT_ERROR:
		return TransportFailureKind::TlsFailure;
	case CURLE_READ_ERROR:
		return TransportFailureKind::LocalReadFailed;
	case CURLE_ABORTED_BY_CALLBACK:
		return TransportFailureKind::Aborted;
	default:
		return TransportFailureKind::Other;
	}
}

} // anonymous namespace

Retry::TransportFailure toTransportFailure(CURLcode code)
{
	Retry::TransportFailure failure;
	failure.kind = toTransportFailureKind(code);
	if (failure.occurred()) {
		failure.message = curl_easy_strerror(code);
	}
	return failure;
}

} // namespace TubeUploader::YouTubeApi
