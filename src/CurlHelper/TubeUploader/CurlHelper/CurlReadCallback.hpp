/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUploader CurlHelper Library
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

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <istream>
#include <limits>

#include <curl/curl.h>

namespace TubeUploader::CurlHelper {

template<typename T>
concept CurlReaderInputStreamLike = requires(T &t, char *ptr, std::streamsize n) {
	t.read(ptr, n);
	{ t.gcount() } -> std::convertible_to<std::streamsize>;
};

/**
 * Feeds at most `remaining` bytes of `stream` to libcurl. Used for chunked PUTs
 * where the request body is one window of a larger file.
 */
template<CurlReaderInputStreamLike StreamT>
struct CurlBoundedStreamSource {
	StreamT *stream = nullptr;
	std::uint64_t remaining = 0;
	bool failed = false;
};

template<CurlReaderInputStreamLike StreamT>
inline std::size_t CurlBoundedStreamReadCallback(char *buffer, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return CURL_READFUNC_ABORT;
	}

	auto *source = static_cast<CurlBoundedStreamSource<StreamT> *>(userp);
	if (!source || !source->stream) {
		return CURL_READFUNC_ABORT;
	}

	const std::uint64_t wanted = std::min<std::uint64_t>(size * nmemb, source->remaining);
	if (wanted == 0) {
		return 0;
	}

	try {
		source->stream->read(buffer, static_cast<std::streamsize>(wanted));
		const auto got = static_cast<std::uint64_t>(source->stream->gcount());
		if (got == 0) {
			source->failed = true;
			return CURL_READFUNC_ABORT;
		}
		source->remaining -= got;
		return static_cast<std::size_t>(got);
	} catch (const std::exception &) {
		source->failed = true;
		return CURL_READFUNC_ABORT;
	}
}

inline std::size_t CurlIstreamReadCallback(char *buffer, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	return CurlBoundedStreamReadCallback<std::istream>(buffer, size, nmemb, userp);
}

} // namespace TubeUploader::CurlHelper
