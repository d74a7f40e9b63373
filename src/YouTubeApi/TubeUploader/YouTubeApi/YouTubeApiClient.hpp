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

#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <TubeUploader/CurlHelper/CurlHandle.hpp>
#include <TubeUploader/Logger/ILogger.hpp>
#include <TubeUploader/Retry/FailureClassifier.hpp>

#include "YouTubeTypes.hpp"

namespace TubeUploader::YouTubeApi {

inline constexpr std::uintmax_t kMaxThumbnailBytes = 2 * 1024 * 1024;

/**
 * Outcome of one resumable-upload exchange. Transport failures are returned,
 * not thrown, so the caller can classify them together with the HTTP status.
 */
struct YouTubeUploadResponse {
	Retry::TransportFailure transportFailure;
	long httpStatus = 0;
	std::string body;
	/** Location header of a session start. */
	std::optional<std::string> location;
	/** Bytes the server holds after a 308, from its Range header (0 when absent). */
	std::optional<std::uint64_t> committedBytes;
};

/**
 * Parses a resumable-upload Range header ("bytes=0-X") into the number of
 * committed bytes (X + 1). Returns std::nullopt for anything else.
 */
[[nodiscard]]
std::optional<std::uint64_t> parseCommittedBytes(std::string_view rangeHeader);

class YouTubeApiClient {
public:
	explicit YouTubeApiClient(std::shared_ptr<CurlHelper::CurlHandle> curl);

	virtual ~YouTubeApiClient() noexcept;

	YouTubeApiClient(const YouTubeApiClient &) = delete;
	YouTubeApiClient &operator=(const YouTubeApiClient &) = delete;
	YouTubeApiClient(YouTubeApiClient &&) = delete;
	YouTubeApiClient &operator=(YouTubeApiClient &&) = delete;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger);

	/** Opens a resumable upload session for videos.insert. */
	[[nodiscard]]
	virtual YouTubeUploadResponse startResumableUpload(std::string_view accessToken,
							   const YouTubeVideoSettings &settings,
							   std::uint64_t contentLength, const std::string &contentType);

	/**
	 * PUTs `length` bytes of `source` starting at `offset` to the session.
	 * A zero `length` queries the session status instead.
	 */
	[[nodiscard]]
	virtual YouTubeUploadResponse uploadChunk(std::string_view accessToken, const std::string &sessionUri,
						  std::istream &source, std::uint64_t offset, std::uint64_t length,
						  std::uint64_t totalBytes);

	/** Throws on any failure. */
	virtual void setThumbnail(std::string_view accessToken, const std::string &videoId,
				  const std::filesystem::path &thumbnailPath);

	/** Throws on any failure. */
	virtual YouTubePlaylistItem insertPlaylistItem(std::string_view accessToken, const std::string &playlistId,
						       const std::string &videoId);

private:
	const std::shared_ptr<CurlHelper::CurlHandle> curl_;
	std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace TubeUploader::YouTubeApi
