/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUploader Uploader Library
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
#include <functional>
#include <istream>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

#include <TubeUploader/Logger/ILogger.hpp>
#include <TubeUploader/Retry/Backoff.hpp>
#include <TubeUploader/YouTubeApi/YouTubeApiClient.hpp>
#include <TubeUploader/YouTubeApi/YouTubeTypes.hpp>

#include "AccessTokenProvider.hpp"
#include "TransferSession.hpp"

namespace TubeUploader::Uploader {

struct ResumableUploadOptions {
	int maxRetries = 10;
	/** Bytes per request, or -1 to send the whole remainder in one request. */
	std::int64_t chunkSize = -1;
	std::string contentType = "video/*";
};

struct UploadResult {
	YouTubeApi::YouTubeVideo video;
	std::uint64_t bytes = 0;
	int chunkCalls = 0;
	int failedAttempts = 0;
};

using ProgressCallback = std::function<void(std::uint64_t acknowledgedBytes, std::uint64_t totalBytes)>;

/**
 * Drives one resumable upload session to completion.
 *
 * Retriable failures (HTTP 500/502/503/504, transient transport errors, a 308
 * without progress) back off for random() * 2^retry seconds; the retry count
 * resets whenever the server acknowledges new bytes. Failures are raised as
 * Retry::ClassifiedError with FatalProtocol, RetryExhausted or Cancelled.
 */
class ResumableUploadEngine {
public:
	explicit ResumableUploadEngine(std::shared_ptr<YouTubeApi::YouTubeApiClient> apiClient,
				       ResumableUploadOptions options = {});

	~ResumableUploadEngine() noexcept;

	ResumableUploadEngine(const ResumableUploadEngine &) = delete;
	ResumableUploadEngine &operator=(const ResumableUploadEngine &) = delete;
	ResumableUploadEngine(ResumableUploadEngine &&) = delete;
	ResumableUploadEngine &operator=(ResumableUploadEngine &&) = delete;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger);
	void setSleeper(Retry::Sleeper sleeper);
	void setRandom(Retry::UniformRandom random);

	/** `source` must be seekable; `totalBytes` is its length. */
	[[nodiscard]]
	UploadResult upload(const AccessTokenProvider &accessTokenProvider, std::istream &source,
			    std::uint64_t totalBytes, const YouTubeApi::YouTubeVideoSettings &settings,
			    std::stop_token stopToken = {}, const ProgressCallback &onProgress = {});

	[[nodiscard]]
	UploadResult uploadFile(const AccessTokenProvider &accessTokenProvider, const std::filesystem::path &path,
				const YouTubeApi::YouTubeVideoSettings &settings, std::stop_token stopToken = {},
				const ProgressCallback &onProgress = {});

private:
	void openSession(TransferSession &session, const AccessTokenProvider &accessTokenProvider,
			 const YouTubeApi::YouTubeVideoSettings &settings, const std::stop_token &stopToken);

	void handleFailure(TransferSession &session, const YouTubeApi::YouTubeUploadResponse &response,
			   std::string_view stage, const std::stop_token &stopToken);

	void backoff(TransferSession &session, std::string_view reason, const std::stop_token &stopToken);

	void throwIfStopRequested(const std::stop_token &stopToken) const;

	const std::shared_ptr<YouTubeApi::YouTubeApiClient> apiClient_;
	const ResumableUploadOptions options_;

	std::shared_ptr<const Logger::ILogger> logger_;
	Retry::Sleeper sleeper_;
	Retry::UniformRandom random_;
};

} // namespace TubeUploader::Uploader
