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

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <TubeUploader/Logger/ILogger.hpp>
#include <TubeUploader/YouTubeApi/YouTubeApiClient.hpp>

#include "AccessTokenProvider.hpp"

namespace TubeUploader::Uploader {

struct PostUploadRequest {
	std::optional<std::filesystem::path> thumbnailPath;
	std::optional<std::string> playlistId;
};

struct PostUploadActionOutcome {
	std::string action;
	bool succeeded = false;
	std::string message;
};

struct PostUploadReport {
	std::vector<PostUploadActionOutcome> outcomes;

	[[nodiscard]]
	bool allSucceeded() const noexcept;
};

/**
 * One-shot calls made after a completed upload. Each runs once without
 * retry; a failure is logged and reported, never thrown.
 */
class PostUploadActions {
public:
	explicit PostUploadActions(std::shared_ptr<YouTubeApi::YouTubeApiClient> apiClient);

	~PostUploadActions() noexcept;

	PostUploadActions(const PostUploadActions &) = delete;
	PostUploadActions &operator=(const PostUploadActions &) = delete;
	PostUploadActions(PostUploadActions &&) = delete;
	PostUploadActions &operator=(PostUploadActions &&) = delete;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger);

	[[nodiscard]]
	PostUploadReport run(const AccessTokenProvider &accessTokenProvider, const std::string &videoId,
			     const PostUploadRequest &request) const;

private:
	const std::shared_ptr<YouTubeApi::YouTubeApiClient> apiClient_;
	std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace TubeUploader::Uploader
