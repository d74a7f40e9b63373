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

#include "PostUploadActions.hpp"

#include <algorithm>
#include <stdexcept>

#include <TubeUploader/Logger/NullLogger.hpp>

namespace TubeUploader::Uploader {

bool PostUploadReport::allSucceeded() const noexcept
{
	return std::all_of(outcomes.begin(), outcomes.end(),
			   [](const PostUploadActionOutcome &outcome) { return outcome.succeeded; });
}

PostUploadActions::PostUploadActions(std::shared_ptr<YouTubeApi::YouTubeApiClient> apiClient)
	: apiClient_(apiClient ? std::move(apiClient)
			       : throw std::invalid_argument("ApiClientIsNullError(PostUploadActions)")),
	  logger_(Logger::NullLogger::instance())
{
}

PostUploadActions::~PostUploadActions() noexcept = default;

void PostUploadActions::setLogger(std::shared_ptr<const Logger::ILogger> logger)
{
	logger_ = logger ? std::move(logger) : Logger::NullLogger::instance();
}

PostUploadReport PostUploadActions::run(const AccessTokenProvider &accessTokenProvider, const std::string &videoId,
					const PostUploadRequest &request) const
{
	PostUploadReport report;

	if (request.thumbnailPath.has_value()) {
		PostUploadActionOutcome outcome{"thumbnail", false, {}};
		try {
			apiClient_->setThumbnail(accessTokenProvider(), videoId, *request.thumbnailPath);
			outcome.succeeded = true;
			logger_->info("ThumbnailUploaded",
				      {{"videoId", videoId}, {"path", request.thumbnailPath->string()}});
		} catch (const std::exception &e) {
			outcome.message = e.what();
			logger_->logException(e, "ThumbnailUploadFailed");
		}
		report.outcomes.push_back(std::move(outcome));
	}

	if (request.playlistId.has_value()) {
		PostUploadActionOutcome outcome{"playlist", false, {}};
		try {
			const YouTubeApi::YouTubePlaylistItem item =
				apiClient_->insertPlaylistItem(accessTokenProvider(), *request.playlistId, videoId);
			outcome.succeeded = true;
			logger_->info("VideoAddedToPlaylist", {{"videoId", videoId},
							       {"playlistId", *request.playlistId},
							       {"playlistItemId", item.id}});
		} catch (const std::exception &e) {
			outcome.message = e.what();
			logger_->logException(e, "PlaylistInsertFailed");
		}
		report.outcomes.push_back(std::move(outcome));
	}

	return report;
}

} // namespace TubeUploader::Uploader
