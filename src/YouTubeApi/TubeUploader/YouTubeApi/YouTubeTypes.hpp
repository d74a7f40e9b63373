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

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace TubeUploader::YouTubeApi {

/** The metadata body sent with videos.insert. */
struct YouTubeVideoSettings {
	struct Snippet {
		std::string title;
		std::string description;
		std::optional<std::vector<std::string>> tags;
		std::string categoryId;
		std::optional<std::string> defaultLanguage;
		std::optional<std::string> defaultAudioLanguage;
	} snippet;

	struct Status {
		std::string privacyStatus = "public"; // "public", "private", "unlisted"
		bool selfDeclaredMadeForKids = false;
		std::string license = "youtube"; // "youtube", "creativeCommon"
		bool publicStatsViewable = false;
		std::optional<std::string> publishAt;
	} status;

	struct RecordingDetails {
		struct Location {
			double latitude = 0.0;
			double longitude = 0.0;
		} location;
	};
	std::optional<RecordingDetails> recordingDetails;

	/** The `part` parameter naming every top-level section present in the body. */
	[[nodiscard]]
	std::string part() const;
};

void to_json(nlohmann::json &j, const YouTubeVideoSettings &p);

struct YouTubeVideo {
	std::string kind;
	std::string etag;
	std::string id;

	struct Snippet {
		std::string publishedAt;
		std::string channelId;
		std::string title;
		std::string description;
	} snippet;

	struct Status {
		std::string uploadStatus;
		std::string privacyStatus;
	} status;
};

void to_json(nlohmann::json &j, const YouTubeVideo &p);
void from_json(const nlohmann::json &j, YouTubeVideo &p);

struct YouTubePlaylistItem {
	std::string kind;
	std::string etag;
	std::string id;

	struct Snippet {
		std::string playlistId;
		std::optional<unsigned int> position;
		struct ResourceId {
			std::string kind;
			std::string videoId;
		} resourceId;
	} snippet;
};

void to_json(nlohmann::json &j, const YouTubePlaylistItem &p);
void from_json(const nlohmann::json &j, YouTubePlaylistItem &p);

} // namespace TubeUploader::YouTubeApi
