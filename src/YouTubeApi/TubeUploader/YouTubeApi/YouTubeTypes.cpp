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

#include "YouTubeTypes.hpp"

#include <nlohmann/json.hpp>

namespace TubeUploader::YouTubeApi {

namespace {

template<typename T> void getOrDefault(const nlohmann::json &j, const char *key, T &field)
{
	if (auto it = j.find(key); it != j.end() && !it->is_null()) {
		it->get_to(field);
	} else {
		field = T{};
	}
}

} // anonymous namespace

std::string YouTubeVideoSettings::part() const
{
	std::string result = "snippet,status";
	if (recordingDetails.has_value()) {
		result += ",recordingDetails";
	}
	return result;
}

void to_json(nlohmann::json &j, const YouTubeVideoSettings &p)
{
	nlohmann::json snippetJson = {{"title", p.snippet.title},
				      {"description", p.snippet.description},
				      {"categoryId", p.snippet.categoryId}};
	if (p.snippet.tags.has_value()) {
		snippetJson["tags"] = p.snippet.tags.value();
	}
	if (p.snippet.defaultLanguage.has_value()) {
		snippetJson["defaultLanguage"] = p.snippet.defaultLanguage.value();
	}
	if (p.snippet.defaultAudioLanguage.has_value()) {
		snippetJson["defaultAudioLanguage"] = p.snippet.defaultAudioLanguage.value();
	}

	nlohmann::json statusJson = {{"privacyStatus", p.status.privacyStatus},
				     {"selfDeclaredMadeForKids", p.status.selfDeclaredMadeForKids},
				     {"license", p.status.license},
				     {"publicStatsViewable", p.status.publicStatsViewable}};
	if (p.status.publishAt.has_value()) {
		statusJson["publishAt"] = p.status.publishAt.value();
	}

	j = nlohmann::json{{"snippet", std::move(snippetJson)}, {"status", std::move(statusJson)}};

	if (p.recordingDetails.has_value()) {
		j["recordingDetails"] = {{"location",
					  {{"latitude", p.recordingDetails->location.latitude},
					   {"longitude", p.recordingDetails->location.longitude}}}};
	}
}

void to_json(nlohmann::json &j, const YouTubeVideo &p)
{
	j = nlohmann::json{{"kind", p.kind},
			   {"etag", p.etag},
			   {"id", p.id},
			   {"snippet",
			    {{"publishedAt", p.snippet.publishedAt},
			     {"channelId", p.snippet.channelId},
			     {"title", p.snippet.title},
			     {"description", p.snippet.description}}},
			   {"status", {{"uploadStatus", p.status.uploadStatus}, {"privacyStatus", p.status.privacyStatus}}}};
}

void from_json(const nlohmann::json &j, YouTubeVideo &p)
{
	// Only the id is guaranteed by a completed upload.
	j.at("id").get_to(p.id);
	getOrDefault(j, "kind", p.kind);
	getOrDefault(j, "etag", p.etag);

	const nlohmann::json empty = nlohmann::json::object();

	const auto snippetIt = j.find("snippet");
	const nlohmann::json &snippet = snippetIt != j.end() && snippetIt->is_object() ? *snippetIt : empty;
	getOrDefault(snippet, "publishedAt", p.snippet.publishedAt);
	getOrDefault(snippet, "channelId", p.snippet.channelId);
	getOrDefault(snippet, "title", p.snippet.title);
	getOrDefault(snippet, "description", p.snippet.description);

	const auto statusIt = j.find("status");
	const nlohmann::json &status = statusIt != j.end() && statusIt->is_object() ? *statusIt : empty;
	getOrDefault(status, "uploadStatus", p.status.uploadStatus);
	getOrDefault(status, "privacyStatus", p.status.privacyStatus);
}

void to_json(nlohmann::json &j, const YouTubePlaylistItem &p)
{
	nlohmann::json snippetJson = {
		{"playlistId", p.snippet.playlistId},
		{"resourceId", {{"kind", p.snippet.resourceId.kind}, {"videoId", p.snippet.resourceId.videoId}}}};
	if (p.snippet.position.has_value()) {
		snippetJson["position"] = p.snippet.position.value();
	}

	j = nlohmann::json{{"snippet", std::move(snippetJson)}};
	if (!p.kind.empty()) {
		j["kind"] = p.kind;
	}
	if (!p.etag.empty()) {
		j["etag"] = p.etag;
	}
	if (!p.id.empty()) {
		j["id"] = p.id;
	}
}

void from_json(const nlohmann::json &j, YouTubePlaylistItem &p)
{
	j.at("id").get_to(p.id);
	getOrDefault(j, "kind", p.kind);
	getOrDefault(j, "etag", p.etag);

	const auto &snippet = j.at("snippet");
	snippet.at("playlistId").get_to(p.snippet.playlistId);
	if (auto it = snippet.find("position"); it != snippet.end() && !it->is_null()) {
		p.snippet.position = it->get<unsigned int>();
	} else {
		p.snippet.position = std::nullopt;
	}

	const auto &resourceId = snippet.at("resourceId");
	getOrDefault(resourceId, "kind", p.snippet.resourceId.kind);
	resourceId.at("videoId").get_to(p.snippet.resourceId.videoId);
}

} // namespace TubeUploader::YouTubeApi
