/*
 * Tube Uploader - Uploader Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>
#include <deque>
#include <filesystem>
#include <istream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <TubeUploader/CurlHelper/CurlHandle.hpp>
#include <TubeUploader/YouTubeApi/YouTubeApiClient.hpp>

namespace TubeUploader::Uploader {

/** Serves scripted responses and records every chunk it is handed. */
class FakeYouTubeApiClient : public YouTubeApi::YouTubeApiClient {
public:
	struct ChunkCall {
		std::uint64_t offset;
		std::uint64_t length;
		std::string accessToken;
		std::string data;
	};

	FakeYouTubeApiClient() : YouTubeApi::YouTubeApiClient(std::make_shared<CurlHelper::CurlHandle>()) {}

	static YouTubeApi::YouTubeUploadResponse sessionOpened()
	{
		YouTubeApi::YouTubeUploadResponse response;
		response.httpStatus = 200;
		response.location = "https://upload.example/session/1";
		return response;
	}

	static YouTubeApi::YouTubeUploadResponse status(long httpStatus, std::string body = {})
	{
		YouTubeApi::YouTubeUploadResponse response;
		response.httpStatus = httpStatus;
		response.body = std::move(body);
		return response;
	}

	static YouTubeApi::YouTubeUploadResponse incomplete(std::uint64_t committedBytes)
	{
		YouTubeApi::YouTubeUploadResponse response = status(308);
		response.committedBytes = committedBytes;
		return response;
	}

	static YouTubeApi::YouTubeUploadResponse completed(const std::string &videoId)
	{
		return status(200, R"({"kind": "youtube#video", "id": ")" + videoId + R"("})");
	}

	static YouTubeApi::YouTubeUploadResponse transportFailure(Retry::TransportFailureKind kind)
	{
		YouTubeApi::YouTubeUploadResponse response;
		response.transportFailure = {kind, "scripted"};
		return response;
	}

	YouTubeApi::YouTubeUploadResponse startResumableUpload(std::string_view accessToken,
							       const YouTubeApi::YouTubeVideoSettings &,
							       std::uint64_t contentLength, const std::string &) override
	{
		startTokens.emplace_back(accessToken);
		startContentLength = contentLength;
		if (startResponses.empty()) {
			return sessionOpened();
		}
		YouTubeApi::YouTubeUploadResponse response = std::move(startResponses.front());
		startResponses.pop_front();
		return response;
	}

	YouTubeApi::YouTubeUploadResponse uploadChunk(std::string_view accessToken, const std::string &sessionUri,
						      std::istream &source, std::uint64_t offset, std::uint64_t length,
						      std::uint64_t) override
	{
		lastSessionUri = sessionUri;

		std::string data(length, '\0');
		source.clear();
		source.seekg(static_cast<std::streamoff>(offset));
		source.read(data.data(), static_cast<std::streamsize>(length));
		chunkCalls.push_back({offset, length, std::string(accessToken), std::move(data)});

		if (chunkResponses.empty()) {
			throw std::logic_error("no scripted chunk response");
		}
		YouTubeApi::YouTubeUploadResponse response = std::move(chunkResponses.front());
		chunkResponses.pop_front();
		return response;
	}

	void setThumbnail(std::string_view accessToken, const std::string &videoId,
			  const std::filesystem::path &thumbnailPath) override
	{
		thumbnailCalls.push_back(std::string(accessToken) + " " + videoId + " " + thumbnailPath.string());
		if (failThumbnail) {
			throw std::runtime_error("ThumbnailRejected");
		}
	}

	YouTubeApi::YouTubePlaylistItem insertPlaylistItem(std::string_view accessToken, const std::string &playlistId,
							   const std::string &videoId) override
	{
		playlistCalls.push_back(std::string(accessToken) + " " + playlistId + " " + videoId);
		if (failPlaylist) {
			throw std::runtime_error("PlaylistNotFound");
		}
		YouTubeApi::YouTubePlaylistItem item;
		item.id = "PLI1";
		item.snippet.playlistId = playlistId;
		item.snippet.resourceId.videoId = videoId;
		return item;
	}

	std::deque<YouTubeApi::YouTubeUploadResponse> startResponses;
	std::deque<YouTubeApi::YouTubeUploadResponse> chunkResponses;

	std::vector<std::string> startTokens;
	std::uint64_t startContentLength = 0;
	std::vector<ChunkCall> chunkCalls;
	std::string lastSessionUri;

	bool failThumbnail = false;
	bool failPlaylist = false;
	std::vector<std::string> thumbnailCalls;
	std::vector<std::string> playlistCalls;
};

} // namespace TubeUploader::Uploader
