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

#include "YouTubeApiClient.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <TubeUploader/CurlHelper/CurlHeaderCallback.hpp>
#include <TubeUploader/CurlHelper/CurlReadCallback.hpp>
#include <TubeUploader/CurlHelper/CurlSlistHandle.hpp>
#include <TubeUploader/CurlHelper/CurlUrlHandle.hpp>
#include <TubeUploader/CurlHelper/CurlUrlSearchParams.hpp>
#include <TubeUploader/CurlHelper/CurlWriteCallback.hpp>
#include <TubeUploader/Logger/NullLogger.hpp>

#include "CurlTransportFailure.hpp"

namespace TubeUploader::YouTubeApi {

namespace {

constexpr const char *kVideosInsertUrl = "https://www.googleapis.com/upload/youtube/v3/videos";
constexpr const char *kThumbnailsSetUrl = "https://www.googleapis.com/upload/youtube/v3/thumbnails/set";
constexpr const char *kPlaylistItemsUrl = "https://www.googleapis.com/youtube/v3/playlistItems";

struct HttpExchange {
	CURLcode code = CURLE_OK;
	long httpStatus = 0;
	std::string body;
	CurlHelper::CurlHeaderMap headers;
};

void setCommonOptions(CURL *curl, HttpExchange &exchange, curl_slist *headers)
{
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &exchange.body);
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, CurlHelper::CurlHeaderMapCallback);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &exchange.headers);

	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
	curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
}

void perform(CURL *curl, HttpExchange &exchange)
{
	exchange.code = curl_easy_perform(curl);
	if (exchange.code == CURLE_OK) {
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &exchange.httpStatus);
	}
}

std::string getLowercaseExtension(const std::filesystem::path &path)
{
	std::string ext = path.extension().string();
	std::transform(ext.begin(), ext.end(), ext.begin(),
		       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return ext;
}

void throwIfApiError(const HttpExchange &exchange, const nlohmann::json &j,
		     const std::shared_ptr<const Logger::ILogger> &logger, const char *where)
{
	if (j.is_object() && j.contains("error")) {
		logger->error("YouTubeApiError",
			      {{"status", std::to_string(exchange.httpStatus)}, {"error", j["error"].dump()}});
		throw std::runtime_error(fmt::format("APIError({}): status {}", where, exchange.httpStatus));
	}
	if (exchange.httpStatus < 200 || exchange.httpStatus >= 300) {
		logger->error("YouTubeApiHttpError", {{"status", std::to_string(exchange.httpStatus)}});
		throw std::runtime_error(fmt::format("HttpError({}): status {}", where, exchange.httpStatus));
	}
}

} // anonymous namespace

std::optional<std::uint64_t> parseCommittedBytes(std::string_view rangeHeader)
{
	constexpr std::string_view prefix = "bytes=0-";
	if (!rangeHeader.starts_with(prefix)) {
		return std::nullopt;
	}
	rangeHeader.remove_prefix(prefix.size());

	std::uint64_t lastByte = 0;
	const auto [ptr, ec] = std::from_chars(rangeHeader.data(), rangeHeader.data() + rangeHeader.size(), lastByte);
	if (ec != std::errc() || ptr != rangeHeader.data() + rangeHeader.size()) {
		return std::nullopt;
	}
	return lastByte + 1;
}

YouTubeApiClient::YouTubeApiClient(std::shared_ptr<CurlHelper::CurlHandle> curl)
	: curl_(curl ? std::move(curl) : throw std::invalid_argument("CurlIsNullError(YouTubeApiClient)")),
	  logger_(Logger::NullLogger::instance())
{
}

YouTubeApiClient::~YouTubeApiClient() noexcept = default;

void YouTubeApiClient::setLogger(std::shared_ptr<const Logger::ILogger> logger)
{
	logger_ = logger ? std::move(logger) : Logger::NullLogger::instance();
}

YouTubeUploadResponse YouTubeApiClient::startResumableUpload(std::string_view accessToken,
							     const YouTubeVideoSettings &settings,
							     std::uint64_t contentLength,
							     const std::string &contentType)
{
	if (accessToken.empty()) {
		logger_->error("AccessTokenIsEmptyError");
		throw std::invalid_argument("AccessTokenIsEmptyError(YouTubeApiClient::startResumableUpload)");
	}

	CURL *curl = curl_->getRaw();

	CurlHelper::CurlUrlSearchParams params(curl);
	params.append("uploadType", "resumable");
	params.append("part", settings.part());

	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(kVideosInsertUrl);
	urlHandle.appendQuery(params.toString());
	const std::string url = urlHandle.toString();

	CurlHelper::CurlSlistHandle headers;
	headers.append(fmt::format("Authorization: Bearer {}", accessToken));
	headers.append("Content-Type: application/json; charset=UTF-8");
	headers.append(fmt::format("X-Upload-Content-Length: {}", contentLength));
	headers.append(fmt::format("X-Upload-Content-Type: {}", contentType));

	const std::string body = nlohmann::json(settings).dump();

	HttpExchange exchange;

	curl_easy_reset(curl);
	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
	setCommonOptions(curl, exchange, headers.getRaw());

	logger_->debug("YouTubeResumableSessionStarting", {{"part", settings.part()}});
	perform(curl, exchange);

	YouTubeUploadResponse response;
	response.transportFailure = toTransportFailure(exchange.code);
	response.httpStatus = exchange.httpStatus;
	response.body = std::move(exchange.body);
	response.location = exchange.headers.get("location");
	return response;
}

YouTubeUploadResponse YouTubeApiClient::uploadChunk(std::string_view accessToken, const std::string &sessionUri,
						    std::istream &source, std::uint64_t offset, std::uint64_t length,
						    std::uint64_t totalBytes)
{
	if (accessToken.empty()) {
		logger_->error("AccessTokenIsEmptyError");
		throw std::invalid_argument("AccessTokenIsEmptyError(YouTubeApiClient::uploadChunk)");
	}
	if (sessionUri.empty()) {
		logger_->error("SessionUriIsEmptyError");
		throw std::invalid_argument("SessionUriIsEmptyError(YouTubeApiClient::uploadChunk)");
	}
	if (offset > totalBytes || length > totalBytes - offset) {
		logger_->error("ChunkOutOfRangeError", {{"offset", std::to_string(offset)},
							{"length", std::to_string(length)},
							{"total", std::to_string(totalBytes)}});
		throw std::invalid_argument("ChunkOutOfRangeError(YouTubeApiClient::uploadChunk)");
	}

	YouTubeUploadResponse response;

	source.clear();
	source.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
	if (!source) {
		logger_->error("SourceSeekError", {{"offset", std::to_string(offset)}});
		response.transportFailure = {Retry::TransportFailureKind::LocalReadFailed, "seek failed"};
		return response;
	}

	CurlHelper::CurlSlistHandle headers;
	headers.append(fmt::format("Authorization: Bearer {}", accessToken));
	if (length == 0) {
		headers.append(fmt::format("Content-Range: bytes */{}", totalBytes));
	} else {
		headers.append(fmt::format("Content-Range: bytes {}-{}/{}", offset, offset + length - 1, totalBytes));
	}

	CurlHelper::CurlBoundedStreamSource<std::istream> streamSource{&source, length, false};

	CURL *curl = curl_->getRaw();
	HttpExchange exchange;

	curl_easy_reset(curl);
	curl_easy_setopt(curl, CURLOPT_URL, sessionUri.c_str());
	curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
	curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(length));
	curl_easy_setopt(curl, CURLOPT_READFUNCTION, CurlHelper::CurlIstreamReadCallback);
	curl_easy_setopt(curl, CURLOPT_READDATA, &streamSource);
	// No overall timeout: a transfer stalled below 1 byte/s for a minute aborts.
	curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
	curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);
	setCommonOptions(curl, exchange, headers.getRaw());

	logger_->debug("YouTubeChunkUploading",
		       {{"offset", std::to_string(offset)}, {"length", std::to_string(length)}});
	perform(curl, exchange);

	if (streamSource.failed) {
		response.transportFailure = {Retry::TransportFailureKind::LocalReadFailed, "source read failed"};
	} else {
		response.transportFailure = toTransportFailure(exchange.code);
	}
	response.httpStatus = exchange.httpStatus;
	response.body = std::move(exchange.body);

	if (!response.transportFailure.occurred() && response.httpStatus == 308) {
		const std::optional<std::string> range = exchange.headers.get("range");
		if (!range.has_value()) {
			response.committedBytes = 0;
		} else {
			response.committedBytes = parseCommittedBytes(*range);
			if (!response.committedBytes.has_value()) {
				logger_->warn("YouTubeRangeHeaderMalformed", {{"range", *range}});
			}
		}
	}

	return response;
}

void YouTubeApiClient::setThumbnail(std::string_view accessToken, const std::string &videoId,
				    const std::filesystem::path &thumbnailPath)
{
	if (accessToken.empty()) {
		logger_->error("AccessTokenIsEmptyError");
		throw std::invalid_argument("AccessTokenIsEmptyError(YouTubeApiClient::setThumbnail)");
	}
	if (videoId.empty()) {
		logger_->error("VideoIdIsEmptyError");
		throw std::invalid_argument("VideoIdIsEmptyError(YouTubeApiClient::setThumbnail)");
	}
	if (!std::filesystem::is_regular_file(thumbnailPath)) {
		logger_->error("ThumbnailNotRegularFileError", {{"path", thumbnailPath.string()}});
		throw std::invalid_argument("ThumbnailNotRegularFileError(YouTubeApiClient::setThumbnail)");
	}

	const std::uintmax_t size = std::filesystem::file_size(thumbnailPath);
	if (size > kMaxThumbnailBytes) {
		logger_->error("ThumbnailFileSizeExceedsLimitError", {{"path", thumbnailPath.string()},
								      {"size", std::to_string(size)},
								      {"maxSize", std::to_string(kMaxThumbnailBytes)}});
		throw std::invalid_argument("ThumbnailFileSizeExceedsLimitError(YouTubeApiClient::setThumbnail)");
	}

	CURL *curl = curl_->getRaw();

	CurlHelper::CurlUrlSearchParams params(curl);
	params.append("videoId", videoId);

	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(kThumbnailsSetUrl);
	urlHandle.appendQuery(params.toString());
	const std::string url = urlHandle.toString();

	CurlHelper::CurlSlistHandle headers;
	headers.append(fmt::format("Authorization: Bearer {}", accessToken));

	const std::string ext = getLowercaseExtension(thumbnailPath);
	if (ext == ".png") {
		headers.append("Content-Type: image/png");
	} else if (ext == ".jpg" || ext == ".jpeg") {
		headers.append("Content-Type: image/jpeg");
	} else {
		headers.append("Content-Type: application/octet-stream");
	}

	std::ifstream ifs(thumbnailPath, std::ios::binary);
	if (!ifs.is_open()) {
		logger_->error("ThumbnailFileOpenError", {{"path", thumbnailPath.string()}});
		throw std::runtime_error("ThumbnailFileOpenError(YouTubeApiClient::setThumbnail)");
	}

	CurlHelper::CurlBoundedStreamSource<std::istream> streamSource{&ifs, size, false};
	HttpExchange exchange;

	curl_easy_reset(curl);
	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(size));
	curl_easy_setopt(curl, CURLOPT_READFUNCTION, CurlHelper::CurlIstreamReadCallback);
	curl_easy_setopt(curl, CURLOPT_READDATA, &streamSource);
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
	setCommonOptions(curl, exchange, headers.getRaw());

	perform(curl, exchange);

	if (exchange.code != CURLE_OK || streamSource.failed) {
		logger_->error("CurlPerformError", {{"error", curl_easy_strerror(exchange.code)}});
		throw std::runtime_error("CurlPerformError(YouTubeApiClient::setThumbnail)");
	}

	const nlohmann::json j = nlohmann::json::parse(exchange.body, nullptr, false);
	throwIfApiError(exchange, j, logger_, "YouTubeApiClient::setThumbnail");

	logger_->info("YouTubeThumbnailSet", {{"videoId", videoId}});
}

YouTubePlaylistItem YouTubeApiClient::insertPlaylistItem(std::string_view accessToken, const std::string &playlistId,
							 const std::string &videoId)
{
	if (accessToken.empty()) {
		logger_->error("AccessTokenIsEmptyError");
		throw std::invalid_argument("AccessTokenIsEmptyError(YouTubeApiClient::insertPlaylistItem)");
	}
	if (playlistId.empty()) {
		logger_->error("PlaylistIdIsEmptyError");
		throw std::invalid_argument("PlaylistIdIsEmptyError(YouTubeApiClient::insertPlaylistItem)");
	}
	if (videoId.empty()) {
		logger_->error("VideoIdIsEmptyError");
		throw std::invalid_argument("VideoIdIsEmptyError(YouTubeApiClient::insertPlaylistItem)");
	}

	CURL *curl = curl_->getRaw();

	CurlHelper::CurlUrlSearchParams params(curl);
	params.append("part", "snippet");

	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(kPlaylistItemsUrl);
	urlHandle.appendQuery(params.toString());
	const std::string url = urlHandle.toString();

	CurlHelper::CurlSlistHandle headers;
	headers.append(fmt::format("Authorization: Bearer {}", accessToken));
	headers.append("Content-Type: application/json; charset=UTF-8");

	YouTubePlaylistItem item;
	item.snippet.playlistId = playlistId;
	item.snippet.resourceId.kind = "youtube#video";
	item.snippet.resourceId.videoId = videoId;
	const std::string body = nlohmann::json(item).dump();

	HttpExchange exchange;

	curl_easy_reset(curl);
	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
	setCommonOptions(curl, exchange, headers.getRaw());

	perform(curl, exchange);

	if (exchange.code != CURLE_OK) {
		logger_->error("CurlPerformError", {{"error", curl_easy_strerror(exchange.code)}});
		throw std::runtime_error("CurlPerformError(YouTubeApiClient::insertPlaylistItem)");
	}

	const nlohmann::json j = nlohmann::json::parse(exchange.body, nullptr, false);
	throwIfApiError(exchange, j, logger_, "YouTubeApiClient::insertPlaylistItem");

	try {
		YouTubePlaylistItem inserted = j.get<YouTubePlaylistItem>();
		logger_->info("YouTubePlaylistItemInserted", {{"playlistId", playlistId}, {"videoId", videoId}});
		return inserted;
	} catch (const nlohmann::json::exception &e) {
		logger_->error("YouTubePlaylistItemParseError", {{"exception", e.what()}});
		throw std::runtime_error("ParseError(YouTubeApiClient::insertPlaylistItem)");
	}
}

} // namespace TubeUploader::YouTubeApi
