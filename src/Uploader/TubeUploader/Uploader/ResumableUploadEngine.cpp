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

#include "ResumableUploadEngine.hpp"

#include <fstream>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <TubeUploader/Logger/NullLogger.hpp>
#include <TubeUploader/Retry/ClassifiedError.hpp>
#include <TubeUploader/Retry/FailureClassifier.hpp>

namespace TubeUploader::Uploader {

namespace {

bool isSuccessStatus(long httpStatus) noexcept
{
	return httpStatus == 200 || httpStatus == 201;
}

YouTubeApi::YouTubeVideo parseCompletedVideo(const std::string &body)
{
	const nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		throw Retry::ClassifiedError(Retry::ErrorKind::FatalProtocol,
					     "MalformedCompletionError(ResumableUploadEngine): body is not a JSON object");
	}

	const auto id = j.find("id");
	if (id == j.end() || !id->is_string() || id->get_ref<const std::string &>().empty()) {
		throw Retry::ClassifiedError(Retry::ErrorKind::FatalProtocol,
					     "MalformedCompletionError(ResumableUploadEngine): response has no video id");
	}

	try {
		return j.get<YouTubeApi::YouTubeVideo>();
	} catch (const nlohmann::json::exception &e) {
		throw Retry::ClassifiedError(Retry::ErrorKind::FatalProtocol,
					     fmt::format("MalformedCompletionError(ResumableUploadEngine): {}", e.what()));
	}
}

std::string describeFailure(const YouTubeApi::YouTubeUploadResponse &response)
{
	if (response.transportFailure.occurred()) {
		return fmt::format("{}: {}", Retry::toString(response.transportFailure.kind),
				   response.transportFailure.message);
	}
	return fmt::format("HTTP {}", response.httpStatus);
}

} // anonymous namespace

ResumableUploadEngine::ResumableUploadEngine(std::shared_ptr<YouTubeApi::YouTubeApiClient> apiClient,
					     ResumableUploadOptions options)
	: apiClient_(apiClient ? std::move(apiClient)
			       : throw std::invalid_argument("ApiClientIsNullError(ResumableUploadEngine)")),
	  options_(options.maxRetries >= 0 && (options.chunkSize == -1 || options.chunkSize > 0)
			   ? std::move(options)
			   : throw std::invalid_argument("OptionsError(ResumableUploadEngine)")),
	  logger_(Logger::NullLogger::instance()),
	  sleeper_(Retry::makeInterruptibleSleeper()),
	  random_(Retry::makeUniformRandom())
{
}

ResumableUploadEngine::~ResumableUploadEngine() noexcept = default;

void ResumableUploadEngine::setLogger(std::shared_ptr<const Logger::ILogger> logger)
{
	logger_ = logger ? std::move(logger) : Logger::NullLogger::instance();
}

void ResumableUploadEngine::setSleeper(Retry::Sleeper sleeper)
{
	if (!sleeper) {
		throw std::invalid_argument("SleeperIsNullError(ResumableUploadEngine::setSleeper)");
	}
	sleeper_ = std::move(sleeper);
}

void ResumableUploadEngine::setRandom(Retry::UniformRandom random)
{
	if (!random) {
		throw std::invalid_argument("RandomIsNullError(ResumableUploadEngine::setRandom)");
	}
	random_ = std::move(random);
}

UploadResult ResumableUploadEngine::upload(const AccessTokenProvider &accessTokenProvider, std::istream &source,
					   std::uint64_t totalBytes, const YouTubeApi::YouTubeVideoSettings &settings,
					   std::stop_token stopToken, const ProgressCallback &onProgress)
{
	if (!accessTokenProvider) {
		throw std::invalid_argument("AccessTokenProviderIsNullError(ResumableUploadEngine::upload)");
	}

	TransferSession session(totalBytes);

	logger_->info("UploadStarting", {{"bytes", std::to_string(totalBytes)}, {"title", settings.snippet.title}});
	openSession(session, accessTokenProvider, settings, stopToken);

	for (;;) {
		throwIfStopRequested(stopToken);

		const std::uint64_t offset = session.acknowledgedBytes();
		const std::uint64_t length = session.nextChunkLength(options_.chunkSize);
		const std::string accessToken = accessTokenProvider();

		session.recordChunkCall();
		const YouTubeApi::YouTubeUploadResponse response =
			apiClient_->uploadChunk(accessToken, session.sessionUri(), source, offset, length, totalBytes);

		if (!response.transportFailure.occurred() && isSuccessStatus(response.httpStatus)) {
			UploadResult result;
			result.video = parseCompletedVideo(response.body);
			result.bytes = totalBytes;
			result.chunkCalls = session.chunkCalls();
			result.failedAttempts = session.failedAttempts();

			if (onProgress) {
				onProgress(totalBytes, totalBytes);
			}
			logger_->info("UploadCompleted", {{"videoId", result.video.id},
							  {"chunkCalls", std::to_string(result.chunkCalls)},
							  {"failedAttempts", std::to_string(result.failedAttempts)}});
			return result;
		}

		if (!response.transportFailure.occurred() && response.httpStatus == 308) {
			if (!response.committedBytes.has_value()) {
				logger_->error("UploadRangeMalformed");
				throw Retry::ClassifiedError(Retry::ErrorKind::FatalProtocol,
							     "MalformedRangeError(ResumableUploadEngine::upload)");
			}

			if (session.acknowledge(*response.committedBytes)) {
				logger_->info("UploadProgress",
					      {{"acknowledged", std::to_string(session.acknowledgedBytes())},
					       {"total", std::to_string(totalBytes)}});
				if (onProgress) {
					onProgress(session.acknowledgedBytes(), totalBytes);
				}
				continue;
			}

			backoff(session, "NoProgress", stopToken);
			continue;
		}

		handleFailure(session, response, "UploadChunk", stopToken);
	}
}

UploadResult ResumableUploadEngine::uploadFile(const AccessTokenProvider &accessTokenProvider,
					       const std::filesystem::path &path,
					       const YouTubeApi::YouTubeVideoSettings &settings, std::stop_token stopToken,
					       const ProgressCallback &onProgress)
{
	if (!std::filesystem::is_regular_file(path)) {
		logger_->error("VideoFileNotRegularFileError", {{"path", path.string()}});
		throw std::runtime_error(
			fmt::format("VideoFileNotRegularFileError(ResumableUploadEngine::uploadFile): {}", path.string()));
	}

	std::ifstream ifs(path, std::ios::in | std::ios::binary);
	if (!ifs.is_open()) {
		logger_->error("FileOpenError", {{"path", path.string()}});
		throw std::runtime_error(
			fmt::format("FileOpenError(ResumableUploadEngine::uploadFile): {}", path.string()));
	}

	const std::uintmax_t size = std::filesystem::file_size(path);
	return upload(accessTokenProvider, ifs, static_cast<std::uint64_t>(size), settings, std::move(stopToken),
		      onProgress);
}

void ResumableUploadEngine::openSession(TransferSession &session, const AccessTokenProvider &accessTokenProvider,
					const YouTubeApi::YouTubeVideoSettings &settings,
					const std::stop_token &stopToken)
{
	while (!session.hasSessionUri()) {
		throwIfStopRequested(stopToken);

		const std::string accessToken = accessTokenProvider();
		const YouTubeApi::YouTubeUploadResponse response = apiClient_->startResumableUpload(
			accessToken, settings, session.totalBytes(), options_.contentType);

		if (!response.transportFailure.occurred() && isSuccessStatus(response.httpStatus)) {
			if (!response.location.has_value() || response.location->empty()) {
				logger_->error("UploadSessionLocationMissing");
				throw Retry::ClassifiedError(Retry::ErrorKind::FatalProtocol,
							     "SessionLocationMissingError(ResumableUploadEngine)");
			}
			session.setSessionUri(*response.location);
			logger_->debug("UploadSessionOpened");
			return;
		}

		handleFailure(session, response, "StartSession", stopToken);
	}
}

void ResumableUploadEngine::handleFailure(TransferSession &session, const YouTubeApi::YouTubeUploadResponse &response,
					  std::string_view stage, const std::stop_token &stopToken)
{
	const std::string description = describeFailure(response);

	if (Retry::classifyFailure(response.transportFailure, response.httpStatus) == Retry::FailureClass::NonRetriable) {
		session.recordNonRetriableFailure();
		logger_->error("UploadFailed", {{"stage", stage}, {"failure", description}, {"body", response.body}});

		if (response.transportFailure.kind == Retry::TransportFailureKind::LocalReadFailed) {
			throw std::runtime_error(fmt::format("SourceReadError({}): {}", stage, description));
		}
		throw Retry::ClassifiedError(Retry::ErrorKind::FatalProtocol,
					     fmt::format("NonRetriableError({}): {}", stage, description));
	}

	backoff(session, description, stopToken);
}

void ResumableUploadEngine::backoff(TransferSession &session, std::string_view reason,
				    const std::stop_token &stopToken)
{
	const int retry = session.recordRetriableFailure();
	if (retry > options_.maxRetries) {
		logger_->error("UploadRetryExhausted",
			       {{"reason", reason}, {"maxRetries", std::to_string(options_.maxRetries)}});
		throw Retry::ClassifiedError(
			Retry::ErrorKind::RetryExhausted,
			fmt::format("RetryExhaustedError(ResumableUploadEngine): {} retries, last failure: {}",
				    options_.maxRetries, reason));
	}

	const Retry::Seconds delay = Retry::multiplicativeJitterBackoff(retry, random_);
	logger_->warn("UploadRetrying", {{"reason", reason},
					 {"retry", std::to_string(retry)},
					 {"seconds", fmt::format("{:.3f}", delay.count())}});

	if (!sleeper_(delay, stopToken)) {
		throw Retry::ClassifiedError(Retry::ErrorKind::Cancelled, "Cancelled(ResumableUploadEngine::backoff)");
	}
}

void ResumableUploadEngine::throwIfStopRequested(const std::stop_token &stopToken) const
{
	if (stopToken.stop_requested()) {
		logger_->warn("UploadCancelled");
		throw Retry::ClassifiedError(Retry::ErrorKind::Cancelled, "Cancelled(ResumableUploadEngine)");
	}
}

} // namespace TubeUploader::Uploader
