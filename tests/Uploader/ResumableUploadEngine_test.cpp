/*
 * Tube Uploader - Uploader Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <sstream>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include <TubeUploader/Retry/ClassifiedError.hpp>
#include <TubeUploader/TestSupport/RecordingLogger.hpp>
#include <TubeUploader/TestSupport/TemporaryDirectory.hpp>
#include <TubeUploader/Uploader/ResumableUploadEngine.hpp>

#include "FakeYouTubeApiClient.hpp"

using namespace TubeUploader;
using namespace TubeUploader::Uploader;
using Fake = FakeYouTubeApiClient;

class ResumableUploadEngineTest : public ::testing::Test {
protected:
	const std::string content = "0123456789";
	std::istringstream source{content};

	std::shared_ptr<FakeYouTubeApiClient> apiClient = std::make_shared<FakeYouTubeApiClient>();
	std::shared_ptr<TestSupport::RecordingLogger> logger = std::make_shared<TestSupport::RecordingLogger>();
	std::vector<Retry::Seconds> sleeps;
	int tokenRequests = 0;

	YouTubeApi::YouTubeVideoSettings settings;

	AccessTokenProvider provider = [this] { return "ya29.token-" + std::to_string(++tokenRequests); };

	std::unique_ptr<ResumableUploadEngine> makeEngine(ResumableUploadOptions options = {})
	{
		auto engine = std::make_unique<ResumableUploadEngine>(apiClient, options);
		engine->setLogger(logger);
		engine->setRandom([] { return 0.5; });
		engine->setSleeper([this](Retry::Seconds duration, std::stop_token) {
			sleeps.push_back(duration);
			return true;
		});
		return engine;
	}

	static ResumableUploadOptions chunked(std::int64_t chunkSize, int maxRetries = 10)
	{
		ResumableUploadOptions options;
		options.chunkSize = chunkSize;
		options.maxRetries = maxRetries;
		return options;
	}

	static Retry::ErrorKind kindOf(const std::function<void()> &action)
	{
		try {
			action();
		} catch (const Retry::ClassifiedError &e) {
			return e.kind();
		}
		ADD_FAILURE() << "expected ClassifiedError";
		return Retry::ErrorKind::Transient;
	}
};

TEST_F(ResumableUploadEngineTest, WholeFileInOneRequest)
{
	apiClient->chunkResponses = {Fake::completed("vid1")};
	auto engine = makeEngine();

	const UploadResult result = engine->upload(provider, source, content.size(), settings);

	EXPECT_EQ(result.video.id, "vid1");
	EXPECT_EQ(result.bytes, content.size());
	EXPECT_EQ(result.chunkCalls, 1);
	EXPECT_EQ(result.failedAttempts, 0);
	EXPECT_EQ(apiClient->startContentLength, content.size());
	ASSERT_EQ(apiClient->chunkCalls.size(), 1u);
	EXPECT_EQ(apiClient->chunkCalls[0].data, content);
	EXPECT_EQ(apiClient->lastSessionUri, "https://upload.example/session/1");
	EXPECT_TRUE(sleeps.empty());
}

TEST_F(ResumableUploadEngineTest, ChunksAdvanceByAcknowledgedOffset)
{
	apiClient->chunkResponses = {Fake::incomplete(4), Fake::incomplete(8), Fake::completed("vid1")};
	std::vector<std::pair<std::uint64_t, std::uint64_t>> progress;
	auto engine = makeEngine(chunked(4));

	const UploadResult result =
		engine->upload(provider, source, content.size(), settings, {},
			       [&progress](std::uint64_t acked, std::uint64_t total) { progress.emplace_back(acked, total); });

	EXPECT_EQ(result.chunkCalls, 3);
	ASSERT_EQ(apiClient->chunkCalls.size(), 3u);
	EXPECT_EQ(apiClient->chunkCalls[0].offset, 0u);
	EXPECT_EQ(apiClient->chunkCalls[1].offset, 4u);
	EXPECT_EQ(apiClient->chunkCalls[2].offset, 8u);
	EXPECT_EQ(apiClient->chunkCalls[2].length, 2u);
	EXPECT_EQ(apiClient->chunkCalls[0].data + apiClient->chunkCalls[1].data + apiClient->chunkCalls[2].data,
		  content);

	const std::vector<std::pair<std::uint64_t, std::uint64_t>> expected = {{4, 10}, {8, 10}, {10, 10}};
	EXPECT_EQ(progress, expected);
	EXPECT_EQ(result.failedAttempts, 0);
	EXPECT_TRUE(sleeps.empty());
}

TEST_F(ResumableUploadEngineTest, ServerMayCommitLessThanSent)
{
	apiClient->chunkResponses = {Fake::incomplete(3), Fake::completed("vid1")};
	auto engine = makeEngine();

	(void)engine->upload(provider, source, content.size(), settings);

	ASSERT_EQ(apiClient->chunkCalls.size(), 2u);
	EXPECT_EQ(apiClient->chunkCalls[1].offset, 3u);
	EXPECT_EQ(apiClient->chunkCalls[1].data, "3456789");
}

TEST_F(ResumableUploadEngineTest, RetriableStatusRetriesSameOffset)
{
	apiClient->chunkResponses = {Fake::incomplete(4), Fake::status(503), Fake::incomplete(8),
				     Fake::completed("vid1")};
	auto engine = makeEngine(chunked(4));

	const UploadResult result = engine->upload(provider, source, content.size(), settings);

	EXPECT_EQ(result.chunkCalls, 4);
	EXPECT_EQ(result.failedAttempts, 1);
	ASSERT_EQ(apiClient->chunkCalls.size(), 4u);
	EXPECT_EQ(apiClient->chunkCalls[1].offset, 4u);
	EXPECT_EQ(apiClient->chunkCalls[2].offset, 4u);
	ASSERT_EQ(sleeps.size(), 1u);
	EXPECT_DOUBLE_EQ(sleeps[0].count(), 1.0);
	EXPECT_TRUE(logger->contains("UploadRetrying"));
}

TEST_F(ResumableUploadEngineTest, BackoffCeilingDoublesPerConsecutiveRetry)
{
	apiClient->chunkResponses = {Fake::status(500), Fake::transportFailure(Retry::TransportFailureKind::Timeout),
				     Fake::status(504), Fake::completed("vid1")};
	auto engine = makeEngine();

	const UploadResult result = engine->upload(provider, source, content.size(), settings);

	EXPECT_EQ(result.failedAttempts, 3);
	ASSERT_EQ(sleeps.size(), 3u);
	EXPECT_DOUBLE_EQ(sleeps[0].count(), 1.0);
	EXPECT_DOUBLE_EQ(sleeps[1].count(), 2.0);
	EXPECT_DOUBLE_EQ(sleeps[2].count(), 4.0);
}

TEST_F(ResumableUploadEngineTest, RetriesAreExhausted)
{
	apiClient->chunkResponses = {Fake::status(503), Fake::status(503), Fake::status(503)};
	auto engine = makeEngine(chunked(-1, 2));

	EXPECT_EQ(kindOf([&] { (void)engine->upload(provider, source, content.size(), settings); }),
		  Retry::ErrorKind::RetryExhausted);
	EXPECT_EQ(apiClient->chunkCalls.size(), 3u);
	EXPECT_EQ(sleeps.size(), 2u);
	EXPECT_TRUE(logger->contains("UploadRetryExhausted"));
}

TEST_F(ResumableUploadEngineTest, RetryCountResetsOnProgress)
{
	apiClient->chunkResponses = {Fake::status(503), Fake::incomplete(4), Fake::status(503),
				     Fake::incomplete(8), Fake::status(503), Fake::completed("vid1")};
	auto engine = makeEngine(chunked(4, 1));

	const UploadResult result = engine->upload(provider, source, content.size(), settings);

	EXPECT_EQ(result.video.id, "vid1");
	EXPECT_EQ(result.failedAttempts, 3);
	ASSERT_EQ(sleeps.size(), 3u);
	for (const Retry::Seconds &sleep : sleeps) {
		EXPECT_DOUBLE_EQ(sleep.count(), 1.0);
	}
}

TEST_F(ResumableUploadEngineTest, NonRetriableStatusStopsImmediately)
{
	apiClient->chunkResponses = {Fake::status(403, R"({"error": {"code": 403}})")};
	auto engine = makeEngine();

	EXPECT_EQ(kindOf([&] { (void)engine->upload(provider, source, content.size(), settings); }),
		  Retry::ErrorKind::FatalProtocol);
	EXPECT_EQ(apiClient->chunkCalls.size(), 1u);
	EXPECT_TRUE(sleeps.empty());
}

TEST_F(ResumableUploadEngineTest, NonRetriableTransportFailureStopsImmediately)
{
	apiClient->chunkResponses = {Fake::transportFailure(Retry::TransportFailureKind::Other)};
	auto engine = makeEngine();

	EXPECT_EQ(kindOf([&] { (void)engine->upload(provider, source, content.size(), settings); }),
		  Retry::ErrorKind::FatalProtocol);
	EXPECT_TRUE(sleeps.empty());
}

TEST_F(ResumableUploadEngineTest, LocalReadFailureIsNotClassified)
{
	apiClient->chunkResponses = {Fake::transportFailure(Retry::TransportFailureKind::LocalReadFailed)};
	auto engine = makeEngine();

	try {
		(void)engine->upload(provider, source, content.size(), settings);
		FAIL() << "expected runtime_error";
	} catch (const Retry::ClassifiedError &) {
		FAIL() << "local read failures are not protocol errors";
	} catch (const std::runtime_error &e) {
		EXPECT_NE(std::string(e.what()).find("SourceReadError"), std::string::npos);
	}
}

TEST_F(ResumableUploadEngineTest, SessionStartIsRetried)
{
	apiClient->startResponses = {Fake::status(500), Fake::sessionOpened()};
	apiClient->chunkResponses = {Fake::completed("vid1")};
	auto engine = makeEngine();

	const UploadResult result = engine->upload(provider, source, content.size(), settings);

	EXPECT_EQ(result.video.id, "vid1");
	EXPECT_EQ(apiClient->startTokens.size(), 2u);
	EXPECT_EQ(sleeps.size(), 1u);
}

TEST_F(ResumableUploadEngineTest, OpeningTheSessionResetsTheRetryCount)
{
	apiClient->startResponses = {Fake::status(503), Fake::status(503), Fake::sessionOpened()};
	apiClient->chunkResponses = {Fake::status(503), Fake::completed("vid1")};
	auto engine = makeEngine(chunked(-1, 2));

	const UploadResult result = engine->upload(provider, source, content.size(), settings);

	EXPECT_EQ(result.video.id, "vid1");
	EXPECT_EQ(result.failedAttempts, 3);
	ASSERT_EQ(sleeps.size(), 3u);
	EXPECT_DOUBLE_EQ(sleeps[2].count(), 1.0);
}

TEST_F(ResumableUploadEngineTest, SessionStartWithoutLocationIsProtocolError)
{
	YouTubeApi::YouTubeUploadResponse noLocation = Fake::status(200);
	apiClient->startResponses = {noLocation};
	auto engine = makeEngine();

	EXPECT_EQ(kindOf([&] { (void)engine->upload(provider, source, content.size(), settings); }),
		  Retry::ErrorKind::FatalProtocol);
	EXPECT_TRUE(apiClient->chunkCalls.empty());
}

TEST_F(ResumableUploadEngineTest, IncompleteWithoutProgressBacksOff)
{
	apiClient->chunkResponses = {Fake::incomplete(0), Fake::completed("vid1")};
	auto engine = makeEngine();

	const UploadResult result = engine->upload(provider, source, content.size(), settings);

	EXPECT_EQ(result.chunkCalls, 2);
	EXPECT_EQ(result.failedAttempts, 1);
	EXPECT_EQ(sleeps.size(), 1u);
	EXPECT_EQ(apiClient->chunkCalls[1].offset, 0u);
}

TEST_F(ResumableUploadEngineTest, MalformedRangeIsProtocolError)
{
	apiClient->chunkResponses = {Fake::status(308)};
	auto engine = makeEngine();

	EXPECT_EQ(kindOf([&] { (void)engine->upload(provider, source, content.size(), settings); }),
		  Retry::ErrorKind::FatalProtocol);
}

TEST_F(ResumableUploadEngineTest, RangeRegressionIsProtocolError)
{
	apiClient->chunkResponses = {Fake::incomplete(8), Fake::incomplete(4)};
	auto engine = makeEngine(chunked(4));

	EXPECT_EQ(kindOf([&] { (void)engine->upload(provider, source, content.size(), settings); }),
		  Retry::ErrorKind::FatalProtocol);
}

TEST_F(ResumableUploadEngineTest, CompletionWithoutVideoIdIsProtocolError)
{
	apiClient->chunkResponses = {Fake::status(201, R"({"kind": "youtube#video"})")};
	auto engine = makeEngine();

	EXPECT_EQ(kindOf([&] { (void)engine->upload(provider, source, content.size(), settings); }),
		  Retry::ErrorKind::FatalProtocol);
}

TEST_F(ResumableUploadEngineTest, CompletionWithNonJsonBodyIsProtocolError)
{
	apiClient->chunkResponses = {Fake::status(200, "<html>")};
	auto engine = makeEngine();

	EXPECT_EQ(kindOf([&] { (void)engine->upload(provider, source, content.size(), settings); }),
		  Retry::ErrorKind::FatalProtocol);
}

TEST_F(ResumableUploadEngineTest, AccessTokenIsRequestedBeforeEveryRequest)
{
	apiClient->chunkResponses = {Fake::incomplete(4), Fake::incomplete(8), Fake::completed("vid1")};
	auto engine = makeEngine(chunked(4));

	(void)engine->upload(provider, source, content.size(), settings);

	EXPECT_EQ(tokenRequests, 4);
	ASSERT_EQ(apiClient->startTokens.size(), 1u);
	EXPECT_EQ(apiClient->startTokens[0], "ya29.token-1");
	EXPECT_EQ(apiClient->chunkCalls[2].accessToken, "ya29.token-4");
}

TEST_F(ResumableUploadEngineTest, StopBeforeStartIsCancelled)
{
	std::stop_source stopSource;
	stopSource.request_stop();
	auto engine = makeEngine();

	EXPECT_EQ(kindOf([&] { (void)engine->upload(provider, source, content.size(), settings, stopSource.get_token()); }),
		  Retry::ErrorKind::Cancelled);
	EXPECT_TRUE(apiClient->startTokens.empty());
}

TEST_F(ResumableUploadEngineTest, StopBetweenChunksIsCancelled)
{
	std::stop_source stopSource;
	apiClient->chunkResponses = {Fake::incomplete(4), Fake::completed("vid1")};
	auto engine = makeEngine(chunked(4));

	EXPECT_EQ(kindOf([&] {
			  (void)engine->upload(provider, source, content.size(), settings, stopSource.get_token(),
					       [&stopSource](std::uint64_t, std::uint64_t) { stopSource.request_stop(); });
		  }),
		  Retry::ErrorKind::Cancelled);
	EXPECT_EQ(apiClient->chunkCalls.size(), 1u);
}

TEST_F(ResumableUploadEngineTest, InterruptedBackoffIsCancelled)
{
	apiClient->chunkResponses = {Fake::status(503)};
	auto engine = makeEngine();
	engine->setSleeper([](Retry::Seconds, std::stop_token) { return false; });

	EXPECT_EQ(kindOf([&] { (void)engine->upload(provider, source, content.size(), settings); }),
		  Retry::ErrorKind::Cancelled);
	EXPECT_EQ(apiClient->chunkCalls.size(), 1u);
}

TEST_F(ResumableUploadEngineTest, UploadFileReadsFromDisk)
{
	TestSupport::TemporaryDirectory tempDir;
	const auto path = tempDir.writeFile("video.mp4", "abcdef");
	apiClient->chunkResponses = {Fake::completed("vid2")};
	auto engine = makeEngine();

	const UploadResult result = engine->uploadFile(provider, path, settings);

	EXPECT_EQ(result.video.id, "vid2");
	EXPECT_EQ(result.bytes, 6u);
	ASSERT_EQ(apiClient->chunkCalls.size(), 1u);
	EXPECT_EQ(apiClient->chunkCalls[0].data, "abcdef");
}

TEST_F(ResumableUploadEngineTest, UploadFileRejectsMissingFile)
{
	TestSupport::TemporaryDirectory tempDir;
	auto engine = makeEngine();

	EXPECT_THROW((void)engine->uploadFile(provider, tempDir.path / "missing.mp4", settings), std::runtime_error);
	EXPECT_TRUE(apiClient->startTokens.empty());
}

TEST_F(ResumableUploadEngineTest, InvalidOptionsAreRejected)
{
	EXPECT_THROW((void)ResumableUploadEngine(apiClient, chunked(0)), std::invalid_argument);
	EXPECT_THROW((void)ResumableUploadEngine(apiClient, chunked(-1, -1)), std::invalid_argument);
	EXPECT_THROW((void)ResumableUploadEngine(nullptr), std::invalid_argument);
}
