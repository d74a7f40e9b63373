/*
 * Tube Uploader - YouTubeApi Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include <TubeUploader/CurlHelper/CurlHandle.hpp>
#include <TubeUploader/TestSupport/TemporaryDirectory.hpp>
#include <TubeUploader/YouTubeApi/YouTubeApiClient.hpp>

using namespace TubeUploader;

class YouTubeApiClientTest : public ::testing::Test {
protected:
	TestSupport::TemporaryDirectory tempDir;
	YouTubeApi::YouTubeApiClient client{std::make_shared<CurlHelper::CurlHandle>()};
};

TEST_F(YouTubeApiClientTest, NullCurlIsRejected)
{
	EXPECT_THROW((void)YouTubeApi::YouTubeApiClient(nullptr), std::invalid_argument);
}

TEST_F(YouTubeApiClientTest, ThumbnailMustExist)
{
	EXPECT_THROW(client.setThumbnail("token", "abc", tempDir.path / "missing.png"), std::invalid_argument);
}

TEST_F(YouTubeApiClientTest, ThumbnailOverLimitIsRejectedBeforeUpload)
{
	const auto path = tempDir.writeFile("big.jpg", std::string(YouTubeApi::kMaxThumbnailBytes + 1, 'x'));
	EXPECT_THROW(client.setThumbnail("token", "abc", path), std::invalid_argument);
}

TEST_F(YouTubeApiClientTest, ThumbnailNeedsTokenAndVideoId)
{
	const auto path = tempDir.writeFile("thumb.png", "png");
	EXPECT_THROW(client.setThumbnail("", "abc", path), std::invalid_argument);
	EXPECT_THROW(client.setThumbnail("token", "", path), std::invalid_argument);
}
