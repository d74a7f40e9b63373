/*
 * Tube Uploader - YouTubeApi Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <TubeUploader/YouTubeApi/YouTubeApiClient.hpp>
#include <TubeUploader/YouTubeApi/YouTubeTypes.hpp>

using namespace TubeUploader::YouTubeApi;

TEST(YouTubeVideoSettingsTest, MinimalBodyCarriesSnippetAndStatus)
{
	YouTubeVideoSettings settings;
	settings.snippet.title = "Test Title";
	settings.snippet.description = "Test Description";
	settings.snippet.categoryId = "22";

	const nlohmann::json j = settings;

	EXPECT_EQ(settings.part(), "snippet,status");
	EXPECT_EQ(j["snippet"]["title"], "Test Title");
	EXPECT_EQ(j["snippet"]["description"], "Test Description");
	EXPECT_EQ(j["snippet"]["categoryId"], "22");
	EXPECT_FALSE(j["snippet"].contains("tags"));
	EXPECT_FALSE(j["snippet"].contains("defaultLanguage"));
	EXPECT_EQ(j["status"]["privacyStatus"], "public");
	EXPECT_EQ(j["status"]["license"], "youtube");
	EXPECT_EQ(j["status"]["selfDeclaredMadeForKids"], false);
	EXPECT_EQ(j["status"]["publicStatsViewable"], false);
	EXPECT_FALSE(j["status"].contains("publishAt"));
	EXPECT_FALSE(j.contains("recordingDetails"));
}

TEST(YouTubeVideoSettingsTest, OptionalFieldsAppearWhenSet)
{
	YouTubeVideoSettings settings;
	settings.snippet.title = "t";
	settings.snippet.tags = std::vector<std::string>{"a", "b"};
	settings.snippet.defaultLanguage = "en";
	settings.snippet.defaultAudioLanguage = "ja";
	settings.status.privacyStatus = "private";
	settings.status.publishAt = "2026-01-01T00:00:00Z";
	settings.recordingDetails = YouTubeVideoSettings::RecordingDetails{{35.6, 139.7}};

	const nlohmann::json j = settings;

	EXPECT_EQ(settings.part(), "snippet,status,recordingDetails");
	EXPECT_EQ(j["snippet"]["tags"], nlohmann::json::array({"a", "b"}));
	EXPECT_EQ(j["snippet"]["defaultLanguage"], "en");
	EXPECT_EQ(j["snippet"]["defaultAudioLanguage"], "ja");
	EXPECT_EQ(j["status"]["privacyStatus"], "private");
	EXPECT_EQ(j["status"]["publishAt"], "2026-01-01T00:00:00Z");
	EXPECT_DOUBLE_EQ(j["recordingDetails"]["location"]["latitude"].get<double>(), 35.6);
	EXPECT_DOUBLE_EQ(j["recordingDetails"]["location"]["longitude"].get<double>(), 139.7);
}

TEST(YouTubeVideoTest, ParsesCompletedUploadWithOnlyId)
{
	const YouTubeVideo video = nlohmann::json::parse(R"({"id": "dQw4w9WgXcQ"})").get<YouTubeVideo>();
	EXPECT_EQ(video.id, "dQw4w9WgXcQ");
	EXPECT_TRUE(video.snippet.title.empty());
}

TEST(YouTubeVideoTest, ParsesFullResource)
{
	const YouTubeVideo video = nlohmann::json::parse(R"({
		"kind": "youtube#video",
		"etag": "e",
		"id": "abc",
		"snippet": {"title": "T", "channelId": "UC1", "publishedAt": "2026-01-01T00:00:00Z"},
		"status": {"uploadStatus": "uploaded", "privacyStatus": "unlisted"}
	})")
					   .get<YouTubeVideo>();
	EXPECT_EQ(video.kind, "youtube#video");
	EXPECT_EQ(video.snippet.title, "T");
	EXPECT_EQ(video.snippet.channelId, "UC1");
	EXPECT_EQ(video.status.uploadStatus, "uploaded");
	EXPECT_EQ(video.status.privacyStatus, "unlisted");
}

TEST(YouTubeVideoTest, MissingIdIsRejected)
{
	EXPECT_THROW((void)nlohmann::json::parse(R"({"kind": "youtube#video"})").get<YouTubeVideo>(),
		     nlohmann::json::exception);
}

TEST(YouTubePlaylistItemTest, ParsesInsertResponse)
{
	const YouTubePlaylistItem item = nlohmann::json::parse(R"({
		"kind": "youtube#playlistItem",
		"id": "PLI1",
		"snippet": {
			"playlistId": "PL1",
			"position": 3,
			"resourceId": {"kind": "youtube#video", "videoId": "abc"}
		}
	})")
						 .get<YouTubePlaylistItem>();
	EXPECT_EQ(item.id, "PLI1");
	EXPECT_EQ(item.snippet.playlistId, "PL1");
	ASSERT_TRUE(item.snippet.position.has_value());
	EXPECT_EQ(*item.snippet.position, 3u);
	EXPECT_EQ(item.snippet.resourceId.videoId, "abc");
}

TEST(ParseCommittedBytesTest, ParsesInclusiveLastByte)
{
	EXPECT_EQ(parseCommittedBytes("bytes=0-0"), 1u);
	EXPECT_EQ(parseCommittedBytes("bytes=0-262143"), 262144u);
}

TEST(ParseCommittedBytesTest, RejectsOtherShapes)
{
	EXPECT_FALSE(parseCommittedBytes("").has_value());
	EXPECT_FALSE(parseCommittedBytes("bytes=0-").has_value());
	EXPECT_FALSE(parseCommittedBytes("bytes=10-20").has_value());
	EXPECT_FALSE(parseCommittedBytes("bytes=0-12x").has_value());
	EXPECT_FALSE(parseCommittedBytes("0-12").has_value());
}
