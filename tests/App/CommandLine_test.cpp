/*
 * Tube Uploader - App Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include <TubeUploader/App/CommandLine.hpp>
#include <TubeUploader/App/ExitStatus.hpp>
#include <TubeUploader/TestSupport/TemporaryDirectory.hpp>

using namespace TubeUploader;
using namespace TubeUploader::App;

class CommandLineTest : public ::testing::Test {
protected:
	TestSupport::TemporaryDirectory tempDir;
	std::string videoPath;

	void SetUp() override { videoPath = tempDir.writeFile("video.mp4", "data").string(); }

	static CommandLineOptions parse(std::vector<std::string> args)
	{
		args.insert(args.begin(), "tube-uploader");
		std::vector<const char *> argv;
		for (const std::string &arg : args) {
			argv.push_back(arg.c_str());
		}
		return parseCommandLine(static_cast<int>(argv.size()), argv.data());
	}
};

TEST_F(CommandLineTest, DefaultsMatchDocumentedValues)
{
	const CommandLineOptions options = parse({"--videofile", videoPath});

	ASSERT_TRUE(options.videoFile.has_value());
	EXPECT_EQ(options.videoFile->string(), videoPath);
	EXPECT_EQ(options.title, "Test Title");
	EXPECT_EQ(options.description, "Test Description");
	EXPECT_EQ(options.category, "22");
	EXPECT_EQ(options.keywords, "");
	EXPECT_EQ(options.privacyStatus, "public");
	EXPECT_EQ(options.language, "en");
	EXPECT_EQ(options.license, "youtube");
	EXPECT_FALSE(options.latitude.has_value());
	EXPECT_FALSE(options.playlistId.has_value());
	EXPECT_FALSE(options.publicStatsViewable);
	EXPECT_FALSE(options.madeForKids);
	EXPECT_FALSE(options.noUpload);
	EXPECT_FALSE(options.forceRefresh);
	EXPECT_EQ(options.configFile.string(), "config.json");
}

TEST_F(CommandLineTest, ParsesEveryVideoOption)
{
	const std::string thumbnail = tempDir.writeFile("thumb.png", "png").string();
	const CommandLineOptions options =
		parse({"--videofile", videoPath, "--title", "My Video", "--description", "About", "--category", "10",
		       "--keywords", "a, b,,c ", "--privacyStatus", "unlisted", "--latitude=-33.86", "--longitude",
		       "151.2", "--language", "ja", "--defaultAudioLanguage", "ja", "--playlistId", "PL1", "--thumbnail",
		       thumbnail, "--license", "creativeCommon", "--publishAt", "2026-01-01T00:00:00Z",
		       "--publicStatsViewable", "--madeForKids", "--force-refresh", "--config", "other.json"});

	EXPECT_EQ(options.title, "My Video");
	EXPECT_EQ(options.privacyStatus, "unlisted");
	ASSERT_TRUE(options.latitude.has_value());
	EXPECT_DOUBLE_EQ(*options.latitude, -33.86);
	EXPECT_DOUBLE_EQ(*options.longitude, 151.2);
	EXPECT_EQ(options.playlistId, "PL1");
	EXPECT_EQ(options.license, "creativeCommon");
	EXPECT_EQ(options.publishAt, "2026-01-01T00:00:00Z");
	EXPECT_TRUE(options.publicStatsViewable);
	EXPECT_TRUE(options.madeForKids);
	EXPECT_TRUE(options.forceRefresh);
	EXPECT_EQ(options.configFile.string(), "other.json");

	const YouTubeApi::YouTubeVideoSettings settings = buildVideoSettings(options);
	EXPECT_EQ(settings.snippet.title, "My Video");
	EXPECT_EQ(settings.snippet.categoryId, "10");
	ASSERT_TRUE(settings.snippet.tags.has_value());
	EXPECT_EQ(*settings.snippet.tags, (std::vector<std::string>{"a", "b", "c"}));
	EXPECT_EQ(settings.snippet.defaultLanguage, "ja");
	EXPECT_EQ(settings.snippet.defaultAudioLanguage, "ja");
	EXPECT_EQ(settings.status.privacyStatus, "unlisted");
	EXPECT_TRUE(settings.status.selfDeclaredMadeForKids);
	EXPECT_TRUE(settings.status.publicStatsViewable);
	EXPECT_EQ(settings.status.publishAt, "2026-01-01T00:00:00Z");
	ASSERT_TRUE(settings.recordingDetails.has_value());
	EXPECT_DOUBLE_EQ(settings.recordingDetails->location.latitude, -33.86);

	const Uploader::PostUploadRequest request = buildPostUploadRequest(options);
	ASSERT_TRUE(request.thumbnailPath.has_value());
	EXPECT_EQ(request.thumbnailPath->string(), thumbnail);
	EXPECT_EQ(request.playlistId, "PL1");
}

TEST_F(CommandLineTest, DefaultSettingsOmitOptionalSections)
{
	const YouTubeApi::YouTubeVideoSettings settings = buildVideoSettings(parse({"--videofile", videoPath}));

	EXPECT_FALSE(settings.snippet.tags.has_value());
	EXPECT_EQ(settings.snippet.defaultLanguage, "en");
	EXPECT_FALSE(settings.snippet.defaultAudioLanguage.has_value());
	EXPECT_FALSE(settings.status.publishAt.has_value());
	EXPECT_FALSE(settings.recordingDetails.has_value());

	const Uploader::PostUploadRequest request = buildPostUploadRequest(parse({"--videofile", videoPath}));
	EXPECT_FALSE(request.thumbnailPath.has_value());
	EXPECT_FALSE(request.playlistId.has_value());
}

TEST_F(CommandLineTest, VideoFileIsRequiredUnlessNoUpload)
{
	EXPECT_THROW((void)parse({}), UsageError);
	EXPECT_THROW((void)parse({"--videofile", (tempDir.path / "missing.mp4").string()}), UsageError);

	const CommandLineOptions options = parse({"--no-upload"});
	EXPECT_TRUE(options.noUpload);
	EXPECT_FALSE(options.videoFile.has_value());
}

TEST_F(CommandLineTest, RejectsInvalidChoices)
{
	EXPECT_THROW((void)parse({"--videofile", videoPath, "--privacyStatus", "secret"}), UsageError);
	EXPECT_THROW((void)parse({"--videofile", videoPath, "--license", "gpl"}), UsageError);
	EXPECT_THROW((void)parse({"--videofile", videoPath, "--thumbnail", (tempDir.path / "none.png").string()}),
		     UsageError);
}

TEST_F(CommandLineTest, LocationNeedsBothCoordinatesInRange)
{
	EXPECT_THROW((void)parse({"--videofile", videoPath, "--latitude", "10"}), UsageError);
	EXPECT_THROW((void)parse({"--videofile", videoPath, "--latitude", "91", "--longitude", "0"}), UsageError);
	EXPECT_THROW((void)parse({"--videofile", videoPath, "--latitude", "0", "--longitude", "181"}), UsageError);
}

TEST_F(CommandLineTest, MalformedArgumentsAreUsageErrors)
{
	EXPECT_THROW((void)parse({"--videofile", videoPath, "--latitude", "north", "--longitude", "0"}), UsageError);
	EXPECT_THROW((void)parse({"--no-such-option"}), UsageError);
	EXPECT_THROW((void)parse({"--title"}), UsageError);
}

TEST_F(CommandLineTest, HelpSkipsValidation)
{
	const CommandLineOptions options = parse({"--help", "--privacyStatus", "secret"});
	EXPECT_TRUE(options.help);

	std::ostringstream os;
	printUsage(os, "tube-uploader");
	EXPECT_NE(os.str().find("--videofile"), std::string::npos);
	EXPECT_NE(os.str().find("--no-upload"), std::string::npos);
}
