/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUploader App Library
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

#include "CommandLine.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include "ExitStatus.hpp"

namespace po = boost::program_options;

namespace TubeUploader::App {

namespace {

constexpr std::array kValidPrivacyStatuses{"public", "private", "unlisted"};
constexpr std::array kValidLicenses{"youtube", "creativeCommon"};

po::options_description createVideoOptionsDesc()
{
	po::options_description desc("Video options");
	desc.add_options()("videofile", po::value<std::string>(), "Video file to upload");
	desc.add_options()("title", po::value<std::string>()->default_value("Test Title"), "Video title");
	desc.add_options()("description", po::value<std::string>()->default_value("Test Description"),
			   "Video description");
	desc.add_options()("category", po::value<std::string>()->default_value("22"), "Numeric video category");
	desc.add_options()("keywords", po::value<std::string>()->default_value(""), "Video keywords, comma separated");
	desc.add_options()("privacyStatus", po::value<std::string>()->default_value("public"),
			   "Video privacy status: public, private or unlisted");
	desc.add_options()("latitude", po::value<double>(), "Latitude of the video location");
	desc.add_options()("longitude", po::value<double>(), "Longitude of the video location");
	desc.add_options()("language", po::value<std::string>()->default_value("en"), "Language of the video");
	desc.add_options()("defaultAudioLanguage", po::value<std::string>(), "Default audio language of the video");
	desc.add_options()("playlistId", po::value<std::string>(), "ID of the playlist to add the video to");
	desc.add_options()("thumbnail", po::value<std::string>(), "Thumbnail image file (PNG or JPEG, 2 MiB max)");
	desc.add_options()("license", po::value<std::string>()->default_value("youtube"),
			   "License of the video: youtube or creativeCommon");
	desc.add_options()("publishAt", po::value<std::string>(), "ISO 8601 timestamp to publish a private video at");
	desc.add_options()("publicStatsViewable", po::bool_switch(), "Make the video statistics public");
	desc.add_options()("madeForKids", po::bool_switch(), "Declare the video as made for kids");
	return desc;
}

po::options_description createGeneralOptionsDesc()
{
	po::options_description desc("Authentication and general options");
	desc.add_options()("no-upload", po::bool_switch(), "Only authenticate, do not upload a video");
	desc.add_options()("force-refresh", po::bool_switch(), "Refresh the stored access token even if still valid");
	desc.add_options()("config", po::value<std::string>()->default_value("config.json"), "Configuration file");
	desc.add_options()("verbose", po::bool_switch(), "Log debug messages");
	desc.add_options()("help", "Show this help");
	return desc;
}

po::options_description createOptionsDesc()
{
	po::options_description desc;
	desc.add(createVideoOptionsDesc()).add(createGeneralOptionsDesc());
	return desc;
}

template<std::size_t N>
bool isOneOf(const std::string &value, const std::array<const char *, N> &choices)
{
	return std::any_of(choices.begin(), choices.end(), [&value](const char *choice) { return value == choice; });
}

template<typename T> std::optional<T> optionalValue(const po::variables_map &vm, const char *key)
{
	if (vm.count(key) == 0) {
		return std::nullopt;
	}
	return vm[key].as<T>();
}

std::string trimmed(std::string_view s)
{
	const auto begin = s.find_first_not_of(" \t");
	if (begin == std::string_view::npos) {
		return {};
	}
	const auto end = s.find_last_not_of(" \t");
	return std::string(s.substr(begin, end - begin + 1));
}

std::vector<std::string> splitKeywords(std::string_view keywords)
{
	std::vector<std::string> tags;
	while (!keywords.empty()) {
		const std::size_t comma = keywords.find(',');
		std::string tag = trimmed(keywords.substr(0, comma));
		if (!tag.empty()) {
			tags.push_back(std::move(tag));
		}
		if (comma == std::string_view::npos) {
			break;
		}
		keywords.remove_prefix(comma + 1);
	}
	return tags;
}

void validate(const CommandLineOptions &options)
{
	if (!isOneOf(options.privacyStatus, kValidPrivacyStatuses)) {
		throw UsageError(fmt::format("InvalidPrivacyStatusError: {}", options.privacyStatus));
	}
	if (!isOneOf(options.license, kValidLicenses)) {
		throw UsageError(fmt::format("InvalidLicenseError: {}", options.license));
	}
	if (options.latitude.has_value() != options.longitude.has_value()) {
		throw UsageError("LocationIncompleteError: --latitude and --longitude must be given together");
	}
	if (options.latitude.has_value() && (*options.latitude < -90.0 || *options.latitude > 90.0)) {
		throw UsageError("InvalidLatitudeError: must be within [-90, 90]");
	}
	if (options.longitude.has_value() && (*options.longitude < -180.0 || *options.longitude > 180.0)) {
		throw UsageError("InvalidLongitudeError: must be within [-180, 180]");
	}

	if (options.noUpload) {
		return;
	}

	if (!options.videoFile.has_value() || options.videoFile->empty()) {
		throw UsageError("VideoFileMissingError: specify --videofile unless --no-upload is given");
	}
	if (!std::filesystem::is_regular_file(*options.videoFile)) {
		throw UsageError(fmt::format("VideoFileNotFoundError: {}", options.videoFile->string()));
	}
	if (options.thumbnail.has_value() && !std::filesystem::is_regular_file(*options.thumbnail)) {
		throw UsageError(fmt::format("ThumbnailNotFoundError: {}", options.thumbnail->string()));
	}
}

} // anonymous namespace

CommandLineOptions parseCommandLine(int argc, const char *const argv[])
{
	po::variables_map vm;
	try {
		po::store(po::parse_command_line(argc, argv, createOptionsDesc()), vm);
		po::notify(vm);
	} catch (const po::error &e) {
		throw UsageError(fmt::format("CommandLineError: {}", e.what()));
	}

	CommandLineOptions options;
	if (vm.count("help") != 0) {
		options.help = true;
		return options;
	}

	if (auto videoFile = optionalValue<std::string>(vm, "videofile")) {
		options.videoFile = std::filesystem::path(*videoFile);
	}
	options.title = vm["title"].as<std::string>();
	options.description = vm["description"].as<std::string>();
	options.category = vm["category"].as<std::string>();
	options.keywords = vm["keywords"].as<std::string>();
	options.privacyStatus = vm["privacyStatus"].as<std::string>();
	options.latitude = optionalValue<double>(vm, "latitude");
	options.longitude = optionalValue<double>(vm, "longitude");
	options.language = vm["language"].as<std::string>();
	options.defaultAudioLanguage = optionalValue<std::string>(vm, "defaultAudioLanguage");
	options.playlistId = optionalValue<std::string>(vm, "playlistId");
	if (auto thumbnail = optionalValue<std::string>(vm, "thumbnail")) {
		options.thumbnail = std::filesystem::path(*thumbnail);
	}
	options.license = vm["license"].as<std::string>();
	options.publishAt = optionalValue<std::string>(vm, "publishAt");
	options.publicStatsViewable = vm["publicStatsViewable"].as<bool>();
	options.madeForKids = vm["madeForKids"].as<bool>();

	options.noUpload = vm["no-upload"].as<bool>();
	options.forceRefresh = vm["force-refresh"].as<bool>();
	options.configFile = vm["config"].as<std::string>();
	options.verbose = vm["verbose"].as<bool>();

	validate(options);
	return options;
}

void printUsage(std::ostream &os, std::string_view programName)
{
	os << "Usage: " << programName << " --videofile FILE [options]\n"
	   << "       " << programName << " --no-upload [options]\n"
	   << createOptionsDesc() << '\n';
}

YouTubeApi::YouTubeVideoSettings buildVideoSettings(const CommandLineOptions &options)
{
	YouTubeApi::YouTubeVideoSettings settings;

	settings.snippet.title = options.title;
	settings.snippet.description = options.description;
	settings.snippet.categoryId = options.category;
	if (std::vector<std::string> tags = splitKeywords(options.keywords); !tags.empty()) {
		settings.snippet.tags = std::move(tags);
	}
	if (!options.language.empty()) {
		settings.snippet.defaultLanguage = options.language;
	}
	if (options.defaultAudioLanguage.has_value() && !options.defaultAudioLanguage->empty()) {
		settings.snippet.defaultAudioLanguage = options.defaultAudioLanguage;
	}

	settings.status.privacyStatus = options.privacyStatus;
	settings.status.selfDeclaredMadeForKids = options.madeForKids;
	settings.status.license = options.license;
	settings.status.publicStatsViewable = options.publicStatsViewable;
	if (options.publishAt.has_value() && !options.publishAt->empty()) {
		settings.status.publishAt = options.publishAt;
	}

	if (options.latitude.has_value() && options.longitude.has_value()) {
		YouTubeApi::YouTubeVideoSettings::RecordingDetails recordingDetails;
		recordingDetails.location.latitude = *options.latitude;
		recordingDetails.location.longitude = *options.longitude;
		settings.recordingDetails = recordingDetails;
	}

	return settings;
}

Uploader::PostUploadRequest buildPostUploadRequest(const CommandLineOptions &options)
{
	Uploader::PostUploadRequest request;
	if (options.thumbnail.has_value() && !options.thumbnail->empty()) {
		request.thumbnailPath = options.thumbnail;
	}
	if (options.playlistId.has_value() && !options.playlistId->empty()) {
		request.playlistId = options.playlistId;
	}
	return request;
}

} // namespace TubeUploader::App
