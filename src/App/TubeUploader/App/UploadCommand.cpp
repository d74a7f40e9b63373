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

#include "UploadCommand.hpp"

#include <chrono>
#include <filesystem>

#include <fmt/format.h>

#include <TubeUploader/CurlHelper/CurlHandle.hpp>
#include <TubeUploader/GoogleAuth/GoogleAuthManager.hpp>
#include <TubeUploader/GoogleAuth/GoogleCredentialManager.hpp>
#include <TubeUploader/GoogleAuth/GoogleOAuth2ClientCredentials.hpp>
#include <TubeUploader/GoogleAuth/GoogleOAuth2Flow.hpp>
#include <TubeUploader/GoogleAuth/GoogleTokenStore.hpp>
#include <TubeUploader/Uploader/PostUploadActions.hpp>
#include <TubeUploader/Uploader/ResumableUploadEngine.hpp>
#include <TubeUploader/YouTubeApi/YouTubeApiClient.hpp>

#include "ExitStatus.hpp"
#include "TerminalCodePrompt.hpp"

namespace TubeUploader::App {

void runUploadCommand(const CommandLineOptions &options, const UploaderConfig &config,
		      const std::shared_ptr<const Logger::ILogger> &logger, std::stop_token stopToken,
		      std::istream &in, std::ostream &out)
{
	using namespace GoogleAuth;

	if (!std::filesystem::is_regular_file(config.clientSecretsFile)) {
		throw UsageError(fmt::format("ClientSecretsNotFoundError: {}", config.clientSecretsFile.string()));
	}
	const GoogleOAuth2ClientCredentials clientCredentials = loadClientSecretsFile(config.clientSecretsFile);

	auto curl = std::make_shared<CurlHelper::CurlHandle>();

	auto authManager = std::make_shared<GoogleAuthManager>(curl, clientCredentials, logger);
	auto oauth2Flow = std::make_shared<GoogleOAuth2Flow>(curl, clientCredentials, logger);
	auto tokenStore = std::make_shared<GoogleTokenStore>(config.tokenStorageFile);
	tokenStore->setLogger(logger);

	GoogleCredentialManagerOptions credentialOptions;
	credentialOptions.refreshMargin = std::chrono::seconds(config.refreshMarginSeconds);
	credentialOptions.maxRefreshAttempts = config.maxRefreshAttempts;
	credentialOptions.forceRefresh = options.forceRefresh;
	credentialOptions.redirectUri = config.redirectUri;

	GoogleCredentialManager credentialManager(authManager, oauth2Flow, tokenStore, TerminalCodePrompt(in, out),
						  credentialOptions);
	credentialManager.setLogger(logger);

	const GoogleTokenState tokenState = credentialManager.obtainCredential(config.scopes, stopToken);
	if (const auto remaining = tokenState.timeToExpiry(std::chrono::system_clock::now())) {
		logger->info("AccessTokenValid", {{"remainingSeconds", std::to_string(remaining->count())}});
	}

	if (options.noUpload) {
		out << "Authentication completed. No video uploaded." << std::endl;
		return;
	}

	auto apiClient = std::make_shared<YouTubeApi::YouTubeApiClient>(curl);
	apiClient->setLogger(logger);

	Uploader::ResumableUploadOptions uploadOptions;
	uploadOptions.maxRetries = config.maxUploadRetries;
	uploadOptions.chunkSize = config.chunkSize;

	Uploader::ResumableUploadEngine engine(apiClient, uploadOptions);
	engine.setLogger(logger);

	const Uploader::AccessTokenProvider accessTokenProvider = [&credentialManager, stopToken] {
		return credentialManager.currentAccessToken(stopToken);
	};

	const Uploader::UploadResult result = engine.uploadFile(
		accessTokenProvider, *options.videoFile, buildVideoSettings(options), stopToken,
		[&out](std::uint64_t acknowledgedBytes, std::uint64_t totalBytes) {
			const double percent =
				totalBytes == 0 ? 100.0 : 100.0 * static_cast<double>(acknowledgedBytes) / totalBytes;
			out << fmt::format("Uploaded {} of {} bytes ({:.1f}%)", acknowledgedBytes, totalBytes, percent)
			    << std::endl;
		});

	out << fmt::format("Video id '{}' was successfully uploaded.", result.video.id) << std::endl;

	const Uploader::PostUploadRequest postUploadRequest = buildPostUploadRequest(options);
	Uploader::PostUploadActions postUploadActions(apiClient);
	postUploadActions.setLogger(logger);

	const Uploader::PostUploadReport report =
		postUploadActions.run(accessTokenProvider, result.video.id, postUploadRequest);
	for (const Uploader::PostUploadActionOutcome &outcome : report.outcomes) {
		if (outcome.succeeded) {
			out << fmt::format("{}: done", outcome.action) << std::endl;
		} else {
			out << fmt::format("{}: failed: {}", outcome.action, outcome.message) << std::endl;
		}
	}
}

} // namespace TubeUploader::App
