/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUploader GoogleAuth Library
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

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

#include <TubeUploader/Logger/ILogger.hpp>
#include <TubeUploader/Retry/Backoff.hpp>

#include "GoogleAuthManager.hpp"
#include "GoogleOAuth2Flow.hpp"
#include "GoogleTokenState.hpp"
#include "GoogleTokenStore.hpp"

namespace TubeUploader::GoogleAuth {

struct GoogleCredentialManagerOptions {
	std::chrono::seconds refreshMargin{300};
	int maxRefreshAttempts = 3;
	bool forceRefresh = false;
	/** Lifetime assumed when the token endpoint omits expires_in. */
	std::chrono::seconds defaultTokenLifetime{3600};
	std::string redirectUri = "urn:ietf:wg:oauth:2.0:oob";
};

/**
 * Keeps one credential valid: loads it from the store, refreshes it when it
 * is about to expire and falls back to the interactive authorization flow
 * when it cannot be refreshed. Every change is persisted before it is
 * returned.
 *
 * Fatal outcomes are reported as Retry::ClassifiedError with
 * ErrorKind::FatalAuth or ErrorKind::Cancelled.
 */
class GoogleCredentialManager {
public:
	/** Shows the authorization URL and returns the code the operator pasted. */
	using AuthorizationCodePrompt = std::function<std::string(const std::string &authorizationUrl)>;
	using Clock = std::function<std::chrono::system_clock::time_point()>;

	GoogleCredentialManager(std::shared_ptr<const GoogleAuthManager> authManager,
				std::shared_ptr<const GoogleOAuth2Flow> oauth2Flow,
				std::shared_ptr<const GoogleTokenStore> tokenStore,
				AuthorizationCodePrompt authorizationCodePrompt,
				GoogleCredentialManagerOptions options = {});

	~GoogleCredentialManager() noexcept;

	GoogleCredentialManager(const GoogleCredentialManager &) = delete;
	GoogleCredentialManager &operator=(const GoogleCredentialManager &) = delete;
	GoogleCredentialManager(GoogleCredentialManager &&) = delete;
	GoogleCredentialManager &operator=(GoogleCredentialManager &&) = delete;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger);
	void setSleeper(Retry::Sleeper sleeper);
	void setRandom(Retry::UniformRandom random);
	void setClock(Clock clock);

	/** Returns a credential valid for `scopes`, authorizing interactively if needed. */
	[[nodiscard]]
	GoogleTokenState obtainCredential(std::span<const std::string> scopes, std::stop_token stopToken = {});

	/**
	 * Returns the access token of the credential obtained last, refreshing it
	 * first when it is within the refresh margin. Never prompts.
	 */
	[[nodiscard]]
	std::string currentAccessToken(std::stop_token stopToken = {});

	[[nodiscard]]
	bool shouldRefresh(const GoogleTokenState &tokenState, std::chrono::system_clock::time_point now) const;

	[[nodiscard]]
	const GoogleCredentialManagerOptions &options() const noexcept
	{
		return options_;
	}

private:
	[[nodiscard]]
	bool isWithinMargin(const GoogleTokenState &tokenState, std::chrono::system_clock::time_point now) const;

	[[nodiscard]]
	std::optional<GoogleTokenState> loadStoredState(std::span<const std::string> scopes) const;

	[[nodiscard]]
	std::optional<GoogleTokenState> refreshWithRetry(const GoogleTokenState &tokenState,
							 const std::stop_token &stopToken) const;

	[[nodiscard]]
	GoogleTokenState authorizeInteractively(std::span<const std::string> scopes) const;

	void discardStoredState() const;

	const std::shared_ptr<const GoogleAuthManager> authManager_;
	const std::shared_ptr<const GoogleOAuth2Flow> oauth2Flow_;
	const std::shared_ptr<const GoogleTokenStore> tokenStore_;
	const AuthorizationCodePrompt authorizationCodePrompt_;
	const GoogleCredentialManagerOptions options_;

	std::shared_ptr<const Logger::ILogger> logger_;
	Retry::Sleeper sleeper_;
	Retry::UniformRandom random_;
	Clock clock_;

	std::optional<GoogleTokenState> current_;
};

} // namespace TubeUploader::GoogleAuth
