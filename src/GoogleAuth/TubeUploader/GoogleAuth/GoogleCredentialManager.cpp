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

#include "GoogleCredentialManager.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include <TubeUploader/Logger/NullLogger.hpp>
#include <TubeUploader/Retry/ClassifiedError.hpp>

#include "GoogleAuthError.hpp"

namespace TubeUploader::GoogleAuth {

namespace {

std::string trimmed(const std::string &s)
{
	const auto begin = s.find_first_not_of(" \t\r\n");
	if (begin == std::string::npos) {
		return {};
	}
	const auto end = s.find_last_not_of(" \t\r\n");
	return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

GoogleCredentialManager::GoogleCredentialManager(std::shared_ptr<const GoogleAuthManager> authManager,
						 std::shared_ptr<const GoogleOAuth2Flow> oauth2Flow,
						 std::shared_ptr<const GoogleTokenStore> tokenStore,
						 AuthorizationCodePrompt authorizationCodePrompt,
						 GoogleCredentialManagerOptions options)
	: authManager_(authManager ? std::move(authManager)
				   : throw std::invalid_argument("AuthManagerIsNullError(GoogleCredentialManager)")),
	  oauth2Flow_(oauth2Flow ? std::move(oauth2Flow)
				 : throw std::invalid_argument("OAuth2FlowIsNullError(GoogleCredentialManager)")),
	  tokenStore_(tokenStore ? std::move(tokenStore)
				 : throw std::invalid_argument("TokenStoreIsNullError(GoogleCredentialManager)")),
	  authorizationCodePrompt_(authorizationCodePrompt
					   ? std::move(authorizationCodePrompt)
					   : throw std::invalid_argument("PromptIsNullError(GoogleCredentialManager)")),
	  options_(options.maxRefreshAttempts >= 1
			   ? std::move(options)
			   : throw std::invalid_argument("MaxRefreshAttemptsError(GoogleCredentialManager)")),
	  logger_(Logger::NullLogger::instance()),
	  sleeper_(Retry::makeInterruptibleSleeper()),
	  random_(Retry::makeUniformRandom()),
	  clock_([] { return std::chrono::system_clock::now(); })
{
}

GoogleCredentialManager::~GoogleCredentialManager() noexcept = default;

void GoogleCredentialManager::setLogger(std::shared_ptr<const Logger::ILogger> logger)
{
	logger_ = logger ? std::move(logger) : Logger::NullLogger::instance();
}

void GoogleCredentialManager::setSleeper(Retry::Sleeper sleeper)
{
	if (!sleeper) {
		throw std::invalid_argument("SleeperIsNullError(GoogleCredentialManager::setSleeper)");
	}
	sleeper_ = std::move(sleeper);
}

void GoogleCredentialManager::setRandom(Retry::UniformRandom random)
{
	if (!random) {
		throw std::invalid_argument("RandomIsNullError(GoogleCredentialManager::setRandom)");
	}
	random_ = std::move(random);
}

void GoogleCredentialManager::setClock(Clock clock)
{
	if (!clock) {
		throw std::invalid_argument("ClockIsNullError(GoogleCredentialManager::setClock)");
	}
	clock_ = std::move(clock);
}

bool GoogleCredentialManager::isWithinMargin(const GoogleTokenState &tokenState,
					     std::chrono::system_clock::time_point now) const
{
	const auto remaining = tokenState.timeToExpiry(now);
	return !remaining.has_value() || *remaining < options_.refreshMargin;
}

bool GoogleCredentialManager::shouldRefresh(const GoogleTokenState &tokenState,
					    std::chrono::system_clock::time_point now) const
{
	return options_.forceRefresh || isWithinMargin(tokenState, now);
}

GoogleTokenState GoogleCredentialManager::obtainCredential(std::span<const std::string> scopes,
							   std::stop_token stopToken)
{
	std::optional<GoogleTokenState> tokenState = loadStoredState(scopes);

	if (tokenState.has_value() && shouldRefresh(*tokenState, clock_())) {
		if (tokenState->isAuthorized()) {
			logger_->info("GoogleCredentialRefreshRequired",
				      {{"forceRefresh", options_.forceRefresh ? "true" : "false"}});
			tokenState = refreshWithRetry(*tokenState, stopToken);
			if (tokenState.has_value()) {
				tokenStore_->save(*tokenState);
			} else {
				discardStoredState();
			}
		} else if (isWithinMargin(*tokenState, clock_())) {
			logger_->warn("GoogleCredentialNotRefreshable");
			discardStoredState();
			tokenState.reset();
		}
	}

	if (!tokenState.has_value()) {
		if (stopToken.stop_requested()) {
			throw Retry::ClassifiedError(Retry::ErrorKind::Cancelled,
						     "Cancelled(GoogleCredentialManager::obtainCredential)");
		}
		tokenState = authorizeInteractively(scopes);
		tokenStore_->save(*tokenState);
	}

	logger_->info("GoogleCredentialReady", {{"accessToken", redactSecret(tokenState->access_token)}});
	current_ = tokenState;
	return *tokenState;
}

std::string GoogleCredentialManager::currentAccessToken(std::stop_token stopToken)
{
	if (!current_.has_value()) {
		throw Retry::ClassifiedError(Retry::ErrorKind::FatalAuth,
					     "NoCredentialError(GoogleCredentialManager::currentAccessToken)");
	}

	if (!isWithinMargin(*current_, clock_())) {
		return current_->access_token;
	}

	if (!current_->isAuthorized()) {
		if (current_->isExpired(clock_()) || !current_->expires_at.has_value()) {
			logger_->error("GoogleCredentialExpiredWithoutRefreshToken");
			discardStoredState();
			current_.reset();
			throw Retry::ClassifiedError(Retry::ErrorKind::FatalAuth,
						     "CredentialExpiredError(GoogleCredentialManager::currentAccessToken)");
		}
		return current_->access_token;
	}

	logger_->info("GoogleCredentialRefreshingMidOperation");
	std::optional<GoogleTokenState> refreshed = refreshWithRetry(*current_, stopToken);
	if (!refreshed.has_value()) {
		discardStoredState();
		current_.reset();
		throw Retry::ClassifiedError(Retry::ErrorKind::FatalAuth,
					     "RefreshFailedError(GoogleCredentialManager::currentAccessToken)");
	}

	tokenStore_->save(*refreshed);
	current_ = std::move(refreshed);
	return current_->access_token;
}

std::optional<GoogleTokenState> GoogleCredentialManager::loadStoredState(std::span<const std::string> scopes) const
{
	std::optional<GoogleTokenState> tokenState;
	try {
		tokenState = tokenStore_->load();
	} catch (const Retry::ClassifiedError &e) {
		if (e.kind() != Retry::ErrorKind::DataIntegrity) {
			throw;
		}
		logger_->logException(e, "GoogleTokenStoreCorrupt");
		discardStoredState();
		return std::nullopt;
	}

	if (!tokenState.has_value()) {
		return std::nullopt;
	}

	const std::string &configuredClientId = authManager_->clientCredentials().client_id;
	if (!tokenState->client_id.empty() && tokenState->client_id != configuredClientId) {
		logger_->warn("GoogleCredentialClientMismatch");
		discardStoredState();
		return std::nullopt;
	}

	if (!tokenState->coversScopes(scopes)) {
		logger_->warn("GoogleCredentialScopeMismatch", {{"granted", joinScopes(tokenState->scopes)}});
		discardStoredState();
		return std::nullopt;
	}

	return tokenState;
}

std::optional<GoogleTokenState> GoogleCredentialManager::refreshWithRetry(const GoogleTokenState &tokenState,
									  const std::stop_token &stopToken) const
{
	for (int attempt = 1; attempt <= options_.maxRefreshAttempts; ++attempt) {
		if (stopToken.stop_requested()) {
			throw Retry::ClassifiedError(Retry::ErrorKind::Cancelled,
						     "Cancelled(GoogleCredentialManager::refreshWithRetry)");
		}

		try {
			const GoogleAuthResponse response = authManager_->fetchFreshAuthResponse(tokenState.refresh_token);
			GoogleTokenState refreshed =
				tokenState.withUpdatedAuthResponse(response, clock_(), options_.defaultTokenLifetime);
			refreshed.client_id = authManager_->clientCredentials().client_id;
			refreshed.client_secret = authManager_->clientCredentials().client_secret;
			refreshed.token_uri = authManager_->clientCredentials().token_uri;
			logger_->info("GoogleCredentialRefreshed", {{"attempt", std::to_string(attempt)}});
			return refreshed;
		} catch (const GoogleAuthError &e) {
			logger_->warn("GoogleCredentialRefreshFailed", {{"attempt", std::to_string(attempt)},
									{"kind", toString(e.kind())},
									{"exception", e.what()}});
		}

		if (attempt < options_.maxRefreshAttempts) {
			const Retry::Seconds delay = Retry::additiveJitterBackoff(attempt, random_);
			logger_->info("GoogleCredentialRefreshBackoff", {{"seconds", fmt::format("{:.3f}", delay.count())}});
			if (!sleeper_(delay, stopToken)) {
				throw Retry::ClassifiedError(Retry::ErrorKind::Cancelled,
							     "Cancelled(GoogleCredentialManager::refreshWithRetry)");
			}
		}
	}

	logger_->error("GoogleCredentialRefreshExhausted",
		       {{"maxRefreshAttempts", std::to_string(options_.maxRefreshAttempts)}});
	return std::nullopt;
}

GoogleTokenState GoogleCredentialManager::authorizeInteractively(std::span<const std::string> scopes) const
{
	const std::string url = oauth2Flow_->getAuthorizationUrl(options_.redirectUri, scopes);
	logger_->info("GoogleOAuth2AuthorizationRequired");

	const std::string code = trimmed(authorizationCodePrompt_(url));
	if (code.empty()) {
		logger_->error("AuthorizationCodeIsEmptyError");
		throw Retry::ClassifiedError(Retry::ErrorKind::FatalAuth,
					     "AuthorizationCodeIsEmptyError(GoogleCredentialManager)");
	}

	GoogleAuthResponse response;
	try {
		response = oauth2Flow_->exchangeCode(code, options_.redirectUri);
	} catch (const GoogleAuthError &e) {
		logger_->logException(e, "GoogleOAuth2ExchangeFailed");
		throw Retry::ClassifiedError(Retry::ErrorKind::FatalAuth,
					     fmt::format("CodeExchangeError(GoogleCredentialManager): {}", e.what()));
	}

	const GoogleOAuth2ClientCredentials &clientCredentials = oauth2Flow_->clientCredentials();

	GoogleTokenState base;
	base.scopes.assign(scopes.begin(), scopes.end());
	base.client_id = clientCredentials.client_id;
	base.client_secret = clientCredentials.client_secret;
	base.token_uri = clientCredentials.token_uri;

	GoogleTokenState tokenState = base.withUpdatedAuthResponse(response, clock_(), options_.defaultTokenLifetime);
	if (!tokenState.isAuthorized()) {
		logger_->warn("GoogleOAuth2NoRefreshToken");
	}
	return tokenState;
}

void GoogleCredentialManager::discardStoredState() const
{
	const bool removed = tokenStore_->remove();
	if (removed) {
		logger_->info("GoogleCredentialDiscarded", {{"path", tokenStore_->path().string()}});
	}
}

} // namespace TubeUploader::GoogleAuth
