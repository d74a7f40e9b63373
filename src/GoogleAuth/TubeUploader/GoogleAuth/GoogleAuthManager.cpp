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

#include "GoogleAuthManager.hpp"

#include <stdexcept>

#include <TubeUploader/CurlHelper/CurlUrlSearchParams.hpp>
#include <TubeUploader/Logger/NullLogger.hpp>

#include "GoogleTokenEndpoint.hpp"

namespace TubeUploader::GoogleAuth {

GoogleAuthManager::GoogleAuthManager(std::shared_ptr<CurlHelper::CurlHandle> curl,
				     GoogleOAuth2ClientCredentials clientCredentials,
				     std::shared_ptr<const Logger::ILogger> logger)
	: curl_(curl ? std::move(curl) : throw std::invalid_argument("CurlIsNullError(GoogleAuthManager)")),
	  clientCredentials_((!clientCredentials.client_id.empty() && !clientCredentials.client_secret.empty())
				     ? std::move(clientCredentials)
				     : throw std::invalid_argument("CredentialsMissingError(GoogleAuthManager)")),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
}

GoogleAuthManager::~GoogleAuthManager() noexcept = default;

GoogleAuthResponse GoogleAuthManager::fetchFreshAuthResponse(const std::string &refreshToken) const
{
	if (refreshToken.empty()) {
		throw std::invalid_argument("RefreshTokenIsEmptyError(GoogleAuthManager::fetchFreshAuthResponse)");
	}

	CurlHelper::CurlUrlSearchParams postParams(curl_->getRaw());
	postParams.append("client_id", clientCredentials_.client_id);
	postParams.append("client_secret", clientCredentials_.client_secret);
	postParams.append("refresh_token", refreshToken);
	postParams.append("grant_type", "refresh_token");
	const std::string postData = postParams.toString();

	logger_->debug("GoogleAuthManagerRefreshing");
	GoogleAuthResponse response = postTokenRequest(curl_->getRaw(), clientCredentials_.token_uri, postData, logger_);
	logger_->debug("GoogleAuthManagerRefreshed");
	return response;
}

} // namespace TubeUploader::GoogleAuth
