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

#include "GoogleOAuth2Flow.hpp"

#include <stdexcept>

#include <TubeUploader/CurlHelper/CurlUrlHandle.hpp>
#include <TubeUploader/CurlHelper/CurlUrlSearchParams.hpp>
#include <TubeUploader/Logger/NullLogger.hpp>

#include "GoogleTokenEndpoint.hpp"
#include "GoogleTokenState.hpp"

namespace TubeUploader::GoogleAuth {

GoogleOAuth2Flow::GoogleOAuth2Flow(std::shared_ptr<CurlHelper::CurlHandle> curl,
				   GoogleOAuth2ClientCredentials clientCredentials,
				   std::shared_ptr<const Logger::ILogger> logger)
	: curl_(curl ? std::move(curl) : throw std::invalid_argument("CurlIsNullError(GoogleOAuth2Flow)")),
	  clientCredentials_(std::move(clientCredentials)),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
}

GoogleOAuth2Flow::~GoogleOAuth2Flow() noexcept = default;

std::string GoogleOAuth2Flow::getAuthorizationUrl(const std::string &redirectUri,
						  std::span<const std::string> scopes) const
{
	CurlHelper::CurlUrlSearchParams params(curl_->getRaw());
	params.append("client_id", clientCredentials_.client_id);
	params.append("redirect_uri", redirectUri);
	params.append("response_type", "code");
	params.append("scope", joinScopes(scopes));
	params.append("access_type", "offline");
	params.append("prompt", "consent");
	params.append("include_granted_scopes", "true");

	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(clientCredentials_.auth_uri);
	urlHandle.appendQuery(params.toString());
	return urlHandle.toString();
}

GoogleAuthResponse GoogleOAuth2Flow::exchangeCode(const std::string &code, const std::string &redirectUri) const
{
	if (code.empty()) {
		throw std::invalid_argument("CodeIsEmptyError(GoogleOAuth2Flow::exchangeCode)");
	}

	CurlHelper::CurlUrlSearchParams params(curl_->getRaw());
	params.append("client_id", clientCredentials_.client_id);
	params.append("client_secret", clientCredentials_.client_secret);
	params.append("code", code);
	params.append("grant_type", "authorization_code");
	params.append("redirect_uri", redirectUri);
	const std::string postData = params.toString();

	logger_->info("GoogleOAuth2FlowTokenExchanging");
	GoogleAuthResponse response = postTokenRequest(curl_->getRaw(), clientCredentials_.token_uri, postData, logger_);
	logger_->info("GoogleOAuth2FlowTokenExchanged");
	return response;
}

} // namespace TubeUploader::GoogleAuth
