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

#include "GoogleTokenEndpoint.hpp"

#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <TubeUploader/CurlHelper/CurlWriteCallback.hpp>

#include "GoogleAuthError.hpp"

namespace TubeUploader::GoogleAuth {

GoogleAuthResponse postTokenRequest(CURL *curl, const std::string &tokenUri, const std::string &postData,
				    const std::shared_ptr<const Logger::ILogger> &logger)
{
	if (!curl) {
		throw std::invalid_argument("CurlIsNullError(postTokenRequest)");
	}
	if (!logger) {
		throw std::invalid_argument("LoggerIsNullError(postTokenRequest)");
	}

	std::string readBuffer;

	curl_easy_reset(curl);

	curl_easy_setopt(curl, CURLOPT_URL, tokenUri.c_str());
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, postData.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(postData.length()));

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);

	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
	curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

	const CURLcode res = curl_easy_perform(curl);

	if (res != CURLE_OK) {
		logger->error("CurlPerformError", {{"error", curl_easy_strerror(res)}});
		throw GoogleAuthError(GoogleAuthErrorKind::NetworkError,
				      fmt::format("NetworkError(postTokenRequest): {}", curl_easy_strerror(res)));
	}

	long httpStatus = 0;
	curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpStatus);

	const nlohmann::json j = nlohmann::json::parse(readBuffer, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		logger->error("TokenResponseParseError", {{"status", std::to_string(httpStatus)}});
		throw GoogleAuthError(GoogleAuthErrorKind::MalformedResponse,
				      fmt::format("MalformedResponseError(postTokenRequest): status {}", httpStatus));
	}

	if (j.contains("error") || httpStatus >= 400) {
		const std::string errorJson = j.contains("error") ? j["error"].dump() : std::string("null");
		logger->error("GoogleOAuth2Error", {{"status", std::to_string(httpStatus)}, {"error", errorJson}});
		throw GoogleAuthError(GoogleAuthErrorKind::ServerError,
				      fmt::format("APIError(postTokenRequest): status {}: {}", httpStatus, errorJson));
	}

	try {
		return j.get<GoogleAuthResponse>();
	} catch (const nlohmann::json::exception &e) {
		logger->error("TokenResponseFormatError", {{"exception", e.what()}});
		throw GoogleAuthError(GoogleAuthErrorKind::MalformedResponse,
				      fmt::format("MalformedResponseError(postTokenRequest): {}", e.what()));
	}
}

} // namespace TubeUploader::GoogleAuth
