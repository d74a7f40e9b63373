/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUploader CurlHelper Library
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

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <curl/curl.h>

namespace TubeUploader::CurlHelper {

/**
 * Builds an application/x-www-form-urlencoded string, usable both as a query
 * string and as a POST body.
 */
class CurlUrlSearchParams {
public:
	explicit CurlUrlSearchParams(CURL *curl)
		: curl_(curl ? curl : throw std::invalid_argument("CurlIsNullError(CurlUrlSearchParams)"))
	{
	}

	~CurlUrlSearchParams() noexcept = default;

	CurlUrlSearchParams(const CurlUrlSearchParams &) = delete;
	CurlUrlSearchParams &operator=(const CurlUrlSearchParams &) = delete;
	CurlUrlSearchParams(CurlUrlSearchParams &&) = delete;
	CurlUrlSearchParams &operator=(CurlUrlSearchParams &&) = delete;

	void append(std::string name, std::string value) { params_.emplace_back(std::move(name), std::move(value)); }

	[[nodiscard]]
	std::string toString() const
	{
		std::string result;
		for (const auto &[key, value] : params_) {
			if (!result.empty()) {
				result += '&';
			}
			result += escape(key);
			result += '=';
			result += escape(value);
		}
		return result;
	}

private:
	std::string escape(const std::string &s) const
	{
		const std::unique_ptr<char, decltype(&curl_free)> escaped(
			curl_easy_escape(curl_, s.c_str(), static_cast<int>(s.length())), &curl_free);
		if (!escaped) {
			throw std::runtime_error("EncodeError(CurlUrlSearchParams::escape)");
		}
		return std::string(escaped.get());
	}

	CURL *const curl_;
	std::vector<std::pair<std::string, std::string>> params_;
};

} // namespace TubeUploader::CurlHelper
