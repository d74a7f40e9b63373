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

#include <filesystem>
#include <memory>
#include <optional>

#include <TubeUploader/Logger/ILogger.hpp>

#include "GoogleTokenState.hpp"

namespace TubeUploader::GoogleAuth {

/**
 * Persists a single GoogleTokenState as a JSON file.
 *
 * load() returns std::nullopt when the file does not exist and throws
 * Retry::ClassifiedError(DataIntegrity) when it exists but cannot be parsed.
 * save() replaces the file atomically (temporary file, then rename) and
 * restricts it to the owner.
 */
class GoogleTokenStore {
public:
	explicit GoogleTokenStore(std::filesystem::path path);

	~GoogleTokenStore() noexcept;

	GoogleTokenStore(const GoogleTokenStore &) = delete;
	GoogleTokenStore &operator=(const GoogleTokenStore &) = delete;
	GoogleTokenStore(GoogleTokenStore &&) = delete;
	GoogleTokenStore &operator=(GoogleTokenStore &&) = delete;

	void setLogger(std::shared_ptr<const Logger::ILogger> logger);

	[[nodiscard]]
	const std::filesystem::path &path() const noexcept
	{
		return path_;
	}

	[[nodiscard]]
	std::optional<GoogleTokenState> load() const;

	void save(const GoogleTokenState &tokenState) const;

	/** Returns true if a file was removed. */
	bool remove() const;

private:
	const std::filesystem::path path_;
	std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace TubeUploader::GoogleAuth
