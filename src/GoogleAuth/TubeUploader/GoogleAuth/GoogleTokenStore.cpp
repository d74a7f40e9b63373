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

#include "GoogleTokenStore.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <TubeUploader/Logger/NullLogger.hpp>
#include <TubeUploader/Retry/ClassifiedError.hpp>

namespace TubeUploader::GoogleAuth {

GoogleTokenStore::GoogleTokenStore(std::filesystem::path path)
	: path_(!path.empty() ? std::move(path) : throw std::invalid_argument("PathIsEmptyError(GoogleTokenStore)")),
	  logger_(Logger::NullLogger::instance())
{
}

GoogleTokenStore::~GoogleTokenStore() noexcept = default;

void GoogleTokenStore::setLogger(std::shared_ptr<const Logger::ILogger> logger)
{
	logger_ = logger ? std::move(logger) : Logger::NullLogger::instance();
}

std::optional<GoogleTokenState> GoogleTokenStore::load() const
{
	std::error_code ec;
	if (!std::filesystem::exists(path_, ec)) {
		logger_->info("GoogleTokenStoreFileNotExist", {{"path", path_.string()}});
		return std::nullopt;
	}

	std::ifstream ifs(path_, std::ios::in | std::ios::binary);
	if (!ifs.is_open()) {
		logger_->error("FileOpenError", {{"path", path_.string()}});
		throw std::runtime_error(fmt::format("FileOpenError(GoogleTokenStore::load): {}", path_.string()));
	}

	const nlohmann::json j = nlohmann::json::parse(ifs, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		logger_->warn("GoogleTokenStoreParseError", {{"path", path_.string()}});
		throw Retry::ClassifiedError(Retry::ErrorKind::DataIntegrity,
					     fmt::format("TokenStoreParseError(GoogleTokenStore::load): {}", path_.string()));
	}

	try {
		GoogleTokenState tokenState = j.get<GoogleTokenState>();
		logger_->debug("GoogleTokenStoreLoaded", {{"path", path_.string()}});
		return tokenState;
	} catch (const nlohmann::json::exception &e) {
		logger_->warn("GoogleTokenStoreFormatError", {{"path", path_.string()}, {"exception", e.what()}});
		throw Retry::ClassifiedError(
			Retry::ErrorKind::DataIntegrity,
			fmt::format("TokenStoreFormatError(GoogleTokenStore::load): {}: {}", path_.string(), e.what()));
	}
}

void GoogleTokenStore::save(const GoogleTokenState &tokenState) const
{
	const nlohmann::json j = tokenState;

	if (path_.has_parent_path()) {
		std::filesystem::create_directories(path_.parent_path());
	}

	std::filesystem::path tmpPath = path_;
	tmpPath += ".tmp";

	{
		std::ofstream ofs(tmpPath, std::ios::out | std::ios::binary | std::ios::trunc);
		if (!ofs.is_open()) {
			logger_->error("FileOpenError", {{"path", tmpPath.string()}});
			throw std::runtime_error(fmt::format("FileOpenError(GoogleTokenStore::save): {}", tmpPath.string()));
		}

		std::error_code ec;
		std::filesystem::permissions(tmpPath,
					     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
					     std::filesystem::perm_options::replace, ec);
		if (ec) {
			logger_->warn("GoogleTokenStorePermissionError",
				      {{"path", tmpPath.string()}, {"error", ec.message()}});
		}

		ofs << j.dump(2);
		ofs.close();

		if (ofs.fail()) {
			logger_->error("FileWriteError", {{"path", tmpPath.string()}});
			std::filesystem::remove(tmpPath, ec);
			throw std::runtime_error(fmt::format("FileWriteError(GoogleTokenStore::save): {}", tmpPath.string()));
		}
	}

	std::error_code ec;
	std::filesystem::rename(tmpPath, path_, ec);
	if (ec) {
		logger_->error("FileRenameError", {{"path", path_.string()}, {"error", ec.message()}});
		std::error_code removeEc;
		std::filesystem::remove(tmpPath, removeEc);
		throw std::runtime_error(fmt::format("FileRenameError(GoogleTokenStore::save): {}", path_.string()));
	}

	logger_->debug("GoogleTokenStoreSaved", {{"path", path_.string()}});
}

bool GoogleTokenStore::remove() const
{
	std::error_code ec;
	const bool removed = std::filesystem::remove(path_, ec);
	if (ec) {
		logger_->error("FileRemoveError", {{"path", path_.string()}, {"error", ec.message()}});
		throw std::runtime_error(fmt::format("FileRemoveError(GoogleTokenStore::remove): {}", path_.string()));
	}
	if (removed) {
		logger_->info("GoogleTokenStoreRemoved", {{"path", path_.string()}});
	}
	return removed;
}

} // namespace TubeUploader::GoogleAuth
