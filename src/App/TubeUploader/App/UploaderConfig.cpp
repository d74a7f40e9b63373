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

#include "UploaderConfig.hpp"

#include <fstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "ExitStatus.hpp"

namespace TubeUploader::App {

namespace {

template<typename T> void getIfPresent(const nlohmann::json &j, const char *key, T &field)
{
	if (auto it = j.find(key); it != j.end() && !it->is_null()) {
		try {
			it->get_to(field);
		} catch (const nlohmann::json::exception &e) {
			throw UsageError(fmt::format("ConfigTypeError({}): {}", key, e.what()));
		}
	}
}

} // anonymous namespace

void to_json(nlohmann::json &j, const UploaderConfig &p)
{
	j = nlohmann::json{
		{"client_secrets_file", p.clientSecretsFile.string()},
		{"token_storage_file", p.tokenStorageFile.string()},
		{"scopes", p.scopes},
		{"max_upload_retries", p.maxUploadRetries},
		{"max_refresh_attempts", p.maxRefreshAttempts},
		{"refresh_margin_seconds", p.refreshMarginSeconds},
		{"chunk_size", p.chunkSize},
		{"redirect_uri", p.redirectUri},
	};
}

void from_json(const nlohmann::json &j, UploaderConfig &p)
{
	if (!j.is_object()) {
		throw UsageError("ConfigNotObjectError(UploaderConfig)");
	}

	std::string clientSecretsFile = p.clientSecretsFile.string();
	std::string tokenStorageFile = p.tokenStorageFile.string();

	getIfPresent(j, "client_secrets_file", clientSecretsFile);
	getIfPresent(j, "token_storage_file", tokenStorageFile);
	getIfPresent(j, "scopes", p.scopes);
	getIfPresent(j, "max_upload_retries", p.maxUploadRetries);
	getIfPresent(j, "max_refresh_attempts", p.maxRefreshAttempts);
	getIfPresent(j, "refresh_margin_seconds", p.refreshMarginSeconds);
	getIfPresent(j, "chunk_size", p.chunkSize);
	getIfPresent(j, "redirect_uri", p.redirectUri);

	if (clientSecretsFile.empty()) {
		throw UsageError("ConfigValueError(client_secrets_file): must not be empty");
	}
	if (tokenStorageFile.empty()) {
		throw UsageError("ConfigValueError(token_storage_file): must not be empty");
	}
	if (p.scopes.empty()) {
		throw UsageError("ConfigValueError(scopes): must not be empty");
	}
	if (p.maxUploadRetries < 0) {
		throw UsageError("ConfigValueError(max_upload_retries): must be >= 0");
	}
	if (p.maxRefreshAttempts < 1) {
		throw UsageError("ConfigValueError(max_refresh_attempts): must be >= 1");
	}
	if (p.refreshMarginSeconds < 0) {
		throw UsageError("ConfigValueError(refresh_margin_seconds): must be >= 0");
	}
	if (p.chunkSize != -1 && p.chunkSize <= 0) {
		throw UsageError("ConfigValueError(chunk_size): must be -1 or positive");
	}
	if (p.redirectUri.empty()) {
		throw UsageError("ConfigValueError(redirect_uri): must not be empty");
	}

	p.clientSecretsFile = clientSecretsFile;
	p.tokenStorageFile = tokenStorageFile;
}

UploaderConfig loadUploaderConfig(const std::filesystem::path &path)
{
	std::ifstream ifs(path);
	if (!ifs.is_open()) {
		throw UsageError(fmt::format("ConfigFileOpenError(loadUploaderConfig): {}", path.string()));
	}

	const nlohmann::json j = nlohmann::json::parse(ifs, nullptr, false);
	if (j.is_discarded()) {
		throw UsageError(fmt::format("ConfigParseError(loadUploaderConfig): {}", path.string()));
	}

	UploaderConfig config = j.get<UploaderConfig>();

	const std::filesystem::path baseDir = path.parent_path();
	if (config.clientSecretsFile.is_relative()) {
		config.clientSecretsFile = baseDir / config.clientSecretsFile;
	}
	if (config.tokenStorageFile.is_relative()) {
		config.tokenStorageFile = baseDir / config.tokenStorageFile;
	}
	return config;
}

} // namespace TubeUploader::App
