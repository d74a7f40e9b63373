/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUploader Uploader Library
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

#include "TransferSession.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

#include <TubeUploader/Retry/ClassifiedError.hpp>

namespace TubeUploader::Uploader {

void TransferSession::setSessionUri(std::string sessionUri)
{
	if (sessionUri.empty()) {
		throw std::invalid_argument("SessionUriIsEmptyError(TransferSession::setSessionUri)");
	}
	sessionUri_ = std::move(sessionUri);
	retryCount_ = 0;
}

bool TransferSession::acknowledge(std::uint64_t committedBytes)
{
	if (committedBytes > totalBytes_) {
		throw Retry::ClassifiedError(
			Retry::ErrorKind::FatalProtocol,
			fmt::format("AcknowledgedBeyondEndError(TransferSession::acknowledge): {} > {}", committedBytes,
				    totalBytes_));
	}
	if (committedBytes < acknowledgedBytes_) {
		throw Retry::ClassifiedError(
			Retry::ErrorKind::FatalProtocol,
			fmt::format("AcknowledgedRegressedError(TransferSession::acknowledge): {} < {}", committedBytes,
				    acknowledgedBytes_));
	}
	if (committedBytes == acknowledgedBytes_) {
		return false;
	}

	acknowledgedBytes_ = committedBytes;
	retryCount_ = 0;
	return true;
}

std::uint64_t TransferSession::nextChunkLength(std::int64_t chunkSize) const
{
	if (chunkSize == -1) {
		return remainingBytes();
	}
	if (chunkSize <= 0) {
		throw std::invalid_argument("ChunkSizeError(TransferSession::nextChunkLength)");
	}
	return std::min<std::uint64_t>(static_cast<std::uint64_t>(chunkSize), remainingBytes());
}

int TransferSession::recordRetriableFailure() noexcept
{
	++failedAttempts_;
	return ++retryCount_;
}

} // namespace TubeUploader::Uploader
