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

#pragma once

#include <cstdint>
#include <string>

namespace TubeUploader::Uploader {

/**
 * Progress of one file through a resumable upload session.
 *
 * The acknowledged byte count only moves forward and never exceeds the
 * source length; a server report violating either is a protocol error.
 */
class TransferSession {
public:
	explicit TransferSession(std::uint64_t totalBytes) noexcept : totalBytes_(totalBytes) {}

	[[nodiscard]]
	std::uint64_t totalBytes() const noexcept
	{
		return totalBytes_;
	}

	[[nodiscard]]
	std::uint64_t acknowledgedBytes() const noexcept
	{
		return acknowledgedBytes_;
	}

	[[nodiscard]]
	std::uint64_t remainingBytes() const noexcept
	{
		return totalBytes_ - acknowledgedBytes_;
	}

	[[nodiscard]]
	bool hasSessionUri() const noexcept
	{
		return !sessionUri_.empty();
	}

	[[nodiscard]]
	const std::string &sessionUri() const noexcept
	{
		return sessionUri_;
	}

	/** Opening the session ends a run of retries, like progress does. */
	void setSessionUri(std::string sessionUri);

	/**
	 * Records the byte count the server reports as committed.
	 * Returns true if it advanced; throws Retry::ClassifiedError(FatalProtocol)
	 * if it went backwards or past the end.
	 */
	bool acknowledge(std::uint64_t committedBytes);

	/** Size of the next request body; a chunkSize of -1 means the whole remainder. */
	[[nodiscard]]
	std::uint64_t nextChunkLength(std::int64_t chunkSize) const;

	/** Counts a retriable failure and returns the consecutive retry number. */
	int recordRetriableFailure() noexcept;

	void recordNonRetriableFailure() noexcept { ++failedAttempts_; }

	void recordChunkCall() noexcept { ++chunkCalls_; }

	[[nodiscard]]
	int retryCount() const noexcept
	{
		return retryCount_;
	}

	[[nodiscard]]
	int chunkCalls() const noexcept
	{
		return chunkCalls_;
	}

	[[nodiscard]]
	int failedAttempts() const noexcept
	{
		return failedAttempts_;
	}

private:
	const std::uint64_t totalBytes_;
	std::uint64_t acknowledgedBytes_ = 0;
	std::string sessionUri_;
	int retryCount_ = 0;
	int chunkCalls_ = 0;
	int failedAttempts_ = 0;
};

} // namespace TubeUploader::Uploader
