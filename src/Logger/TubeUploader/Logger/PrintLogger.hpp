/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUploader Logger Library
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

#include <chrono>
#include <iostream>
#include <iterator>
#include <mutex>
#include <source_location>
#include <span>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "ILogger.hpp"

namespace TubeUploader::Logger {

/**
 * Writes one logfmt-style line per event to an output stream (stderr by default),
 * so that stdout stays free for the operator prompt.
 */
class PrintLogger : public ILogger {
public:
	explicit PrintLogger(LogLevel minLevel = LogLevel::Info, std::ostream &os = std::clog)
		: minLevel_(minLevel),
		  os_(os)
	{
	}

	~PrintLogger() override = default;

protected:
	void log(LogLevel level, std::string_view name, std::source_location loc,
		 std::span<const LogField> context) const noexcept override
	try {
		if (level < minLevel_) {
			return;
		}

		const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());

		fmt::memory_buffer buf;
		fmt::format_to(std::back_inserter(buf), "time={:%Y-%m-%dT%H:%M:%S}Z\tlevel={}\tname={}", now,
			       levelName(level), name);
		for (const LogField &field : context) {
			fmt::format_to(std::back_inserter(buf), "\t{}={}", field.key, field.value);
		}
		if (minLevel_ == LogLevel::Debug) {
			fmt::format_to(std::back_inserter(buf), "\tlocation={}:{}", loc.file_name(), loc.line());
		}
		buf.push_back('\n');

		std::scoped_lock lock(mutex_);
		os_.write(buf.data(), static_cast<std::streamsize>(buf.size()));
		os_.flush();
	} catch (const std::exception &) {
		// Logging never throws into the caller.
	}

private:
	static std::string_view levelName(LogLevel level) noexcept
	{
		switch (level) {
		case LogLevel::Debug:
			return "DEBUG";
		case LogLevel::Info:
			return "INFO";
		case LogLevel::Warn:
			return "WARN";
		case LogLevel::Error:
			return "ERROR";
		default:
			return "UNKNOWN";
		}
	}

	const LogLevel minLevel_;
	std::ostream &os_;
	mutable std::mutex mutex_;
};

} // namespace TubeUploader::Logger
