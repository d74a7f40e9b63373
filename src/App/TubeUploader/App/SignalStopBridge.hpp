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

#pragma once

#include <memory>
#include <stop_token>
#include <thread>

#include <TubeUploader/Logger/ILogger.hpp>

namespace TubeUploader::App {

/**
 * Turns SIGINT and SIGTERM into a stop request on `stopSource`. A second
 * signal terminates the process at once with status 130.
 *
 * Blocks both signals in the calling thread, so construct it in main before
 * any other thread is started.
 */
class SignalStopBridge {
public:
	SignalStopBridge(std::stop_source stopSource, std::shared_ptr<const Logger::ILogger> logger);

	~SignalStopBridge() noexcept;

	SignalStopBridge(const SignalStopBridge &) = delete;
	SignalStopBridge &operator=(const SignalStopBridge &) = delete;
	SignalStopBridge(SignalStopBridge &&) = delete;
	SignalStopBridge &operator=(SignalStopBridge &&) = delete;

private:
	void run(std::stop_token threadStopToken) noexcept;

	std::stop_source stopSource_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	std::jthread thread_;
};

} // namespace TubeUploader::App
