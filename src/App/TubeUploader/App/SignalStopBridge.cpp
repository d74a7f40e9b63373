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

#include "SignalStopBridge.hpp"

#include <csignal>
#include <cstdlib>
#include <stdexcept>

#include <pthread.h>
#include <signal.h>

#include <TubeUploader/Logger/NullLogger.hpp>

#include "ExitStatus.hpp"

namespace TubeUploader::App {

namespace {

sigset_t handledSignals() noexcept
{
	sigset_t set;
	sigemptyset(&set);
	sigaddset(&set, SIGINT);
	sigaddset(&set, SIGTERM);
	return set;
}

} // anonymous namespace

SignalStopBridge::SignalStopBridge(std::stop_source stopSource, std::shared_ptr<const Logger::ILogger> logger)
	: stopSource_(std::move(stopSource)),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
	const sigset_t set = handledSignals();
	if (pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0) {
		throw std::runtime_error("SignalMaskError(SignalStopBridge)");
	}
	thread_ = std::jthread([this](std::stop_token threadStopToken) { run(std::move(threadStopToken)); });
}

SignalStopBridge::~SignalStopBridge() noexcept
{
	thread_.request_stop();
	if (thread_.joinable()) {
		thread_.join();
	}
}

void SignalStopBridge::run(std::stop_token threadStopToken) noexcept
{
	const sigset_t set = handledSignals();
	timespec timeout{0, 200'000'000};

	while (!threadStopToken.stop_requested()) {
		const int sig = sigtimedwait(&set, nullptr, &timeout);
		if (sig < 0) {
			continue;
		}

		if (stopSource_.stop_requested()) {
			logger_->warn("SecondSignalReceived", {{"signal", sig == SIGINT ? "SIGINT" : "SIGTERM"}});
			std::_Exit(ExitStatus::Cancelled);
		}

		logger_->warn("StopRequested", {{"signal", sig == SIGINT ? "SIGINT" : "SIGTERM"}});
		stopSource_.request_stop();
	}
}

} // namespace TubeUploader::App
