/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * Tube Uploader
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

#include <exception>
#include <iostream>
#include <memory>
#include <stop_token>

#include <TubeUploader/App/CommandLine.hpp>
#include <TubeUploader/App/ExitStatus.hpp>
#include <TubeUploader/App/SignalStopBridge.hpp>
#include <TubeUploader/App/UploadCommand.hpp>
#include <TubeUploader/App/UploaderConfig.hpp>
#include <TubeUploader/CurlHelper/CurlHandle.hpp>
#include <TubeUploader/Logger/PrintLogger.hpp>
#include <TubeUploader/Retry/ClassifiedError.hpp>

using namespace TubeUploader;

int main(int argc, char *argv[])
{
	App::CommandLineOptions options;
	App::UploaderConfig config;
	try {
		options = App::parseCommandLine(argc, argv);
		if (options.help) {
			App::printUsage(std::cout, argv[0]);
			return App::ExitStatus::Success;
		}
		config = App::loadUploaderConfig(options.configFile);
	} catch (const App::UsageError &e) {
		std::cerr << e.what() << "\n\n";
		App::printUsage(std::cerr, argv[0]);
		return App::ExitStatus::Usage;
	}

	auto logger = std::make_shared<const Logger::PrintLogger>(options.verbose ? Logger::LogLevel::Debug
										  : Logger::LogLevel::Info);

	try {
		const CurlHelper::CurlGlobalGuard curlGlobalGuard;

		std::stop_source stopSource;
		const App::SignalStopBridge signalStopBridge(stopSource, logger);

		App::runUploadCommand(options, config, logger, stopSource.get_token(), std::cin, std::cout);
		return App::ExitStatus::Success;
	} catch (const Retry::ClassifiedError &e) {
		logger->logException(e, "UploaderFailed");
		std::cerr << e.what() << '\n' << App::adviceFor(e.kind()) << std::endl;
		return App::exitStatusFor(e.kind());
	} catch (const App::UsageError &e) {
		std::cerr << e.what() << std::endl;
		return App::ExitStatus::Usage;
	} catch (const std::exception &e) {
		logger->logException(e, "UploaderFailed");
		std::cerr << e.what() << std::endl;
		return App::ExitStatus::Failure;
	}
}
