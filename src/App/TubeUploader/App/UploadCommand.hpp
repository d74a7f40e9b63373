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

#include <istream>
#include <memory>
#include <ostream>
#include <stop_token>

#include <TubeUploader/Logger/ILogger.hpp>

#include "CommandLine.hpp"
#include "UploaderConfig.hpp"

namespace TubeUploader::App {

/**
 * Obtains a credential and, unless --no-upload is given, uploads the video and
 * runs the post-upload actions. Failures propagate as exceptions; the
 * operator prompt reads from `in` and the summary goes to `out`.
 */
void runUploadCommand(const CommandLineOptions &options, const UploaderConfig &config,
		      const std::shared_ptr<const Logger::ILogger> &logger, std::stop_token stopToken,
		      std::istream &in, std::ostream &out);

} // namespace TubeUploader::App
