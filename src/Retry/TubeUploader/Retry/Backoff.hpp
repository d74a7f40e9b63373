/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUploader Retry Library
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
#include <cstdint>
#include <functional>
#include <stop_token>

namespace TubeUploader::Retry {

using Seconds = std::chrono::duration<double>;

/** Returns a value in [0, 1). */
using UniformRandom = std::function<double()>;

/** Blocks for the given duration. Returns false if woken early by a stop request. */
using Sleeper = std::function<bool(Seconds, std::stop_token)>;

/** 2^retry seconds: the exclusive upper bound of the upload backoff for that retry. */
[[nodiscard]]
Seconds backoffCeiling(int retry);

/** random() * 2^retry, in [0, 2^retry). */
[[nodiscard]]
Seconds multiplicativeJitterBackoff(int retry, const UniformRandom &random);

/** 2^attempt + random() * maxJitter, in [2^attempt, 2^attempt + maxJitter). */
[[nodiscard]]
Seconds additiveJitterBackoff(int attempt, const UniformRandom &random, Seconds maxJitter = Seconds(1.0));

[[nodiscard]]
UniformRandom makeUniformRandom();

[[nodiscard]]
UniformRandom makeUniformRandom(std::uint64_t seed);

/** Longest single wait a sleeper performs. */
inline constexpr Seconds kMaxSleepDuration = std::chrono::hours(24);

/** Limits a delay to [0, kMaxSleepDuration]; NaN counts as zero. */
[[nodiscard]]
Seconds clampSleepDuration(Seconds duration) noexcept;

[[nodiscard]]
Sleeper makeInterruptibleSleeper();

} // namespace TubeUploader::Retry
