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

#include "Backoff.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>

namespace TubeUploader::Retry {

namespace {

double unitInterval(const UniformRandom &random)
{
	if (!random) {
		throw std::invalid_argument("RandomIsNullError(Backoff)");
	}

	const double r = random();
	if (!(r > 0.0)) {
		return 0.0;
	}
	if (r >= 1.0) {
		return std::nextafter(1.0, 0.0);
	}
	return r;
}

UniformRandom makeUniformRandomFromEngine(std::shared_ptr<std::mt19937_64> engine)
{
	return [engine = std::move(engine)]() {
		std::uniform_real_distribution<double> dist(0.0, 1.0);
		return dist(*engine);
	};
}

} // anonymous namespace

Seconds backoffCeiling(int retry)
{
	if (retry < 0) {
		throw std::invalid_argument("NegativeRetryError(backoffCeiling)");
	}
	return Seconds(std::ldexp(1.0, retry));
}

Seconds multiplicativeJitterBackoff(int retry, const UniformRandom &random)
{
	return backoffCeiling(retry) * unitInterval(random);
}

Seconds additiveJitterBackoff(int attempt, const UniformRandom &random, Seconds maxJitter)
{
	return backoffCeiling(attempt) + maxJitter * unitInterval(random);
}

UniformRandom makeUniformRandom()
{
	std::random_device rd;
	std::seed_seq seq{rd(), rd(), rd(), rd()};
	return makeUniformRandomFromEngine(std::make_shared<std::mt19937_64>(seq));
}

UniformRandom makeUniformRandom(std::uint64_t seed)
{
	return makeUniformRandomFromEngine(std::make_shared<std::mt19937_64>(seed));
}

Seconds clampSleepDuration(Seconds duration) noexcept
{
	if (!(duration.count() > 0.0)) {
		return Seconds(0.0);
	}
	return std::min(duration, kMaxSleepDuration);
}

Sleeper makeInterruptibleSleeper()
{
	return [](Seconds duration, std::stop_token stopToken) {
		if (stopToken.stop_requested()) {
			return false;
		}

		std::mutex mutex;
		std::condition_variable_any cv;
		std::unique_lock lock(mutex);
		const auto timeout =
			std::chrono::duration_cast<std::chrono::steady_clock::duration>(clampSleepDuration(duration));
		cv.wait_for(lock, stopToken, timeout, [] { return false; });

		return !stopToken.stop_requested();
	};
}

} // namespace TubeUploader::Retry
