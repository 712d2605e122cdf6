/*
 * SPDX-FileCopyrightText: Copyright (C) 2026 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * CaptionRelay Transcript Library
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
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <CaptionRelay/Logger/ILogger.hpp>

#include "ITranscriptProvider.hpp"

namespace CaptionRelay::Transcript {

struct YouTubeTranscriptProviderOptions {
	/// Budget for the whole fetch, shared by every request it makes.
	std::chrono::milliseconds timeout{15000};
	/// Scheme and host the watch page and player API are requested from, without a trailing slash.
	std::string baseUrl = "https://www.youtube.com";
	std::vector<std::string> languages{"en"};
	/// Upper bound for any single upstream response body.
	std::size_t maxResponseBytes = 8 * 1024 * 1024;
	std::string userAgent = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
				"Chrome/124.0.0.0 Safari/537.36";
};

/**
 * @brief Fetches caption tracks from YouTube's innertube player API and downloads them as json3.
 *
 * Each call creates its own curl handle, so one provider can serve concurrent requests.
 * The caller MUST have called `curl_global_init` before the first fetch.
 */
class YouTubeTranscriptProvider : public ITranscriptProvider {
public:
	YouTubeTranscriptProvider(YouTubeTranscriptProviderOptions options,
				  std::shared_ptr<const Logger::ILogger> logger);

	~YouTubeTranscriptProvider() noexcept override;

	TranscriptFetchResult fetchTranscript(const std::string &videoId) const override;

private:
	const YouTubeTranscriptProviderOptions options_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace CaptionRelay::Transcript
