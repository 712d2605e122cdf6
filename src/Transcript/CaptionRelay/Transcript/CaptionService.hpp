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

#include <memory>
#include <string>
#include <string_view>

#include <CaptionRelay/Logger/ILogger.hpp>

#include "ICaptionService.hpp"
#include "ITranscriptProvider.hpp"
#include "TranscriptTypes.hpp"

namespace CaptionRelay::Transcript {

/**
 * @brief Joins segment texts with single spaces, collapses whitespace and computes the end time
 * of the last-ending segment.
 */
[[nodiscard]]
CaptionResponse buildCaptionResponse(std::string videoId, const FetchedTranscript &transcript);

/// Replaces every whitespace run with one space and trims both ends.
[[nodiscard]]
std::string collapseWhitespace(std::string_view text);

class CaptionService : public ICaptionService {
public:
	CaptionService(std::shared_ptr<const ITranscriptProvider> provider,
		       std::shared_ptr<const Logger::ILogger> logger);

	~CaptionService() noexcept override;

	/// Normalizes the raw input, then fetches. A validation error echoes the raw input.
	CaptionResult getCaptions(std::string_view rawVideoId) const override;

	/// Expects an already normalized video ID.
	CaptionResult fetchCaptions(const std::string &videoId) const;

private:
	const std::shared_ptr<const ITranscriptProvider> provider_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace CaptionRelay::Transcript
