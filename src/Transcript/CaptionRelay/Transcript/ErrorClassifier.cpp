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

#include "ErrorClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>

#include <fmt/format.h>

namespace CaptionRelay::Transcript {

namespace {

char toLowerAscii(char c)
{
	return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string toLowercase(std::string_view s)
{
	std::string lowered(s);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(), toLowerAscii);
	return lowered;
}

bool containsAny(const std::string &haystack, std::initializer_list<std::string_view> needles)
{
	return std::any_of(needles.begin(), needles.end(),
			   [&haystack](std::string_view needle) { return haystack.find(needle) != std::string::npos; });
}

} // anonymous namespace

CaptionError classifyFetchFailure(std::string_view upstreamMessage)
{
	const std::string lowered = toLowercase(upstreamMessage);

	if (containsAny(lowered, {"video unavailable", "video does not exist", "does not exist"})) {
		return {.kind = ErrorKind::VideoNotFound, .message = "Video not found or is unavailable"};
	}
	if (containsAny(lowered, {"private"})) {
		return {.kind = ErrorKind::VideoPrivate, .message = "Video is private and captions cannot be accessed"};
	}
	if (containsAny(lowered, {"disabled", "not available"})) {
		return {.kind = ErrorKind::CaptionsDisabled, .message = "Captions are disabled for this video"};
	}

	return {.kind = ErrorKind::ProcessingError,
		.message = fmt::format("Error processing video: {}", upstreamMessage)};
}

CaptionError makeNoTranscriptError()
{
	return {.kind = ErrorKind::NoTranscriptAvailable,
		.message = "No captions/transcripts available for this video"};
}

CaptionError makeValidationError(std::string_view message)
{
	return {.kind = ErrorKind::ValidationError, .message = std::string(message)};
}

} // namespace CaptionRelay::Transcript
