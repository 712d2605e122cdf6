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

#include "CaptionService.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "ErrorClassifier.hpp"
#include "VideoId.hpp"

namespace CaptionRelay::Transcript {

namespace {

struct DecodedCodePoint {
	char32_t value;
	std::size_t length;
};

// Decodes one well-formed UTF-8 sequence at pos. Malformed input yields std::nullopt.
std::optional<DecodedCodePoint> decodeUtf8At(std::string_view text, std::size_t pos)
{
	const auto lead = static_cast<unsigned char>(text[pos]);
	if (lead < 0x80) {
		return DecodedCodePoint{lead, 1};
	}

	std::size_t length;
	char32_t value;
	char32_t minimum;
	if ((lead & 0xe0) == 0xc0) {
		length = 2;
		value = lead & 0x1f;
		minimum = 0x80;
	} else if ((lead & 0xf0) == 0xe0) {
		length = 3;
		value = lead & 0x0f;
		minimum = 0x800;
	} else if ((lead & 0xf8) == 0xf0) {
		length = 4;
		value = lead & 0x07;
		minimum = 0x10000;
	} else {
		return std::nullopt;
	}

	if (text.size() - pos < length) {
		return std::nullopt;
	}
	for (std::size_t i = 1; i < length; ++i) {
		const auto c = static_cast<unsigned char>(text[pos + i]);
		if ((c & 0xc0) != 0x80) {
			return std::nullopt;
		}
		value = (value << 6) | (c & 0x3f);
	}
	if (value < minimum || value > 0x10ffff) {
		return std::nullopt;
	}
	return DecodedCodePoint{value, length};
}

// The code points Python's str.isspace() accepts.
bool isUnicodeWhitespace(char32_t cp) noexcept
{
	switch (cp) {
	case 0x20:
	case 0x85:
	case 0xa0:
	case 0x1680:
	case 0x2028:
	case 0x2029:
	case 0x202f:
	case 0x205f:
	case 0x3000:
		return true;
	default:
		return (cp >= 0x09 && cp <= 0x0d) || (cp >= 0x1c && cp <= 0x1f) || (cp >= 0x2000 && cp <= 0x200a);
	}
}

// Byte length of the whitespace character starting at pos, or 0.
std::size_t whitespaceLengthAt(std::string_view text, std::size_t pos)
{
	const std::optional<DecodedCodePoint> decoded = decodeUtf8At(text, pos);
	if (!decoded.has_value() || !isUnicodeWhitespace(decoded->value)) {
		return 0;
	}
	return decoded->length;
}

} // anonymous namespace

std::string collapseWhitespace(std::string_view text)
{
	std::string result;
	result.reserve(text.size());

	bool pendingSpace = false;
	std::size_t pos = 0;
	while (pos < text.size()) {
		if (std::size_t len = whitespaceLengthAt(text, pos); len > 0) {
			pendingSpace = !result.empty();
			pos += len;
			continue;
		}
		if (pendingSpace) {
			result.push_back(' ');
			pendingSpace = false;
		}
		result.push_back(text[pos]);
		++pos;
	}

	return result;
}

CaptionResponse buildCaptionResponse(std::string videoId, const FetchedTranscript &transcript)
{
	std::string joined;
	double totalDuration = 0.0;

	bool first = true;
	for (const TranscriptSegment &segment : transcript.segments) {
		if (!first) {
			joined.push_back(' ');
		}
		first = false;
		joined += segment.text;

		totalDuration = std::max(totalDuration, segment.start + segment.duration);
	}

	CaptionResponse response;
	response.video_id = std::move(videoId);
	response.captions = collapseWhitespace(joined);
	if (transcript.language.has_value() && !transcript.language->empty()) {
		response.language = *transcript.language;
	}
	response.total_duration = totalDuration;
	return response;
}

CaptionService::CaptionService(std::shared_ptr<const ITranscriptProvider> provider,
			       std::shared_ptr<const Logger::ILogger> logger)
	: provider_(provider ? std::move(provider)
			     : throw std::invalid_argument("ProviderIsNullError(CaptionService::CaptionService)")),
	  logger_(logger ? std::move(logger)
			 : throw std::invalid_argument("LoggerIsNullError(CaptionService::CaptionService)"))
{
}

CaptionService::~CaptionService() noexcept = default;

CaptionResult CaptionService::getCaptions(std::string_view rawVideoId) const
{
	std::optional<std::string> videoId = normalizeVideoId(rawVideoId);
	if (!videoId.has_value()) {
		logger_->warn("InvalidVideoId", {{"videoId", rawVideoId}});
		CaptionError error = makeValidationError(kInvalidVideoIdMessage);
		error.video_id = std::string(rawVideoId);
		return error;
	}

	return fetchCaptions(*videoId);
}

CaptionResult CaptionService::fetchCaptions(const std::string &videoId) const
{
	logger_->info("CaptionRequestReceived", {{"videoId", videoId}});

	TranscriptFetchResult result;
	try {
		result = provider_->fetchTranscript(videoId);
	} catch (const std::exception &e) {
		result = TranscriptFetchError{e.what()};
	}

	if (const auto *transcript = std::get_if<FetchedTranscript>(&result)) {
		CaptionResponse response = buildCaptionResponse(videoId, *transcript);
		logger_->info("CaptionsExtracted", {{"videoId", videoId},
						    {"segments", std::to_string(transcript->segments.size())},
						    {"length", std::to_string(response.captions.size())},
						    {"language", response.language}});
		return response;
	}

	CaptionError error;
	if (const auto *notFound = std::get_if<TranscriptNotFound>(&result)) {
		logger_->error("NoTranscriptAvailable", {{"videoId", videoId}, {"reason", notFound->message}});
		error = makeNoTranscriptError();
	} else {
		const auto &fetchError = std::get<TranscriptFetchError>(result);
		error = classifyFetchFailure(fetchError.message);
		logger_->error("CaptionRequestFailed", {{"videoId", videoId},
							{"errorCode", errorCodeOf(error.kind)},
							{"reason", fetchError.message}});
	}

	error.video_id = videoId;
	return error;
}

} // namespace CaptionRelay::Transcript
