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

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace CaptionRelay::Transcript {

inline constexpr std::string_view kDefaultLanguage = "en";

struct TranscriptSegment {
	std::string text;
	double start = 0.0;
	double duration = 0.0;
};

struct FetchedTranscript {
	std::vector<TranscriptSegment> segments;
	std::optional<std::string> language;
};

/// The upstream has captions for the video, but none it is willing to hand out.
struct TranscriptNotFound {
	std::string message;
};

/// Anything else that went wrong upstream. The message text drives classification.
struct TranscriptFetchError {
	std::string message;
};

using TranscriptFetchResult = std::variant<FetchedTranscript, TranscriptNotFound, TranscriptFetchError>;

struct CaptionResponse {
	std::string video_id;
	std::string captions;
	std::string language{kDefaultLanguage};
	double total_duration = 0.0;
};

void to_json(nlohmann::json &j, const CaptionResponse &p);
void from_json(const nlohmann::json &j, CaptionResponse &p);

enum class ErrorKind {
	ValidationError,
	NoTranscriptAvailable,
	VideoNotFound,
	VideoPrivate,
	CaptionsDisabled,
	ProcessingError,
};

[[nodiscard]]
std::string_view errorCodeOf(ErrorKind kind) noexcept;

[[nodiscard]]
int httpStatusOf(ErrorKind kind) noexcept;

struct CaptionError {
	ErrorKind kind = ErrorKind::ProcessingError;
	std::string message;
	std::optional<std::string> video_id;

	[[nodiscard]]
	int httpStatus() const noexcept
	{
		return httpStatusOf(kind);
	}
};

/// Serialized as {"error", "error_code", "video_id"}; video_id is null when unknown.
void to_json(nlohmann::json &j, const CaptionError &p);

using CaptionResult = std::variant<CaptionResponse, CaptionError>;

} // namespace CaptionRelay::Transcript
