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

#include "TranscriptTypes.hpp"

#include <nlohmann/json.hpp>

namespace CaptionRelay::Transcript {

void to_json(nlohmann::json &j, const CaptionResponse &p)
{
	j = nlohmann::json{
		{"video_id", p.video_id},
		{"captions", p.captions},
		{"language", p.language},
		{"total_duration", p.total_duration},
	};
}

void from_json(const nlohmann::json &j, CaptionResponse &p)
{
	j.at("video_id").get_to(p.video_id);
	j.at("captions").get_to(p.captions);

	if (auto it = j.find("language"); it != j.end() && !it->is_null()) {
		it->get_to(p.language);
	} else {
		p.language = kDefaultLanguage;
	}

	if (auto it = j.find("total_duration"); it != j.end() && !it->is_null()) {
		it->get_to(p.total_duration);
	} else {
		p.total_duration = 0.0;
	}
}

std::string_view errorCodeOf(ErrorKind kind) noexcept
{
	switch (kind) {
	case ErrorKind::ValidationError:
		return "VALIDATION_ERROR";
	case ErrorKind::NoTranscriptAvailable:
		return "NO_TRANSCRIPT_AVAILABLE";
	case ErrorKind::VideoNotFound:
		return "VIDEO_NOT_FOUND";
	case ErrorKind::VideoPrivate:
		return "VIDEO_PRIVATE";
	case ErrorKind::CaptionsDisabled:
		return "CAPTIONS_DISABLED";
	case ErrorKind::ProcessingError:
		return "PROCESSING_ERROR";
	}
	return "PROCESSING_ERROR";
}

int httpStatusOf(ErrorKind kind) noexcept
{
	switch (kind) {
	case ErrorKind::ValidationError:
		return 400;
	case ErrorKind::NoTranscriptAvailable:
		return 404;
	case ErrorKind::VideoNotFound:
		return 404;
	case ErrorKind::VideoPrivate:
		return 403;
	case ErrorKind::CaptionsDisabled:
		return 400;
	case ErrorKind::ProcessingError:
		return 500;
	}
	return 500;
}

void to_json(nlohmann::json &j, const CaptionError &p)
{
	j = nlohmann::json{
		{"error", p.message},
		{"error_code", std::string(errorCodeOf(p.kind))},
	};

	if (p.video_id.has_value()) {
		j["video_id"] = *p.video_id;
	} else {
		j["video_id"] = nullptr;
	}
}

} // namespace CaptionRelay::Transcript
