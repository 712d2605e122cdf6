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
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "TranscriptTypes.hpp"

namespace CaptionRelay::Transcript {

struct CaptionTrack {
	std::string baseUrl;
	std::string languageCode;
	bool isGenerated = false;
};

void from_json(const nlohmann::json &j, CaptionTrack &p);

using PlayerInspection = std::variant<CaptionTrack, TranscriptNotFound, TranscriptFetchError>;

/// Pulls "INNERTUBE_API_KEY" out of a watch page.
[[nodiscard]]
std::optional<std::string> extractInnertubeApiKey(std::string_view html);

[[nodiscard]]
bool isCaptchaPage(std::string_view html);

[[nodiscard]]
std::vector<CaptionTrack> parseCaptionTracks(const nlohmann::json &playerResponse);

/**
 * @brief Picks the first track matching the preferred languages in order.
 *
 * For each language a manually created track wins over an auto-generated one.
 */
[[nodiscard]]
std::optional<CaptionTrack> selectCaptionTrack(std::span<const CaptionTrack> tracks,
					       std::span<const std::string> preferredLanguages);

/**
 * @brief Checks playability and caption availability of an innertube player response and
 * selects the track to download.
 */
[[nodiscard]]
PlayerInspection inspectPlayerResponse(const nlohmann::json &playerResponse,
				       std::span<const std::string> preferredLanguages);

/**
 * @brief Parses a timedtext document in json3 format.
 *
 * Times are converted from milliseconds to seconds. Events without text are skipped.
 *
 * @throw nlohmann::json::exception If the body is not a json3 document.
 */
[[nodiscard]]
std::vector<TranscriptSegment> parseJson3Transcript(std::string_view body);

/// Rewrites a caption track URL so that the timedtext endpoint answers in json3.
[[nodiscard]]
std::string withJson3Format(const std::string &baseUrl);

} // namespace CaptionRelay::Transcript
