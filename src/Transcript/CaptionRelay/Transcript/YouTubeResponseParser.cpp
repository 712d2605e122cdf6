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

#include "YouTubeResponseParser.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <sstream>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include <CaptionRelay/CurlHelper/CurlUrlHandle.hpp>

namespace CaptionRelay::Transcript {

namespace {

std::string toLowercase(std::string s)
{
	std::transform(s.begin(), s.end(), s.begin(),
		       [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
	return s;
}

bool isApiKeyChar(char c) noexcept
{
	return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

} // anonymous namespace

void from_json(const nlohmann::json &j, CaptionTrack &p)
{
	j.at("baseUrl").get_to(p.baseUrl);
	j.at("languageCode").get_to(p.languageCode);
	p.isGenerated = j.value("kind", std::string()) == "asr";
}

std::optional<std::string> extractInnertubeApiKey(std::string_view html)
{
	constexpr std::string_view marker = "\"INNERTUBE_API_KEY\":";

	for (std::size_t pos = html.find(marker); pos != std::string_view::npos; pos = html.find(marker, pos + 1)) {
		std::string_view rest = html.substr(pos + marker.size());
		const auto valueStart = std::find_if_not(rest.begin(), rest.end(), [](char c) {
			return std::isspace(static_cast<unsigned char>(c));
		});
		rest.remove_prefix(static_cast<std::size_t>(valueStart - rest.begin()));
		if (rest.empty() || rest.front() != '"') {
			continue;
		}
		rest.remove_prefix(1);

		const auto keyEnd = std::find_if_not(rest.begin(), rest.end(), isApiKeyChar);
		const auto keyLength = static_cast<std::size_t>(keyEnd - rest.begin());
		if (keyLength > 0 && keyLength < rest.size() && rest[keyLength] == '"') {
			return std::string(rest.substr(0, keyLength));
		}
	}
	return std::nullopt;
}

bool isCaptchaPage(std::string_view html)
{
	return html.find("class=\"g-recaptcha\"") != std::string_view::npos;
}

std::vector<CaptionTrack> parseCaptionTracks(const nlohmann::json &playerResponse)
{
	const nlohmann::json::json_pointer tracksPointer("/captions/playerCaptionsTracklistRenderer/captionTracks");
	if (!playerResponse.contains(tracksPointer) || !playerResponse.at(tracksPointer).is_array()) {
		return {};
	}

	std::vector<CaptionTrack> tracks;
	for (const nlohmann::json &item : playerResponse.at(tracksPointer)) {
		if (item.contains("baseUrl") && item.contains("languageCode")) {
			tracks.push_back(item.get<CaptionTrack>());
		}
	}
	return tracks;
}

std::optional<CaptionTrack> selectCaptionTrack(std::span<const CaptionTrack> tracks,
					       std::span<const std::string> preferredLanguages)
{
	for (const std::string &language : preferredLanguages) {
		for (bool generated : {false, true}) {
			auto it = std::find_if(tracks.begin(), tracks.end(), [&](const CaptionTrack &track) {
				return track.languageCode == language && track.isGenerated == generated;
			});
			if (it != tracks.end()) {
				return *it;
			}
		}
	}
	return std::nullopt;
}

PlayerInspection inspectPlayerResponse(const nlohmann::json &playerResponse,
				       std::span<const std::string> preferredLanguages)
{
	const nlohmann::json playability = playerResponse.value("playabilityStatus", nlohmann::json::object());
	const std::string status = playability.value("status", std::string("OK"));
	const std::string reason = playability.value("reason", std::string());

	if (status == "ERROR") {
		return TranscriptFetchError{
			fmt::format("Video unavailable: {}", reason.empty() ? "The video is no longer available" : reason)};
	}
	if (status == "LOGIN_REQUIRED" && toLowercase(reason).find("private") != std::string::npos) {
		return TranscriptFetchError{"Video is private"};
	}
	if (status != "OK") {
		return TranscriptFetchError{fmt::format("Video is unplayable ({}): {}", status, reason)};
	}

	const std::vector<CaptionTrack> tracks = parseCaptionTracks(playerResponse);
	if (tracks.empty()) {
		return TranscriptFetchError{"Subtitles are disabled for this video"};
	}

	if (std::optional<CaptionTrack> track = selectCaptionTrack(tracks, preferredLanguages)) {
		return std::move(*track);
	}

	std::vector<std::string> available;
	for (const CaptionTrack &track : tracks) {
		available.push_back(track.isGenerated ? track.languageCode + " (generated)" : track.languageCode);
	}
	return TranscriptNotFound{fmt::format("No transcripts were found for any of the requested language codes: {}"
					      " (available: {})",
					      fmt::join(preferredLanguages, ", "), fmt::join(available, ", "))};
}

std::vector<TranscriptSegment> parseJson3Transcript(std::string_view body)
{
	const nlohmann::json j = nlohmann::json::parse(body);

	std::vector<TranscriptSegment> segments;
	if (!j.contains("events")) {
		return segments;
	}

	for (const nlohmann::json &event : j.at("events")) {
		if (!event.contains("segs")) {
			continue;
		}

		std::string text;
		for (const nlohmann::json &seg : event.at("segs")) {
			text += seg.value("utf8", std::string());
		}
		if (text.empty()) {
			continue;
		}

		TranscriptSegment segment;
		segment.text = std::move(text);
		segment.start = static_cast<double>(event.value("tStartMs", std::int64_t{0})) / 1000.0;
		segment.duration = static_cast<double>(event.value("dDurationMs", std::int64_t{0})) / 1000.0;
		segments.push_back(std::move(segment));
	}

	return segments;
}

std::string withJson3Format(const std::string &baseUrl)
{
	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(baseUrl.c_str());

	std::vector<std::string> kept;
	std::istringstream iss(urlHandle.query());
	std::string param;
	while (std::getline(iss, param, '&')) {
		if (!param.empty() && param.rfind("fmt=", 0) != 0) {
			kept.push_back(param);
		}
	}
	kept.emplace_back("fmt=json3");

	urlHandle.setQuery(fmt::format("{}", fmt::join(kept, "&")));
	return std::string(urlHandle.c_str().get());
}

} // namespace CaptionRelay::Transcript
