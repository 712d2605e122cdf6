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

#include "VideoId.hpp"

#include <algorithm>
#include <cstddef>

namespace CaptionRelay::Transcript {

namespace {

constexpr std::size_t kVideoIdLength = 11;

constexpr std::string_view kWatchUrlMarker = "youtube.com/watch?v=";
constexpr std::string_view kWatchParamMarker = "v=";
constexpr std::string_view kShortUrlMarker = "youtu.be/";

bool isVideoIdChar(char c) noexcept
{
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

// Returns the run of ID characters right after the first occurrence of marker, if non-empty.
std::optional<std::string_view> runAfter(std::string_view input, std::string_view marker)
{
	const std::size_t pos = input.find(marker);
	if (pos == std::string_view::npos) {
		return std::nullopt;
	}

	const std::string_view rest = input.substr(pos + marker.size());
	const auto end = std::find_if_not(rest.begin(), rest.end(), isVideoIdChar);
	const auto length = static_cast<std::size_t>(end - rest.begin());
	if (length == 0) {
		return std::nullopt;
	}
	return rest.substr(0, length);
}

} // anonymous namespace

bool isValidVideoId(std::string_view candidate)
{
	return candidate.size() == kVideoIdLength && std::all_of(candidate.begin(), candidate.end(), isVideoIdChar);
}

std::optional<std::string> normalizeVideoId(std::string_view raw)
{
	std::string_view candidate = raw;

	if (raw.find(kWatchUrlMarker) != std::string_view::npos) {
		candidate = runAfter(raw, kWatchParamMarker).value_or(raw);
	} else if (raw.find(kShortUrlMarker) != std::string_view::npos) {
		candidate = runAfter(raw, kShortUrlMarker).value_or(raw);
	}

	if (!isValidVideoId(candidate)) {
		return std::nullopt;
	}

	return std::string(candidate);
}

} // namespace CaptionRelay::Transcript
