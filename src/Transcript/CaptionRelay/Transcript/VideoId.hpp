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

namespace CaptionRelay::Transcript {

inline constexpr std::string_view kInvalidVideoIdMessage = "Invalid YouTube video ID format";

/**
 * @brief Reduces a bare video ID or a watch / youtu.be URL to an 11-character video ID.
 *
 * A `youtube.com/watch?v=` URL yields the run of `[a-zA-Z0-9_-]` after `v=`, and a
 * `youtu.be/` URL the run after `youtu.be/`. Anything else is taken as the ID itself.
 * The result must then be exactly 11 characters from that alphabet.
 *
 * @return The normalized ID, or std::nullopt if the input does not reduce to a valid one.
 */
[[nodiscard]]
std::optional<std::string> normalizeVideoId(std::string_view raw);

[[nodiscard]]
bool isValidVideoId(std::string_view candidate);

} // namespace CaptionRelay::Transcript
