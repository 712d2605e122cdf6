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

#include <string_view>

#include "TranscriptTypes.hpp"

namespace CaptionRelay::Transcript {

/**
 * @brief Maps the text of an upstream failure onto the caption error taxonomy.
 *
 * Matching is a case-insensitive substring search, first rule wins:
 *  - "video unavailable", "video does not exist" or "does not exist" -> VideoNotFound
 *  - "private"                                                    -> VideoPrivate
 *  - "disabled" or "not available"                                -> CaptionsDisabled
 *  - anything else                                                -> ProcessingError
 *
 * The returned error carries the user-facing message but no video_id.
 */
[[nodiscard]]
CaptionError classifyFetchFailure(std::string_view upstreamMessage);

[[nodiscard]]
CaptionError makeNoTranscriptError();

[[nodiscard]]
CaptionError makeValidationError(std::string_view message);

} // namespace CaptionRelay::Transcript
