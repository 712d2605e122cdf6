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

#include <string>

#include "TranscriptTypes.hpp"

namespace CaptionRelay::Transcript {

class ITranscriptProvider {
public:
	ITranscriptProvider() noexcept = default;
	virtual ~ITranscriptProvider() = default;

	ITranscriptProvider(const ITranscriptProvider &) = delete;
	ITranscriptProvider &operator=(const ITranscriptProvider &) = delete;
	ITranscriptProvider(ITranscriptProvider &&) = delete;
	ITranscriptProvider &operator=(ITranscriptProvider &&) = delete;

	/// Blocking. May be called from many request threads at once.
	virtual TranscriptFetchResult fetchTranscript(const std::string &videoId) const = 0;
};

} // namespace CaptionRelay::Transcript
