/*
 * SPDX-FileCopyrightText: Copyright (C) 2026 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * CaptionRelay CurlHelper Library
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

#include <cstddef>
#include <exception>
#include <limits>
#include <vector>

#include <curl/curl.h>

namespace CaptionRelay::CurlHelper {

/// Response body with an upper bound on its size.
struct CurlResponseBuffer {
	explicit CurlResponseBuffer(std::size_t maxBytes) : limit(maxBytes) {}

	std::vector<char> data;
	const std::size_t limit;
	/// Set when the transfer was aborted because the body would exceed limit.
	bool overflowed = false;
};

/// userp MUST point to a CurlResponseBuffer. Aborts the transfer once the limit would be exceeded.
inline std::size_t CurlResponseBufferWriteCallback(void *contents, std::size_t size, std::size_t nmemb,
						   void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return CURL_WRITEFUNC_ERROR;
	}

	const std::size_t totalSize = size * nmemb;
	auto *buffer = static_cast<CurlResponseBuffer *>(userp);

	if (totalSize > buffer->limit - buffer->data.size()) {
		buffer->overflowed = true;
		return CURL_WRITEFUNC_ERROR;
	}

	try {
		const auto *start = static_cast<const char *>(contents);
		buffer->data.insert(buffer->data.end(), start, start + totalSize);
	} catch (const std::exception &) {
		return CURL_WRITEFUNC_ERROR;
	}

	return totalSize;
}

} // namespace CaptionRelay::CurlHelper
