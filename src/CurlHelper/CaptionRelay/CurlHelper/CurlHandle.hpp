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
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <curl/curl.h>

#include "CurlWriteCallback.hpp"

namespace CaptionRelay::CurlHelper {

/**
 * @brief Owns one easy handle and the setup shared by every transfer made through it.
 *
 * A handle is reused for the consecutive requests of one fetch. `prepareTransfer` clears
 * whatever the previous request left behind.
 */
class CurlHandle {
	[[nodiscard]]
	static auto createCurlHandle()
	{
		CURL *curl = curl_easy_init();
		if (!curl)
			throw std::runtime_error("CurlInitError(CurlHandle::createCurlHandle)");
		return std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>(curl, &curl_easy_cleanup);
	}

public:
	CurlHandle() : curl_(createCurlHandle()) {}

	~CurlHandle() noexcept = default;

	CurlHandle(const CurlHandle &) = delete;
	CurlHandle &operator=(const CurlHandle &) = delete;
	CurlHandle(CurlHandle &&) = delete;
	CurlHandle &operator=(CurlHandle &&) = delete;

	template<typename T>
	void setOpt(CURLoption option, T value)
	{
		CURLcode res = curl_easy_setopt(curl_.get(), option, value);
		if (res != CURLE_OK) {
			throw std::runtime_error(std::string("SetOptError(CurlHandle::setOpt):") + curl_easy_strerror(res));
		}
	}

	/**
	 * @brief Resets every option and directs the response body into responseBody.
	 *
	 * Signals stay off so the handle is safe on worker threads, and TLS peers are always verified.
	 * responseBody MUST outlive the next call to perform().
	 */
	void prepareTransfer(CurlResponseBuffer &responseBody, long connectTimeoutMs, long timeoutMs)
	{
		curl_easy_reset(curl_.get());

		setOpt(CURLOPT_WRITEFUNCTION, CurlResponseBufferWriteCallback);
		setOpt(CURLOPT_WRITEDATA, &responseBody);

		setOpt(CURLOPT_CONNECTTIMEOUT_MS, connectTimeoutMs);
		setOpt(CURLOPT_TIMEOUT_MS, timeoutMs);
		setOpt(CURLOPT_NOSIGNAL, 1L);

		setOpt(CURLOPT_SSL_VERIFYPEER, 1L);
		setOpt(CURLOPT_SSL_VERIFYHOST, 2L);
	}

	[[nodiscard]]
	CURLcode perform() const noexcept
	{
		return curl_easy_perform(curl_.get());
	}

	[[nodiscard]]
	long responseCode() const
	{
		long code = 0;
		CURLcode res = curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &code);
		if (res != CURLE_OK) {
			throw std::runtime_error(std::string("GetInfoError(CurlHandle::responseCode):") +
						 curl_easy_strerror(res));
		}
		return code;
	}

	// Decodes %XX sequences. A '+' is left alone, as in a URL path.
	[[nodiscard]]
	std::string unescape(std::string_view encoded) const
	{
		int decodedLength = 0;
		std::unique_ptr<char, decltype(&curl_free)> decoded(
			curl_easy_unescape(curl_.get(), encoded.data(), static_cast<int>(encoded.size()), &decodedLength),
			curl_free);
		if (!decoded) {
			throw std::runtime_error("DecodeError(CurlHandle::unescape)");
		}
		return std::string(decoded.get(), static_cast<std::size_t>(decodedLength));
	}

private:
	std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
};

} // namespace CaptionRelay::CurlHelper
