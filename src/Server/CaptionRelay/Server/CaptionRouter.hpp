/*
 * SPDX-FileCopyrightText: Copyright (C) 2026 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * CaptionRelay Server Library
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

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <CaptionRelay/Logger/ILogger.hpp>
#include <CaptionRelay/Transcript/ICaptionService.hpp>

#include "ServiceConfig.hpp"

namespace CaptionRelay::Server {

/**
 * @brief Maps HTTP requests onto the caption service.
 *
 * Routes:
 *  - GET  /                          health payload with endpoint listing
 *  - GET  /health                    short health payload
 *  - POST /get-captions              {"video_id": "..."} in the body
 *  - GET  /video/{video_id}/captions video ID (or percent-encoded URL) in the path
 *
 * Every response carries CORS headers and OPTIONS answers preflight requests on known paths.
 * Nothing thrown below this class reaches the transport; it is turned into a 500 response.
 */
class CaptionRouter {
public:
	using Request = boost::beast::http::request<boost::beast::http::string_body>;
	using Response = boost::beast::http::response<boost::beast::http::string_body>;

	CaptionRouter(std::shared_ptr<const Transcript::ICaptionService> service, ServiceConfig config,
		      std::shared_ptr<const Logger::ILogger> logger);

	~CaptionRouter() noexcept;

	CaptionRouter(const CaptionRouter &) = delete;
	CaptionRouter &operator=(const CaptionRouter &) = delete;

	Response handle(const Request &request) const;

private:
	// videoId receives the raw video ID as soon as it is known, so a 500 can still echo it.
	Response dispatch(const Request &request, std::string_view path, std::optional<std::string> &videoId) const;

	Response handleRootHealth(const Request &request) const;
	Response handleHealth(const Request &request) const;
	Response handleGetCaptions(const Request &request, std::optional<std::string> &videoId) const;
	Response handleCaptionsByPath(const Request &request, std::string_view encodedVideoId,
				      std::optional<std::string> &videoId) const;

	Response respondWithResult(const Request &request, const Transcript::CaptionResult &result) const;

	const std::shared_ptr<const Transcript::ICaptionService> service_;
	const ServiceConfig config_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace CaptionRelay::Server
