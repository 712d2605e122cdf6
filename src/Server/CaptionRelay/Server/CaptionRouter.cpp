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

#include "CaptionRouter.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <CaptionRelay/CurlHelper/CurlHandle.hpp>
#include <CaptionRelay/Transcript/ErrorClassifier.hpp>
#include <CaptionRelay/Transcript/TranscriptTypes.hpp>

namespace CaptionRelay::Server {

namespace http = boost::beast::http;

namespace {

constexpr std::string_view kRootPath = "/";
constexpr std::string_view kHealthPath = "/health";
constexpr std::string_view kGetCaptionsPath = "/get-captions";
constexpr std::string_view kVideoPathPrefix = "/video/";
constexpr std::string_view kVideoPathSuffix = "/captions";

constexpr std::string_view kAllowedMethods = "GET, POST, OPTIONS";
constexpr std::string_view kPreflightMaxAgeSeconds = "600";

constexpr std::string_view kInvalidBodyMessage = "Request body must be a JSON object with a string field video_id";

template<typename StringViewLike>
std::string_view toStdStringView(const StringViewLike &sv)
{
	return std::string_view(sv.data(), sv.size());
}

void applyCorsHeaders(const CaptionRouter::Request &request, CaptionRouter::Response &response)
{
	const std::string_view origin = toStdStringView(request[http::field::origin]);
	if (origin.empty()) {
		response.set(http::field::access_control_allow_origin, "*");
	} else {
		response.set(http::field::access_control_allow_origin, std::string(origin));
		response.set(http::field::access_control_allow_credentials, "true");
		response.set(http::field::vary, "Origin");
	}
}

CaptionRouter::Response makeJsonResponse(const CaptionRouter::Request &request, unsigned status,
					 const nlohmann::json &body)
{
	CaptionRouter::Response response{static_cast<http::status>(status), request.version()};
	response.set(http::field::content_type, "application/json");
	response.keep_alive(request.keep_alive());
	response.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
	applyCorsHeaders(request, response);
	response.prepare_payload();
	return response;
}

CaptionRouter::Response makePreflightResponse(const CaptionRouter::Request &request)
{
	CaptionRouter::Response response{http::status::no_content, request.version()};
	response.keep_alive(request.keep_alive());
	applyCorsHeaders(request, response);
	response.set(http::field::access_control_allow_methods, std::string(kAllowedMethods));

	const std::string_view requestedHeaders = toStdStringView(request[http::field::access_control_request_headers]);
	response.set(http::field::access_control_allow_headers,
		     requestedHeaders.empty() ? std::string("*") : std::string(requestedHeaders));
	response.set(http::field::access_control_max_age, std::string(kPreflightMaxAgeSeconds));
	response.prepare_payload();
	return response;
}

CaptionRouter::Response makeDetailResponse(const CaptionRouter::Request &request, http::status status,
					   std::string_view detail)
{
	return makeJsonResponse(request, static_cast<unsigned>(status), nlohmann::json{{"detail", detail}});
}

CaptionRouter::Response makeErrorResponse(const CaptionRouter::Request &request,
					  const Transcript::CaptionError &error)
{
	return makeJsonResponse(request, static_cast<unsigned>(error.httpStatus()), nlohmann::json(error));
}

// Matches /video/{video_id}/captions and yields the still-encoded path segment.
std::optional<std::string_view> matchCaptionsByPath(std::string_view path)
{
	if (path.size() <= kVideoPathPrefix.size() + kVideoPathSuffix.size()) {
		return std::nullopt;
	}
	if (path.substr(0, kVideoPathPrefix.size()) != kVideoPathPrefix ||
	    path.substr(path.size() - kVideoPathSuffix.size()) != kVideoPathSuffix) {
		return std::nullopt;
	}

	std::string_view segment = path.substr(kVideoPathPrefix.size(),
					       path.size() - kVideoPathPrefix.size() - kVideoPathSuffix.size());
	if (segment.find('/') != std::string_view::npos) {
		return std::nullopt;
	}
	return segment;
}

} // anonymous namespace

CaptionRouter::CaptionRouter(std::shared_ptr<const Transcript::ICaptionService> service, ServiceConfig config,
			     std::shared_ptr<const Logger::ILogger> logger)
	: service_(service ? std::move(service)
			   : throw std::invalid_argument("ServiceIsNullError(CaptionRouter::CaptionRouter)")),
	  config_(std::move(config)),
	  logger_(logger ? std::move(logger)
			 : throw std::invalid_argument("LoggerIsNullError(CaptionRouter::CaptionRouter)"))
{
}

CaptionRouter::~CaptionRouter() noexcept = default;

CaptionRouter::Response CaptionRouter::handle(const Request &request) const
{
	const std::string_view target = toStdStringView(request.target());
	const std::string_view path = target.substr(0, target.find('?'));

	Response response;
	std::optional<std::string> videoId;
	try {
		response = dispatch(request, path, videoId);
	} catch (const std::exception &e) {
		logger_->error("UnhandledRequestError", {{"target", target}, {"error", e.what()}});
		Transcript::CaptionError error{.kind = Transcript::ErrorKind::ProcessingError,
					       .message = fmt::format("Error processing video: {}", e.what()),
					       .video_id = std::move(videoId)};
		response = makeErrorResponse(request, error);
	}

	if (logger_->isEnabled(Logger::LogLevel::Debug)) {
		logger_->debug("HttpRequestHandled", {{"method", toStdStringView(request.method_string())},
						      {"target", target},
						      {"status", std::to_string(response.result_int())}});
	}
	return response;
}

CaptionRouter::Response CaptionRouter::dispatch(const Request &request, std::string_view path,
						std::optional<std::string> &videoId) const
{
	const http::verb method = request.method();

	if (path == kRootPath || path == kHealthPath) {
		if (method == http::verb::options) {
			return makePreflightResponse(request);
		}
		if (method != http::verb::get) {
			return makeDetailResponse(request, http::status::method_not_allowed, "Method Not Allowed");
		}
		return path == kRootPath ? handleRootHealth(request) : handleHealth(request);
	}

	if (path == kGetCaptionsPath) {
		if (method == http::verb::options) {
			return makePreflightResponse(request);
		}
		if (method != http::verb::post) {
			return makeDetailResponse(request, http::status::method_not_allowed, "Method Not Allowed");
		}
		return handleGetCaptions(request, videoId);
	}

	if (std::optional<std::string_view> encodedVideoId = matchCaptionsByPath(path)) {
		if (method == http::verb::options) {
			return makePreflightResponse(request);
		}
		if (method != http::verb::get) {
			return makeDetailResponse(request, http::status::method_not_allowed, "Method Not Allowed");
		}
		return handleCaptionsByPath(request, *encodedVideoId, videoId);
	}

	return makeDetailResponse(request, http::status::not_found, "Not Found");
}

CaptionRouter::Response CaptionRouter::handleRootHealth(const Request &request) const
{
	nlohmann::json body{
		{"status", "healthy"},
		{"service", config_.serviceName},
		{"version", config_.version},
		{"endpoints",
		 {
			 {"get_captions", std::string(kGetCaptionsPath)},
			 {"captions_by_path", "/video/{video_id}/captions"},
			 {"health", std::string(kRootPath)},
		 }},
	};
	return makeJsonResponse(request, static_cast<unsigned>(http::status::ok), body);
}

CaptionRouter::Response CaptionRouter::handleHealth(const Request &request) const
{
	nlohmann::json body{
		{"status", "ok"},
		{"service", config_.serviceSlug},
		{"version", config_.version},
	};
	return makeJsonResponse(request, static_cast<unsigned>(http::status::ok), body);
}

CaptionRouter::Response CaptionRouter::handleGetCaptions(const Request &request,
							 std::optional<std::string> &videoId) const
{
	const nlohmann::json body = nlohmann::json::parse(request.body(), nullptr, false);

	if (body.is_discarded() || !body.is_object()) {
		logger_->warn("InvalidRequestBody", {{"reason", "NotAJsonObject"}});
		return makeErrorResponse(request, Transcript::makeValidationError(kInvalidBodyMessage));
	}

	auto it = body.find("video_id");
	if (it == body.end() || !it->is_string()) {
		logger_->warn("InvalidRequestBody", {{"reason", "VideoIdMissingOrNotString"}});
		return makeErrorResponse(request, Transcript::makeValidationError(kInvalidBodyMessage));
	}

	videoId = it->get<std::string>();
	return respondWithResult(request, service_->getCaptions(*videoId));
}

CaptionRouter::Response CaptionRouter::handleCaptionsByPath(const Request &request,
							    std::string_view encodedVideoId,
							    std::optional<std::string> &videoId) const
{
	// Echoed as-is if decoding fails.
	videoId = std::string(encodedVideoId);

	CurlHelper::CurlHandle curl;
	videoId = curl.unescape(encodedVideoId);

	return respondWithResult(request, service_->getCaptions(*videoId));
}

CaptionRouter::Response CaptionRouter::respondWithResult(const Request &request,
							 const Transcript::CaptionResult &result) const
{
	if (const auto *response = std::get_if<Transcript::CaptionResponse>(&result)) {
		return makeJsonResponse(request, static_cast<unsigned>(http::status::ok), nlohmann::json(*response));
	}
	return makeErrorResponse(request, std::get<Transcript::CaptionError>(result));
}

} // namespace CaptionRelay::Server
