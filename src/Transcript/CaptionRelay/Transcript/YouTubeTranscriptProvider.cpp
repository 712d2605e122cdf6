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

#include "YouTubeTranscriptProvider.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <CaptionRelay/CurlHelper/CurlHandle.hpp>
#include <CaptionRelay/CurlHelper/CurlSlistHandle.hpp>
#include <CaptionRelay/CurlHelper/CurlUrlHandle.hpp>
#include <CaptionRelay/CurlHelper/CurlWriteCallback.hpp>

#include "YouTubeResponseParser.hpp"

namespace CaptionRelay::Transcript {

namespace {

constexpr std::string_view kWatchPath = "/watch";
constexpr std::string_view kPlayerPath = "/youtubei/v1/player";
constexpr const char *kInnertubeClientName = "ANDROID";
constexpr const char *kInnertubeClientVersion = "20.10.38";
constexpr long kMaxConnectTimeoutMs = 10000;

class UpstreamError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

using Clock = std::chrono::steady_clock;

class RequestBudget {
public:
	explicit RequestBudget(std::chrono::milliseconds timeout) : timeout_(timeout), deadline_(Clock::now() + timeout)
	{
	}

	long remainingMs() const
	{
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
		if (remaining.count() <= 0) {
			throw UpstreamError(timedOutMessage());
		}
		return static_cast<long>(remaining.count());
	}

	std::string timedOutMessage() const
	{
		return fmt::format("Upstream request timed out after {} ms", timeout_.count());
	}

private:
	const std::chrono::milliseconds timeout_;
	const Clock::time_point deadline_;
};

struct HttpRequest {
	const char *url = nullptr;
	const std::string *postBody = nullptr;
	curl_slist *headers = nullptr;
};

std::vector<char> perform(CurlHelper::CurlHandle &curl, const HttpRequest &request, const RequestBudget &budget,
			  const YouTubeTranscriptProviderOptions &options, const Logger::ILogger &logger)
{
	if (!request.url) {
		throw std::invalid_argument("UrlIsNullError(YouTubeTranscriptProvider::perform)");
	}

	const long remainingMs = budget.remainingMs();

	CurlHelper::CurlResponseBuffer readBuffer(options.maxResponseBytes);
	curl.prepareTransfer(readBuffer, std::min(remainingMs, kMaxConnectTimeoutMs), remainingMs);

	curl.setOpt(CURLOPT_URL, request.url);
	curl.setOpt(CURLOPT_HTTPHEADER, request.headers);
	if (request.postBody) {
		curl.setOpt(CURLOPT_POST, 1L);
		curl.setOpt(CURLOPT_POSTFIELDS, request.postBody->data());
		curl.setOpt(CURLOPT_POSTFIELDSIZE, static_cast<long>(request.postBody->size()));
	}

	curl.setOpt(CURLOPT_USERAGENT, options.userAgent.c_str());
	curl.setOpt(CURLOPT_COOKIE, "CONSENT=YES+cb; SOCS=CAI");
	curl.setOpt(CURLOPT_ACCEPT_ENCODING, "");
	curl.setOpt(CURLOPT_FOLLOWLOCATION, 1L);
	curl.setOpt(CURLOPT_MAXREDIRS, 5L);

	CURLcode res = curl.perform();

	if (res == CURLE_OPERATION_TIMEDOUT) {
		logger.error("UpstreamRequestTimedOut", {{"url", request.url}});
		throw UpstreamError(budget.timedOutMessage());
	}
	if (res == CURLE_WRITE_ERROR && readBuffer.overflowed) {
		logger.error("UpstreamResponseTooLarge",
			     {{"url", request.url}, {"limit", std::to_string(readBuffer.limit)}});
		throw UpstreamError(fmt::format("Upstream response exceeded {} bytes", readBuffer.limit));
	}
	if (res != CURLE_OK) {
		logger.error("UpstreamRequestFailed", {{"url", request.url}, {"error", curl_easy_strerror(res)}});
		throw UpstreamError(fmt::format("Upstream request failed: {}", curl_easy_strerror(res)));
	}

	const long httpStatus = curl.responseCode();

	if (httpStatus == 429) {
		logger.error("UpstreamRateLimited", {{"url", request.url}});
		throw UpstreamError("Too many requests: YouTube is rate limiting this server (HTTP 429)");
	}
	if (httpStatus != 200) {
		logger.error("UpstreamHttpError", {{"url", request.url}, {"status", std::to_string(httpStatus)}});
		throw UpstreamError(fmt::format("Upstream returned HTTP {}", httpStatus));
	}

	return std::move(readBuffer.data);
}

std::string fetchApiKey(CurlHelper::CurlHandle &curl, const std::string &videoId, const RequestBudget &budget,
			const YouTubeTranscriptProviderOptions &options, const Logger::ILogger &logger)
{
	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(fmt::format("{}{}", options.baseUrl, kWatchPath).c_str());
	urlHandle.appendQuery("v", videoId);
	auto url = urlHandle.c_str();

	CurlHelper::CurlSlistHandle headers;
	headers.append("Accept-Language: en-US");

	std::vector<char> responseBody = perform(curl, {.url = url.get(), .headers = headers.getRaw()}, budget,
						 options, logger);
	std::string_view html(responseBody.data(), responseBody.size());

	if (isCaptchaPage(html)) {
		throw UpstreamError("Too many requests from this IP: YouTube requires a captcha");
	}

	std::optional<std::string> apiKey = extractInnertubeApiKey(html);
	if (!apiKey.has_value()) {
		throw UpstreamError("Could not find the innertube API key on the watch page");
	}
	return *apiKey;
}

nlohmann::json fetchPlayerResponse(CurlHelper::CurlHandle &curl, const std::string &videoId,
				   const std::string &apiKey, const RequestBudget &budget,
				   const YouTubeTranscriptProviderOptions &options, const Logger::ILogger &logger)
{
	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(fmt::format("{}{}", options.baseUrl, kPlayerPath).c_str());
	urlHandle.appendQuery("key", apiKey);
	auto url = urlHandle.c_str();

	CurlHelper::CurlSlistHandle headers;
	headers.append("Content-Type: application/json");
	headers.append("Accept-Language: en-US");

	nlohmann::json requestBody{
		{"context", {{"client", {{"clientName", kInnertubeClientName}, {"clientVersion", kInnertubeClientVersion}}}}},
		{"videoId", videoId},
	};
	const std::string bodyStr = requestBody.dump();

	std::vector<char> responseBody = perform(
		curl, {.url = url.get(), .postBody = &bodyStr, .headers = headers.getRaw()}, budget, options, logger);

	return nlohmann::json::parse(responseBody);
}

std::vector<TranscriptSegment> fetchJson3Transcript(CurlHelper::CurlHandle &curl, const CaptionTrack &track,
						    const RequestBudget &budget,
						    const YouTubeTranscriptProviderOptions &options,
						    const Logger::ILogger &logger)
{
	const std::string url = withJson3Format(track.baseUrl);

	std::vector<char> responseBody = perform(curl, {.url = url.c_str()}, budget, options, logger);
	if (responseBody.empty()) {
		throw UpstreamError("Upstream returned an empty transcript body");
	}

	return parseJson3Transcript(std::string_view(responseBody.data(), responseBody.size()));
}

} // anonymous namespace

YouTubeTranscriptProvider::YouTubeTranscriptProvider(YouTubeTranscriptProviderOptions options,
						     std::shared_ptr<const Logger::ILogger> logger)
	: options_(std::move(options)),
	  logger_(logger ? std::move(logger)
			 : throw std::invalid_argument(
				   "LoggerIsNullError(YouTubeTranscriptProvider::YouTubeTranscriptProvider)"))
{
	if (options_.timeout.count() <= 0) {
		throw std::invalid_argument("TimeoutIsNotPositiveError(YouTubeTranscriptProvider::YouTubeTranscriptProvider)");
	}
	if (options_.baseUrl.empty()) {
		throw std::invalid_argument("BaseUrlIsEmptyError(YouTubeTranscriptProvider::YouTubeTranscriptProvider)");
	}
	if (options_.languages.empty()) {
		throw std::invalid_argument("LanguagesIsEmptyError(YouTubeTranscriptProvider::YouTubeTranscriptProvider)");
	}
}

YouTubeTranscriptProvider::~YouTubeTranscriptProvider() noexcept = default;

TranscriptFetchResult YouTubeTranscriptProvider::fetchTranscript(const std::string &videoId) const
{
	const RequestBudget budget(options_.timeout);

	try {
		CurlHelper::CurlHandle curl;

		const std::string apiKey = fetchApiKey(curl, videoId, budget, options_, *logger_);
		const nlohmann::json playerResponse =
			fetchPlayerResponse(curl, videoId, apiKey, budget, options_, *logger_);

		PlayerInspection inspection = inspectPlayerResponse(playerResponse, options_.languages);
		if (auto *notFound = std::get_if<TranscriptNotFound>(&inspection)) {
			return std::move(*notFound);
		}
		if (auto *fetchError = std::get_if<TranscriptFetchError>(&inspection)) {
			return std::move(*fetchError);
		}

		const CaptionTrack &track = std::get<CaptionTrack>(inspection);
		if (track.baseUrl.find("&exp=xpe") != std::string::npos) {
			return TranscriptFetchError{"YouTube requires a PO token to fetch captions for this video"};
		}

		logger_->debug("CaptionTrackSelected", {{"videoId", videoId},
							{"language", track.languageCode},
							{"generated", track.isGenerated ? "true" : "false"}});

		FetchedTranscript transcript;
		transcript.segments = fetchJson3Transcript(curl, track, budget, options_, *logger_);
		transcript.language = track.languageCode;
		return transcript;
	} catch (const UpstreamError &e) {
		return TranscriptFetchError{e.what()};
	} catch (const nlohmann::json::exception &e) {
		logger_->error("UpstreamResponseParseError", {{"videoId", videoId}, {"error", e.what()}});
		return TranscriptFetchError{fmt::format("Failed to parse upstream response: {}", e.what())};
	} catch (const std::runtime_error &e) {
		logger_->error("UpstreamClientError", {{"videoId", videoId}, {"error", e.what()}});
		return TranscriptFetchError{e.what()};
	}
}

} // namespace CaptionRelay::Transcript
