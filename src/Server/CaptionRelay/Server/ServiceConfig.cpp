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

#include "ServiceConfig.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

namespace CaptionRelay::Server {

namespace {

constexpr long kMinUpstreamTimeoutSeconds = 1;
constexpr long kMaxUpstreamTimeoutSeconds = 300;

std::string toLowercase(std::string s)
{
	std::transform(s.begin(), s.end(), s.begin(),
		       [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
	return s;
}

std::string trim(std::string_view s)
{
	const auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
	auto first = std::find_if_not(s.begin(), s.end(), isSpace);
	auto last = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
	return first < last ? std::string(first, last) : std::string();
}

template<typename T>
std::optional<T> parseInteger(std::string_view value, T min, T max)
{
	const std::string trimmed = trim(value);
	T parsed{};
	auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), parsed);
	if (ec != std::errc() || ptr != trimmed.data() + trimmed.size() || trimmed.empty()) {
		return std::nullopt;
	}
	if (parsed < min || parsed > max) {
		return std::nullopt;
	}
	return parsed;
}

std::vector<std::string> splitLanguages(std::string_view value)
{
	std::vector<std::string> languages;
	std::istringstream iss{std::string(value)};
	std::string item;
	while (std::getline(iss, item, ',')) {
		std::string language = trim(item);
		if (!language.empty()) {
			languages.push_back(std::move(language));
		}
	}
	return languages;
}

} // anonymous namespace

std::optional<Logger::LogLevel> parseLogLevel(std::string_view value)
{
	const std::string lowered = toLowercase(trim(value));
	if (lowered == "debug") {
		return Logger::LogLevel::Debug;
	} else if (lowered == "info") {
		return Logger::LogLevel::Info;
	} else if (lowered == "warn" || lowered == "warning") {
		return Logger::LogLevel::Warn;
	} else if (lowered == "error") {
		return Logger::LogLevel::Error;
	}
	return std::nullopt;
}

ServiceConfig ServiceConfig::load(const EnvironmentLookup &lookup, const Logger::ILogger &logger)
{
	ServiceConfig config;

	if (std::optional<std::string> host = lookup("HOST")) {
		if (std::string trimmed = trim(*host); !trimmed.empty()) {
			config.host = std::move(trimmed);
		} else {
			logger.warn("InvalidConfigValue", {{"key", "HOST"}, {"value", *host}});
		}
	}

	if (std::optional<std::string> port = lookup("PORT")) {
		if (auto parsed = parseInteger<unsigned int>(*port, 0, std::numeric_limits<std::uint16_t>::max())) {
			config.port = static_cast<std::uint16_t>(*parsed);
		} else {
			logger.warn("InvalidConfigValue", {{"key", "PORT"}, {"value", *port}});
		}
	}

	if (std::optional<std::string> logLevel = lookup("LOG_LEVEL")) {
		if (auto parsed = parseLogLevel(*logLevel)) {
			config.logLevel = *parsed;
		} else {
			logger.warn("InvalidConfigValue", {{"key", "LOG_LEVEL"}, {"value", *logLevel}});
		}
	}

	if (std::optional<std::string> timeout = lookup("UPSTREAM_TIMEOUT_SECONDS")) {
		if (auto parsed = parseInteger<long>(*timeout, kMinUpstreamTimeoutSeconds, kMaxUpstreamTimeoutSeconds)) {
			config.upstreamTimeout = std::chrono::seconds(*parsed);
		} else {
			logger.warn("InvalidConfigValue", {{"key", "UPSTREAM_TIMEOUT_SECONDS"}, {"value", *timeout}});
		}
	}

	if (std::optional<std::string> languages = lookup("TRANSCRIPT_LANGUAGES")) {
		if (std::vector<std::string> parsed = splitLanguages(*languages); !parsed.empty()) {
			config.transcriptLanguages = std::move(parsed);
		} else {
			logger.warn("InvalidConfigValue", {{"key", "TRANSCRIPT_LANGUAGES"}, {"value", *languages}});
		}
	}

	return config;
}

ServiceConfig ServiceConfig::loadFromEnvironment(const Logger::ILogger &logger)
{
	return load(
		[](const char *name) -> std::optional<std::string> {
			if (const char *value = std::getenv(name)) {
				return std::string(value);
			}
			return std::nullopt;
		},
		logger);
}

} // namespace CaptionRelay::Server
