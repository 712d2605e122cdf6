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

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <CaptionRelay/Logger/ILogger.hpp>

#ifndef CAPTION_RELAY_VERSION
#define CAPTION_RELAY_VERSION "0.0.0"
#endif

namespace CaptionRelay::Server {

[[nodiscard]]
std::optional<Logger::LogLevel> parseLogLevel(std::string_view value);

struct ServiceConfig {
	std::string serviceName = "YouTube Caption Extractor";
	std::string serviceSlug = "youtube-caption-extractor";
	std::string version = CAPTION_RELAY_VERSION;

	std::string host = "0.0.0.0";
	std::uint16_t port = 5000;
	Logger::LogLevel logLevel = Logger::LogLevel::Info;
	std::chrono::seconds upstreamTimeout{15};
	std::vector<std::string> transcriptLanguages{"en"};

	using EnvironmentLookup = std::function<std::optional<std::string>(const char *name)>;

	/**
	 * @brief Builds a configuration from environment variables.
	 *
	 * Reads HOST, PORT, LOG_LEVEL, UPSTREAM_TIMEOUT_SECONDS and TRANSCRIPT_LANGUAGES.
	 * A value that cannot be parsed is reported through @p logger and the default is kept.
	 */
	static ServiceConfig load(const EnvironmentLookup &lookup, const Logger::ILogger &logger);

	static ServiceConfig loadFromEnvironment(const Logger::ILogger &logger);
};

} // namespace CaptionRelay::Server
