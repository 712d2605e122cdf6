/*
 * SPDX-FileCopyrightText: Copyright (C) 2026 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * CaptionRelay Logger Library
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

#include <initializer_list>
#include <source_location>
#include <span>
#include <string_view>

namespace CaptionRelay::Logger {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]]
constexpr std::string_view logLevelName(LogLevel level) noexcept
{
	switch (level) {
	case LogLevel::Debug:
		return "DEBUG";
	case LogLevel::Info:
		return "INFO";
	case LogLevel::Warn:
		return "WARN";
	case LogLevel::Error:
		return "ERROR";
	}
	return "UNKNOWN";
}

/// Values are only borrowed for the duration of the call.
struct LogField {
	std::string_view key;
	std::string_view value;
};

/**
 * @brief Structured event logger shared by the request threads.
 *
 * Events are a PascalCase name plus key/value fields. Implementations MUST be thread-safe.
 */
class ILogger {
public:
	ILogger() noexcept = default;
	virtual ~ILogger() = default;

	ILogger(const ILogger &) = delete;
	ILogger &operator=(const ILogger &) = delete;
	ILogger(ILogger &&) = delete;
	ILogger &operator=(ILogger &&) = delete;

	/// Lets callers skip building fields for events that would be dropped.
	[[nodiscard]]
	virtual bool isEnabled(LogLevel) const noexcept
	{
		return true;
	}

	void debug(std::string_view name, std::initializer_list<LogField> context = {},
		   std::source_location loc = std::source_location::current()) const noexcept
	{
		emit(LogLevel::Debug, name, loc, context);
	}

	void info(std::string_view name, std::initializer_list<LogField> context = {},
		  std::source_location loc = std::source_location::current()) const noexcept
	{
		emit(LogLevel::Info, name, loc, context);
	}

	void warn(std::string_view name, std::initializer_list<LogField> context = {},
		  std::source_location loc = std::source_location::current()) const noexcept
	{
		emit(LogLevel::Warn, name, loc, context);
	}

	void error(std::string_view name, std::initializer_list<LogField> context = {},
		   std::source_location loc = std::source_location::current()) const noexcept
	{
		emit(LogLevel::Error, name, loc, context);
	}

protected:
	/// Only called for levels isEnabled() accepted.
	virtual void write(LogLevel level, std::string_view name, std::source_location loc,
			   std::span<const LogField> context) const noexcept = 0;

private:
	void emit(LogLevel level, std::string_view name, std::source_location loc,
		  std::span<const LogField> context) const noexcept
	{
		if (isEnabled(level)) {
			write(level, name, loc, context);
		}
	}
};

} // namespace CaptionRelay::Logger
