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

#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <ostream>
#include <source_location>
#include <span>
#include <string_view>

#include "ILogger.hpp"

namespace CaptionRelay::Logger {

class PrintLogger : public ILogger {
public:
	explicit PrintLogger(LogLevel minLevel = LogLevel::Info, std::ostream &out = std::cout)
		: minLevel_(minLevel),
		  out_(out)
	{
	}

	~PrintLogger() override = default;

	void setMinLevel(LogLevel minLevel) noexcept { minLevel_.store(minLevel); }

	LogLevel minLevel() const noexcept { return minLevel_.load(); }

	bool isEnabled(LogLevel level) const noexcept override { return level >= minLevel_.load(); }

protected:
	void write(LogLevel level, std::string_view name, std::source_location loc,
		   std::span<const LogField> context) const noexcept override
	{
		try {
			std::scoped_lock lock(mutex_);

			out_ << "level=" << logLevelName(level) << "\tname=" << name << "\tlocation=" << loc.file_name()
			     << ":" << loc.line();
			for (const auto &field : context) {
				out_ << "\t" << field.key << "=" << field.value;
			}
			out_ << std::endl;
		} catch (const std::exception &) {
			// Nothing sensible left to report to once the sink itself fails.
		}
	}

private:
	std::atomic<LogLevel> minLevel_;
	std::ostream &out_;
	mutable std::mutex mutex_;
};

} // namespace CaptionRelay::Logger
