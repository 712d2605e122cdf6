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
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/error_code.hpp>

#include <CaptionRelay/Logger/ILogger.hpp>

#include "CaptionRouter.hpp"

namespace CaptionRelay::Server {

inline constexpr std::uint64_t kRequestBodyLimit = 64 * 1024;

struct HttpServerOptions {
	/// Time allowed to receive one complete request. Also bounds idle time between keep-alive requests.
	std::chrono::milliseconds requestTimeout{30000};
	std::chrono::milliseconds writeTimeout{30000};
	/// Connections accepted beyond this are closed at once.
	std::size_t maxConnections = 256;
};

class HttpSession;
class ConnectionRegistry;

/**
 * @brief Accepts HTTP/1.1 connections and hands each one to its own thread.
 *
 * The accept loop runs on one io_context. Every connection runs on a thread of its own with a
 * private io_context, so a slow upstream fetch only ever blocks its own connection. Reads and
 * writes are bounded by the timeouts in HttpServerOptions.
 *
 * Stopping closes the listen socket and idle connections. Requests already being handled run
 * to completion and get their response with `Connection: close`; waitForConnections() blocks
 * until they are done.
 */
class HttpServer {
public:
	HttpServer(std::shared_ptr<const CaptionRouter> router, std::shared_ptr<const Logger::ILogger> logger,
		   HttpServerOptions options = {});

	/// run() MUST have returned before the server is destroyed.
	~HttpServer() noexcept;

	HttpServer(const HttpServer &) = delete;
	HttpServer &operator=(const HttpServer &) = delete;
	HttpServer(HttpServer &&) = delete;
	HttpServer &operator=(HttpServer &&) = delete;

	/**
	 * @brief Binds the listen socket and starts accepting.
	 *
	 * @return The bound port, which differs from @p port when @p port is 0.
	 * @throw boost::system::system_error If the address is invalid or the socket cannot be bound.
	 */
	std::uint16_t listen(const std::string &host, std::uint16_t port);

	/// Stops the server on SIGINT or SIGTERM.
	void handleSignals();

	/// Blocks until stop() is called or a handled signal arrives.
	void run();

	/// Thread-safe. run() returns once the listener is closed.
	void stop() noexcept;

	/**
	 * @brief Waits for every open connection to finish.
	 *
	 * @return false if connections were still open when @p timeout ran out.
	 */
	bool waitForConnections(std::chrono::milliseconds timeout) const;

	/// Number of connections currently being served.
	std::size_t connectionCount() const;

private:
	void doAccept();
	void onAccept(const boost::system::error_code &ec, std::shared_ptr<HttpSession> session);
	void shutdownListener() noexcept;

	const std::shared_ptr<const CaptionRouter> router_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const HttpServerOptions options_;

	// Connection threads share ownership, so the registry outlives the server if they do.
	const std::shared_ptr<ConnectionRegistry> connections_;
	std::uint64_t nextConnectionId_ = 0;

	boost::asio::io_context ioContext_;
	boost::asio::ip::tcp::acceptor acceptor_;
	std::optional<boost::asio::signal_set> signals_;
};

} // namespace CaptionRelay::Server
