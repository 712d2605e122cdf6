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

#include "HttpServer.hpp"

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/write.hpp>

namespace CaptionRelay::Server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

CaptionRouter::Response makePayloadTooLargeResponse()
{
	CaptionRouter::Response response{http::status::payload_too_large, 11};
	response.set(http::field::content_type, "application/json");
	response.set(http::field::access_control_allow_origin, "*");
	response.keep_alive(false);
	response.body() = R"({"detail":"Request Entity Too Large"})";
	response.prepare_payload();
	return response;
}

} // anonymous namespace

/// One accepted connection. Its handlers all run on the thread that calls run().
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
	HttpSession(std::shared_ptr<const CaptionRouter> router, std::shared_ptr<const Logger::ILogger> logger,
		    const HttpServerOptions &options)
		: router_(std::move(router)),
		  logger_(std::move(logger)),
		  requestTimeout_(options.requestTimeout),
		  writeTimeout_(options.writeTimeout),
		  stream_(ioContext_)
	{
	}

	HttpSession(const HttpSession &) = delete;
	HttpSession &operator=(const HttpSession &) = delete;

	tcp::socket &socket() noexcept { return stream_.socket(); }

	/// Serves requests until the connection ends.
	void run()
	{
		doRead();
		ioContext_.run();
	}

	/**
	 * @brief Thread-safe. Closes the connection if it is waiting for a request.
	 *
	 * A request that is already being handled still gets its response, sent with `Connection: close`.
	 */
	void shutdown() noexcept
	{
		stopping_.store(true);
		try {
			asio::post(ioContext_, [weak = weak_from_this()] {
				if (auto self = weak.lock(); self && self->reading_) {
					self->close();
				}
			});
		} catch (const std::exception &e) {
			logger_->error("ConnectionShutdownFailed", {{"error", e.what()}});
		}
	}

private:
	void doRead()
	{
		parser_.emplace();
		parser_->body_limit(kRequestBodyLimit);

		reading_ = true;
		stream_.expires_after(requestTimeout_);
		http::async_read(stream_, buffer_, *parser_,
				 beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
	}

	void onRead(beast::error_code ec, std::size_t)
	{
		reading_ = false;

		if (ec == asio::error::operation_aborted) {
			return;
		}
		if (ec == beast::error::timeout) {
			logger_->info("ConnectionTimedOut", {{"phase", "read"}});
			return;
		}
		if (ec == http::error::end_of_stream) {
			close();
			return;
		}
		if (ec == http::error::body_limit) {
			logger_->warn("RequestBodyTooLarge", {{"limit", std::to_string(kRequestBodyLimit)}});
			response_ = makePayloadTooLargeResponse();
			doWrite();
			return;
		}
		if (ec) {
			logger_->debug("ConnectionReadFailed", {{"error", ec.message()}});
			close();
			return;
		}

		response_ = router_->handle(parser_->get());
		if (stopping_.load()) {
			response_.keep_alive(false);
		}
		doWrite();
	}

	void doWrite()
	{
		stream_.expires_after(writeTimeout_);
		http::async_write(stream_, response_, beast::bind_front_handler(&HttpSession::onWrite, shared_from_this()));
	}

	void onWrite(beast::error_code ec, std::size_t)
	{
		if (ec == beast::error::timeout) {
			logger_->info("ConnectionTimedOut", {{"phase", "write"}});
			return;
		}
		if (ec) {
			logger_->warn("ConnectionWriteFailed", {{"error", ec.message()}});
			close();
			return;
		}
		if (!response_.keep_alive() || stopping_.load()) {
			close();
			return;
		}
		doRead();
	}

	void close()
	{
		// Best effort: the peer may already be gone.
		beast::error_code ec;
		stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
		stream_.close();
	}

	const std::shared_ptr<const CaptionRouter> router_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const std::chrono::milliseconds requestTimeout_;
	const std::chrono::milliseconds writeTimeout_;

	asio::io_context ioContext_;
	beast::tcp_stream stream_;
	beast::flat_buffer buffer_;
	std::optional<http::request_parser<http::string_body>> parser_;
	CaptionRouter::Response response_;

	bool reading_ = false;
	std::atomic<bool> stopping_{false};
};

/// Live connections, keyed by an id that is unique for the server's lifetime.
class ConnectionRegistry {
public:
	void add(std::uint64_t id, std::weak_ptr<HttpSession> session)
	{
		std::scoped_lock lock(mutex_);
		sessions_.emplace(id, std::move(session));
	}

	void remove(std::uint64_t id)
	{
		{
			std::scoped_lock lock(mutex_);
			sessions_.erase(id);
		}
		drained_.notify_all();
	}

	void closeAll()
	{
		std::vector<std::shared_ptr<HttpSession>> live;
		{
			std::scoped_lock lock(mutex_);
			for (const auto &[id, weak] : sessions_) {
				if (auto session = weak.lock()) {
					live.push_back(std::move(session));
				}
			}
		}
		for (const auto &session : live) {
			session->shutdown();
		}
	}

	bool waitUntilEmpty(std::chrono::milliseconds timeout)
	{
		std::unique_lock lock(mutex_);
		return drained_.wait_for(lock, timeout, [this] { return sessions_.empty(); });
	}

	std::size_t size() const
	{
		std::scoped_lock lock(mutex_);
		return sessions_.size();
	}

private:
	mutable std::mutex mutex_;
	std::condition_variable drained_;
	std::map<std::uint64_t, std::weak_ptr<HttpSession>> sessions_;
};

HttpServer::HttpServer(std::shared_ptr<const CaptionRouter> router, std::shared_ptr<const Logger::ILogger> logger,
		       HttpServerOptions options)
	: router_(router ? std::move(router) : throw std::invalid_argument("RouterIsNullError(HttpServer::HttpServer)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(HttpServer::HttpServer)")),
	  options_(std::move(options)),
	  connections_(std::make_shared<ConnectionRegistry>()),
	  acceptor_(ioContext_)
{
	if (options_.requestTimeout.count() <= 0 || options_.writeTimeout.count() <= 0) {
		throw std::invalid_argument("TimeoutIsNotPositiveError(HttpServer::HttpServer)");
	}
	if (options_.maxConnections == 0) {
		throw std::invalid_argument("MaxConnectionsIsZeroError(HttpServer::HttpServer)");
	}
}

HttpServer::~HttpServer() noexcept
{
	shutdownListener();
}

std::uint16_t HttpServer::listen(const std::string &host, std::uint16_t port)
{
	const tcp::endpoint endpoint{asio::ip::make_address(host), port};

	acceptor_.open(endpoint.protocol());
	acceptor_.set_option(asio::socket_base::reuse_address(true));
	acceptor_.bind(endpoint);
	acceptor_.listen(asio::socket_base::max_listen_connections);

	doAccept();

	return acceptor_.local_endpoint().port();
}

void HttpServer::handleSignals()
{
	signals_.emplace(ioContext_, SIGINT, SIGTERM);
	signals_->async_wait([this](const boost::system::error_code &ec, int signalNumber) {
		if (ec) {
			return;
		}
		logger_->info("ShutdownSignalReceived", {{"signal", std::to_string(signalNumber)}});
		shutdownListener();
	});
}

void HttpServer::run()
{
	ioContext_.run();
}

void HttpServer::stop() noexcept
{
	try {
		asio::post(ioContext_, [this] { shutdownListener(); });
	} catch (const std::exception &e) {
		logger_->error("ServerStopFailed", {{"error", e.what()}});
		ioContext_.stop();
	}
}

bool HttpServer::waitForConnections(std::chrono::milliseconds timeout) const
{
	return connections_->waitUntilEmpty(timeout);
}

std::size_t HttpServer::connectionCount() const
{
	return connections_->size();
}

void HttpServer::doAccept()
{
	auto session = std::make_shared<HttpSession>(router_, logger_, options_);
	tcp::socket &socket = session->socket();
	acceptor_.async_accept(socket, [this, session = std::move(session)](const boost::system::error_code &ec) mutable {
		onAccept(ec, std::move(session));
	});
}

void HttpServer::onAccept(const boost::system::error_code &ec, std::shared_ptr<HttpSession> session)
{
	if (ec == asio::error::operation_aborted) {
		return;
	}

	if (ec) {
		logger_->warn("AcceptFailed", {{"error", ec.message()}});
	} else if (connections_->size() >= options_.maxConnections) {
		logger_->warn("ConnectionLimitReached", {{"limit", std::to_string(options_.maxConnections)}});
		boost::system::error_code closeEc;
		session->socket().close(closeEc);
	} else {
		const std::uint64_t id = nextConnectionId_++;
		connections_->add(id, session);
		try {
			std::thread([session = std::move(session), connections = connections_, logger = logger_,
				     id]() mutable {
				try {
					session->run();
				} catch (const std::exception &e) {
					logger->error("ConnectionFailed", {{"error", e.what()}});
				}
				session.reset();
				connections->remove(id);
			}).detach();
		} catch (const std::system_error &e) {
			connections_->remove(id);
			logger_->error("ConnectionThreadStartFailed", {{"error", e.what()}});
		}
	}

	doAccept();
}

void HttpServer::shutdownListener() noexcept
{
	boost::system::error_code ec;
	acceptor_.close(ec);
	if (ec) {
		logger_->warn("ListenerCloseFailed", {{"error", ec.message()}});
	}
	if (signals_) {
		signals_->cancel(ec);
	}

	try {
		connections_->closeAll();
	} catch (const std::exception &e) {
		logger_->error("ConnectionShutdownFailed", {{"error", e.what()}});
	}
}

} // namespace CaptionRelay::Server
