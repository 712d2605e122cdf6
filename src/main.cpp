/*
 * Caption Relay
 * Copyright (C) 2026 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

#include <CaptionRelay/Logger/PrintLogger.hpp>
#include <CaptionRelay/Server/CaptionRouter.hpp>
#include <CaptionRelay/Server/HttpServer.hpp>
#include <CaptionRelay/Server/ServiceConfig.hpp>
#include <CaptionRelay/Transcript/CaptionService.hpp>
#include <CaptionRelay/Transcript/YouTubeTranscriptProvider.hpp>

using namespace CaptionRelay;

namespace {

class CurlGlobalGuard {
public:
	CurlGlobalGuard()
	{
		if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
			throw std::runtime_error("CurlGlobalInitError(CurlGlobalGuard::CurlGlobalGuard)");
		}
	}

	~CurlGlobalGuard() noexcept
	{
		if (!dismissed_) {
			curl_global_cleanup();
		}
	}

	CurlGlobalGuard(const CurlGlobalGuard &) = delete;
	CurlGlobalGuard &operator=(const CurlGlobalGuard &) = delete;

	/// Skips the cleanup. Used when transfers may still be running on other threads at exit.
	void dismiss() noexcept { dismissed_ = true; }

private:
	bool dismissed_ = false;
};

// Time left for writing responses once the slowest upstream fetch has finished.
constexpr std::chrono::seconds kShutdownGracePeriod{5};

} // anonymous namespace

int main()
{
	auto logger = std::make_shared<Logger::PrintLogger>();

	try {
		const Server::ServiceConfig config = Server::ServiceConfig::loadFromEnvironment(*logger);
		logger->setMinLevel(config.logLevel);

		CurlGlobalGuard curlGlobalGuard;

		auto provider = std::make_shared<Transcript::YouTubeTranscriptProvider>(
			Transcript::YouTubeTranscriptProviderOptions{
				.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.upstreamTimeout),
				.languages = config.transcriptLanguages,
			},
			logger);
		auto service = std::make_shared<Transcript::CaptionService>(provider, logger);
		auto router = std::make_shared<Server::CaptionRouter>(service, config, logger);

		Server::HttpServer server(router, logger);
		const std::uint16_t port = server.listen(config.host, config.port);
		server.handleSignals();

		logger->info("ServerListening",
			     {{"host", config.host}, {"port", std::to_string(port)}, {"version", config.version}});

		server.run();

		const auto drainTimeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.upstreamTimeout +
												   kShutdownGracePeriod);
		if (server.waitForConnections(drainTimeout)) {
			logger->info("ServerStopped");
		} else {
			logger->warn("ConnectionsStillOpenAtExit",
				     {{"connections", std::to_string(server.connectionCount())}});
			curlGlobalGuard.dismiss();
		}
	} catch (const std::exception &e) {
		logger->error("ServerStartFailed", {{"error", e.what()}});
		return 1;
	}

	return 0;
}
