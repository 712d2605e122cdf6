/*
 * Caption Relay
 * Copyright (C) 2026 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <CaptionRelay/Logger/PrintLogger.hpp>
#include <CaptionRelay/Server/ServiceConfig.hpp>

using namespace CaptionRelay;
using namespace CaptionRelay::Server;

class ServiceConfigTest : public ::testing::Test {
protected:
	ServiceConfig load(std::map<std::string, std::string> env)
	{
		return ServiceConfig::load(
			[env = std::move(env)](const char *name) -> std::optional<std::string> {
				if (auto it = env.find(name); it != env.end()) {
					return it->second;
				}
				return std::nullopt;
			},
			logger);
	}

	std::ostringstream logOutput;
	Logger::PrintLogger logger{Logger::LogLevel::Debug, logOutput};
};

TEST_F(ServiceConfigTest, DefaultsWhenEnvironmentIsEmpty)
{
	const ServiceConfig config = load({});

	EXPECT_EQ(config.host, "0.0.0.0");
	EXPECT_EQ(config.port, 5000);
	EXPECT_EQ(config.logLevel, Logger::LogLevel::Info);
	EXPECT_EQ(config.upstreamTimeout, std::chrono::seconds(15));
	EXPECT_EQ(config.transcriptLanguages, std::vector<std::string>{"en"});
	EXPECT_EQ(config.serviceName, "YouTube Caption Extractor");
	EXPECT_EQ(config.serviceSlug, "youtube-caption-extractor");
	EXPECT_FALSE(config.version.empty());
	EXPECT_TRUE(logOutput.str().empty());
}

TEST_F(ServiceConfigTest, ReadsAllVariables)
{
	const ServiceConfig config = load({
		{"HOST", "127.0.0.1"},
		{"PORT", "8080"},
		{"LOG_LEVEL", "DEBUG"},
		{"UPSTREAM_TIMEOUT_SECONDS", "30"},
		{"TRANSCRIPT_LANGUAGES", "ja, en ,,de"},
	});

	EXPECT_EQ(config.host, "127.0.0.1");
	EXPECT_EQ(config.port, 8080);
	EXPECT_EQ(config.logLevel, Logger::LogLevel::Debug);
	EXPECT_EQ(config.upstreamTimeout, std::chrono::seconds(30));
	EXPECT_EQ(config.transcriptLanguages, (std::vector<std::string>{"ja", "en", "de"}));
}

TEST_F(ServiceConfigTest, InvalidPortKeepsDefaultAndWarns)
{
	for (const char *value : {"abc", "70000", "-1", "80x", ""}) {
		logOutput.str("");
		const ServiceConfig config = load({{"PORT", value}});
		EXPECT_EQ(config.port, 5000) << value;
		EXPECT_NE(logOutput.str().find("name=InvalidConfigValue"), std::string::npos) << value;
		EXPECT_NE(logOutput.str().find("key=PORT"), std::string::npos) << value;
	}
}

TEST_F(ServiceConfigTest, TimeoutOutOfRangeKeepsDefault)
{
	EXPECT_EQ(load({{"UPSTREAM_TIMEOUT_SECONDS", "0"}}).upstreamTimeout, std::chrono::seconds(15));
	EXPECT_EQ(load({{"UPSTREAM_TIMEOUT_SECONDS", "301"}}).upstreamTimeout, std::chrono::seconds(15));
	EXPECT_EQ(load({{"UPSTREAM_TIMEOUT_SECONDS", "300"}}).upstreamTimeout, std::chrono::seconds(300));
	EXPECT_EQ(load({{"UPSTREAM_TIMEOUT_SECONDS", " 1 "}}).upstreamTimeout, std::chrono::seconds(1));
}

TEST_F(ServiceConfigTest, UnknownLogLevelKeepsDefault)
{
	const ServiceConfig config = load({{"LOG_LEVEL", "verbose"}});
	EXPECT_EQ(config.logLevel, Logger::LogLevel::Info);
	EXPECT_NE(logOutput.str().find("key=LOG_LEVEL"), std::string::npos);
}

TEST_F(ServiceConfigTest, EmptyLanguageListKeepsDefault)
{
	EXPECT_EQ(load({{"TRANSCRIPT_LANGUAGES", " , "}}).transcriptLanguages, std::vector<std::string>{"en"});
}

TEST_F(ServiceConfigTest, ParseLogLevel)
{
	EXPECT_EQ(parseLogLevel("debug"), Logger::LogLevel::Debug);
	EXPECT_EQ(parseLogLevel("Info"), Logger::LogLevel::Info);
	EXPECT_EQ(parseLogLevel("warning"), Logger::LogLevel::Warn);
	EXPECT_EQ(parseLogLevel(" ERROR "), Logger::LogLevel::Error);
	EXPECT_EQ(parseLogLevel("trace"), std::nullopt);
}
