/*
 * Caption Relay
 * Copyright (C) 2026 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include <CaptionRelay/Logger/NullLogger.hpp>
#include <CaptionRelay/Logger/PrintLogger.hpp>

using namespace CaptionRelay::Logger;

class PrintLoggerTest : public ::testing::Test {
protected:
	std::ostringstream out;
};

TEST_F(PrintLoggerTest, WritesTabSeparatedFields)
{
	PrintLogger logger(LogLevel::Info, out);
	logger.info("CaptionsExtracted", {{"videoId", "dQw4w9WgXcQ"}, {"language", "en"}});

	const std::string line = out.str();
	EXPECT_EQ(line.rfind("level=INFO\tname=CaptionsExtracted\tlocation=", 0), 0u);
	EXPECT_NE(line.find("PrintLogger_test.cpp:"), std::string::npos);
	EXPECT_NE(line.find("\tvideoId=dQw4w9WgXcQ\tlanguage=en\n"), std::string::npos);
}

TEST_F(PrintLoggerTest, FiltersBelowMinimumLevel)
{
	PrintLogger logger(LogLevel::Warn, out);
	logger.debug("Dropped");
	logger.info("Dropped");
	logger.warn("Kept");
	logger.error("Kept");

	const std::string output = out.str();
	EXPECT_EQ(output.find("Dropped"), std::string::npos);
	EXPECT_NE(output.find("level=WARN\tname=Kept"), std::string::npos);
	EXPECT_NE(output.find("level=ERROR\tname=Kept"), std::string::npos);
}

TEST_F(PrintLoggerTest, SetMinLevel)
{
	PrintLogger logger(LogLevel::Error, out);
	logger.setMinLevel(LogLevel::Debug);
	EXPECT_EQ(logger.minLevel(), LogLevel::Debug);

	logger.debug("Visible");
	EXPECT_NE(out.str().find("level=DEBUG\tname=Visible"), std::string::npos);
}

TEST_F(PrintLoggerTest, NullLoggerIsShared)
{
	EXPECT_EQ(NullLogger::instance(), NullLogger::instance());
	NullLogger::instance()->error("Ignored", {{"key", "value"}});
}

TEST_F(PrintLoggerTest, IsEnabledFollowsMinimumLevel)
{
	PrintLogger logger(LogLevel::Info, out);
	EXPECT_FALSE(logger.isEnabled(LogLevel::Debug));
	EXPECT_TRUE(logger.isEnabled(LogLevel::Info));
	EXPECT_TRUE(logger.isEnabled(LogLevel::Error));

	logger.setMinLevel(LogLevel::Error);
	EXPECT_FALSE(logger.isEnabled(LogLevel::Warn));
}

TEST_F(PrintLoggerTest, NullLoggerIsNeverEnabled)
{
	EXPECT_FALSE(NullLogger::instance()->isEnabled(LogLevel::Error));
}

TEST_F(PrintLoggerTest, LogLevelNames)
{
	EXPECT_EQ(logLevelName(LogLevel::Debug), "DEBUG");
	EXPECT_EQ(logLevelName(LogLevel::Info), "INFO");
	EXPECT_EQ(logLevelName(LogLevel::Warn), "WARN");
	EXPECT_EQ(logLevelName(LogLevel::Error), "ERROR");
}
