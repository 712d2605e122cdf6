/*
 * Caption Relay
 * Copyright (C) 2026 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include <CaptionRelay/Logger/NullLogger.hpp>
#include <CaptionRelay/Transcript/CaptionService.hpp>

#include "Transcript/FakeTranscriptProvider.hpp"

using namespace CaptionRelay;
using namespace CaptionRelay::Transcript;
using Transcript::Testing::FakeTranscriptProvider;

class CaptionServiceTest : public ::testing::Test {
protected:
	std::shared_ptr<FakeTranscriptProvider> makeProvider(TranscriptFetchResult result)
	{
		return std::make_shared<FakeTranscriptProvider>(std::move(result));
	}

	CaptionService makeService(std::shared_ptr<const ITranscriptProvider> provider)
	{
		return CaptionService(std::move(provider), Logger::NullLogger::instance());
	}

	static CaptionResponse expectResponse(const CaptionResult &result)
	{
		const auto *response = std::get_if<CaptionResponse>(&result);
		if (!response) {
			throw std::runtime_error("expected a CaptionResponse");
		}
		return *response;
	}

	static CaptionError expectError(const CaptionResult &result)
	{
		const auto *error = std::get_if<CaptionError>(&result);
		if (!error) {
			throw std::runtime_error("expected a CaptionError");
		}
		return *error;
	}
};

TEST_F(CaptionServiceTest, ConstructorRejectsNullCollaborators)
{
	auto provider = makeProvider(FetchedTranscript{});
	EXPECT_THROW({ CaptionService service(nullptr, Logger::NullLogger::instance()); }, std::invalid_argument);
	EXPECT_THROW({ CaptionService service(provider, nullptr); }, std::invalid_argument);
}

TEST_F(CaptionServiceTest, JoinsSegmentsAndComputesTotalDuration)
{
	auto provider = makeProvider(FetchedTranscript{.segments = {{"hello", 0.0, 1.5}, {"world", 1.5, 1.5}}});
	CaptionService service = makeService(provider);

	const CaptionResult result = service.getCaptions("dQw4w9WgXcQ");
	const CaptionResponse &response = expectResponse(result);

	EXPECT_EQ(response.video_id, "dQw4w9WgXcQ");
	EXPECT_EQ(response.captions, "hello world");
	EXPECT_DOUBLE_EQ(response.total_duration, 3.0);
	EXPECT_EQ(response.language, "en");
	EXPECT_EQ(provider->callCount(), 1);
}

TEST_F(CaptionServiceTest, TotalDurationIsMaximumEndTimeNotLastSegment)
{
	auto provider = makeProvider(FetchedTranscript{.segments = {{"long", 0.0, 10.0}, {"short", 2.0, 1.0}}});
	CaptionService service = makeService(provider);

	EXPECT_DOUBLE_EQ(expectResponse(service.getCaptions("dQw4w9WgXcQ")).total_duration, 10.0);
}

TEST_F(CaptionServiceTest, CollapsesWhitespaceRuns)
{
	auto provider = makeProvider(FetchedTranscript{.segments = {{"  a\n\nb  ", 0.0, 1.0}, {"\tc ", 1.0, 1.0}}});
	CaptionService service = makeService(provider);

	EXPECT_EQ(expectResponse(service.getCaptions("dQw4w9WgXcQ")).captions, "a b c");
}

TEST_F(CaptionServiceTest, CollapseWhitespaceHandlesNoBreakSpace)
{
	EXPECT_EQ(collapseWhitespace("a\xc2\xa0\xc2\xa0 b"), "a b");
	EXPECT_EQ(collapseWhitespace("   "), "");
	EXPECT_EQ(collapseWhitespace(""), "");
	EXPECT_EQ(collapseWhitespace("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST_F(CaptionServiceTest, CollapseWhitespaceHandlesUnicodeSpaces)
{
	// U+3000 IDEOGRAPHIC SPACE, U+2009 THIN SPACE
	EXPECT_EQ(collapseWhitespace("a\xe3\x80\x80\xe3\x80\x80" "b\xe2\x80\x89" "c"), "a b c");
	// U+202F NARROW NO-BREAK SPACE, U+2028 LINE SEPARATOR, U+2029 PARAGRAPH SEPARATOR
	EXPECT_EQ(collapseWhitespace("a\xe2\x80\xaf" "b\xe2\x80\xa8\xe2\x80\xa9" "c"), "a b c");
	// U+0085 NEXT LINE, U+1680 OGHAM SPACE MARK, U+205F MEDIUM MATHEMATICAL SPACE
	EXPECT_EQ(collapseWhitespace("\xc2\x85" "a\xe1\x9a\x80" "b\xe2\x81\x9f"), "a b");
}

TEST_F(CaptionServiceTest, CollapseWhitespaceKeepsNonSpaceCharacters)
{
	// U+200B ZERO WIDTH SPACE is not whitespace
	EXPECT_EQ(collapseWhitespace("a\xe2\x80\x8b" "b"), "a\xe2\x80\x8b" "b");
	// U+3042 HIRAGANA A
	EXPECT_EQ(collapseWhitespace("\xe3\x81\x82 \xe3\x81\x82"), "\xe3\x81\x82 \xe3\x81\x82");
	// Malformed bytes pass through
	EXPECT_EQ(collapseWhitespace("a\xe3\x80 b\xff"), "a\xe3\x80 b\xff");
}

TEST_F(CaptionServiceTest, EmptySegmentsGiveEmptyCaptions)
{
	auto provider = makeProvider(FetchedTranscript{});
	CaptionService service = makeService(provider);

	const CaptionResponse &response = expectResponse(service.getCaptions("dQw4w9WgXcQ"));
	EXPECT_EQ(response.captions, "");
	EXPECT_DOUBLE_EQ(response.total_duration, 0.0);
}

TEST_F(CaptionServiceTest, UpstreamLanguageIsReported)
{
	auto provider = makeProvider(FetchedTranscript{.segments = {{"hola", 0.0, 1.0}}, .language = "es"});
	CaptionService service = makeService(provider);

	EXPECT_EQ(expectResponse(service.getCaptions("dQw4w9WgXcQ")).language, "es");
}

TEST_F(CaptionServiceTest, UrlInputIsNormalizedBeforeFetching)
{
	auto provider = makeProvider(FetchedTranscript{.segments = {{"x", 0.0, 1.0}}});
	CaptionService service = makeService(provider);

	const CaptionResponse &response = expectResponse(service.getCaptions("https://youtu.be/dQw4w9WgXcQ?t=1"));
	EXPECT_EQ(response.video_id, "dQw4w9WgXcQ");
	EXPECT_EQ(provider->lastVideoId(), "dQw4w9WgXcQ");
}

TEST_F(CaptionServiceTest, InvalidIdIsRejectedWithoutCallingProvider)
{
	auto provider = makeProvider(FetchedTranscript{});
	CaptionService service = makeService(provider);

	const CaptionResult result = service.getCaptions("not-a-valid-id!!");
	const CaptionError &error = expectError(result);

	EXPECT_EQ(error.kind, ErrorKind::ValidationError);
	EXPECT_EQ(error.httpStatus(), 400);
	EXPECT_EQ(error.message, "Invalid YouTube video ID format");
	EXPECT_EQ(error.video_id, "not-a-valid-id!!");
	EXPECT_EQ(provider->callCount(), 0);
}

TEST_F(CaptionServiceTest, InvalidUrlEchoesRawInput)
{
	auto provider = makeProvider(FetchedTranscript{});
	CaptionService service = makeService(provider);

	const CaptionError &error = expectError(service.getCaptions("https://youtu.be/short"));
	EXPECT_EQ(error.video_id, "https://youtu.be/short");
}

TEST_F(CaptionServiceTest, TranscriptNotFoundMapsToNoTranscriptAvailable)
{
	auto provider = makeProvider(TranscriptNotFound{"No transcripts were found"});
	CaptionService service = makeService(provider);

	const CaptionError &error = expectError(service.getCaptions("dQw4w9WgXcQ"));
	EXPECT_EQ(error.kind, ErrorKind::NoTranscriptAvailable);
	EXPECT_EQ(error.httpStatus(), 404);
	EXPECT_EQ(error.message, "No captions/transcripts available for this video");
	EXPECT_EQ(error.video_id, "dQw4w9WgXcQ");
}

TEST_F(CaptionServiceTest, PrivateVideoFailure)
{
	auto provider = makeProvider(TranscriptFetchError{"Video is private"});
	CaptionService service = makeService(provider);

	const CaptionError &error = expectError(service.getCaptions("dQw4w9WgXcQ"));
	EXPECT_EQ(error.kind, ErrorKind::VideoPrivate);
	EXPECT_EQ(error.httpStatus(), 403);
	EXPECT_EQ(error.video_id, "dQw4w9WgXcQ");
}

TEST_F(CaptionServiceTest, SubtitlesDisabledFailure)
{
	auto provider = makeProvider(TranscriptFetchError{"subtitles disabled"});
	CaptionService service = makeService(provider);

	const CaptionError &error = expectError(service.getCaptions("dQw4w9WgXcQ"));
	EXPECT_EQ(error.kind, ErrorKind::CaptionsDisabled);
	EXPECT_EQ(error.httpStatus(), 400);
}

TEST_F(CaptionServiceTest, ThrowingProviderBecomesProcessingError)
{
	auto provider = makeProvider(FetchedTranscript{});
	provider->setThrowMessage("connection reset by peer");
	CaptionService service = makeService(provider);

	const CaptionError &error = expectError(service.getCaptions("dQw4w9WgXcQ"));
	EXPECT_EQ(error.kind, ErrorKind::ProcessingError);
	EXPECT_EQ(error.httpStatus(), 500);
	EXPECT_EQ(error.message, "Error processing video: connection reset by peer");
	EXPECT_EQ(error.video_id, "dQw4w9WgXcQ");
	EXPECT_EQ(provider->callCount(), 1);
}

TEST_F(CaptionServiceTest, RepeatedCallsSerializeIdentically)
{
	auto provider = makeProvider(
		FetchedTranscript{.segments = {{"one", 0.25, 1.0}, {"two", 1.25, 2.5}}, .language = "en"});
	CaptionService service = makeService(provider);

	const std::string first = nlohmann::json(expectResponse(service.getCaptions("dQw4w9WgXcQ"))).dump();
	const std::string second = nlohmann::json(expectResponse(service.getCaptions("dQw4w9WgXcQ"))).dump();

	EXPECT_EQ(first, second);
	EXPECT_EQ(provider->callCount(), 2);
}

TEST_F(CaptionServiceTest, ResponseJsonShape)
{
	auto provider = makeProvider(FetchedTranscript{.segments = {{"hello", 0.0, 1.0}}});
	CaptionService service = makeService(provider);

	const nlohmann::json j = expectResponse(service.getCaptions("dQw4w9WgXcQ"));
	EXPECT_EQ(j.size(), 4u);
	EXPECT_EQ(j.at("video_id"), "dQw4w9WgXcQ");
	EXPECT_EQ(j.at("captions"), "hello");
	EXPECT_EQ(j.at("language"), "en");
	EXPECT_DOUBLE_EQ(j.at("total_duration").get<double>(), 1.0);

	const CaptionResponse parsed = j.get<CaptionResponse>();
	EXPECT_EQ(parsed.captions, "hello");
}
