/*
 * Caption Relay
 * Copyright (C) 2026 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <CaptionRelay/Transcript/CaptionService.hpp>
#include <CaptionRelay/Transcript/YouTubeResponseParser.hpp>

using namespace CaptionRelay::Transcript;

class YouTubeResponseParserTest : public ::testing::Test {
protected:
	static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
	static void TearDownTestSuite() { curl_global_cleanup(); }

	static nlohmann::json playerResponseWithTracks(nlohmann::json tracks)
	{
		return nlohmann::json{
			{"playabilityStatus", {{"status", "OK"}}},
			{"captions", {{"playerCaptionsTracklistRenderer", {{"captionTracks", std::move(tracks)}}}}},
		};
	}

	const std::vector<std::string> english{"en"};
};

TEST_F(YouTubeResponseParserTest, ExtractInnertubeApiKey)
{
	const std::string html = R"(<script>ytcfg.set({"INNERTUBE_API_KEY":"AIzaSyA-test_KEY123","OTHER":1});</script>)";
	EXPECT_EQ(extractInnertubeApiKey(html), std::optional<std::string>("AIzaSyA-test_KEY123"));
}

TEST_F(YouTubeResponseParserTest, ExtractInnertubeApiKey_WhitespaceAfterColon)
{
	EXPECT_EQ(extractInnertubeApiKey(R"({"INNERTUBE_API_KEY":  "abc_DEF-123"})"), std::optional<std::string>("abc_DEF-123"));
}

TEST_F(YouTubeResponseParserTest, ExtractInnertubeApiKey_UnterminatedLongRun)
{
	const std::string html = "\"INNERTUBE_API_KEY\":\"" + std::string(60000, 'k');
	EXPECT_EQ(extractInnertubeApiKey(html), std::nullopt);
}

TEST_F(YouTubeResponseParserTest, ExtractInnertubeApiKey_Missing)
{
	EXPECT_EQ(extractInnertubeApiKey("<html><body>nothing here</body></html>"), std::nullopt);
}

TEST_F(YouTubeResponseParserTest, CaptchaPageIsDetected)
{
	EXPECT_TRUE(isCaptchaPage(R"(<div class="g-recaptcha" data-sitekey="x"></div>)"));
	EXPECT_FALSE(isCaptchaPage("<html></html>"));
}

TEST_F(YouTubeResponseParserTest, ManualTrackIsPreferredOverGenerated)
{
	const nlohmann::json player = playerResponseWithTracks(nlohmann::json::array({
		{{"baseUrl", "https://example.com/asr"}, {"languageCode", "en"}, {"kind", "asr"}},
		{{"baseUrl", "https://example.com/manual"}, {"languageCode", "en"}},
	}));

	const PlayerInspection inspection = inspectPlayerResponse(player, english);
	const auto *track = std::get_if<CaptionTrack>(&inspection);
	ASSERT_NE(track, nullptr);
	EXPECT_EQ(track->baseUrl, "https://example.com/manual");
	EXPECT_FALSE(track->isGenerated);
}

TEST_F(YouTubeResponseParserTest, GeneratedTrackIsUsedWhenNoManualTrack)
{
	const nlohmann::json player = playerResponseWithTracks(nlohmann::json::array({
		{{"baseUrl", "https://example.com/de"}, {"languageCode", "de"}},
		{{"baseUrl", "https://example.com/asr"}, {"languageCode", "en"}, {"kind", "asr"}},
	}));

	const PlayerInspection inspection = inspectPlayerResponse(player, english);
	const auto *track = std::get_if<CaptionTrack>(&inspection);
	ASSERT_NE(track, nullptr);
	EXPECT_EQ(track->languageCode, "en");
	EXPECT_TRUE(track->isGenerated);
}

TEST_F(YouTubeResponseParserTest, LanguagePreferenceOrderWins)
{
	const std::vector<CaptionTrack> tracks{
		{.baseUrl = "en", .languageCode = "en"},
		{.baseUrl = "ja", .languageCode = "ja", .isGenerated = true},
	};
	const std::vector<std::string> preferred{"ja", "en"};

	const std::optional<CaptionTrack> track = selectCaptionTrack(tracks, preferred);
	ASSERT_TRUE(track.has_value());
	EXPECT_EQ(track->baseUrl, "ja");
}

TEST_F(YouTubeResponseParserTest, NoMatchingLanguageIsTranscriptNotFound)
{
	const nlohmann::json player = playerResponseWithTracks(nlohmann::json::array({
		{{"baseUrl", "https://example.com/de"}, {"languageCode", "de"}},
	}));

	const PlayerInspection inspection = inspectPlayerResponse(player, english);
	const auto *notFound = std::get_if<TranscriptNotFound>(&inspection);
	ASSERT_NE(notFound, nullptr);
	EXPECT_NE(notFound->message.find("de"), std::string::npos);
}

TEST_F(YouTubeResponseParserTest, MissingCaptionsMeansSubtitlesDisabled)
{
	const nlohmann::json player{{"playabilityStatus", {{"status", "OK"}}}};

	const PlayerInspection inspection = inspectPlayerResponse(player, english);
	const auto *error = std::get_if<TranscriptFetchError>(&inspection);
	ASSERT_NE(error, nullptr);
	EXPECT_EQ(error->message, "Subtitles are disabled for this video");
}

TEST_F(YouTubeResponseParserTest, ErrorStatusMeansVideoUnavailable)
{
	const nlohmann::json player{{"playabilityStatus", {{"status", "ERROR"}, {"reason", "This video is unavailable"}}}};

	const PlayerInspection inspection = inspectPlayerResponse(player, english);
	const auto *error = std::get_if<TranscriptFetchError>(&inspection);
	ASSERT_NE(error, nullptr);
	EXPECT_EQ(error->message, "Video unavailable: This video is unavailable");
}

TEST_F(YouTubeResponseParserTest, LoginRequiredPrivateVideo)
{
	const nlohmann::json player{{"playabilityStatus", {{"status", "LOGIN_REQUIRED"}, {"reason", "This video is private"}}}};

	const PlayerInspection inspection = inspectPlayerResponse(player, english);
	const auto *error = std::get_if<TranscriptFetchError>(&inspection);
	ASSERT_NE(error, nullptr);
	EXPECT_EQ(error->message, "Video is private");
}

TEST_F(YouTubeResponseParserTest, OtherStatusIsUnplayable)
{
	const nlohmann::json player{
		{"playabilityStatus", {{"status", "LOGIN_REQUIRED"}, {"reason", "Sign in to confirm your age"}}}};

	const PlayerInspection inspection = inspectPlayerResponse(player, english);
	const auto *error = std::get_if<TranscriptFetchError>(&inspection);
	ASSERT_NE(error, nullptr);
	EXPECT_EQ(error->message, "Video is unplayable (LOGIN_REQUIRED): Sign in to confirm your age");
}

TEST_F(YouTubeResponseParserTest, ParseJson3Transcript)
{
	const std::string body = R"({
		"events": [
			{"tStartMs": 0, "dDurationMs": 1500},
			{"tStartMs": 0, "dDurationMs": 1500, "segs": [{"utf8": "hello"}, {"utf8": " there"}]},
			{"tStartMs": 1500, "dDurationMs": 500, "segs": [{"utf8": "\n"}]},
			{"tStartMs": 2000, "dDurationMs": 1000, "segs": [{"utf8": "world"}]}
		]
	})";

	const std::vector<TranscriptSegment> segments = parseJson3Transcript(body);
	ASSERT_EQ(segments.size(), 3u);
	EXPECT_EQ(segments[0].text, "hello there");
	EXPECT_DOUBLE_EQ(segments[0].start, 0.0);
	EXPECT_DOUBLE_EQ(segments[0].duration, 1.5);
	EXPECT_EQ(segments[1].text, "\n");
	EXPECT_EQ(segments[2].text, "world");
	EXPECT_DOUBLE_EQ(segments[2].start, 2.0);
	EXPECT_DOUBLE_EQ(segments[2].duration, 1.0);
}

TEST_F(YouTubeResponseParserTest, ParseJson3TranscriptKeepsTrailingLineBreakEvent)
{
	const std::string body = R"({
		"events": [
			{"tStartMs": 0, "dDurationMs": 2000, "segs": [{"utf8": "hello"}]},
			{"tStartMs": 2000, "dDurationMs": 3000, "segs": [{"utf8": "\n"}]},
			{"tStartMs": 5000, "dDurationMs": 100, "segs": [{"utf8": ""}]},
			{"tStartMs": 6000, "dDurationMs": 100, "segs": []}
		]
	})";

	const std::vector<TranscriptSegment> segments = parseJson3Transcript(body);
	ASSERT_EQ(segments.size(), 2u);

	const CaptionResponse response = buildCaptionResponse("dQw4w9WgXcQ", FetchedTranscript{segments, "en"});
	EXPECT_EQ(response.captions, "hello");
	EXPECT_DOUBLE_EQ(response.total_duration, 5.0);
}

TEST_F(YouTubeResponseParserTest, ParseJson3Transcript_NoEvents)
{
	EXPECT_TRUE(parseJson3Transcript("{}").empty());
}

TEST_F(YouTubeResponseParserTest, ParseJson3Transcript_Malformed)
{
	EXPECT_THROW({ auto segments = parseJson3Transcript("<transcript/>"); }, nlohmann::json::exception);
}

TEST_F(YouTubeResponseParserTest, WithJson3FormatReplacesExistingFormat)
{
	const std::string url = withJson3Format("https://www.youtube.com/api/timedtext?v=abc&fmt=srv3&lang=en");
	EXPECT_EQ(url, "https://www.youtube.com/api/timedtext?v=abc&lang=en&fmt=json3");
}

TEST_F(YouTubeResponseParserTest, WithJson3FormatAddsFormat)
{
	const std::string url = withJson3Format("https://www.youtube.com/api/timedtext?v=abc");
	EXPECT_EQ(url, "https://www.youtube.com/api/timedtext?v=abc&fmt=json3");
}
