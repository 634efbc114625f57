#include <gtest/gtest.h>
#include "peck_response_parser.h"

TEST(ResponseParser, StructuredReply) {
  PeckResponseParser parser;
  PeckResponseParser::ExtractResult result =
      parser.Extract(R"({"hex_coord": "0280,01E0", "reasoning": "icon"})");
  ASSERT_TRUE(result.found);
  EXPECT_EQ(result.label.x, 640);
  EXPECT_EQ(result.label.y, 480);
  EXPECT_EQ(result.stage, "structured");
}

TEST(ResponseParser, FencedBlockWithSurroundingProse) {
  PeckResponseParser parser(1920, 1080);
  PeckResponseParser::ExtractResult result = parser.Extract(
      "The Save button is in the toolbar.\n"
      "```json\n"
      "{\"hex_coord\": \"0140,0028\", \"reasoning\": \"floppy icon, top left\"}\n"
      "```\n");
  ASSERT_TRUE(result.found);
  EXPECT_EQ(result.label.x, 0x140);
  EXPECT_EQ(result.label.y, 0x28);
  EXPECT_EQ(result.stage, "structured");
}

TEST(ResponseParser, NestedObjectIsSearched) {
  PeckResponseParser parser;
  PeckResponseParser::ExtractResult result =
      parser.Extract(R"({"answer": {"hex_coord": "0010,0020"}})");
  ASSERT_TRUE(result.found);
  EXPECT_EQ(result.label.x, 0x10);
  EXPECT_EQ(result.label.y, 0x20);
}

TEST(ResponseParser, ProseFallback) {
  PeckResponseParser parser;
  PeckResponseParser::ExtractResult result =
      parser.Extract("Looking at the grid, around 0280, 01E0 you'll find it");
  ASSERT_TRUE(result.found);
  EXPECT_EQ(result.label.x, 640);
  EXPECT_EQ(result.label.y, 480);
  EXPECT_EQ(result.stage, "pattern");
}

TEST(ResponseParser, NullCoordinateIsNotFound) {
  PeckResponseParser parser;
  PeckResponseParser::ExtractResult result =
      parser.Extract(R"({"hex_coord": null, "reasoning": "no such button on screen"})");
  EXPECT_FALSE(result.found);
}

TEST(ResponseParser, MalformedStructuredLabelFallsThroughToPattern) {
  PeckResponseParser parser;
  PeckResponseParser::ExtractResult result = parser.Extract(
      R"({"hex_coord": "28,1E0", "reasoning": "probably 0028,01E0"})");
  ASSERT_TRUE(result.found);
  EXPECT_EQ(result.stage, "pattern");
  EXPECT_EQ(result.label.x, 0x28);
  EXPECT_EQ(result.label.y, 0x1E0);
}

TEST(ResponseParser, BrokenJsonFallsThroughToPattern) {
  PeckResponseParser parser;
  PeckResponseParser::ExtractResult result =
      parser.Extract(R"({"hex_coord": "0300,0100", "reasoning": })");
  ASSERT_TRUE(result.found);
  EXPECT_EQ(result.stage, "pattern");
  EXPECT_EQ(result.label.x, 0x300);
  EXPECT_EQ(result.label.y, 0x100);
}

TEST(ResponseParser, StructuredStageRejectsOutOfBoundsLabel) {
  EXPECT_TRUE(PeckResponseParser::ExtractStructured(
      R"({"hex_coord": "0800,0000"})", nullptr).has_value());

  ScreenSize bounds;
  bounds.width = 1920;
  bounds.height = 1080;
  EXPECT_FALSE(PeckResponseParser::ExtractStructured(
      R"({"hex_coord": "0800,0000"})", &bounds).has_value());
}

TEST(ResponseParser, PatternIgnoresLongerHexRuns) {
  EXPECT_FALSE(PeckResponseParser::ExtractPattern("id 12345,67890 only").has_value());
  EXPECT_FALSE(PeckResponseParser::ExtractPattern("no coordinates here").has_value());
  EXPECT_TRUE(PeckResponseParser::ExtractPattern("(00A0,0B00)").has_value());
}

TEST(ResponseParser, FirstPatternMatchWins) {
  std::optional<CoordinateLabel> label =
      PeckResponseParser::ExtractPattern("either 0010,0020 or 0030,0040");
  ASSERT_TRUE(label.has_value());
  EXPECT_EQ(label->x, 0x10);
  EXPECT_EQ(label->y, 0x20);
}

TEST(ResponseParser, EmptyReply) {
  PeckResponseParser parser;
  EXPECT_FALSE(parser.Extract("").found);
}

TEST(ResponseParser, CustomExtractorRunsAfterDefaults) {
  PeckResponseParser parser;
  parser.AddExtractor("decimal", [](const std::string& reply) -> std::optional<CoordinateLabel> {
    if (reply != "x=640 y=480") {
      return std::nullopt;
    }
    CoordinateLabel label;
    label.x = 640;
    label.y = 480;
    return label;
  });

  PeckResponseParser::ExtractResult result = parser.Extract("x=640 y=480");
  ASSERT_TRUE(result.found);
  EXPECT_EQ(result.stage, "decimal");
  EXPECT_EQ(result.label.x, 640);
}

TEST(ResponseParser, JsonCandidatesPreferFencedBlocks) {
  std::vector<std::string> candidates = PeckResponseParser::FindJsonCandidates(
      "{\"a\": 1} then ```json\n{\"b\": \"}\"}\n```");
  ASSERT_GE(candidates.size(), 3u);
  EXPECT_NE(candidates[0].find("\"b\""), std::string::npos);
  EXPECT_EQ(candidates[1], "{\"a\": 1}");
  EXPECT_EQ(candidates[2], "{\"b\": \"}\"}");
}

TEST(ResponseParser, LongFencedReplyIsParsed) {
  std::string reasoning(120000, 'a');
  std::string reply = "```json\n{\"hex_coord\": \"0280,01E0\", \"reasoning\": \"" + reasoning +
                      "\"}\n```";

  PeckResponseParser parser(1920, 1080);
  PeckResponseParser::ExtractResult result = parser.Extract(reply);
  ASSERT_TRUE(result.found);
  EXPECT_EQ(result.stage, "structured");
  EXPECT_EQ(result.label.x, 640);
  EXPECT_EQ(result.label.y, 480);
}

TEST(ResponseParser, LongProseWithoutLabelIsNotFound) {
  std::string reply = "I looked everywhere." + std::string(100000, ' ') + "Nothing matches.";
  PeckResponseParser parser(1920, 1080);
  EXPECT_FALSE(parser.Extract(reply).found);
}

TEST(ResponseParser, UnclosedFenceFallsBackToBareObject) {
  PeckResponseParser parser;
  PeckResponseParser::ExtractResult result =
      parser.Extract("```json\n{\"hex_coord\": \"0040,0080\"}");
  ASSERT_TRUE(result.found);
  EXPECT_EQ(result.stage, "structured");
  EXPECT_EQ(result.label.x, 0x40);
  EXPECT_EQ(result.label.y, 0x80);
}

TEST(ResponseParser, StrayBraceInProseDoesNotHidePayload) {
  PeckResponseParser parser(1920, 1080);
  PeckResponseParser::ExtractResult result = parser.Extract(
      "Cells near 0010,0020 are the title bar {not the icon.\n"
      "{\"hex_coord\": \"0280,01E0\", \"reasoning\": \"icon\"}");
  ASSERT_TRUE(result.found);
  EXPECT_EQ(result.stage, "structured");
  EXPECT_EQ(result.label.x, 0x280);
  EXPECT_EQ(result.label.y, 0x1E0);
}

TEST(ResponseParser, ManyStrayBracesAreBounded) {
  std::string reply(5000, '{');
  reply += "no label";
  PeckResponseParser parser;
  EXPECT_FALSE(parser.Extract(reply).found);
}
