#include <gtest/gtest.h>
#include "xray/extract/segment.h"

#include <stdexcept>

using xray::MatchState;
using xray::Segment;

TEST(SegmentTest, ToJsonFlattensMetadata) {
    Segment segment;
    segment.text = "Welcome";
    segment.geometry = xray::Rect{10.0f, 20.0f, 30.0f, 40.0f};
    segment.metadata = nlohmann::json{{"sid", "home.welcome"}, {"g", "guid-1"}};

    const nlohmann::json j = xray::segmentToJson(segment);
    EXPECT_EQ(j["text"], "Welcome");
    EXPECT_FLOAT_EQ(j["x"].get<float>(), 10.0f);
    EXPECT_FLOAT_EQ(j["height"].get<float>(), 40.0f);
    EXPECT_EQ(j["sid"], "home.welcome");
    EXPECT_EQ(j["g"], "guid-1");
    EXPECT_FALSE(j.contains("matched"));
    EXPECT_FALSE(j.contains("decodingError"));
}

TEST(SegmentTest, ReservedMetadataKeysNeverShadowSegmentFields) {
    Segment segment;
    segment.text = "real";
    segment.metadata = nlohmann::json{{"text", "fake"}, {"x", 99}};

    const nlohmann::json j = xray::segmentToJson(segment);
    EXPECT_EQ(j["text"], "real");
    EXPECT_FLOAT_EQ(j["x"].get<float>(), 0.0f);
}

TEST(SegmentTest, FromJsonReadsMatchAndMetadata) {
    const Segment segment = xray::segmentFromJson(nlohmann::json::parse(R"({
        "text": "Buy", "x": 1, "y": 2, "width": 3, "height": 4,
        "g": "guid-7", "matched": false, "decodingError": "bad"
    })"));
    EXPECT_EQ(segment.text, "Buy");
    EXPECT_EQ(segment.geometry, (xray::Rect{1.0f, 2.0f, 3.0f, 4.0f}));
    EXPECT_EQ(segment.matched, MatchState::Unmatched);
    ASSERT_TRUE(segment.decodingError.has_value());
    EXPECT_EQ(*segment.decodingError, "bad");
    EXPECT_EQ(segment.metadata.size(), 1u);
    EXPECT_EQ(segment.metadata["g"], "guid-7");
}

TEST(SegmentTest, FromJsonRejectsMissingText) {
    EXPECT_THROW(xray::segmentFromJson(nlohmann::json{{"x", 1}}), std::invalid_argument);
    EXPECT_THROW(xray::segmentsFromJson(nlohmann::json::object()), std::invalid_argument);
}

TEST(SegmentTest, MetadataOnlyDropsNullsAndReservedKeys) {
    Segment segment;
    segment.text = "t";
    segment.metadata = nlohmann::json{{"g", "guid"}, {"empty", nullptr}, {"matched", true}};
    segment.matched = MatchState::Matched;

    const nlohmann::json clean = xray::metadataOnly(segment);
    EXPECT_EQ(clean, (nlohmann::json{{"g", "guid"}}));
}

TEST(SegmentTest, ExtractionResultJsonShapes) {
    xray::ExtractionResult failed;
    failed.error = "Document body not found.";
    EXPECT_EQ(xray::extractionResultToJson(failed), (nlohmann::json{{"error", "Document body not found."}}));

    xray::ExtractionResult ok;
    ok.textElements.push_back(Segment{});
    const nlohmann::json j = xray::extractionResultToJson(ok);
    ASSERT_TRUE(j["textElements"].is_array());
    EXPECT_EQ(j["textElements"].size(), 1u);
    EXPECT_FALSE(j.contains("error"));
}
