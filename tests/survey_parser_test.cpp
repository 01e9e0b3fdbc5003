#include "survey_parser.hpp"

#include <gtest/gtest.h>

static const char* kThreeCells =
    "wlan0     Scan completed :\n"
    "          Cell 01 - Address: AA:BB:CC:00:00:01\n"
    "                    Channel:6\n"
    "                    Quality=35/70  Signal level=-75 dBm\n"
    "                    Encryption key:on\n"
    "                    ESSID:\"Weak\"\n"
    "          Cell 02 - Address: AA:BB:CC:00:00:02\n"
    "                    ESSID:\"Strong\"\n"
    "                    Quality=70/70  Signal level=-30 dBm\n"
    "                    Encryption key:off\n"
    "          Cell 03 - Address: AA:BB:CC:00:00:03\n"
    "                    Quality=56/70  Signal level=-50 dBm\n"
    "                    Encryption key:on\n"
    "                    ESSID:\"Middle\"\n";

TEST(SurveyParserTest, ParsesEveryStanzaSortedByQuality) {
    auto networks = SurveyParser::parse(kThreeCells);

    ASSERT_EQ(networks.size(), 3u);
    EXPECT_EQ(networks[0].ssid, "Strong");
    EXPECT_EQ(networks[0].bssid, "AA:BB:CC:00:00:02");
    EXPECT_EQ(networks[0].quality, 100);
    EXPECT_FALSE(networks[0].encrypted);

    EXPECT_EQ(networks[1].ssid, "Middle");
    EXPECT_EQ(networks[1].quality, 80);
    EXPECT_TRUE(networks[1].encrypted);

    EXPECT_EQ(networks[2].ssid, "Weak");
    EXPECT_EQ(networks[2].quality, 50);
    EXPECT_TRUE(networks[2].encrypted);
}

TEST(SurveyParserTest, EqualQualityKeepsStanzaOrder) {
    const char* text =
        "Cell 01 - Address: 00:00:00:00:00:01\n"
        "  ESSID:\"first\"\n"
        "  Quality=40/70\n"
        "Cell 02 - Address: 00:00:00:00:00:02\n"
        "  ESSID:\"better\"\n"
        "  Quality=60/70\n"
        "Cell 03 - Address: 00:00:00:00:00:03\n"
        "  ESSID:\"second\"\n"
        "  Quality=40/70\n";

    auto networks = SurveyParser::parse(text);

    ASSERT_EQ(networks.size(), 3u);
    EXPECT_EQ(networks[0].ssid, "better");
    EXPECT_EQ(networks[1].ssid, "first");
    EXPECT_EQ(networks[2].ssid, "second");
}

TEST(SurveyParserTest, MalformedQualitySortsAsZeroAndKeepsParsing) {
    const char* text =
        "Cell 01 - Address: 00:00:00:00:00:01\n"
        "  ESSID:\"broken\"\n"
        "  Quality=abc/70  Signal level=-60 dBm\n"
        "Cell 02 - Address: 00:00:00:00:00:02\n"
        "  ESSID:\"fine\"\n"
        "  Quality=7/70\n";

    auto networks = SurveyParser::parse(text);

    ASSERT_EQ(networks.size(), 2u);
    EXPECT_EQ(networks[0].ssid, "fine");
    EXPECT_EQ(networks[0].quality, 10);
    EXPECT_EQ(networks[1].ssid, "broken");
    EXPECT_FALSE(networks[1].quality.has_value());
    EXPECT_EQ(networks[1].effectiveQuality(), 0);
}

TEST(SurveyParserTest, HiddenNetworkHasEmptySsid) {
    auto networks = SurveyParser::parse(
        "Cell 01 - Address: 00:00:00:00:00:09\n"
        "  ESSID:\"\"\n"
        "  Quality=20/70\n");

    ASSERT_EQ(networks.size(), 1u);
    EXPECT_TRUE(networks[0].ssid.empty());
    EXPECT_EQ(networks[0].bssid, "00:00:00:00:00:09");
}

TEST(SurveyParserTest, EncryptionFlagReadsTheValueOnly) {
    auto networks = SurveyParser::parse(
        "Cell 01 - Address: 00:00:00:00:00:01\n"
        "  Encryption key:off\n");

    ASSERT_EQ(networks.size(), 1u);
    EXPECT_FALSE(networks[0].encrypted);
}

TEST(SurveyParserTest, EmptyOutputYieldsNoRecords) {
    EXPECT_TRUE(SurveyParser::parse("").empty());
    EXPECT_TRUE(SurveyParser::parse("wlan0     No scan results\n").empty());
}

TEST(SurveyParserTest, QualityRatio) {
    EXPECT_EQ(SurveyParser::parseQualityRatio("70/70"), 100);
    EXPECT_EQ(SurveyParser::parseQualityRatio("69/70"), 98);
    EXPECT_EQ(SurveyParser::parseQualityRatio("90/70"), 100);
    EXPECT_FALSE(SurveyParser::parseQualityRatio("10/0").has_value());
    EXPECT_FALSE(SurveyParser::parseQualityRatio("70").has_value());
    EXPECT_FALSE(SurveyParser::parseQualityRatio("/70").has_value());
}

TEST(SurveyParserTest, QualityRatioStaysInRangeForHugeReadings) {
    EXPECT_EQ(SurveyParser::parseQualityRatio("99999999999999999/1"), 100);
    EXPECT_EQ(SurveyParser::parseQualityRatio("60000000000000000/70000000000000000"), 85);
    EXPECT_EQ(SurveyParser::parseQualityRatio("0/9223372036854775807"), 0);
    EXPECT_FALSE(SurveyParser::parseQualityRatio("99999999999999999999999/70").has_value());
}

TEST(SurveyParserTest, RecordJson) {
    NetworkRecord record;
    record.bssid = "AA:BB";
    record.ssid = "Cafe \"Bar\"";
    record.encrypted = true;

    EXPECT_EQ(record.toJson(),
              "{\"bssid\":\"AA:BB\",\"ssid\":\"Cafe \\\"Bar\\\"\",\"quality\":null,"
              "\"encrypted\":true}");
}
