#include <gtest/gtest.h>
#include <stdint.h>
#include "GatewayJsonParser.h"

namespace {

const char* EXAMPLE_BODY =
    "{\"data\":{\"timestamp\":100,\"gw_mac\":\"AA:BB:CC:DD:EE:FF\","
    "\"tags\":{\"11:22:33:44:55:66\":{\"rssi\":-70,\"timestamp\":95,\"data\":\"0201060303aafe\"}}}}";

bool decodeBody(const std::string& body, HistoryResponse& response, std::string& error) {
    JsonDocument doc;
    DeserializationError jsonError = deserializeJson(doc, body);
    EXPECT_FALSE(jsonError) << jsonError.c_str();
    return GatewayJsonParser::decodeHistory(doc.as<JsonVariantConst>(), response, error);
}

HistoryResponse decodeOk(const std::string& body) {
    HistoryResponse response;
    std::string error;
    EXPECT_TRUE(decodeBody(body, response, error)) << error;
    return response;
}

std::string decodeError(const std::string& body) {
    HistoryResponse response;
    std::string error;
    EXPECT_FALSE(decodeBody(body, response, error));
    return error;
}

}  // namespace

TEST(GatewayJsonParser, DecodesExampleResponse) {
    HistoryResponse response = decodeOk(EXAMPLE_BODY);

    EXPECT_EQ(100, response.timestamp);
    EXPECT_EQ("AA:BB:CC:DD:EE:FF", response.gwMac);
    EXPECT_EQ("", response.coordinates);
    ASSERT_EQ(1u, response.tags.size());

    const TagData& tag = response.tags[0];
    EXPECT_EQ("11:22:33:44:55:66", tag.mac);
    EXPECT_EQ(-70, tag.rssi);
    EXPECT_EQ(95, tag.timestamp);
    EXPECT_TRUE(tag.hasAgeSeconds);
    EXPECT_EQ(5, tag.ageSeconds);
    EXPECT_EQ((std::vector<uint8_t>{0x02, 0x01, 0x06, 0x03, 0x03, 0xaa, 0xfe}), tag.data);
}

TEST(GatewayJsonParser, DecodingIsDeterministic) {
    HistoryResponse first = decodeOk(EXAMPLE_BODY);
    HistoryResponse second = decodeOk(EXAMPLE_BODY);

    ASSERT_EQ(first.tags.size(), second.tags.size());
    EXPECT_EQ(first.tags[0].mac, second.tags[0].mac);
    EXPECT_EQ(first.tags[0].data, second.tags[0].data);
    EXPECT_EQ(first.tags[0].ageSeconds, second.tags[0].ageSeconds);
}

TEST(GatewayJsonParser, DerivesGatewaySuffixAndTitle) {
    HistoryResponse response = decodeOk(
        "{\"data\":{\"timestamp\":1,\"gw_mac\":\"aa:bb:cc:dd:ee:ff\",\"coordinates\":\"60.1,24.9\"}}");

    EXPECT_EQ("EE:FF", response.gwMacSuffix());
    EXPECT_EQ("Ruuvi Gateway EE:FF", response.title());
    EXPECT_EQ("60.1,24.9", response.coordinates);
    EXPECT_TRUE(response.tags.empty());
}

TEST(GatewayJsonParser, ZeroResponseTimestampLeavesAgeUnset) {
    HistoryResponse response = decodeOk(
        "{\"data\":{\"timestamp\":0,\"gw_mac\":\"AA:BB:CC:DD:EE:FF\","
        "\"tags\":{\"11:22:33:44:55:66\":{\"rssi\":-70,\"timestamp\":95,\"data\":\"0201\"}}}}");

    ASSERT_EQ(1u, response.tags.size());
    EXPECT_FALSE(response.tags[0].hasAgeSeconds);
}

TEST(GatewayJsonParser, AcceptsNumericStrings) {
    HistoryResponse response = decodeOk(
        "{\"data\":{\"timestamp\":\"200\",\"gw_mac\":\"AA:BB:CC:DD:EE:FF\","
        "\"tags\":{\"11:22:33:44:55:66\":{\"rssi\":\"-81\",\"timestamp\":\"150\",\"data\":\"FF\"}}}}");

    ASSERT_EQ(1u, response.tags.size());
    EXPECT_EQ(-81, response.tags[0].rssi);
    EXPECT_EQ(50, response.tags[0].ageSeconds);
}

TEST(GatewayJsonParser, NormalizesTagIdentifiers) {
    HistoryResponse response = decodeOk(
        "{\"data\":{\"timestamp\":10,\"gw_mac\":\"AA:BB:CC:DD:EE:FF\","
        "\"tags\":{\" c1:d2:e3:f4:a5:b6 \":{\"rssi\":-60,\"timestamp\":10,\"data\":\"00\"}}}}");

    ASSERT_EQ(1u, response.tags.size());
    EXPECT_EQ("C1:D2:E3:F4:A5:B6", response.tags[0].mac);
}

TEST(GatewayJsonParser, RejectsDuplicateIdentifiersAfterNormalization) {
    std::string error = decodeError(
        "{\"data\":{\"timestamp\":10,\"gw_mac\":\"AA:BB:CC:DD:EE:FF\",\"tags\":{"
        "\"aa:00:00:00:00:01\":{\"rssi\":-60,\"timestamp\":10,\"data\":\"00\"},"
        "\"AA:00:00:00:00:01\":{\"rssi\":-61,\"timestamp\":10,\"data\":\"01\"}}}}");
    EXPECT_NE(std::string::npos, error.find("duplicate"));
}

TEST(GatewayJsonParser, RejectsNonHexPayloadWithoutPartialResult) {
    HistoryResponse response;
    response.gwMac = "untouched";
    std::string error;
    bool decoded = decodeBody(
        "{\"data\":{\"timestamp\":10,\"gw_mac\":\"AA:BB:CC:DD:EE:FF\",\"tags\":{"
        "\"11:11:11:11:11:11\":{\"rssi\":-60,\"timestamp\":10,\"data\":\"0201\"},"
        "\"22:22:22:22:22:22\":{\"rssi\":-60,\"timestamp\":10,\"data\":\"zz01\"}}}}",
        response, error);

    EXPECT_FALSE(decoded);
    EXPECT_NE(std::string::npos, error.find("22:22:22:22:22:22"));
    EXPECT_EQ("untouched", response.gwMac);
    EXPECT_TRUE(response.tags.empty());
}

TEST(GatewayJsonParser, RejectsOddLengthAndEmptyPayloads) {
    decodeError("{\"data\":{\"timestamp\":1,\"gw_mac\":\"G\",\"tags\":{\"T\":{\"rssi\":1,\"timestamp\":1,\"data\":\"abc\"}}}}");
    decodeError("{\"data\":{\"timestamp\":1,\"gw_mac\":\"G\",\"tags\":{\"T\":{\"rssi\":1,\"timestamp\":1,\"data\":\"\"}}}}");
    decodeError("{\"data\":{\"timestamp\":1,\"gw_mac\":\"G\",\"tags\":{\"T\":{\"rssi\":1,\"timestamp\":1,\"data\":\"02 01\"}}}}");
}

TEST(GatewayJsonParser, RejectsMissingRequiredFields) {
    EXPECT_NE(std::string::npos, decodeError("{}").find("'data'"));
    EXPECT_NE(std::string::npos, decodeError("{\"data\":{\"gw_mac\":\"G\"}}").find("'timestamp'"));
    EXPECT_NE(std::string::npos, decodeError("{\"data\":{\"timestamp\":1}}").find("'gw_mac'"));
    EXPECT_NE(std::string::npos,
              decodeError("{\"data\":{\"timestamp\":1,\"gw_mac\":\"G\",\"tags\":{\"T\":{\"timestamp\":1,\"data\":\"00\"}}}}")
                  .find("'rssi'"));
    EXPECT_NE(std::string::npos,
              decodeError("{\"data\":{\"timestamp\":1,\"gw_mac\":\"G\",\"tags\":{\"T\":{\"rssi\":1,\"data\":\"00\"}}}}")
                  .find("'timestamp'"));
    EXPECT_NE(std::string::npos,
              decodeError("{\"data\":{\"timestamp\":1,\"gw_mac\":\"G\",\"tags\":{\"T\":{\"rssi\":1,\"timestamp\":1}}}}")
                  .find("'data'"));
}

TEST(GatewayJsonParser, RejectsMistypedFields) {
    decodeError("{\"data\":{\"timestamp\":\"soon\",\"gw_mac\":\"G\"}}");
    decodeError("{\"data\":{\"timestamp\":1.5,\"gw_mac\":\"G\"}}");
    decodeError("{\"data\":{\"timestamp\":true,\"gw_mac\":\"G\"}}");
    decodeError("{\"data\":{\"timestamp\":1,\"gw_mac\":42}}");
    decodeError("{\"data\":{\"timestamp\":1,\"gw_mac\":\"G\",\"tags\":[]}}");
    decodeError("{\"data\":{\"timestamp\":1,\"gw_mac\":\"G\",\"coordinates\":7}}");
    decodeError("{\"data\":{\"timestamp\":1,\"gw_mac\":\"G\",\"tags\":{\"T\":{\"rssi\":\"-7x\",\"timestamp\":1,\"data\":\"00\"}}}}");
    decodeError("{\"data\":{\"timestamp\":1,\"gw_mac\":\"G\",\"tags\":{\"T\":{\"rssi\":1,\"timestamp\":1,\"data\":12}}}}");
    decodeError("{\"data\":{\"timestamp\":1,\"gw_mac\":\"G\",\"tags\":{\"T\":\"nope\"}}}");
    decodeError("[1,2,3]");
}

TEST(GatewayJsonParser, RejectsAgeThatOverflows) {
    std::string error = decodeError(
        "{\"data\":{\"timestamp\":\"9223372036854775807\",\"gw_mac\":\"G\","
        "\"tags\":{\"T\":{\"rssi\":1,\"timestamp\":\"-5\",\"data\":\"00\"}}}}");
    EXPECT_NE(std::string::npos, error.find("'timestamp'"));

    decodeError(
        "{\"data\":{\"timestamp\":\"-9223372036854775807\",\"gw_mac\":\"G\","
        "\"tags\":{\"T\":{\"rssi\":1,\"timestamp\":\"9223372036854775807\",\"data\":\"00\"}}}}");
}

TEST(GatewayJsonParser, AcceptsExtremeTimestampsThatFit) {
    HistoryResponse response = decodeOk(
        "{\"data\":{\"timestamp\":\"9223372036854775807\",\"gw_mac\":\"G\","
        "\"tags\":{\"T\":{\"rssi\":1,\"timestamp\":\"0\",\"data\":\"00\"}}}}");
    ASSERT_EQ(1u, response.tags.size());
    EXPECT_EQ(INT64_MAX, response.tags[0].ageSeconds);

    response = decodeOk(
        "{\"data\":{\"timestamp\":-1,\"gw_mac\":\"G\","
        "\"tags\":{\"T\":{\"rssi\":1,\"timestamp\":\"9223372036854775807\",\"data\":\"00\"}}}}");
    ASSERT_EQ(1u, response.tags.size());
    EXPECT_EQ(INT64_MIN, response.tags[0].ageSeconds);
}

TEST(GatewayJsonParser, ParseHexAcceptsBothCases) {
    std::vector<uint8_t> bytes;
    std::string error;
    ASSERT_TRUE(GatewayJsonParser::parseHex("aAfF09", bytes, error));
    EXPECT_EQ((std::vector<uint8_t>{0xaa, 0xff, 0x09}), bytes);
    EXPECT_EQ("AAFF09", toHex(bytes));
}

TEST(GatewayJsonParser, ParseIntegerRejectsOverflow) {
    int64_t value = 0;
    std::string error;
    EXPECT_TRUE(GatewayJsonParser::parseInteger(std::string("9223372036854775807"), value, error));
    EXPECT_FALSE(GatewayJsonParser::parseInteger(std::string("9223372036854775808"), value, error));
    EXPECT_FALSE(GatewayJsonParser::parseInteger(std::string("-"), value, error));
    EXPECT_TRUE(GatewayJsonParser::parseInteger(std::string(" -12 "), value, error));
    EXPECT_EQ(-12, value);
}

TEST(GatewayTypes, FormatsUtcTimestamps) {
    EXPECT_EQ("1970-01-01T00:00:00Z", formatUtcTimestamp(0));
    EXPECT_EQ("2023-11-14T22:13:20Z", formatUtcTimestamp(1700000000));
}

TEST(GatewayTypes, TagDataHexIsUpperCase) {
    TagData tag;
    tag.data = {0x02, 0x01, 0x06, 0xaa, 0xfe};
    EXPECT_EQ("020106AAFE", tag.dataHex());
}
