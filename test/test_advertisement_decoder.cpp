#include <gtest/gtest.h>
#include "AdvertisementDecoder.h"
#include "GatewayJsonParser.h"

namespace {

std::vector<uint8_t> hex(const std::string& text) {
    std::vector<uint8_t> bytes;
    std::string error;
    EXPECT_TRUE(GatewayJsonParser::parseHex(text, bytes, error)) << error;
    return bytes;
}

class GapAdvertisementDecoderTest : public ::testing::Test {
protected:
    GapAdvertisementDecoder decoder;
    Advertisement advertisement;
    std::string error;
};

}  // namespace

TEST_F(GapAdvertisementDecoderTest, DecodesFlagsAndServiceUuid) {
    ASSERT_TRUE(decoder.decode(hex("0201060303aafe"), advertisement, error)) << error;

    EXPECT_TRUE(advertisement.hasFlags);
    EXPECT_EQ(0x06, advertisement.flags);
    ASSERT_EQ(1u, advertisement.serviceUuids.size());
    EXPECT_EQ("0000feaa-0000-1000-8000-00805f9b34fb", advertisement.serviceUuids[0]);
    EXPECT_FALSE(advertisement.hasTxPower);
    EXPECT_TRUE(advertisement.manufacturerData.empty());
}

TEST_F(GapAdvertisementDecoderTest, DecodesManufacturerDataWithLittleEndianCompany) {
    ASSERT_TRUE(decoder.decode(hex("05FF99040102"), advertisement, error)) << error;

    ASSERT_EQ(1u, advertisement.manufacturerData.count(0x0499));
    EXPECT_EQ((std::vector<uint8_t>{0x01, 0x02}), advertisement.manufacturerData[0x0499]);
}

TEST_F(GapAdvertisementDecoderTest, CompleteNameWinsOverShortName) {
    // Complete name, then a shortened name, then TX power.
    ASSERT_TRUE(decoder.decode(hex("0509527575760308527502" "0AF4"), advertisement, error)) << error;

    EXPECT_EQ("Ruuv", advertisement.localName);
    EXPECT_TRUE(advertisement.hasTxPower);
    EXPECT_EQ(-12, advertisement.txPower);
}

TEST_F(GapAdvertisementDecoderTest, ShortNameUsedWhenNoCompleteName) {
    ASSERT_TRUE(decoder.decode(hex("03085275"), advertisement, error)) << error;
    EXPECT_EQ("Ru", advertisement.localName);
}

TEST_F(GapAdvertisementDecoderTest, DecodesServiceDataKeyedByUuid) {
    ASSERT_TRUE(decoder.decode(hex("0516AAFE1020"), advertisement, error)) << error;

    const std::string uuid = GapAdvertisementDecoder::uuid16ToString(0xFEAA);
    ASSERT_EQ(1u, advertisement.serviceData.count(uuid));
    EXPECT_EQ((std::vector<uint8_t>{0x10, 0x20}), advertisement.serviceData[uuid]);
}

TEST_F(GapAdvertisementDecoderTest, FormatsUuid128FromLittleEndianBytes) {
    std::vector<uint8_t> bytes = hex("9ECADC240EE5A9E093F3A3B50100406E");
    EXPECT_EQ("6e400001-b5a3-f393-e0a9-e50e24dcca9e", GapAdvertisementDecoder::uuid128ToString(bytes.data()));
}

TEST_F(GapAdvertisementDecoderTest, StopsAtZeroPadding) {
    ASSERT_TRUE(decoder.decode(hex("0201060000FFFF"), advertisement, error)) << error;
    EXPECT_EQ(0x06, advertisement.flags);
}

TEST_F(GapAdvertisementDecoderTest, RejectsOverrunningStructure) {
    advertisement.localName = "previous";

    EXPECT_FALSE(decoder.decode(hex("02010605FF99"), advertisement, error));
    EXPECT_EQ("AD structure at offset 3 overruns payload", error);
    EXPECT_EQ("previous", advertisement.localName);
}

TEST_F(GapAdvertisementDecoderTest, RejectsTruncatedManufacturerAndServiceData) {
    EXPECT_FALSE(decoder.decode(hex("02FF99"), advertisement, error));
    EXPECT_EQ("Manufacturer data shorter than company id", error);
    EXPECT_FALSE(decoder.decode(hex("0216AA"), advertisement, error));
    EXPECT_EQ("Service data shorter than its UUID", error);
}

TEST_F(GapAdvertisementDecoderTest, IgnoresUnknownTypes) {
    ASSERT_TRUE(decoder.decode(hex("03191234020106"), advertisement, error)) << error;
    EXPECT_EQ(0x06, advertisement.flags);
}
