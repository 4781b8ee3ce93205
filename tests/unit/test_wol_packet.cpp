// tests/unit/test_wol_packet.cpp
#include <gtest/gtest.h>
#include "../../src/core/relay/wol_packet.hpp"

using namespace WolRelay::Relay;

// ==================== Test Fixture ====================
class WolPacketTest : public ::testing::Test
{
protected:
    WolPacketCodec codec;

    static Packet withTrailer(const Packet &packet, std::initializer_list<uint8_t> trailer)
    {
        Packet result(packet);
        result.insert(result.end(), trailer.begin(), trailer.end());
        return result;
    }
};

// ==================== Build Tests ====================

TEST_F(WolPacketTest, BuildPacketLayout)
{
    Packet packet = WolPacketCodec::buildPacket("AA:BB:CC:DD:EE:FF");

    ASSERT_EQ(packet.size(), WOL_PACKET_SIZE);
    for (size_t i = 0; i < WOL_SYNC_LENGTH; ++i)
    {
        EXPECT_EQ(packet[i], 0xFF);
    }

    const uint8_t expected[] = {0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF};
    for (size_t rep = 0; rep < WOL_HW_REPEAT; ++rep)
    {
        for (size_t j = 0; j < WOL_HW_ADDRESS_LENGTH; ++j)
        {
            EXPECT_EQ(packet[WOL_SYNC_LENGTH + rep * WOL_HW_ADDRESS_LENGTH + j], expected[j]);
        }
    }
}

TEST_F(WolPacketTest, BuildPacketAcceptsSeparatorsAndCase)
{
    Packet reference = WolPacketCodec::buildPacket("AABBCCDDEEFF");

    EXPECT_EQ(WolPacketCodec::buildPacket("aa:bb:cc:dd:ee:ff"), reference);
    EXPECT_EQ(WolPacketCodec::buildPacket("AA-BB-CC-DD-EE-FF"), reference);
    EXPECT_EQ(WolPacketCodec::buildPacket("  aabbccddeeff \n"), reference);

    // Dấu phân cách bị bỏ ở bất kỳ vị trí nào
    EXPECT_EQ(WolPacketCodec::buildPacket("AABB-CCDD-EEFF"), reference);
    EXPECT_EQ(WolPacketCodec::buildPacket("AABBCC:DDEEFF"), reference);
    EXPECT_EQ(WolPacketCodec::buildPacket("A:AB:BC:CD:DE:EF:F"), reference);
    EXPECT_EQ(WolPacketCodec::buildPacket("AA:BB-CC:DD-EE:FF"), reference);
}

TEST_F(WolPacketTest, BuildPacketRejectsInvalidAddress)
{
    EXPECT_THROW(WolPacketCodec::buildPacket(""), PacketFormatError);
    EXPECT_THROW(WolPacketCodec::buildPacket("AA:BB:CC:DD:EE"), PacketFormatError);
    EXPECT_THROW(WolPacketCodec::buildPacket("AA:BB:CC:DD:EE:FF:00"), PacketFormatError);
    EXPECT_THROW(WolPacketCodec::buildPacket("GG:BB:CC:DD:EE:FF"), PacketFormatError);
    EXPECT_THROW(WolPacketCodec::buildPacket("AA BB CC DD EE FF"), PacketFormatError);
    EXPECT_THROW(WolPacketCodec::buildPacket("aabb.ccdd.eeff"), PacketFormatError);
}

TEST_F(WolPacketTest, NormalizeHwAddress)
{
    EXPECT_EQ(WolPacketCodec::normalizeHwAddress("aabbccddeeff"), std::optional<std::string>("AA:BB:CC:DD:EE:FF"));
    EXPECT_EQ(WolPacketCodec::normalizeHwAddress("00-11-22-33-44-55"), std::optional<std::string>("00:11:22:33:44:55"));
    EXPECT_EQ(WolPacketCodec::normalizeHwAddress("aabb-ccdd-eeff"), std::optional<std::string>("AA:BB:CC:DD:EE:FF"));
    EXPECT_FALSE(WolPacketCodec::normalizeHwAddress("00:11:22:33:44").has_value());
    EXPECT_FALSE(WolPacketCodec::normalizeHwAddress("zz:11:22:33:44:55").has_value());
}

// ==================== Shape Tests ====================

TEST_F(WolPacketTest, DefaultPatternAcceptsMagicPacket)
{
    EXPECT_TRUE(codec.isWolShaped(WolPacketCodec::buildPacket("00:11:22:33:44:55")));
    EXPECT_TRUE(codec.isWolShaped(WolPacketCodec::buildPacket("ff:ff:ff:ff:ff:ff")));
}

TEST_F(WolPacketTest, DefaultPatternRejectsOtherData)
{
    Packet packet = WolPacketCodec::buildPacket("00:11:22:33:44:55");

    // Thiếu một byte
    Packet truncated(packet.begin(), packet.end() - 1);
    EXPECT_FALSE(codec.isWolShaped(truncated));

    // Dư một byte
    EXPECT_FALSE(codec.isWolShaped(withTrailer(packet, {0x00})));

    // Sai phần sync
    Packet bad_sync(packet);
    bad_sync[0] = 0xFE;
    EXPECT_FALSE(codec.isWolShaped(bad_sync));

    std::string text = "hello world";
    EXPECT_FALSE(codec.isWolShaped(reinterpret_cast<const uint8_t *>(text.data()), text.size()));
    EXPECT_FALSE(codec.isWolShaped(nullptr, 0));
    EXPECT_FALSE(codec.isWolShaped(Packet()));
}

TEST_F(WolPacketTest, SecureOnPacketNeedsCustomPattern)
{
    Packet secure_on = withTrailer(WolPacketCodec::buildPacket("00:11:22:33:44:55"),
                                   {0x01, 0x02, 0x03, 0x04, 0x05, 0x06});

    EXPECT_FALSE(codec.isWolShaped(secure_on));

    WolPacketCodec custom("^(FF){6}([0-9A-F]{12}){16}([0-9A-F]{8}|[0-9A-F]{12})?$", DEFAULT_MAC_PATTERN);
    EXPECT_TRUE(custom.isWolShaped(secure_on));
    EXPECT_EQ(custom.extractHwAddress(secure_on), std::optional<std::string>("00:11:22:33:44:55"));
}

// ==================== Extraction Tests ====================

TEST_F(WolPacketTest, ExtractHwAddress)
{
    Packet packet = WolPacketCodec::buildPacket("aa-bb-cc-dd-ee-ff");

    auto hw_address = codec.extractHwAddress(packet);
    ASSERT_TRUE(hw_address.has_value());
    EXPECT_EQ(*hw_address, "AA:BB:CC:DD:EE:FF");
}

TEST_F(WolPacketTest, ExtractHwAddressNoMatch)
{
    Packet data(WOL_PACKET_SIZE, 0x00);
    EXPECT_FALSE(codec.extractHwAddress(data).has_value());
    EXPECT_FALSE(codec.extractHwAddress(nullptr, 0).has_value());
}

TEST_F(WolPacketTest, ExtractRequiresSixOctetGroups)
{
    // Pattern chỉ có một nhóm capture thì không lấy được MAC
    WolPacketCodec single_group(DEFAULT_WOL_PATTERN, "^(?:FF){6}([0-9A-F]{12})");
    Packet packet = WolPacketCodec::buildPacket("00:11:22:33:44:55");

    EXPECT_TRUE(single_group.isWolShaped(packet));
    EXPECT_FALSE(single_group.extractHwAddress(packet).has_value());
}

TEST_F(WolPacketTest, PatternsAreCaseInsensitive)
{
    WolPacketCodec lower("^(ff){6}([0-9a-f]{12}){16}$",
                         "^(?:ff){6}([0-9a-f]{2})([0-9a-f]{2})([0-9a-f]{2})([0-9a-f]{2})([0-9a-f]{2})([0-9a-f]{2})");
    Packet packet = WolPacketCodec::buildPacket("0a:1b:2c:3d:4e:5f");

    EXPECT_TRUE(lower.isWolShaped(packet));
    EXPECT_EQ(lower.extractHwAddress(packet), std::optional<std::string>("0A:1B:2C:3D:4E:5F"));
}

// ==================== Construction Tests ====================

TEST_F(WolPacketTest, DefaultPatterns)
{
    EXPECT_EQ(codec.getWolPattern(), DEFAULT_WOL_PATTERN);
    EXPECT_EQ(codec.getMacPattern(), DEFAULT_MAC_PATTERN);
}

TEST_F(WolPacketTest, InvalidPatternThrows)
{
    EXPECT_THROW(WolPacketCodec("^(FF{6}", DEFAULT_MAC_PATTERN), std::regex_error);
    EXPECT_THROW(WolPacketCodec(DEFAULT_WOL_PATTERN, "([0-9A-F]{2}"), std::regex_error);
}
