#include <gtest/gtest.h>
#include "srcquery/net/packet_buffer.h"
#include "srcquery/net/packet_error.h"
#include <cmath>
#include <string>

using SQ::Bytes;
using SQ::Net::PacketBuffer;
using SQ::Net::UnderrunError;

class PacketBufferTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// =============================================================================
// Reads
// =============================================================================

TEST_F(PacketBufferTest, ReadIntegers_LittleEndian) {
    PacketBuffer in(Bytes{0x2A, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12, 0xFF, 0xFF, 0xFF, 0xFF});

    EXPECT_EQ(in.ReadUInt8(), 0x2A);
    EXPECT_EQ(in.ReadUInt16(), 0x1234);
    EXPECT_EQ(in.ReadUInt32(), 0x12345678u);
    EXPECT_EQ(in.ReadInt32(), -1);
    EXPECT_FALSE(in.HasRemaining());
}

TEST_F(PacketBufferTest, ReadUInt16BE_IsBigEndian) {
    PacketBuffer in(Bytes{0x69, 0x87});
    EXPECT_EQ(in.ReadUInt16BE(), 27015);
}

TEST_F(PacketBufferTest, ReadUInt64) {
    PacketBuffer in(Bytes{0x01, 0x00, 0x10, 0x01, 0x00, 0x00, 0x10, 0x90});
    EXPECT_EQ(in.ReadUInt64(), 0x9010000001100001ull);
}

TEST_F(PacketBufferTest, ReadFloat) {
    // 1.5f
    PacketBuffer in(Bytes{0x00, 0x00, 0xC0, 0x3F});
    EXPECT_FLOAT_EQ(in.ReadFloat(), 1.5f);
}

TEST_F(PacketBufferTest, ReadCString_ConsumesTerminator) {
    PacketBuffer in(Bytes{'d', 'e', '_', 'd', 'u', 's', 't', '2', 0x00, 0x00, 0x07});

    EXPECT_EQ(in.ReadCString(), "de_dust2");
    EXPECT_EQ(in.Position(), 9u);
    EXPECT_EQ(in.ReadCString(), "");
    EXPECT_EQ(in.ReadUInt8(), 0x07);
}

TEST_F(PacketBufferTest, ReadCString_WithoutTerminatorThrows) {
    PacketBuffer in(Bytes{'a', 'b', 'c'});
    EXPECT_THROW(in.ReadCString(), UnderrunError);
    // Position is unchanged after a failed read
    EXPECT_EQ(in.Position(), 0u);
}

TEST_F(PacketBufferTest, ReadBytesAndRemaining) {
    PacketBuffer in(Bytes{1, 2, 3, 4, 5});

    EXPECT_EQ(in.ReadBytes(2), (Bytes{1, 2}));
    EXPECT_EQ(in.Remaining(), 3u);
    EXPECT_EQ(in.ReadRemaining(), (Bytes{3, 4, 5}));
    EXPECT_EQ(in.ReadRemaining(), Bytes{});
}

// =============================================================================
// Underrun
// =============================================================================

TEST_F(PacketBufferTest, Underrun_ReportsSizes) {
    PacketBuffer in(Bytes{0x01, 0x02, 0x03});

    try {
        in.ReadUInt32();
        FAIL() << "Expected UnderrunError";
    }
    catch (const UnderrunError& ex) {
        EXPECT_EQ(ex.Kind(), SQ::Net::PacketErrorKind::Underrun);
        EXPECT_EQ(ex.Requested(), 4u);
        EXPECT_EQ(ex.Available(), 3u);
    }

    // A failed read does not consume anything
    EXPECT_EQ(in.Position(), 0u);
    EXPECT_EQ(in.ReadUInt16(), 0x0201);
}

TEST_F(PacketBufferTest, Underrun_EmptyBuffer) {
    PacketBuffer in;
    EXPECT_THROW(in.ReadUInt8(), UnderrunError);
    EXPECT_THROW(in.ReadUInt16BE(), UnderrunError);
    EXPECT_THROW(in.ReadUInt64(), UnderrunError);
    EXPECT_THROW(in.ReadFloat(), UnderrunError);
    EXPECT_THROW(in.ReadCString(), UnderrunError);
    EXPECT_THROW(in.ReadBytes(1), UnderrunError);
}

// =============================================================================
// Writes
// =============================================================================

TEST_F(PacketBufferTest, Write_AppendsInWireOrder) {
    PacketBuffer out;
    out.WriteUInt8(0x49);
    out.WriteUInt16(0x1234);
    out.WriteUInt16BE(0x1234);
    out.WriteUInt32(0xFFFFFFFFu);
    out.WriteInt32(-2);
    out.WriteCString("hi");
    out.WriteBytes(Bytes{0xAA, 0xBB});

    Bytes expected = {
        0x49,
        0x34, 0x12,
        0x12, 0x34,
        0xFF, 0xFF, 0xFF, 0xFF,
        0xFE, 0xFF, 0xFF, 0xFF,
        'h', 'i', 0x00,
        0xAA, 0xBB
    };
    EXPECT_EQ(out.Data(), expected);
    EXPECT_EQ(out.Length(), expected.size());
}

TEST_F(PacketBufferTest, WriteThenRead) {
    PacketBuffer out;
    out.WriteUInt64(76561197960287930ull);
    out.WriteFloat(-12.25f);
    out.WriteCString("Counter-Strike");

    PacketBuffer in(out.Release());
    EXPECT_EQ(in.ReadUInt64(), 76561197960287930ull);
    EXPECT_FLOAT_EQ(in.ReadFloat(), -12.25f);
    EXPECT_EQ(in.ReadCString(), "Counter-Strike");
    EXPECT_FALSE(in.HasRemaining());
}

TEST_F(PacketBufferTest, Release_LeavesBufferEmpty) {
    PacketBuffer out;
    out.WriteUInt32(7);
    Bytes data = out.Release();

    EXPECT_EQ(data.size(), 4u);
    EXPECT_EQ(out.Length(), 0u);
    EXPECT_EQ(out.Position(), 0u);
    EXPECT_FALSE(out.HasRemaining());
}
