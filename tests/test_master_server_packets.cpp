#include <gtest/gtest.h>
#include "srcquery/net/master_server_packets.h"
#include "srcquery/net/packet_error.h"

using namespace SQ::Net;
using SQ::Bytes;

class MasterServerPacketsTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(MasterServerPacketsTest, Request_DefaultsToSeedAndAllRegions) {
    MasterServerQueryRequest req;
    PacketBuffer out;
    req.Encode(out);

    Bytes expected = {0xFF, '0', '.', '0', '.', '0', '.', '0', ':', '0', 0x00, 0x00};
    EXPECT_EQ(out.Data(), expected);
}

TEST_F(MasterServerPacketsTest, Request_EncodesRegionStartAndFilter) {
    MasterServerQueryRequest req;
    req.region = MasterRegion::Europe;
    req.start_address = "1.2.3.4:27015";
    req.filter = "\\gamedir\\cstrike";

    PacketBuffer out;
    req.Encode(out);
    PacketBuffer in(out.Release());

    EXPECT_EQ(in.ReadUInt8(), 0x03);
    EXPECT_EQ(in.ReadCString(), "1.2.3.4:27015");
    EXPECT_EQ(in.ReadCString(), "\\gamedir\\cstrike");
    EXPECT_FALSE(in.HasRemaining());
}

TEST_F(MasterServerPacketsTest, Request_Decode) {
    PacketBuffer in(Bytes{0x01, '5', '.', '6', '.', '7', '.', '8', ':', '9', 0x00, 0x00});
    MasterServerQueryRequest req = MasterServerQueryRequest::Decode(in);

    EXPECT_EQ(req.region, MasterRegion::UsWestCoast);
    EXPECT_EQ(req.start_address, "5.6.7.8:9");
    EXPECT_EQ(req.filter, "");
}

TEST_F(MasterServerPacketsTest, Response_DecodesBigEndianPorts) {
    Bytes body = {
        0x0A,
        192, 168, 1, 10, 0x69, 0x87,   // 27015
        10, 0, 0, 1, 0x69, 0x88        // 27016
    };

    PacketBuffer in(body);
    MasterServerQueryResponse r = MasterServerQueryResponse::Decode(in);

    ASSERT_EQ(r.servers.size(), 2u);
    EXPECT_EQ(r.servers[0].ToString(), "192.168.1.10:27015");
    EXPECT_EQ(r.servers[1].ToString(), "10.0.0.1:27016");
    EXPECT_FALSE(r.IsLastPage());

    PacketBuffer out;
    r.Encode(out);
    EXPECT_EQ(out.Data(), body);
}

TEST_F(MasterServerPacketsTest, Response_SeedEndsListing) {
    Bytes body = {
        0x0A,
        8, 8, 4, 4, 0x00, 0x50,
        0, 0, 0, 0, 0x00, 0x00
    };

    PacketBuffer in(body);
    MasterServerQueryResponse r = MasterServerQueryResponse::Decode(in);

    ASSERT_EQ(r.servers.size(), 2u);
    EXPECT_EQ(r.servers[0].port, 80);
    EXPECT_TRUE(r.servers[1].IsSeed());
    EXPECT_EQ(r.servers[1].ToString(), MasterSeedAddress);
    EXPECT_TRUE(r.IsLastPage());
}

TEST_F(MasterServerPacketsTest, Response_EmptyBatch) {
    PacketBuffer in(Bytes{0x0A});
    MasterServerQueryResponse r = MasterServerQueryResponse::Decode(in);
    EXPECT_TRUE(r.servers.empty());
    EXPECT_FALSE(r.IsLastPage());
}

TEST_F(MasterServerPacketsTest, Response_BadPrefixIsMalformed) {
    PacketBuffer in(Bytes{0x0B, 1, 2, 3, 4, 0, 80});
    try {
        MasterServerQueryResponse::Decode(in);
        FAIL() << "Expected MalformedPacketError";
    }
    catch (const MalformedPacketError& ex) {
        EXPECT_EQ(ex.Kind(), PacketErrorKind::MalformedPacket);
    }
}

TEST_F(MasterServerPacketsTest, Response_PartialEntryUnderruns) {
    PacketBuffer in(Bytes{0x0A, 1, 2, 3, 4, 0x69});
    EXPECT_THROW(MasterServerQueryResponse::Decode(in), UnderrunError);
}

TEST_F(MasterServerPacketsTest, Response_MissingPrefixUnderruns) {
    PacketBuffer in;
    EXPECT_THROW(MasterServerQueryResponse::Decode(in), UnderrunError);
}
