#include <gtest/gtest.h>
#include "srcquery/net/packet_reassembler.h"
#include "srcquery/net/compression.h"
#include "srcquery/net/crc32.h"
#include "srcquery/net/packet_error.h"
#include "srcquery/net/packet_factory.h"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace SQ::Net;
using SQ::Bytes;

class PacketReassemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dispatch_count = 0;
        m_last_payload.clear();
    }

    void TearDown() override {}

    // Records what reaches dispatch and decodes it normally
    PacketReassembler SpyReassembler(const ReassemblerOptions& opts = ReassemblerOptions()) {
        return PacketReassembler(opts, [this](const Bytes& payload) {
            ++m_dispatch_count;
            m_last_payload = payload;
            return CreatePacket(payload);
        });
    }

    static Bytes ToBytes(const std::string& s) {
        return Bytes(s.begin(), s.end());
    }

    // Splits data into fragments of at most chunk bytes
    static FragmentSet Split(const Bytes& data, size_t chunk) {
        size_t count = (data.size() + chunk - 1) / chunk;
        FragmentSet set(count);
        for (size_t i = 0; i < count; ++i) {
            size_t begin = i * chunk;
            size_t end = std::min(data.size(), begin + chunk);
            set.SetFragment(i, Bytes(data.begin() + begin, data.begin() + end));
        }
        return set;
    }

    static RulesResponse SampleRules() {
        RulesResponse rules;
        for (int i = 0; i < 40; ++i) {
            rules.rules.push_back({"sv_rule_" + std::to_string(i), std::to_string(i * 10)});
        }
        return rules;
    }

    int m_dispatch_count = 0;
    Bytes m_last_payload;
};

// =============================================================================
// FragmentSet
// =============================================================================

TEST_F(PacketReassemblerTest, FragmentSet_TracksCompleteness) {
    FragmentSet set(3);
    EXPECT_EQ(set.Count(), 3u);
    EXPECT_FALSE(set.IsComplete());

    set.SetFragment(2, ToBytes("EF"));
    set.SetFragment(0, ToBytes("AB"));
    EXPECT_FALSE(set.IsComplete());

    set.SetFragment(1, ToBytes("CD"));
    EXPECT_TRUE(set.IsComplete());
}

TEST_F(PacketReassemblerTest, FragmentSet_IndexOutOfRange) {
    FragmentSet set(2);
    EXPECT_THROW(set.SetFragment(2, ToBytes("x")), std::out_of_range);
}

// =============================================================================
// Uncompressed
// =============================================================================

TEST_F(PacketReassemblerTest, Uncompressed_ConcatenatesInOrder) {
    FragmentSet set(3);
    set.SetFragment(0, ToBytes("AB"));
    set.SetFragment(1, ToBytes("CD"));
    set.SetFragment(2, ToBytes("EF"));

    PacketReassembler reassembler = SpyReassembler();
    EXPECT_EQ(reassembler.ReassemblePayload(set), ToBytes("ABCDEF"));
    EXPECT_EQ(m_dispatch_count, 0);

    // 'A' (0x41) selects the challenge reply; "BCDE" is its number
    Packet packet = reassembler.Reassemble(set);
    EXPECT_EQ(m_dispatch_count, 1);
    EXPECT_EQ(m_last_payload, ToBytes("ABCDEF"));
    ASSERT_TRUE(std::holds_alternative<ChallengeResponse>(packet));
    EXPECT_EQ(std::get<ChallengeResponse>(packet).challenge, 0x45444342);
}

TEST_F(PacketReassemblerTest, Uncompressed_DispatchesJoinedPacket) {
    RulesResponse rules = SampleRules();
    FragmentSet set = Split(EncodePacket(rules), 100);
    ASSERT_GT(set.Count(), 1u);

    PacketReassembler reassembler = SpyReassembler();
    Packet packet = reassembler.Reassemble(set);

    EXPECT_EQ(m_dispatch_count, 1);
    ASSERT_TRUE(std::holds_alternative<RulesResponse>(packet));
    const auto& decoded = std::get<RulesResponse>(packet);
    ASSERT_EQ(decoded.rules.size(), rules.rules.size());
    EXPECT_EQ(decoded.rules[39].name, "sv_rule_39");
    EXPECT_EQ(decoded.rules[39].value, "390");
}

TEST_F(PacketReassemblerTest, SingleFragment) {
    FragmentSet set(1);
    set.SetFragment(0, Bytes{0x41, 0x05, 0x00, 0x00, 0x00});

    PacketReassembler reassembler;
    Packet packet = reassembler.Reassemble(set);
    ASSERT_TRUE(std::holds_alternative<ChallengeResponse>(packet));
    EXPECT_EQ(std::get<ChallengeResponse>(packet).challenge, 5);
}

TEST_F(PacketReassemblerTest, MissingFragment_IsRetryable) {
    FragmentSet set(3);
    set.SetFragment(0, ToBytes("AB"));
    set.SetFragment(2, ToBytes("EF"));

    PacketReassembler reassembler = SpyReassembler();
    try {
        reassembler.Reassemble(set);
        FAIL() << "Expected IncompletePacketError";
    }
    catch (const IncompletePacketError& ex) {
        EXPECT_EQ(ex.MissingIndex(), 1u);
        EXPECT_EQ(ex.Kind(), PacketErrorKind::IncompletePacket);
        EXPECT_TRUE(ex.IsRetryable());
    }
    EXPECT_EQ(m_dispatch_count, 0);
}

TEST_F(PacketReassemblerTest, DispatchErrorsPropagate) {
    FragmentSet set(2);
    set.SetFragment(0, Bytes{0x00});
    set.SetFragment(1, Bytes{0x01});

    PacketReassembler reassembler = SpyReassembler();
    EXPECT_THROW(reassembler.Reassemble(set), UnknownHeaderError);
    EXPECT_EQ(m_dispatch_count, 1);
    EXPECT_EQ(m_last_payload, (Bytes{0x00, 0x01}));
}

// =============================================================================
// Compressed
// =============================================================================

TEST_F(PacketReassemblerTest, Compressed_DecompressesAndVerifies) {
    Bytes payload = EncodePacket(SampleRules());
    Bytes compressed = Bzip2Compress(payload);

    FragmentSet set = Split(compressed, 64);
    set.is_compressed = true;
    set.uncompressed_size = static_cast<uint32_t>(payload.size());
    set.checksum = SQ::Crc32(payload.data(), payload.size());

    PacketReassembler reassembler = SpyReassembler();
    Packet packet = reassembler.Reassemble(set);

    EXPECT_EQ(m_dispatch_count, 1);
    EXPECT_EQ(m_last_payload, payload);
    ASSERT_TRUE(std::holds_alternative<RulesResponse>(packet));
    EXPECT_EQ(std::get<RulesResponse>(packet).rules.size(), 40u);
}

TEST_F(PacketReassemblerTest, Compressed_BadChecksumNeverDispatches) {
    Bytes payload = EncodePacket(SampleRules());
    Bytes compressed = Bzip2Compress(payload);
    uint32_t good = SQ::Crc32(payload.data(), payload.size());

    FragmentSet set = Split(compressed, 64);
    set.is_compressed = true;
    set.uncompressed_size = static_cast<uint32_t>(payload.size());
    set.checksum = good ^ 0x1u;

    PacketReassembler reassembler = SpyReassembler();
    try {
        reassembler.Reassemble(set);
        FAIL() << "Expected ChecksumMismatchError";
    }
    catch (const ChecksumMismatchError& ex) {
        EXPECT_EQ(ex.Expected(), good ^ 0x1u);
        EXPECT_EQ(ex.Actual(), good);
        EXPECT_EQ(ex.Kind(), PacketErrorKind::ChecksumMismatch);
        EXPECT_FALSE(ex.IsRetryable());
    }
    EXPECT_EQ(m_dispatch_count, 0);
}

TEST_F(PacketReassemblerTest, Compressed_WrongSizeIsDecompressionError) {
    Bytes payload = EncodePacket(SampleRules());
    Bytes compressed = Bzip2Compress(payload);

    FragmentSet set = Split(compressed, 64);
    set.is_compressed = true;
    set.uncompressed_size = static_cast<uint32_t>(payload.size() + 1);
    set.checksum = SQ::Crc32(payload.data(), payload.size());

    PacketReassembler reassembler = SpyReassembler();
    EXPECT_THROW(reassembler.Reassemble(set), DecompressionError);
    EXPECT_EQ(m_dispatch_count, 0);
}

TEST_F(PacketReassemblerTest, Compressed_FragmentsOutOfOrderFailToDecompress) {
    Bytes payload = EncodePacket(SampleRules());
    Bytes compressed = Bzip2Compress(payload);

    FragmentSet set = Split(compressed, 64);
    ASSERT_GT(set.Count(), 1u);
    std::swap(set.fragments[0], set.fragments[1]);
    set.is_compressed = true;
    set.uncompressed_size = static_cast<uint32_t>(payload.size());
    set.checksum = SQ::Crc32(payload.data(), payload.size());

    PacketReassembler reassembler = SpyReassembler();
    EXPECT_THROW(reassembler.Reassemble(set), PacketError);
    EXPECT_EQ(m_dispatch_count, 0);
}

TEST_F(PacketReassemblerTest, Compressed_DeclaredSizeOverLimit) {
    Bytes payload = EncodePacket(SampleRules());
    Bytes compressed = Bzip2Compress(payload);

    ReassemblerOptions opts;
    opts.max_uncompressed_size = 128;
    ASSERT_GT(payload.size(), 128u);

    FragmentSet set = Split(compressed, 64);
    set.is_compressed = true;
    set.uncompressed_size = static_cast<uint32_t>(payload.size());
    set.checksum = SQ::Crc32(payload.data(), payload.size());

    PacketReassembler reassembler = SpyReassembler(opts);
    EXPECT_THROW(reassembler.Reassemble(set), DecompressionError);
    EXPECT_EQ(m_dispatch_count, 0);
    EXPECT_EQ(reassembler.GetOptions().max_uncompressed_size, 128u);
}

TEST_F(PacketReassemblerTest, Compressed_MissingFragmentCheckedFirst) {
    FragmentSet set(2);
    set.SetFragment(1, ToBytes("garbage"));
    set.is_compressed = true;
    set.uncompressed_size = 10;

    PacketReassembler reassembler;
    EXPECT_THROW(reassembler.ReassemblePayload(set), IncompletePacketError);
}
