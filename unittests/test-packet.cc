#include <algorithm>

#include "gtest/gtest.h"

#include "vrlnc-test.h"

using namespace vrlnc;
using namespace vrlnc_test;

static const char* B1 = "e2f2ae0a6abc4e71a884a961c500515f58e30b6aa582dd8db6a65945e08d2d76";
static const char* B2 = "6a493210f7499cd17fecb510ae0cea23a110e8d5b901f8acadd3095c73a3b919";

static Packet sample_packet() {
    Packet p;
    p.coding_vector = {sc_from_u64(1), sc_from_u64(2)};
    p.payload = {sc_from_u64(3), sc_from_u64(4), sc_from_u64(5)};
    p.commitments = {point_from_hex(B1), point_from_hex(B2)};
    return p;
}

TEST(PACKET, test_wire_layout)
{
    Bytes wire = serialize_packet(sample_packet());
    ASSERT_EQ(wire.size(), 3 * 8 + 7 * 32u);

    // u64le count then 32-byte elements
    EXPECT_EQ(wire[0], 2);
    for (size_t i = 1; i < 8; i++) EXPECT_EQ(wire[i], 0);
    EXPECT_EQ(wire[8], 1);
    EXPECT_EQ(wire[40], 2);
    EXPECT_EQ(wire[72], 3);
    EXPECT_EQ(wire[80], 3);
    EXPECT_EQ(wire[80 + 3 * 32], 2);

    Packet back;
    ASSERT_EQ(parse_packet(wire, back), Status::Ok);
    EXPECT_EQ(back.coding_vector.size(), 2u);
    EXPECT_EQ(back.payload.size(), 3u);
    EXPECT_TRUE(sc_eq(back.payload[2], sc_from_u64(5)));
    EXPECT_EQ(back.commitments, sample_packet().commitments);
}

TEST(PACKET, test_parse_rejects_malformed)
{
    Bytes wire = serialize_packet(sample_packet());
    Packet p;

    EXPECT_EQ(parse_packet(Bytes{}, p), Status::InvalidMessage);
    EXPECT_EQ(parse_packet(Bytes(wire.begin(), wire.end() - 1), p), Status::InvalidMessage);

    Bytes bad = wire;
    bad.push_back(0);
    EXPECT_EQ(parse_packet(bad, p), Status::InvalidMessage);

    // count far beyond the buffer
    bad = wire;
    bad[7] = 0x40;
    EXPECT_EQ(parse_packet(bad, p), Status::InvalidMessage);

    // non-canonical scalar: l itself
    bad = wire;
    uint8_t l_bytes[32];
    sc_tobytes(l_bytes, Scalar{{SC_L[0], SC_L[1], SC_L[2], SC_L[3]}});
    std::copy(l_bytes, l_bytes + 32, bad.begin() + 8);
    EXPECT_EQ(parse_packet(bad, p), Status::InvalidMessage);

    // commitments are carried as bytes; decoding them is left to the receiver
    bad = wire;
    bad[bad.size() - 32] = 0x01;
    for (size_t i = bad.size() - 31; i < bad.size(); i++) bad[i] = 0;
    ASSERT_EQ(parse_packet(bad, p), Status::Ok);
    EXPECT_FALSE(rist_is_valid(p.commitments[1]));
}

TEST(PACKET, test_commitments_hash)
{
    Digest d;
    ASSERT_TRUE(commitments_hash(sample_packet().commitments, d));
    EXPECT_EQ(Bytes(d.begin(), d.end()),
              from_hex("22718f5a630cc374406df854037ee2c1eaa674511926252418465d96f8e0b2c9"));

    ASSERT_TRUE(commitments_hash({}, d));
    EXPECT_EQ(Bytes(d.begin(), d.end()),
              from_hex("af5570f5a1810b7af78caf4bc70a660f0df51e42baf91d4de5b2328de0e83dfc"));

    Packet other = sample_packet();
    other.payload.clear();
    other.coding_vector = {sc_from_u64(9), sc_from_u64(9)};
    Bytes wire = serialize_packet(other);
    Digest from_wire;
    ASSERT_EQ(packet_commitments_hash(wire.data(), wire.size(), from_wire), Status::Ok);
    ASSERT_TRUE(commitments_hash(sample_packet().commitments, d));
    EXPECT_EQ(from_wire, d);

    EXPECT_EQ(packet_commitments_hash(wire.data(), wire.size() - 1, from_wire), Status::InvalidMessage);
}

TEST(PACKET, test_combine_packets)
{
    Packet a = sample_packet(), b = sample_packet();
    b.coding_vector = {sc_from_u64(10), sc_from_u64(20)};
    b.payload = {sc_from_u64(30), sc_from_u64(40), sc_from_u64(50)};

    Packet out;
    ASSERT_EQ(combine_packets({&a, &b}, {sc_from_u64(2), sc_from_u64(1)}, out), Status::Ok);
    EXPECT_TRUE(sc_eq(out.coding_vector[0], sc_from_u64(12)));
    EXPECT_TRUE(sc_eq(out.coding_vector[1], sc_from_u64(24)));
    EXPECT_TRUE(sc_eq(out.payload[2], sc_from_u64(60)));
    EXPECT_EQ(out.commitments, a.commitments);

    EXPECT_EQ(combine_packets({&a}, {sc_one(), sc_one()}, out), Status::SizeMismatch);
    EXPECT_EQ(combine_packets({}, {}, out), Status::SizeMismatch);

    b.commitments.pop_back();
    EXPECT_EQ(combine_packets({&a, &b}, {sc_one(), sc_one()}, out), Status::CommitmentsMismatch);
}
