#include <algorithm>

#include "gtest/gtest.h"

#include "vrlnc-test.h"

using namespace vrlnc;
using namespace vrlnc_test;

TEST(CHUNK_CODEC, test_scalars_for_chunk)
{
    EXPECT_EQ(scalars_for_chunk(0), 0u);
    EXPECT_EQ(scalars_for_chunk(1), 1u);
    EXPECT_EQ(scalars_for_chunk(31), 1u);
    EXPECT_EQ(scalars_for_chunk(32), 2u);
    EXPECT_EQ(scalars_for_chunk(63), 2u);
    EXPECT_EQ(scalars_for_chunk(64), 3u);
    EXPECT_EQ(scalars_for_chunk(31 * 512), 504u);
}

TEST(CHUNK_CODEC, test_split_block)
{
    size_t chunk_size = 0;
    EXPECT_EQ(split_block(64, 8, chunk_size), Status::Ok);
    EXPECT_EQ(chunk_size, 8u);
    EXPECT_EQ(split_block(65, 8, chunk_size), Status::SizeMismatch);
    EXPECT_EQ(split_block(0, 8, chunk_size), Status::SizeMismatch);
    EXPECT_EQ(split_block(64, 0, chunk_size), Status::SizeMismatch);
    EXPECT_EQ(split_block(7, 8, chunk_size), Status::SizeMismatch);
}

TEST(CHUNK_CODEC, test_word_layout)
{
    Bytes ones(63, 0xFF);
    Chunk c;
    ASSERT_EQ(pack_chunk(ones, 4, c), Status::Ok);
    ASSERT_EQ(c.size(), 4u);

    // two full 252-bit words, then zero padding
    Scalar full = scalar_from_hex("ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff0f");
    EXPECT_TRUE(sc_eq(c[0], full));
    EXPECT_TRUE(sc_eq(c[1], full));
    EXPECT_TRUE(sc_is_zero(c[2]));
    EXPECT_TRUE(sc_is_zero(c[3]));

    // byte 31 straddles the first word boundary
    Bytes b(32, 0);
    b[31] = 0xA5;
    ASSERT_EQ(pack_chunk(b, 2, c), Status::Ok);
    EXPECT_TRUE(sc_eq(c[0], scalar_from_hex("0000000000000000000000000000000000000000000000000000000000000005")));
    EXPECT_TRUE(sc_eq(c[1], sc_from_u64(0x0A)));
}

TEST(CHUNK_CODEC, test_pack_needs_room)
{
    Chunk c;
    EXPECT_EQ(pack_chunk(Bytes(64, 1), 2, c), Status::SizeMismatch);
    EXPECT_EQ(pack_chunk(Bytes(63, 1), 2, c), Status::Ok);
}

TEST(CHUNK_CODEC, test_round_trip_unaligned_lengths)
{
    SeedableRng rng = test_rng("codec.lengths");
    ASSERT_TRUE(rng.ready());

    for (size_t len : {1u, 2u, 31u, 32u, 33u, 62u, 63u, 64u, 100u, 127u, 1000u, 31u * 512u}) {
        Bytes data = random_block(rng, len);
        size_t m = scalars_for_chunk(len) + 1;
        Chunk c;
        ASSERT_EQ(pack_chunk(data, m, c), Status::Ok) << len;
        ASSERT_EQ(c.size(), m);
        for (const auto& s : c) EXPECT_TRUE(sc_is_canonical(s));

        Bytes out = {0xEE};
        ASSERT_EQ(unpack_chunk(c, len, out), Status::Ok) << len;
        ASSERT_EQ(out.size(), len + 1);
        EXPECT_EQ(out[0], 0xEE);
        EXPECT_TRUE(std::equal(data.begin(), data.end(), out.begin() + 1)) << len;
    }
}

TEST(CHUNK_CODEC, test_unpack_rejects_stray_bits)
{
    Bytes out;

    // bit 8 set but only one byte expected
    Chunk c = {sc_from_u64(0x1FF)};
    EXPECT_EQ(unpack_chunk(c, 1, out), Status::InvalidMessage);
    EXPECT_TRUE(out.empty());

    // non-zero padding word
    c = {sc_from_u64(0x7F), sc_one()};
    EXPECT_EQ(unpack_chunk(c, 1, out), Status::InvalidMessage);

    // 2^252 + 1 is a valid scalar but not a packed word
    c = {Scalar{{1, 0, 0, 0x1000000000000000ULL}}};
    out = {1, 2, 3};
    EXPECT_EQ(unpack_chunk(c, 31, out), Status::InvalidMessage);
    EXPECT_EQ(out, (Bytes{1, 2, 3}));

    c = {sc_from_u64(0x7F)};
    EXPECT_EQ(unpack_chunk(c, 1, out), Status::Ok);
    EXPECT_EQ(out, (Bytes{1, 2, 3, 0x7F}));
}
