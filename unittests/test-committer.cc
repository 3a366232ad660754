#include "gtest/gtest.h"

#include "vrlnc-test.h"

using namespace vrlnc;
using namespace vrlnc_test;

TEST(COMMITTER, test_init_bounds)
{
    Committer c;
    EXPECT_FALSE(c.ready());
    EXPECT_EQ(c.init(0), Status::SizeMismatch);
    EXPECT_EQ(c.init(DEFAULT_PARAMS.max_chunk_scalars + 1), Status::SizeMismatch);
    EXPECT_FALSE(c.ready());

    ASSERT_EQ(c.init(5), Status::Ok);
    EXPECT_TRUE(c.ready());
    EXPECT_EQ(c.len(), 5u);
    EXPECT_EQ(c.generators().size(), 5u);
}

TEST(COMMITTER, test_init_for_message)
{
    Committer c;
    ASSERT_EQ(c.init_for_message(31 * 512 * 8, 8), Status::Ok);
    EXPECT_EQ(c.len(), 504u);
    EXPECT_EQ(c.init_for_message(1001, 8), Status::SizeMismatch);
    EXPECT_EQ(c.init_for_message(0, 8), Status::SizeMismatch);
    EXPECT_EQ(c.len(), 504u);
}

TEST(COMMITTER, test_independent_instances_agree)
{
    Committer a, b;
    ASSERT_EQ(a.init(12), Status::Ok);
    ASSERT_EQ(b.init(12), Status::Ok);
    EXPECT_EQ(a.generators(), b.generators());

    SeedableRng rng = test_rng("committer.agree");
    Chunk chunk = sc_random_vec(12, rng);
    Commitment ca, cb;
    ASSERT_EQ(a.commit(chunk, ca), Status::Ok);
    ASSERT_EQ(b.commit(chunk, cb), Status::Ok);
    EXPECT_EQ(ca, cb);
}

TEST(COMMITTER, test_serialize_round_trip)
{
    Committer orig;
    ASSERT_EQ(orig.init(9), Status::Ok);
    SeedableRng rng = test_rng("committer.serialize");
    Chunk chunk = sc_random_vec(9, rng);
    Commitment expected;
    ASSERT_EQ(orig.commit(chunk, expected), Status::Ok);

    for (bool with_basis : {false, true}) {
        Bytes wire = orig.serialize(with_basis);
        EXPECT_EQ(wire.size(), 10u + (with_basis ? 9u * 32u : 0u));

        Committer copy;
        ASSERT_EQ(copy.deserialize(wire), Status::Ok);
        EXPECT_EQ(copy.len(), 9u);
        EXPECT_EQ(copy.generators(), orig.generators());

        Commitment got;
        ASSERT_EQ(copy.commit(chunk, got), Status::Ok);
        EXPECT_EQ(got, expected);
        EXPECT_EQ(copy.serialize(with_basis), wire);
    }
}

TEST(COMMITTER, test_deserialize_rejects_garbage)
{
    Committer orig;
    ASSERT_EQ(orig.init(3), Status::Ok);
    Bytes compact = orig.serialize();
    Bytes full = orig.serialize(true);

    Committer c;
    EXPECT_EQ(c.deserialize(Bytes{}), Status::InvalidMessage);
    EXPECT_EQ(c.deserialize(Bytes(compact.begin(), compact.end() - 1)), Status::InvalidMessage);

    Bytes bad = compact;
    bad[0] = 2;
    EXPECT_EQ(c.deserialize(bad), Status::InvalidMessage);

    bad = compact;
    bad[1] = 0x02;
    EXPECT_EQ(c.deserialize(bad), Status::InvalidMessage);

    // m = 0
    bad = compact;
    for (size_t i = 2; i < 10; i++) bad[i] = 0;
    EXPECT_EQ(c.deserialize(bad), Status::InvalidMessage);

    bad = compact;
    bad.push_back(0);
    EXPECT_EQ(c.deserialize(bad), Status::InvalidMessage);

    EXPECT_EQ(c.deserialize(Bytes(full.begin(), full.end() - 32)), Status::InvalidMessage);

    // carried generator that is not a point
    bad = full;
    bad[10] = 0x01;
    for (size_t i = 11; i < 42; i++) bad[i] = 0;
    EXPECT_EQ(c.deserialize(bad), Status::InvalidMessage);

    EXPECT_FALSE(c.ready());
}
