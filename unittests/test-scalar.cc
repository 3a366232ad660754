#include <algorithm>
#include <utility>

#include "gtest/gtest.h"

#include "vrlnc-test.h"

using namespace vrlnc;
using namespace vrlnc_test;

static Scalar l_minus(uint64_t k) {
    Scalar s{{SC_L[0] - k, SC_L[1], SC_L[2], SC_L[3]}};
    return s;
}

TEST(SCALAR, test_canonical_bound)
{
    Scalar l{{SC_L[0], SC_L[1], SC_L[2], SC_L[3]}};
    EXPECT_FALSE(sc_is_canonical(l));
    EXPECT_TRUE(sc_is_canonical(l_minus(1)));
    EXPECT_TRUE(sc_is_canonical(sc_zero()));

    Scalar all_ones{{~0ULL, ~0ULL, ~0ULL, ~0ULL}};
    EXPECT_FALSE(sc_is_canonical(all_ones));
}

TEST(SCALAR, test_add_wraps_at_l)
{
    EXPECT_TRUE(sc_is_zero(sc_add(l_minus(1), sc_one())));
    EXPECT_TRUE(sc_eq(sc_add(l_minus(1), sc_from_u64(5)), sc_from_u64(4)));
    EXPECT_TRUE(sc_eq(sc_neg(sc_one()), l_minus(1)));
    EXPECT_TRUE(sc_is_zero(sc_neg(sc_zero())));
    EXPECT_TRUE(sc_eq(sc_sub(sc_from_u64(3), sc_from_u64(5)), l_minus(2)));
    EXPECT_TRUE(sc_eq(sc_mul(l_minus(1), l_minus(1)), sc_one()));
}

TEST(SCALAR, test_reduce512)
{
    uint64_t max[8];
    for (auto& w : max) w = ~0ULL;
    EXPECT_TRUE(sc_eq(sc_reduce512(max),
        scalar_from_hex("000f9c44e31106a447938568a71b0ed065bef517d273ecce3d9a307c1b419903")));

    uint64_t two_256[8] = {0, 0, 0, 0, 1, 0, 0, 0};
    EXPECT_TRUE(sc_eq(sc_reduce512(two_256),
        scalar_from_hex("1d95988d7431ecd670cf7d73f45befc6feffffffffffffffffffffffffffff0f")));

    // l * 2^64
    uint64_t l_shifted[8] = {0, SC_L[0], SC_L[1], SC_L[2], SC_L[3], 0, 0, 0};
    EXPECT_TRUE(sc_is_zero(sc_reduce512(l_shifted)));

    Scalar two_252{{0, 0, 0, 0x1000000000000000ULL}};
    EXPECT_TRUE(sc_eq(sc_mul(two_252, two_252),
        scalar_from_hex("698912ab85f6ede21da3982276920368bef517d273ecce3d9a307c1b4199b301")));
}

TEST(SCALAR, test_inverse)
{
    EXPECT_TRUE(sc_eq(sc_inv(sc_from_u64(2)),
        scalar_from_hex("f7e97a2e8d31092c6bce7b51ef7c6f0a00000000000000000000000000000008")));
    EXPECT_TRUE(sc_is_zero(sc_inv(sc_zero())));

    SeedableRng rng = test_rng("scalar.inverse");
    ASSERT_TRUE(rng.ready());
    for (int i = 0; i < 16; i++) {
        Scalar a = sc_random(rng);
        if (sc_is_zero(a)) continue;
        EXPECT_TRUE(sc_eq(sc_mul(a, sc_inv(a)), sc_one()));
    }
}

TEST(SCALAR, test_field_identities)
{
    SeedableRng rng = test_rng("scalar.identities");
    ASSERT_TRUE(rng.ready());
    for (int i = 0; i < 32; i++) {
        Scalar a = sc_random(rng), b = sc_random(rng), c = sc_random(rng);
        EXPECT_TRUE(sc_is_canonical(a));
        EXPECT_TRUE(sc_eq(sc_mul(sc_add(a, b), c), sc_add(sc_mul(a, c), sc_mul(b, c))));
        EXPECT_TRUE(sc_eq(sc_mul(a, sc_mul(b, c)), sc_mul(sc_mul(a, b), c)));
        EXPECT_TRUE(sc_eq(sc_muladd(a, b, c), sc_add(a, sc_mul(b, c))));
        EXPECT_TRUE(sc_is_zero(sc_add(a, sc_neg(a))));
    }
}

TEST(SCALAR, test_random_sources)
{
    std::vector<Scalar> v;
    ASSERT_TRUE(sc_random_vec(v, 8));
    ASSERT_EQ(v.size(), 8u);
    for (const auto& s : v) EXPECT_TRUE(sc_is_canonical(s));
    EXPECT_FALSE(sc_eq(v[0], v[1]));

    SeedableRng r1 = test_rng("scalar.rng", 7);
    SeedableRng r2 = test_rng("scalar.rng", 7);
    SeedableRng r3 = test_rng("scalar.rng", 8);
    std::vector<Scalar> a = sc_random_vec(4, r1);
    std::vector<Scalar> b = sc_random_vec(4, r2);
    std::vector<Scalar> c = sc_random_vec(4, r3);
    for (size_t i = 0; i < 4; i++) EXPECT_TRUE(sc_eq(a[i], b[i]));
    EXPECT_FALSE(sc_eq(a[0], c[0]));
}

TEST(SEEDABLE_RNG, test_default_and_moved_streams)
{
    SeedableRng empty;
    EXPECT_FALSE(empty.ready());
    SeedableRng moved_empty(std::move(empty));
    EXPECT_FALSE(moved_empty.ready());

    SeedableRng a = test_rng("rng.move");
    SeedableRng b = test_rng("rng.move");
    ASSERT_TRUE(a.ready());
    ASSERT_TRUE(b.ready());

    // moving mid-block keeps the position in the keystream
    uint8_t head_a[10], head_b[10];
    a.fill(head_a, sizeof(head_a));
    b.fill(head_b, sizeof(head_b));
    EXPECT_TRUE(std::equal(head_a, head_a + 10, head_b));

    SeedableRng c(std::move(a));
    EXPECT_TRUE(c.ready());
    EXPECT_FALSE(a.ready());
    EXPECT_EQ(c.u64(), b.u64());

    SeedableRng d;
    d = std::move(c);
    EXPECT_TRUE(d.ready());
    EXPECT_EQ(d.u64(), b.u64());
}
