#include "gtest/gtest.h"

#include "vrlnc-test.h"

using namespace vrlnc;
using namespace vrlnc_test;

static std::vector<Scalar> v(std::initializer_list<uint64_t> xs) {
    std::vector<Scalar> out;
    for (uint64_t x : xs) out.push_back(sc_from_u64(x));
    return out;
}

TEST(ECHELON, test_solves_small_system)
{
    Echelon e;
    e.init(2);
    EXPECT_EQ(e.rank(), 0u);
    EXPECT_FALSE(e.is_full());
    EXPECT_EQ(e.payload_for(0), nullptr);

    // x + y = 3, x + 2y = 5
    ASSERT_EQ(e.insert(v({1, 1}), v({3})), Status::Ok);
    EXPECT_EQ(e.insert(v({2, 2}), v({6})), Status::LinearlyDependentChunk);
    EXPECT_EQ(e.rank(), 1u);
    ASSERT_EQ(e.insert(v({1, 2}), v({5})), Status::Ok);
    ASSERT_TRUE(e.is_full());

    ASSERT_NE(e.payload_for(0), nullptr);
    ASSERT_NE(e.payload_for(1), nullptr);
    EXPECT_TRUE(sc_eq((*e.payload_for(0))[0], sc_from_u64(1)));
    EXPECT_TRUE(sc_eq((*e.payload_for(1))[0], sc_from_u64(2)));

    // reduced form: identity matrix
    for (const auto& row : e.rows())
        for (size_t k = 0; k < 2; k++)
            EXPECT_TRUE(sc_eq(row.coeffs[k], k == row.pivot ? sc_one() : sc_zero()));
}

TEST(ECHELON, test_dependent_rows_leave_state_alone)
{
    Echelon e;
    e.init(3);
    ASSERT_EQ(e.insert(v({0, 2, 4}), v({6, 8})), Status::Ok);
    EXPECT_EQ(e.rows()[0].pivot, 1u);

    EXPECT_EQ(e.insert(v({0, 1, 2}), v({3, 4})), Status::LinearlyDependentChunk);
    EXPECT_EQ(e.insert(v({0, 0, 0}), v({0, 0})), Status::LinearlyDependentChunk);
    EXPECT_EQ(e.rank(), 1u);

    EXPECT_EQ(e.insert(v({1, 1}), v({0, 0})), Status::SizeMismatch);
    EXPECT_EQ(e.rank(), 1u);

    // the stored row is untouched by the rejected ones
    const EchelonRow& row = e.rows()[0];
    EXPECT_TRUE(sc_eq(row.coeffs[2], sc_from_u64(2)));
    EXPECT_TRUE(sc_eq(row.payload[0], sc_from_u64(3)));
    EXPECT_TRUE(sc_eq(row.payload[1], sc_from_u64(4)));
}

TEST(ECHELON, test_random_full_rank)
{
    const size_t n = 6, m = 5;
    SeedableRng rng = test_rng("echelon.random");
    ASSERT_TRUE(rng.ready());

    std::vector<Chunk> original(n);
    for (auto& c : original) c = sc_random_vec(m, rng);

    Echelon e;
    e.init(n);
    while (!e.is_full()) {
        std::vector<Scalar> coeffs = sc_random_vec(n, rng);
        Chunk payload(m, sc_zero());
        for (size_t k = 0; k < n; k++)
            for (size_t j = 0; j < m; j++)
                payload[j] = sc_muladd(payload[j], coeffs[k], original[k][j]);
        ASSERT_EQ(e.insert(coeffs, payload), Status::Ok);
    }

    for (size_t k = 0; k < n; k++) {
        const Chunk* got = e.payload_for(k);
        ASSERT_NE(got, nullptr);
        for (size_t j = 0; j < m; j++) EXPECT_TRUE(sc_eq((*got)[j], original[k][j]));
    }
}
