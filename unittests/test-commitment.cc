#include "gtest/gtest.h"

#include "vrlnc-test.h"

using namespace vrlnc;
using namespace vrlnc_test;

class COMMITMENT : public ::testing::Test {
protected:
    GeneratorBasis basis;
    void SetUp() override {
        ASSERT_TRUE(derive_basis(basis, 24));
    }
};

TEST_F(COMMITMENT, test_zero_chunk_commits_to_identity)
{
    Commitment c;
    ASSERT_EQ(commit(basis, Chunk(24, sc_zero()), c), Status::Ok);
    EXPECT_EQ(c, rist_identity());
    ASSERT_EQ(commit(basis, Chunk(), c), Status::Ok);
    EXPECT_EQ(c, rist_identity());
}

TEST_F(COMMITMENT, test_unit_vector_commits_to_generator)
{
    Chunk e(24, sc_zero());
    e[5] = sc_one();
    Commitment c;
    ASSERT_EQ(commit(basis, e, c), Status::Ok);
    EXPECT_EQ(c, basis.encoded[5]);
}

TEST_F(COMMITMENT, test_chunk_longer_than_basis)
{
    Commitment c;
    EXPECT_EQ(commit(basis, Chunk(25, sc_one()), c), Status::SizeMismatch);
}

TEST_F(COMMITMENT, test_homomorphism)
{
    SeedableRng rng = test_rng("commitment.homomorphism");
    ASSERT_TRUE(rng.ready());

    for (int round = 0; round < 4; round++) {
        Chunk u = sc_random_vec(24, rng), v = sc_random_vec(24, rng);
        Scalar a = sc_random(rng), b = sc_random(rng);

        Chunk mix(24);
        for (size_t j = 0; j < mix.size(); j++)
            mix[j] = sc_add(sc_mul(a, u[j]), sc_mul(b, v[j]));

        Commitment cu, cv, cmix;
        ASSERT_EQ(commit(basis, u, cu), Status::Ok);
        ASSERT_EQ(commit(basis, v, cv), Status::Ok);
        ASSERT_EQ(commit(basis, mix, cmix), Status::Ok);

        RistrettoPoint au, bv, sum;
        ASSERT_TRUE(rist_scalarmul(au, cu, a));
        ASSERT_TRUE(rist_scalarmul(bv, cv, b));
        ASSERT_TRUE(rist_add(sum, au, bv));
        EXPECT_EQ(sum, cmix);

        EXPECT_TRUE(verify_linear_combination({a, b}, std::vector<Commitment>{cu, cv}, cmix));
        EXPECT_FALSE(verify_linear_combination({a, sc_add(b, sc_one())}, std::vector<Commitment>{cu, cv}, cmix));
    }
}

TEST_F(COMMITMENT, test_verify_rejects_malformed_reference)
{
    Chunk u(24, sc_one());
    Commitment cu;
    ASSERT_EQ(commit(basis, u, cu), Status::Ok);

    EXPECT_TRUE(verify_linear_combination({sc_one()}, std::vector<Commitment>{cu}, cu));
    // length mismatch
    EXPECT_FALSE(verify_linear_combination({sc_one(), sc_one()}, std::vector<Commitment>{cu}, cu));
    EXPECT_FALSE(verify_linear_combination({}, std::vector<Commitment>{cu}, cu));
    // undecodable reference point
    EXPECT_FALSE(verify_linear_combination({sc_one()},
        std::vector<Commitment>{point_from_hex("0100000000000000000000000000000000000000000000000000000000000000")}, cu));
}
