#include "gtest/gtest.h"

#include "vrlnc-test.h"

using namespace vrlnc;
using namespace vrlnc_test;

// multiples of the ristretto255 base point
static const char* BASE_MULTIPLES[] = {
    "0000000000000000000000000000000000000000000000000000000000000000",
    "e2f2ae0a6abc4e71a884a961c500515f58e30b6aa582dd8db6a65945e08d2d76",
    "6a493210f7499cd17fecb510ae0cea23a110e8d5b901f8acadd3095c73a3b919",
    "94741f5d5d52755ece4f23f044ee27d5d1ea1e2bd196b462166b16152a9d0259",
};

TEST(RISTRETTO, test_identity_encoding)
{
    EXPECT_EQ(rist_identity(), point_from_hex(BASE_MULTIPLES[0]));
    EXPECT_EQ(rist_encode(ext_identity()), rist_identity());
    EXPECT_TRUE(rist_is_valid(rist_identity()));
}

TEST(RISTRETTO, test_base_point_multiples)
{
    ExtPoint B;
    ASSERT_TRUE(rist_decode(B, point_from_hex(BASE_MULTIPLES[1])));

    EXPECT_EQ(rist_encode(ext_double(B)), point_from_hex(BASE_MULTIPLES[2]));
    EXPECT_EQ(rist_encode(ext_add(B, B)), point_from_hex(BASE_MULTIPLES[2]));
    EXPECT_EQ(rist_encode(ext_add(ext_double(B), B)), point_from_hex(BASE_MULTIPLES[3]));
    EXPECT_EQ(rist_encode(ext_scalarmul(B, sc_from_u64(3))), point_from_hex(BASE_MULTIPLES[3]));
    EXPECT_EQ(rist_encode(ext_sub(ext_double(B), B)), point_from_hex(BASE_MULTIPLES[1]));

    RistrettoPoint sum;
    ASSERT_TRUE(rist_add(sum, point_from_hex(BASE_MULTIPLES[1]), point_from_hex(BASE_MULTIPLES[2])));
    EXPECT_EQ(sum, point_from_hex(BASE_MULTIPLES[3]));

    // -1 * B + B
    RistrettoPoint neg;
    ASSERT_TRUE(rist_scalarmul(neg, point_from_hex(BASE_MULTIPLES[1]), sc_neg(sc_one())));
    ASSERT_TRUE(rist_add(sum, neg, point_from_hex(BASE_MULTIPLES[1])));
    EXPECT_EQ(sum, rist_identity());
}

TEST(RISTRETTO, test_rejects_bad_encodings)
{
    const char* bad[] = {
        // non-canonical field element
        "ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff7f",
        "edffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff7f",
        // negative field element
        "0100000000000000000000000000000000000000000000000000000000000000",
        "01ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff7f",
        // top bit set
        "0000000000000000000000000000000000000000000000000000000000000080",
    };
    for (const char* hex : bad) {
        ExtPoint P;
        EXPECT_FALSE(rist_decode(P, point_from_hex(hex))) << hex;
        EXPECT_FALSE(rist_is_valid(point_from_hex(hex))) << hex;
    }

    RistrettoPoint out;
    EXPECT_FALSE(rist_add(out, point_from_hex(bad[0]), rist_identity()));
    EXPECT_FALSE(rist_scalarmul(out, point_from_hex(bad[2]), sc_one()));
}

TEST(RISTRETTO, test_from_uniform_bytes)
{
    // SHA-512("Ristretto is traditionally a short shot of espresso coffee")
    std::vector<uint8_t> wide = from_hex(
        "5d1be09e3d0c82fc538112490e35701979d99e06ca3e2b5b54bffe8b4dc772c1"
        "4d98b696a1bbfb5ca32c436cc61c16563790306c79eaca7705668b47dffe5bb6");
    ASSERT_EQ(wide.size(), 64u);
    EXPECT_EQ(rist_encode(rist_from_uniform_bytes(wide.data())),
              point_from_hex("3066f82a1a747d45120d1740f14358531a8f04bbffe6a819f86dfe50f44a0a46"));
}

TEST(RISTRETTO, test_generator_basis)
{
    GeneratorBasis basis;
    ASSERT_TRUE(derive_basis(basis, 3));
    ASSERT_EQ(basis.size(), 3u);
    ASSERT_EQ(basis.points.size(), 3u);
    EXPECT_EQ(basis.encoded[0], point_from_hex("5c614763734989930509d0c08ad489bfc8ba91baa05de4a84be10c594c9cab46"));
    EXPECT_EQ(basis.encoded[1], point_from_hex("0ccbc18b3155f1e7e7b858f3dcf82a745fbad3575b3dbf575c1b7f3f4e09016f"));
    EXPECT_EQ(basis.encoded[2], point_from_hex("4c3358359eb32cc8437e6423de7195ee1d3a6ef26a68ef2b199a81c9f081fd48"));

    // a longer basis extends the shorter one
    GeneratorBasis longer;
    ASSERT_TRUE(derive_basis(longer, 16));
    for (size_t i = 0; i < basis.size(); i++) EXPECT_EQ(longer.encoded[i], basis.encoded[i]);
    for (size_t i = 0; i < longer.size(); i++)
        for (size_t j = i + 1; j < longer.size(); j++)
            EXPECT_NE(longer.encoded[i], longer.encoded[j]);

    GeneratorBasis other_domain;
    ASSERT_TRUE(derive_basis(other_domain, 1, "vrlnc.dom.other"));
    EXPECT_NE(other_domain.encoded[0], basis.encoded[0]);

    GeneratorBasis adopted;
    ASSERT_TRUE(basis_from_encoded(adopted, longer.encoded));
    EXPECT_EQ(adopted.encoded, longer.encoded);
    EXPECT_FALSE(basis_from_encoded(adopted, {point_from_hex("0100000000000000000000000000000000000000000000000000000000000000")}));
}

TEST(RISTRETTO, test_multi_scalar_mul)
{
    GeneratorBasis basis;
    ASSERT_TRUE(derive_basis(basis, 40));
    SeedableRng rng = test_rng("ristretto.msm");
    ASSERT_TRUE(rng.ready());

    for (size_t n : {0u, 1u, 2u, 3u, 17u, 40u}) {
        std::vector<Scalar> s = sc_random_vec(n, rng);
        ExtPoint naive = ext_identity();
        for (size_t i = 0; i < n; i++)
            naive = ext_add(naive, ext_scalarmul(basis.points[i], s[i]));
        EXPECT_EQ(rist_encode(multi_scalar_mul(s.data(), basis.points.data(), n)), rist_encode(naive)) << n;
    }
}
