#include <algorithm>
#include <vector>

#include "gtest/gtest.h"

#include "vrlnc-test.h"

using namespace vrlnc;
using namespace vrlnc_test;

class NODES : public ::testing::Test {
protected:
    static constexpr size_t NUM_CHUNKS = 4;
    static constexpr size_t CHUNK_SIZE = 100;

    Committer committer;
    Bytes block;
    SourceNode source;
    DestinationNode dest;
    SeedableRng rng;

    void SetUp() override {
        rng = test_rng("nodes.fixture");
        ASSERT_TRUE(rng.ready());
        ASSERT_EQ(committer.init(scalars_for_chunk(CHUNK_SIZE)), Status::Ok);
        block = random_block(rng, NUM_CHUNKS * CHUNK_SIZE);
        ASSERT_EQ(source.init(committer, block, NUM_CHUNKS), Status::Ok);
        ASSERT_EQ(dest.init(committer, NUM_CHUNKS, CHUNK_SIZE), Status::Ok);
    }

    Bytes send() {
        Packet p;
        EXPECT_EQ(source.chunk_to_send(rng, p), Status::Ok);
        return serialize_packet(p);
    }
};

TEST_F(NODES, test_round_trip)
{
    EXPECT_EQ(source.num_chunks(), NUM_CHUNKS);
    EXPECT_EQ(source.chunk_size(), CHUNK_SIZE);
    EXPECT_EQ(source.commitments().size(), NUM_CHUNKS);

    Bytes out;
    EXPECT_EQ(dest.decode(out), Status::NotReady);

    for (size_t i = 0; i < NUM_CHUNKS; i++) {
        EXPECT_FALSE(dest.is_full());
        ASSERT_EQ(dest.receive_chunk(send()), Status::Ok);
        EXPECT_EQ(dest.rank(), i + 1);
    }
    ASSERT_TRUE(dest.is_full());
    EXPECT_EQ(dest.commitments(), source.commitments());

    ASSERT_EQ(dest.decode(out), Status::Ok);
    EXPECT_EQ(out, block);

    // anything after full rank is dependent
    EXPECT_EQ(dest.receive_chunk(send()), Status::LinearlyDependentChunk);
    EXPECT_EQ(dest.rank(), NUM_CHUNKS);
}

TEST_F(NODES, test_csprng_send)
{
    while (!dest.is_full()) {
        Bytes wire;
        ASSERT_EQ(source.chunk_to_send(wire), Status::Ok);
        ASSERT_EQ(dest.receive_chunk(wire), Status::Ok);
    }
    Bytes out;
    ASSERT_EQ(dest.decode(out), Status::Ok);
    EXPECT_EQ(out, block);
}

TEST_F(NODES, test_replay_is_dependent)
{
    Bytes wire = send();
    ASSERT_EQ(dest.receive_chunk(wire), Status::Ok);
    EXPECT_EQ(dest.receive_chunk(wire), Status::LinearlyDependentChunk);
    EXPECT_EQ(dest.receive_chunk(wire), Status::LinearlyDependentChunk);
    EXPECT_EQ(dest.rank(), 1u);

    Packet zero;
    ASSERT_EQ(source.chunk_with_coefficients(std::vector<Scalar>(NUM_CHUNKS, sc_zero()), zero), Status::Ok);
    EXPECT_EQ(dest.receive(zero), Status::LinearlyDependentChunk);
    EXPECT_EQ(dest.rank(), 1u);
}

TEST_F(NODES, test_forged_replay_is_not_dependent)
{
    Packet p;
    ASSERT_EQ(source.chunk_to_send(rng, p), Status::Ok);
    ASSERT_EQ(dest.receive(p), Status::Ok);

    // same coding vector, altered payload
    Packet forged = p;
    forged.payload[0] = sc_add(forged.payload[0], sc_one());
    EXPECT_EQ(dest.receive(forged), Status::VerificationFailed);
    EXPECT_EQ(dest.rank(), 1u);

    // scaled coding vector, unscaled payload
    forged = p;
    for (auto& c : forged.coding_vector) c = sc_add(c, c);
    EXPECT_EQ(dest.receive(forged), Status::VerificationFailed);
    EXPECT_EQ(dest.rank(), 1u);
}

TEST_F(NODES, test_forgeries_detected_after_full_rank)
{
    while (!dest.is_full()) ASSERT_EQ(dest.receive_chunk(send()), Status::Ok);

    Packet p;
    ASSERT_EQ(source.chunk_to_send(rng, p), Status::Ok);
    Packet forged = p;
    forged.payload[1] = sc_add(forged.payload[1], sc_one());
    EXPECT_EQ(dest.receive(forged), Status::VerificationFailed);
    EXPECT_EQ(dest.receive(p), Status::LinearlyDependentChunk);

    Bytes out;
    ASSERT_EQ(dest.decode(out), Status::Ok);
    EXPECT_EQ(out, block);
}

TEST_F(NODES, test_first_packet_with_undecodable_commitment)
{
    Packet p;
    ASSERT_EQ(source.chunk_to_send(rng, p), Status::Ok);

    Packet bad = p;
    bad.commitments[3] = point_from_hex("0100000000000000000000000000000000000000000000000000000000000000");
    EXPECT_EQ(dest.receive_chunk(serialize_packet(bad)), Status::InvalidMessage);
    EXPECT_EQ(dest.rank(), 0u);
    EXPECT_TRUE(dest.commitments().empty());

    ASSERT_EQ(dest.receive(p), Status::Ok);
    EXPECT_EQ(dest.receive(bad), Status::CommitmentsMismatch);
}

TEST_F(NODES, test_unit_coefficients_carry_original_chunk)
{
    std::vector<Scalar> e(NUM_CHUNKS, sc_zero());
    e[2] = sc_one();
    Packet p;
    ASSERT_EQ(source.chunk_with_coefficients(e, p), Status::Ok);
    ASSERT_EQ(p.payload.size(), committer.len());
    for (size_t j = 0; j < p.payload.size(); j++)
        EXPECT_TRUE(sc_eq(p.payload[j], source.chunks()[2][j]));

    EXPECT_EQ(source.chunk_with_coefficients(std::vector<Scalar>(NUM_CHUNKS + 1, sc_one()), p),
              Status::SizeMismatch);
}

TEST_F(NODES, test_commitments_hash_stable_per_source)
{
    Digest first, second;
    Bytes a = send(), b = send();
    ASSERT_NE(a, b);
    ASSERT_EQ(packet_commitments_hash(a.data(), a.size(), first), Status::Ok);
    ASSERT_EQ(packet_commitments_hash(b.data(), b.size(), second), Status::Ok);
    EXPECT_EQ(first, second);

    Digest direct;
    ASSERT_TRUE(commitments_hash(source.commitments(), direct));
    EXPECT_EQ(first, direct);
}

TEST_F(NODES, test_cross_session_rejected)
{
    SourceNode other;
    ASSERT_EQ(other.init(committer, random_block(rng, NUM_CHUNKS * CHUNK_SIZE), NUM_CHUNKS), Status::Ok);

    ASSERT_EQ(dest.receive_chunk(send()), Status::Ok);

    Packet p;
    ASSERT_EQ(other.chunk_to_send(rng, p), Status::Ok);
    EXPECT_EQ(dest.receive(p), Status::CommitmentsMismatch);
    EXPECT_EQ(dest.rank(), 1u);
    EXPECT_EQ(dest.commitments(), source.commitments());
}

TEST_F(NODES, test_tampered_packets)
{
    Packet p;
    ASSERT_EQ(source.chunk_to_send(rng, p), Status::Ok);

    Packet bad = p;
    bad.payload[0] = sc_add(bad.payload[0], sc_one());
    EXPECT_EQ(dest.receive(bad), Status::VerificationFailed);

    bad = p;
    bad.coding_vector[1] = sc_add(bad.coding_vector[1], sc_one());
    EXPECT_EQ(dest.receive(bad), Status::VerificationFailed);

    // reordered commitments
    bad = p;
    std::swap(bad.commitments[0], bad.commitments[1]);
    EXPECT_EQ(dest.receive(bad), Status::VerificationFailed);

    EXPECT_EQ(dest.rank(), 0u);
    EXPECT_TRUE(dest.commitments().empty());

    ASSERT_EQ(dest.receive(p), Status::Ok);
    EXPECT_EQ(dest.rank(), 1u);
}

TEST_F(NODES, test_shape_errors)
{
    Packet p;
    ASSERT_EQ(source.chunk_to_send(rng, p), Status::Ok);

    Packet bad = p;
    bad.coding_vector.pop_back();
    EXPECT_EQ(dest.receive(bad), Status::InvalidMessage);

    bad = p;
    bad.payload.push_back(sc_zero());
    EXPECT_EQ(dest.receive(bad), Status::InvalidMessage);

    bad = p;
    bad.commitments.pop_back();
    EXPECT_EQ(dest.receive(bad), Status::ChunkCountMismatch);

    Bytes wire = serialize_packet(p);
    EXPECT_EQ(dest.receive_chunk(wire.data(), wire.size() - 5), Status::InvalidMessage);
    EXPECT_EQ(dest.receive_chunk(Bytes{}), Status::InvalidMessage);
    EXPECT_EQ(dest.rank(), 0u);

    // after the reference set is adopted a short set no longer matches it
    ASSERT_EQ(dest.receive(p), Status::Ok);
    EXPECT_EQ(dest.receive(bad), Status::CommitmentsMismatch);
}

TEST_F(NODES, test_geometry_fuzz)
{
    SourceNode s;
    for (size_t len : {1u, 3u, 99u, 101u, 399u, 401u, 402u}) {
        Bytes data = random_block(rng, len);
        EXPECT_EQ(s.init(committer, data, NUM_CHUNKS), Status::SizeMismatch) << len;
        EXPECT_FALSE(s.ready());
    }
    EXPECT_EQ(s.init(committer, Bytes{}, NUM_CHUNKS), Status::SizeMismatch);
    EXPECT_EQ(s.init(committer, block, 0), Status::SizeMismatch);

    // chunks wider than the committer
    EXPECT_EQ(s.init(committer, random_block(rng, NUM_CHUNKS * 200), NUM_CHUNKS), Status::SizeMismatch);

    Packet p;
    EXPECT_EQ(s.chunk_to_send(p), Status::NotReady);

    DestinationNode d;
    EXPECT_EQ(d.receive(p), Status::NotReady);
    EXPECT_EQ(d.init(committer, 0, CHUNK_SIZE), Status::SizeMismatch);
    EXPECT_EQ(d.init(committer, NUM_CHUNKS, 0), Status::SizeMismatch);
    EXPECT_EQ(d.init(committer, NUM_CHUNKS, 200), Status::SizeMismatch);
    EXPECT_EQ(d.init(Committer(), NUM_CHUNKS, CHUNK_SIZE), Status::NotReady);
}

TEST_F(NODES, test_relay_recoding)
{
    DestinationNode relay, sink;
    ASSERT_EQ(relay.init(committer, NUM_CHUNKS, CHUNK_SIZE), Status::Ok);
    ASSERT_EQ(sink.init(committer, NUM_CHUNKS, CHUNK_SIZE), Status::Ok);

    Packet p;
    EXPECT_EQ(relay.chunk_to_send(rng, p), Status::NothingToSend);
    EXPECT_EQ(relay.chunk_to_send(p), Status::NothingToSend);

    // a partial relay can only pass on what it holds
    ASSERT_EQ(relay.receive_chunk(send()), Status::Ok);
    ASSERT_EQ(relay.receive_chunk(send()), Status::Ok);
    for (int i = 0; i < 4; i++) {
        ASSERT_EQ(relay.chunk_to_send(rng, p), Status::Ok);
        Status st = sink.receive(p);
        EXPECT_TRUE(st == Status::Ok || st == Status::LinearlyDependentChunk);
    }
    EXPECT_EQ(sink.rank(), 2u);

    while (!relay.is_full()) ASSERT_EQ(relay.receive_chunk(send()), Status::Ok);
    while (!sink.is_full()) {
        Bytes wire;
        ASSERT_EQ(relay.chunk_to_send(wire), Status::Ok);
        ASSERT_EQ(sink.receive_chunk(wire), Status::Ok);
    }

    Bytes out;
    ASSERT_EQ(sink.decode(out), Status::Ok);
    EXPECT_EQ(out, block);
    EXPECT_EQ(sink.commitments(), source.commitments());
}

TEST_F(NODES, test_shared_committer_by_serialization)
{
    Committer remote;
    ASSERT_EQ(remote.deserialize(committer.serialize()), Status::Ok);
    DestinationNode far;
    ASSERT_EQ(far.init(remote, NUM_CHUNKS, CHUNK_SIZE), Status::Ok);
    while (!far.is_full()) ASSERT_EQ(far.receive_chunk(send()), Status::Ok);
    Bytes out;
    ASSERT_EQ(far.decode(out), Status::Ok);
    EXPECT_EQ(out, block);
}

// 8 chunks of 31 * 512 bytes, each packed into 504 scalars
TEST(NODES_SCENARIO, test_eight_chunks_of_15872_bytes)
{
    const size_t num_chunks = 8;
    const size_t chunk_size = 31 * 512;

    SeedableRng rng = test_rng("nodes.scenario");
    ASSERT_TRUE(rng.ready());
    Bytes block = random_block(rng, num_chunks * chunk_size);

    Committer committer;
    ASSERT_EQ(committer.init_for_message(block.size(), num_chunks), Status::Ok);
    ASSERT_EQ(committer.len(), 504u);

    SourceNode source;
    ASSERT_EQ(source.init(committer, block, num_chunks), Status::Ok);
    DestinationNode dest;
    ASSERT_EQ(dest.init(committer, num_chunks, chunk_size), Status::Ok);

    std::vector<Packet> accepted;
    for (size_t i = 0; i < num_chunks - 1; i++) {
        Packet p;
        ASSERT_EQ(source.chunk_to_send(rng, p), Status::Ok);
        ASSERT_EQ(dest.receive_chunk(serialize_packet(p)), Status::Ok);
        accepted.push_back(std::move(p));
    }
    ASSERT_EQ(dest.rank(), num_chunks - 1);

    // 8th packet spanned by the first 7
    std::vector<const Packet*> rows;
    for (const auto& p : accepted) rows.push_back(&p);
    Packet dependent;
    ASSERT_EQ(combine_packets(rows, sc_random_vec(rows.size(), rng), dependent), Status::Ok);
    EXPECT_EQ(dest.receive_chunk(serialize_packet(dependent)), Status::LinearlyDependentChunk);
    EXPECT_FALSE(dest.is_full());
    EXPECT_EQ(dest.rank(), num_chunks - 1);

    Packet last;
    ASSERT_EQ(source.chunk_to_send(rng, last), Status::Ok);
    ASSERT_EQ(dest.receive_chunk(serialize_packet(last)), Status::Ok);
    ASSERT_TRUE(dest.is_full());

    Bytes out;
    ASSERT_EQ(dest.decode(out), Status::Ok);
    ASSERT_EQ(out.size(), block.size());
    EXPECT_TRUE(out == block);
}
