#define BOOST_TEST_MODULE Commitment_Tests
#include <boost/test/included/unit_test.hpp>
#include "libsaver/curve/G1Element.h"
#include "libsaver/curve/Random.h"
#include "libsaver/saver/Commitment.h"
#include "libsaver/saver/Errors.h"
#include <string>

using namespace saver;

namespace {

struct PairingFixture {
    PairingFixture() { G1Element::init(); }
};

Fr fr(uint64_t v) {
    Fr x;
    x.setStr(std::to_string(v), 10);
    return x;
}

std::vector<G1Element> random_points(RandomSource& rng, size_t n) {
    std::vector<G1Element> res(n);
    for (size_t i = 0; i < n; i++) {
        res[i] = G1Element(rng.next_nonzero());
    }
    return res;
}

}

BOOST_GLOBAL_FIXTURE(PairingFixture);

// ============================================================================
// Test Suite: commitment keys
// ============================================================================

BOOST_AUTO_TEST_SUITE(Commitment_Key_Tests)

BOOST_AUTO_TEST_CASE(doubling_and_multiplication_agree) {
    G1Element g = G1Element::hash_to_point("commitment key test");
    const uint32_t radixes[] = {2, 4, 16, 256, 65536};
    for (uint32_t b : radixes) {
        std::vector<G1Element> by_doubling = commitment_key_for_radix_power_of_2(g, b, 6);
        std::vector<G1Element> by_mul = commitment_key_for_radix_non_power_of_2(g, b, 6);
        BOOST_REQUIRE_EQUAL(by_doubling.size(), 6u);
        for (size_t i = 0; i < 6; i++) {
            BOOST_CHECK(by_doubling[i] == by_mul[i]);
        }
    }
}

BOOST_AUTO_TEST_CASE(last_base_is_g) {
    G1Element g = G1Element::hash_to_point("commitment key test");
    std::vector<G1Element> key = commitment_key(g, 10, 4);
    BOOST_CHECK(key[3] == g);
    BOOST_CHECK(key[2] == g * fr(10));
    BOOST_CHECK(key[0] == g * fr(1000));
}

BOOST_AUTO_TEST_CASE(doubling_needs_power_of_two) {
    G1Element g = G1Element::generator();
    BOOST_CHECK_THROW(commitment_key_for_radix_power_of_2(g, 10, 3), RangeError);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: multi-base commitments
// ============================================================================

BOOST_AUTO_TEST_SUITE(Commit_Tests)

BOOST_AUTO_TEST_CASE(commit_matches_manual_sum) {
    SeededRandom rng(1);
    std::vector<G1Element> bases = random_points(rng, 3);
    G1Element h = G1Element(rng.next_nonzero());
    Decomposition d = decompose(fr(325), 16, 3);
    Fr r = rng.next();

    Commitment c = commit(d, r, bases, h);
    G1Element expected = bases[0] * fr(1) + bases[1] * fr(4) + bases[2] * fr(5) + h * r;
    BOOST_CHECK(c.get_point() == expected);
    BOOST_CHECK(c.get_blinding() == r);
}

BOOST_AUTO_TEST_CASE(base_count_mismatch) {
    SeededRandom rng(2);
    std::vector<G1Element> bases = random_points(rng, 2);
    Decomposition d = decompose(fr(325), 16, 3);
    BOOST_CHECK_THROW(commit(d, rng.next(), bases, G1Element::generator()), GeneratorMismatchError);
}

BOOST_AUTO_TEST_CASE(chunked_commitment_is_whole_message_commitment) {
    G1Element g = G1Element::hash_to_point("J base G");
    G1Element h = G1Element::hash_to_point("J base H");
    SeededRandom rng(3);
    Fr r = rng.next();
    const uint32_t radixes[] = {16, 10, 2};
    const size_t counts[] = {4, 5, 16};
    for (size_t t = 0; t < 3; t++) {
        Fr m = fr(12345);
        Commitment J = ChunkedCommitment::create(m, r, g, h, radixes[t], counts[t]);
        BOOST_CHECK(J.get_point() == g * m + h * r);
    }
}

BOOST_AUTO_TEST_CASE(only_the_point_is_serialized) {
    SeededRandom rng(4);
    Commitment c(G1Element(rng.next()), rng.next());
    std::string bytes = c.to_bytes();
    BOOST_CHECK_EQUAL(bytes.size(), G1Element::length());

    Commitment back;
    BOOST_REQUIRE(back.from_bytes(bytes));
    BOOST_CHECK(back == c);
    BOOST_CHECK(back.get_blinding().isZero());
    BOOST_CHECK(!back.from_bytes(bytes.substr(1)));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: GeneratorSet
// ============================================================================

BOOST_AUTO_TEST_SUITE(Generator_Set_Tests)

BOOST_AUTO_TEST_CASE(create_derives_digit_bases) {
    SeededRandom rng(5);
    std::vector<G1Element> Y = random_points(rng, 4);
    G1Element G = G1Element::hash_to_point("G");
    GeneratorSet gens = GeneratorSet::create(Y, G1Element(rng.next_nonzero()), G,
        G1Element::hash_to_point("H"), 16, 4);
    BOOST_REQUIRE_EQUAL(gens.G_i.size(), 4u);
    BOOST_CHECK(gens.G_i[3] == G);
    BOOST_CHECK(gens.G_i[0] == G * fr(4096));
    BOOST_CHECK_NO_THROW(gens.check());
}

BOOST_AUTO_TEST_CASE(tampered_digit_base_is_rejected) {
    SeededRandom rng(6);
    GeneratorSet gens = GeneratorSet::create(random_points(rng, 3), G1Element(rng.next_nonzero()),
        G1Element::hash_to_point("G"), G1Element::hash_to_point("H"), 16, 3);
    gens.G_i[1] = gens.G_i[1].dbl();
    BOOST_CHECK_THROW(gens.check(), GeneratorMismatchError);
}

BOOST_AUTO_TEST_CASE(wrong_lengths_are_rejected) {
    SeededRandom rng(7);
    BOOST_CHECK_THROW(GeneratorSet::create(random_points(rng, 2), G1Element(rng.next_nonzero()),
        G1Element::hash_to_point("G"), G1Element::hash_to_point("H"), 16, 3), GeneratorMismatchError);
}

BOOST_AUTO_TEST_CASE(identity_blinding_base_is_rejected) {
    SeededRandom rng(8);
    BOOST_CHECK_THROW(GeneratorSet::create(random_points(rng, 3), G1Element(),
        G1Element::hash_to_point("G"), G1Element::hash_to_point("H"), 16, 3), GeneratorMismatchError);
}

BOOST_AUTO_TEST_CASE(phi_and_j_share_the_digits) {
    SeededRandom rng(9);
    G1Element G = G1Element::hash_to_point("G");
    G1Element H = G1Element::hash_to_point("H");
    GeneratorSet gens = GeneratorSet::create(random_points(rng, 3), G1Element(rng.next_nonzero()), G, H, 16, 3);
    Decomposition d = decompose(fr(325), 16, 3);
    Fr r = rng.next();
    Fr r2 = rng.next();

    BOOST_CHECK(gens.commit_phi(d, r).get_point() == multi_base_commit(d.to_scalars(), r, gens.Y, gens.P_2));
    BOOST_CHECK(gens.commit_j(d, r2).get_point() == G * fr(325) + H * r2);
}

BOOST_AUTO_TEST_SUITE_END()
