#define BOOST_TEST_MODULE Saver_BN254_Tests
#include <boost/test/included/unit_test.hpp>
#include "libsaver/saver_interface.hpp"
#include "libsaver/curve/FFT.h"
#include <stdexcept>
#include <string>

using namespace saver;

namespace {

// mcl's pairing state is per process, so BN254 gets its own executable
struct PairingFixture {
    PairingFixture() { G1Element::init(CurveType::BN254); }
};

Fr fr(uint64_t v) {
    Fr x;
    x.setStr(std::to_string(v), 10);
    return x;
}

std::string flip_bit(const std::string& bytes, size_t bit) {
    std::string res = bytes;
    res[bit / 8] ^= static_cast<char>(1 << (bit % 8));
    return res;
}

struct Saver16x3 {
    SeededRandom rng;
    SAVER scheme;
    SetupResult keys;

    Saver16x3() : rng(254), scheme(Params(16, 3, CurveType::BN254)) {
        keys = scheme.setup(rng);
    }
};

}

BOOST_GLOBAL_FIXTURE(PairingFixture);

// ============================================================================
// Test Suite: curve parameters
// ============================================================================

BOOST_AUTO_TEST_SUITE(BN254_Curve_Tests)

BOOST_AUTO_TEST_CASE(curve_is_bn254) {
    BOOST_CHECK(G1Element::curve() == CurveType::BN254);
    BOOST_CHECK_EQUAL(G1Element::type_string(), "BN254");
    BOOST_CHECK_THROW(G1Element::init(CurveType::BLS12_381), std::runtime_error);
    BOOST_CHECK_NO_THROW(G1Element::init(CurveType::BN254));
}

BOOST_AUTO_TEST_CASE(generators_are_valid) {
    G1Element g1 = G1Element::generator();
    BOOST_CHECK(!g1.is_zero());
    BOOST_CHECK(g1.is_valid());
    BOOST_CHECK(g1 == G1Element(Fr(1)));
    BOOST_CHECK(G1Element::generator() * fr(5) == G1Element(fr(5)));

    // e(aG, bH) = e(G, H)^{ab}
    G2Element g2 = G2Element::generator();
    GT lhs = pair_of(g1 * fr(6), g2 * fr(7));
    GT rhs;
    GT::pow(rhs, pair_of(g1, g2), fr(42));
    BOOST_CHECK(lhs == rhs);
    BOOST_CHECK(!pair_of(g1, g2).isOne());
}

BOOST_AUTO_TEST_CASE(fr_two_adicity) {
    BOOST_CHECK_EQUAL(EvaluationDomain::two_adicity(), 28u);
    BOOST_CHECK(EvaluationDomain::multiplicative_generator() == Fr(5));

    // the root of unity check runs in the constructor for the largest domain
    EvaluationDomain largest(size_t(1) << 28);
    BOOST_CHECK_EQUAL(largest.size(), size_t(1) << 28);
    BOOST_CHECK_THROW(EvaluationDomain too_big(size_t(1) << 29), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(fft_round_trip) {
    SeededRandom rng(2541);
    EvaluationDomain domain(16);
    std::vector<Fr> a(16);
    for (size_t i = 0; i < a.size(); i++) {
        a[i] = rng.next();
    }
    std::vector<Fr> b = a;
    domain.coset_fft(b);
    domain.icoset_fft(b);
    BOOST_CHECK(a == b);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: encrypt / decrypt / verify on BN254
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(BN254_Saver_Tests, Saver16x3)

BOOST_AUTO_TEST_CASE(example_325) {
    EncryptionResult enc = scheme.encrypt(fr(325), keys.ek, keys.pk, rng);

    std::vector<uint64_t> digits = decrypt_digits(enc.ciphertext, keys.dk);
    std::vector<uint64_t> expected = {1, 4, 5};
    BOOST_CHECK(digits == expected);
    BOOST_CHECK(scheme.decrypt(enc.ciphertext, keys.dk) == fr(325));
    BOOST_CHECK(scheme.verify(enc.ciphertext, enc.commitment.get_point(), enc.proof, keys.vk));
    BOOST_CHECK_THROW(scheme.encrypt(fr(4096), keys.ek, keys.pk, rng), RangeError);
}

BOOST_AUTO_TEST_CASE(sizes_follow_the_curve) {
    EncryptionResult enc = scheme.encrypt(fr(7), keys.ek, keys.pk, rng);
    // 32-byte compressed G1, 64-byte compressed G2
    BOOST_CHECK_EQUAL(G1Element::length(), 32u);
    BOOST_CHECK_EQUAL(G2Element::length(), 64u);
    BOOST_CHECK_EQUAL(enc.ciphertext.to_bytes().size(), 4u * 32u);
    BOOST_CHECK_EQUAL(enc.proof.to_bytes().size(), 2u * 32u + 64u);
}

BOOST_AUTO_TEST_CASE(flipped_proof_bits_are_rejected) {
    EncryptionResult enc = scheme.encrypt(fr(325), keys.ek, keys.pk, rng);
    std::string bytes = enc.proof.to_bytes();
    for (size_t bit = 0; bit < bytes.size() * 8; bit += 5) {
        Groth16Proof tampered;
        if (!tampered.from_bytes(flip_bit(bytes, bit))) {
            continue;
        }
        BOOST_CHECK_MESSAGE(!scheme.verify(enc.ciphertext, enc.commitment.get_point(), tampered, keys.vk),
            "proof bit " << bit << " accepted");
    }
}

BOOST_AUTO_TEST_CASE(flipped_ciphertext_bits_are_rejected) {
    EncryptionResult enc = scheme.encrypt(fr(325), keys.ek, keys.pk, rng);
    std::string bytes = enc.ciphertext.to_bytes();
    for (size_t bit = 0; bit < bytes.size() * 8; bit += 5) {
        Ciphertext tampered;
        if (!tampered.from_bytes(flip_bit(bytes, bit), 3)) {
            continue;
        }
        BOOST_CHECK_MESSAGE(!scheme.verify(tampered, enc.commitment.get_point(), enc.proof, keys.vk),
            "ciphertext bit " << bit << " accepted");
    }
}

BOOST_AUTO_TEST_CASE(equality_proof) {
    Fr m = fr(0xabc);
    EncryptionResult enc = scheme.encrypt(m, keys.ek, keys.pk, rng);
    Commitment J = scheme.commit_message(m, rng.next(), keys.gens);
    EqualityOpening opening = scheme.opening(m, enc.commitment, J);
    EqualityProof proof = scheme.prove_equal_opening(enc.commitment.get_point(), J.get_point(), opening, keys.gens, rng);
    BOOST_CHECK(scheme.verify_equal_opening(enc.commitment.get_point(), J.get_point(), proof, keys.gens));
}

BOOST_AUTO_TEST_SUITE_END()
