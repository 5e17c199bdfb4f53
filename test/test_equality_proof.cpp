#define BOOST_TEST_MODULE Equality_Proof_Tests
#include <boost/test/included/unit_test.hpp>
#include "libsaver/saver_interface.hpp"
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

// generators without a Groth16 setup: Y and P_2 are random points
struct Statement {
    SeededRandom rng;
    GeneratorSet gens;
    Decomposition digits;
    Commitment phi;
    Commitment J;
    EqualityOpening opening;

    Statement() : rng(500) {
        std::vector<G1Element> Y(4);
        for (size_t i = 0; i < Y.size(); i++) {
            Y[i] = G1Element(rng.next_nonzero());
        }
        gens = GeneratorSet::create(Y, G1Element(rng.next_nonzero()), G1Element::hash_to_point(COMMITMENT_G_TAG),
            G1Element::hash_to_point(COMMITMENT_H_TAG), 16, 4);
        digits = decompose(fr(0xbeef), 16, 4);
        phi = gens.commit_phi(digits, rng.next());
        J = gens.commit_j(digits, rng.next());
        opening.digits = digits;
        opening.phi_blinding = phi.get_blinding();
        opening.j_blinding = J.get_blinding();
    }

    EqualityProof prove(const G1Element& phi_point, const G1Element& J_point, const EqualityOpening& o) {
        EqualityProof proof(gens.digits);
        EqualityProver prover(proof, gens);
        prover.NIZKPoK(phi_point, J_point, o, rng);
        return proof;
    }

    bool check(EqualityProof& proof, const G1Element& phi_point, const G1Element& J_point) {
        EqualityVerifier verifier(proof, gens);
        return verifier.verify(phi_point, J_point);
    }
};

}

BOOST_GLOBAL_FIXTURE(PairingFixture);

// ============================================================================
// Test Suite: completeness and soundness
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(Equality_Proof_Tests, Statement)

BOOST_AUTO_TEST_CASE(honest_proof_verifies) {
    EqualityProof proof = prove(phi.get_point(), J.get_point(), opening);
    BOOST_CHECK(check(proof, phi.get_point(), J.get_point()));
}

BOOST_AUTO_TEST_CASE(j_is_the_whole_message_commitment) {
    BOOST_CHECK(J.get_point() == gens.G * fr(0xbeef) + gens.H * J.get_blinding());
}

BOOST_AUTO_TEST_CASE(mutated_digit_in_j_is_rejected) {
    std::vector<uint64_t> d = digits.digits();
    d[2] = (d[2] + 1) % 16;
    Commitment J_other = gens.commit_j(Decomposition(d, 16), J.get_blinding());

    EqualityProof proof = prove(phi.get_point(), J_other.get_point(), opening);
    BOOST_CHECK(!check(proof, phi.get_point(), J_other.get_point()));

    EqualityOpening other = opening;
    other.digits = Decomposition(d, 16);
    EqualityProof proof2 = prove(phi.get_point(), J_other.get_point(), other);
    BOOST_CHECK(!check(proof2, phi.get_point(), J_other.get_point()));
}

BOOST_AUTO_TEST_CASE(proof_for_other_statement_is_rejected) {
    EqualityProof proof = prove(phi.get_point(), J.get_point(), opening);
    G1Element other_phi = phi.get_point() + gens.P_2;
    BOOST_CHECK(!check(proof, other_phi, J.get_point()));
    BOOST_CHECK(!check(proof, phi.get_point(), J.get_point().dbl()));
}

BOOST_AUTO_TEST_CASE(tampered_responses_are_rejected) {
    EqualityProof proof = prove(phi.get_point(), J.get_point(), opening);

    EqualityProof t1 = proof;
    t1.z[0] = t1.z[0] + Plaintext(Fr(1));
    BOOST_CHECK(!check(t1, phi.get_point(), J.get_point()));

    EqualityProof t2 = proof;
    t2.z_r_prime = t2.z_r_prime + Plaintext(Fr(1));
    BOOST_CHECK(!check(t2, phi.get_point(), J.get_point()));

    EqualityProof t3 = proof;
    t3.T1 = t3.T1 + gens.P_2;
    BOOST_CHECK(!check(t3, phi.get_point(), J.get_point()));
}

BOOST_AUTO_TEST_CASE(blinds_are_fresh_per_proof) {
    EqualityProof a = prove(phi.get_point(), J.get_point(), opening);
    EqualityProof b = prove(phi.get_point(), J.get_point(), opening);
    BOOST_CHECK(a.T1 != b.T1);
    BOOST_CHECK(a.T2 != b.T2);
    BOOST_CHECK(a.challenge != b.challenge);
}

BOOST_AUTO_TEST_CASE(serialized_proof_verifies) {
    EqualityProof proof = prove(phi.get_point(), J.get_point(), opening);
    std::string bytes = proof.to_bytes();
    BOOST_CHECK_EQUAL(bytes.size(), EqualityProof::length(4));

    EqualityProof back(4);
    BOOST_REQUIRE(back.from_bytes(bytes));
    BOOST_CHECK(check(back, phi.get_point(), J.get_point()));

    EqualityProof wrong_count(3);
    BOOST_CHECK(!wrong_count.from_bytes(bytes));
}

BOOST_AUTO_TEST_CASE(flipped_bits_are_rejected) {
    EqualityProof proof = prove(phi.get_point(), J.get_point(), opening);
    std::string bytes = proof.to_bytes();
    for (size_t bit = 0; bit < bytes.size() * 8; bit += 7) {
        std::string tampered = bytes;
        tampered[bit / 8] ^= static_cast<char>(1 << (bit % 8));
        EqualityProof back(4);
        if (!back.from_bytes(tampered)) {
            continue;
        }
        BOOST_CHECK_MESSAGE(!check(back, phi.get_point(), J.get_point()), "bit " << bit << " accepted");
    }
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: protocol states
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(Equality_State_Tests, Statement)

BOOST_AUTO_TEST_CASE(states_advance_in_order) {
    EqualityProof proof(gens.digits);
    EqualityProver prover(proof, gens);
    BOOST_CHECK(prover.get_state() == SigmaState::Init);
    prover.commit(phi.get_point(), J.get_point(), rng);
    BOOST_CHECK(prover.get_state() == SigmaState::Committed);
    prover.challenge();
    BOOST_CHECK(prover.get_state() == SigmaState::Challenged);
    prover.respond(opening);
    BOOST_CHECK(prover.get_state() == SigmaState::Responded);

    EqualityVerifier verifier(proof, gens);
    BOOST_CHECK(verifier.get_state() == SigmaState::Init);
    BOOST_CHECK(verifier.verify(phi.get_point(), J.get_point()));
    BOOST_CHECK(verifier.get_state() == SigmaState::Verified);
}

BOOST_AUTO_TEST_CASE(rejected_state) {
    EqualityProof proof = prove(phi.get_point(), J.get_point(), opening);
    EqualityVerifier verifier(proof, gens);
    BOOST_CHECK(!verifier.verify(phi.get_point(), J.get_point().dbl()));
    BOOST_CHECK(verifier.get_state() == SigmaState::Rejected);
    BOOST_CHECK_THROW(verifier.NIZKPoK(phi.get_point(), J.get_point().dbl()), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(out_of_order_steps) {
    EqualityProof proof(gens.digits);
    EqualityProver prover(proof, gens);
    BOOST_CHECK_THROW(prover.challenge(), EncodingError);
    BOOST_CHECK_THROW(prover.respond(opening), EncodingError);
    prover.commit(phi.get_point(), J.get_point(), rng);
    BOOST_CHECK_THROW(prover.commit(phi.get_point(), J.get_point(), rng), EncodingError);
    BOOST_CHECK_THROW(prover.respond(opening), EncodingError);
    prover.challenge();
    prover.respond(opening);
    // a prover runs once
    BOOST_CHECK_THROW(prover.commit(phi.get_point(), J.get_point(), rng), EncodingError);
    BOOST_CHECK_THROW(prover.respond(opening), EncodingError);
}

BOOST_AUTO_TEST_CASE(opening_of_wrong_length) {
    EqualityProof proof(gens.digits);
    EqualityProver prover(proof, gens);
    prover.commit(phi.get_point(), J.get_point(), rng);
    prover.challenge();
    EqualityOpening short_opening = opening;
    short_opening.digits = decompose(fr(0xbeef), 16, 5);
    BOOST_CHECK_THROW(prover.respond(short_opening), EncodingError);
}

BOOST_AUTO_TEST_CASE(bad_generators_are_refused) {
    GeneratorSet bad = gens;
    bad.G_i[0] = bad.G_i[1];
    EqualityProof proof(gens.digits);
    BOOST_CHECK_THROW(EqualityProver prover(proof, bad), GeneratorMismatchError);
    BOOST_CHECK_THROW(EqualityVerifier verifier(proof, bad), GeneratorMismatchError);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: facade, phi from a real encryption
// ============================================================================

BOOST_AUTO_TEST_SUITE(Equality_Facade_Tests)

BOOST_AUTO_TEST_CASE(phi_from_encryption) {
    SeededRandom rng(600);
    SAVER scheme(Params(16, 4));
    SetupResult keys = scheme.setup(rng);
    Fr m = fr(0xbeef);
    EncryptionResult enc = scheme.encrypt(m, keys.ek, keys.pk, rng);
    Commitment J = scheme.commit_message(m, rng.next(), keys.gens);
    BOOST_CHECK(J.get_point() == keys.gens.G * m + keys.gens.H * J.get_blinding());

    EqualityOpening opening = scheme.opening(m, enc.commitment, J);
    EqualityProof proof = scheme.prove_equal_opening(enc.commitment.get_point(), J.get_point(), opening, keys.gens, rng);
    BOOST_CHECK(scheme.verify_equal_opening(enc.commitment.get_point(), J.get_point(), proof, keys.gens));

    Commitment J_other = scheme.commit_message(fr(0xbeee), J.get_blinding(), keys.gens);
    BOOST_CHECK(!scheme.verify_equal_opening(enc.commitment.get_point(), J_other.get_point(), proof, keys.gens));
}

BOOST_AUTO_TEST_SUITE_END()
