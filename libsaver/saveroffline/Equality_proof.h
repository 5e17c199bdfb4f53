#ifndef EQUALITY_PROOF_H
#define EQUALITY_PROOF_H

#include "libsaver/curve/Plaintext.h"
#include "libsaver/saver/Commitment.h"
#include <sstream>
#include <string>
#include <vector>

namespace saver {

// Init -> Committed -> Challenged -> Responded on the prover side,
// Init -> Verified | Rejected on the verifier side
enum class SigmaState { Init, Committed, Challenged, Responded, Verified, Rejected };

const char* state_name(SigmaState s);

// what the prover knows: the digits and both blindings
class EqualityOpening{
    public:
    Decomposition digits;
    // r in phi = sum m_i Y_i + r P_2
    Fr phi_blinding;
    // r' in J = sum m_i G_i + r' H
    Fr j_blinding;
};

/**
 * Proof that phi and J open to the same digits:
 *   T1 = sum k_i Y_i + k_r P_2, T2 = sum k_i G_i + k_r' H,
 *   z_i = k_i + c m_i, z_r = k_r + c r, z_r' = k_r' + c r'.
 * The challenge c is not sent; both sides hash the transcript.
 */
class EqualityProof{
    public:
    size_t n_digits;

    G1Element T1;
    G1Element T2;
    std::vector<Plaintext> z;
    Plaintext z_r;
    Plaintext z_r_prime;

    Plaintext challenge;

    explicit EqualityProof(size_t n_digits_ = 0) : n_digits(n_digits_) {}

    // bases, phi and J, the start of every transcript
    static void pack_statement(std::stringstream& ciphertexts, const GeneratorSet& gens,
        const G1Element& phi, const G1Element& J);

    void set_challenge(std::stringstream& ciphertexts);

    static size_t length(size_t n) { return 2 * G1Element::length() + (n + 2) * Plaintext::length(); }

    // T1 || T2 || z_1 .. z_n || z_r || z_r'
    std::string to_bytes() const;
    // false on a length mismatch or any non-canonical element
    bool from_bytes(const std::string& bytes);
};

}

#endif
