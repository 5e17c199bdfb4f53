#ifndef EQUALITY_PROVER_H
#define EQUALITY_PROVER_H

#include "libsaver/saveroffline/Equality_proof.h"
#include "libsaver/curve/Random.h"

namespace saver {

/**
 * One run of the equality-of-opening protocol. The blinds k_i, k_r, k_r'
 * are sampled in commit() and erased in respond(); a prover object cannot
 * be rewound, so the blinds are never used for a second challenge.
 * Calling a step out of order throws EncodingError.
 */
class EqualityProver{
    EqualityProof& P;
    const GeneratorSet& gens;
    SigmaState state;

    std::vector<Plaintext> k;
    Plaintext k_r, k_r_prime;
    std::stringstream ciphertexts;

    void expect(SigmaState s, const char* step) const;
    void erase_blinds();

    public:
    EqualityProver(EqualityProof& proof, const GeneratorSet& gens);
    ~EqualityProver();

    SigmaState get_state() const { return state; }

    // Init -> Committed
    void commit(const G1Element& phi, const G1Element& J, RandomSource& rng);
    // Committed -> Challenged
    void challenge();
    // Challenged -> Responded
    void respond(const EqualityOpening& opening);

    // all three steps
    void NIZKPoK(const G1Element& phi, const G1Element& J, const EqualityOpening& opening, RandomSource& rng);
};

}

#endif
