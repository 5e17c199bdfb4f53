#ifndef EQUALITY_VERIFIER_H
#define EQUALITY_VERIFIER_H

#include "libsaver/saveroffline/Equality_proof.h"

namespace saver {

class EqualityVerifier{
    EqualityProof& P;
    const GeneratorSet& gens;
    SigmaState state;

    public:
    EqualityVerifier(EqualityProof& proof, const GeneratorSet& gens);

    SigmaState get_state() const { return state; }

    // Init -> Verified | Rejected
    bool verify(const G1Element& phi, const G1Element& J);

    // throws runtime_error("invalid proof") on rejection
    void NIZKPoK(const G1Element& phi, const G1Element& J);
};

}

#endif
