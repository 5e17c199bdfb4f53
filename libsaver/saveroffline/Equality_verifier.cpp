#include "libsaver/saveroffline/Equality_verifier.h"
#include <stdexcept>

namespace saver {

EqualityVerifier::EqualityVerifier(EqualityProof& proof, const GeneratorSet& gens_) :
    P(proof), gens(gens_), state(SigmaState::Init)
{
    gens.check();
}

bool EqualityVerifier::verify(const G1Element& phi, const G1Element& J){
    if (state != SigmaState::Init){
        return state == SigmaState::Verified;
    }
    size_t n = gens.digits;
    if (P.n_digits != n || P.z.size() != n){
        state = SigmaState::Rejected;
        return false;
    }

    std::stringstream ciphertexts;
    EqualityProof::pack_statement(ciphertexts, gens, phi, J);
    P.T1.pack(ciphertexts);
    P.T2.pack(ciphertexts);
    P.set_challenge(ciphertexts);
    const Fr& c = P.challenge.get_message();

    std::vector<Fr> z(n);
    for (size_t i = 0; i < n; i++){
        z[i] = P.z[i].get_message();
    }

    // sum z_i Y_i + z_r P_2 == T1 + c phi
    G1Element left1 = multi_base_commit(z, P.z_r.get_message(), gens.Y, gens.P_2);
    G1Element right1 = P.T1 + phi * c;
    // sum z_i G_i + z_r' H == T2 + c J
    G1Element left2 = multi_base_commit(z, P.z_r_prime.get_message(), gens.G_i, gens.H);
    G1Element right2 = P.T2 + J * c;

    state = (left1 == right1 && left2 == right2) ? SigmaState::Verified : SigmaState::Rejected;
    return state == SigmaState::Verified;
}

void EqualityVerifier::NIZKPoK(const G1Element& phi, const G1Element& J){
    if (!verify(phi, J)){
        throw std::runtime_error("invalid proof");
    }
}

}
