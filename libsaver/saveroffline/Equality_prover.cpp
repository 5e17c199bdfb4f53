#include "libsaver/saveroffline/Equality_prover.h"
#include "libsaver/saver/Errors.h"
#include <string>

namespace saver {

EqualityProver::EqualityProver(EqualityProof& proof, const GeneratorSet& gens_) :
    P(proof), gens(gens_), state(SigmaState::Init)
{
    gens.check();
    P.n_digits = gens.digits;
}

EqualityProver::~EqualityProver(){
    erase_blinds();
}

void EqualityProver::expect(SigmaState s, const char* step) const{
    if (state != s){
        throw EncodingError(std::string("equality prover: ") + step + " called in state " + state_name(state));
    }
}

void EqualityProver::erase_blinds(){
    for (size_t i = 0; i < k.size(); i++){
        k[i].assign_zero();
    }
    k.clear();
    k_r.assign_zero();
    k_r_prime.assign_zero();
}

void EqualityProver::commit(const G1Element& phi, const G1Element& J, RandomSource& rng){
    expect(SigmaState::Init, "commit");
    size_t n = gens.digits;

    k.resize(n);
    std::vector<Fr> ks(n);
    for (size_t i = 0; i < n; i++){
        ks[i] = rng.next();
        k[i] = Plaintext(ks[i]);
    }
    k_r = Plaintext(rng.next());
    k_r_prime = Plaintext(rng.next());

    // same digit blinds under both bases
    P.T1 = multi_base_commit(ks, k_r.get_message(), gens.Y, gens.P_2);
    P.T2 = multi_base_commit(ks, k_r_prime.get_message(), gens.G_i, gens.H);

    EqualityProof::pack_statement(ciphertexts, gens, phi, J);
    P.T1.pack(ciphertexts);
    P.T2.pack(ciphertexts);
    state = SigmaState::Committed;
}

void EqualityProver::challenge(){
    expect(SigmaState::Committed, "challenge");
    P.set_challenge(ciphertexts);
    state = SigmaState::Challenged;
}

void EqualityProver::respond(const EqualityOpening& opening){
    expect(SigmaState::Challenged, "respond");
    if (opening.digits.size() != gens.digits){
        throw EncodingError("opening has " + std::to_string(opening.digits.size()) + " digits, generators "
            + std::to_string(gens.digits));
    }
    std::vector<Fr> m = opening.digits.to_scalars();
    const Plaintext& c = P.challenge;

    P.z.resize(m.size());
    for (size_t i = 0; i < m.size(); i++){
        P.z[i] = k[i] + c * Plaintext(m[i]);
    }
    P.z_r = k_r + c * Plaintext(opening.phi_blinding);
    P.z_r_prime = k_r_prime + c * Plaintext(opening.j_blinding);

    erase_blinds();
    state = SigmaState::Responded;
}

void EqualityProver::NIZKPoK(const G1Element& phi, const G1Element& J, const EqualityOpening& opening, RandomSource& rng){
    commit(phi, J, rng);
    challenge();
    respond(opening);
}

}
