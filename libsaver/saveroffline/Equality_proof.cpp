#include "libsaver/saveroffline/Equality_proof.h"

namespace saver {

const char* state_name(SigmaState s){
    switch (s){
        case SigmaState::Init: return "Init";
        case SigmaState::Committed: return "Committed";
        case SigmaState::Challenged: return "Challenged";
        case SigmaState::Responded: return "Responded";
        case SigmaState::Verified: return "Verified";
        case SigmaState::Rejected: return "Rejected";
    }
    return "Unknown";
}

void EqualityProof::pack_statement(std::stringstream& ciphertexts, const GeneratorSet& gens,
        const G1Element& phi, const G1Element& J){
    gens.pack(ciphertexts);
    phi.pack(ciphertexts);
    J.pack(ciphertexts);
}

void EqualityProof::set_challenge(std::stringstream& ciphertexts) {
    std::string buf = ciphertexts.str();
    challenge.setHashof(buf.data(), buf.size());
}

std::string EqualityProof::to_bytes() const{
    std::string res = T1.to_bytes() + T2.to_bytes();
    for (size_t i = 0; i < z.size(); i++){
        res += z[i].to_bytes();
    }
    res += z_r.to_bytes();
    res += z_r_prime.to_bytes();
    return res;
}

bool EqualityProof::from_bytes(const std::string& bytes){
    if (bytes.size() != length(n_digits)){
        return false;
    }
    size_t g = G1Element::length();
    size_t f = Plaintext::length();
    size_t pos = 0;
    if (!T1.from_bytes(bytes.substr(pos, g))) return false;
    pos += g;
    if (!T2.from_bytes(bytes.substr(pos, g))) return false;
    pos += g;
    z.resize(n_digits);
    for (size_t i = 0; i < n_digits; i++){
        if (!z[i].from_bytes(bytes.substr(pos, f))) return false;
        pos += f;
    }
    if (!z_r.from_bytes(bytes.substr(pos, f))) return false;
    pos += f;
    return z_r_prime.from_bytes(bytes.substr(pos, f));
}

}
