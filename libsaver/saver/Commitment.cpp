#include "libsaver/saver/Commitment.h"
#include "libsaver/saver/Errors.h"
#include <algorithm>
#include <string>

namespace saver {

bool Commitment::from_bytes(const std::string& bytes){
    blinding.clear();
    return point.from_bytes(bytes);
}

G1Element multi_base_commit(const std::vector<Fr>& values, const Fr& blinding,
    const std::vector<G1Element>& bases, const G1Element& blinding_base){
    if (bases.size() != values.size()){
        throw GeneratorMismatchError("commitment has " + std::to_string(bases.size())
            + " bases for " + std::to_string(values.size()) + " values");
    }
    std::vector<G1Element> all_bases(bases);
    all_bases.push_back(blinding_base);
    std::vector<Fr> scalars(values);
    scalars.push_back(blinding);
    return G1Element::mulVec(all_bases, scalars);
}

Commitment commit(const Decomposition& decomposition, const Fr& randomness,
    const std::vector<G1Element>& bases, const G1Element& blinding_base){
    return Commitment(multi_base_commit(decomposition.to_scalars(), randomness, bases, blinding_base), randomness);
}

std::vector<G1Element> commitment_key_for_radix_power_of_2(const G1Element& g, uint32_t radix, size_t n){
    if (radix < 2 || (radix & (radix - 1)) != 0){
        throw RangeError("radix is not a power of two");
    }
    unsigned log2 = 0;
    while ((1u << log2) < radix){
        log2++;
    }
    std::vector<G1Element> gs;
    gs.reserve(n);
    if (n == 0){
        return gs;
    }
    gs.push_back(g);
    for (size_t i = 1; i < n; i++){
        // log2 doublings multiply by the radix
        G1Element curr = gs[i - 1];
        for (unsigned j = 0; j < log2; j++){
            curr = curr.dbl();
        }
        gs.push_back(curr);
    }
    std::reverse(gs.begin(), gs.end());
    return gs;
}

std::vector<G1Element> commitment_key_for_radix_non_power_of_2(const G1Element& g, uint32_t radix, size_t n){
    Fr b, factor(1);
    b.setStr(std::to_string(radix), 10);
    std::vector<G1Element> gs(n);
    for (size_t i = n; i-- > 0;){
        gs[i] = g * factor;
        factor *= b;
    }
    return gs;
}

std::vector<G1Element> commitment_key(const G1Element& g, uint32_t radix, size_t n){
    if ((radix & (radix - 1)) == 0 && radix >= 2){
        return commitment_key_for_radix_power_of_2(g, radix, n);
    }
    return commitment_key_for_radix_non_power_of_2(g, radix, n);
}

GeneratorSet GeneratorSet::create(const std::vector<G1Element>& Y, const G1Element& P_2,
    const G1Element& G, const G1Element& H, uint32_t radix, size_t digits){
    GeneratorSet gens;
    gens.Y = Y;
    gens.P_2 = P_2;
    gens.G = G;
    gens.H = H;
    gens.radix = radix;
    gens.digits = digits;
    gens.G_i = commitment_key(G, radix, digits);
    gens.check();
    return gens;
}

void GeneratorSet::check() const{
    if (Y.size() != digits){
        throw GeneratorMismatchError("expected " + std::to_string(digits) + " digit bases Y, got " + std::to_string(Y.size()));
    }
    if (G_i.size() != digits){
        throw GeneratorMismatchError("expected " + std::to_string(digits) + " digit bases G_i, got " + std::to_string(G_i.size()));
    }
    if (G.is_zero() || H.is_zero() || P_2.is_zero()){
        throw GeneratorMismatchError("blinding generator or base is the identity");
    }
    std::vector<G1Element> expected = commitment_key_for_radix_non_power_of_2(G, radix, digits);
    for (size_t i = 0; i < digits; i++){
        if (G_i[i] != expected[i]){
            throw GeneratorMismatchError("G_" + std::to_string(i + 1) + " is not radix^(n-i) * G");
        }
    }
}

Commitment GeneratorSet::commit_phi(const Decomposition& decomposition, const Fr& r) const{
    return commit(decomposition, r, Y, P_2);
}

Commitment GeneratorSet::commit_j(const Decomposition& decomposition, const Fr& r) const{
    return commit(decomposition, r, G_i, H);
}

void GeneratorSet::pack(std::stringstream& os) const{
    for (size_t i = 0; i < Y.size(); i++){
        Y[i].pack(os);
    }
    P_2.pack(os);
    for (size_t i = 0; i < G_i.size(); i++){
        G_i[i].pack(os);
    }
    H.pack(os);
}

Commitment ChunkedCommitment::create(const Fr& message, const Fr& blinding, const G1Element& g,
    const G1Element& h, uint32_t radix, size_t n){
    Decomposition d = decompose(message, radix, n);
    return commit(d, blinding, commitment_key(g, radix, n), h);
}

}
