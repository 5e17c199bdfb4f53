#ifndef SAVER_COMMITMENT_H_
#define SAVER_COMMITMENT_H_

#include "libsaver/curve/G1Element.h"
#include "libsaver/saver/Decompose.h"
#include <vector>

namespace saver {

/**
 * Pedersen commitment point together with the blinding that produced it.
 * Only the point leaves the committer: to_bytes() encodes nothing else.
 */
class Commitment{
    G1Element point;
    Fr blinding;

    public:
    Commitment() { blinding.clear(); }
    Commitment(const G1Element& point_, const Fr& blinding_) : point(point_), blinding(blinding_) {}

    const G1Element& get_point() const { return point; }
    const Fr& get_blinding() const { return blinding; }

    std::string to_bytes() const { return point.to_bytes(); }
    bool from_bytes(const std::string& bytes);

    bool operator==(const Commitment& other) const { return point == other.point; }
    bool operator!=(const Commitment& other) const { return point != other.point; }
};

/**
 * sum values[i] * bases[i] + blinding * blinding_base. Shared by every
 * commitment in the scheme, whatever its bases.
 * Throws GeneratorMismatchError if the base count differs from the value count.
 */
G1Element multi_base_commit(const std::vector<Fr>& values, const Fr& blinding,
    const std::vector<G1Element>& bases, const G1Element& blinding_base);

Commitment commit(const Decomposition& decomposition, const Fr& randomness,
    const std::vector<G1Element>& bases, const G1Element& blinding_base);

// G_i = radix^{n-i} * g for i = 1..n, i.e. [radix^{n-1} g, .., radix g, g]
std::vector<G1Element> commitment_key(const G1Element& g, uint32_t radix, size_t n);
// repeated doubling, radix must be a power of two
std::vector<G1Element> commitment_key_for_radix_power_of_2(const G1Element& g, uint32_t radix, size_t n);
std::vector<G1Element> commitment_key_for_radix_non_power_of_2(const G1Element& g, uint32_t radix, size_t n);

/**
 * Public bases of both commitments over the same digits:
 *   phi = sum m_i Y_i + r  P_2      (built during encryption)
 *   J   = sum m_i G_i + r' H        (commitment to the whole message)
 * with G_i = radix^{n-i} G, which makes J = m G + r' H.
 */
class GeneratorSet{
    public:
    std::vector<G1Element> Y;
    G1Element P_2;
    G1Element G;
    std::vector<G1Element> G_i;
    G1Element H;
    uint32_t radix;
    size_t digits;

    GeneratorSet() : radix(2), digits(0) {}

    static GeneratorSet create(const std::vector<G1Element>& Y, const G1Element& P_2,
        const G1Element& G, const G1Element& H, uint32_t radix, size_t digits);

    // re-derives G_i from (G, radix, digits); throws GeneratorMismatchError
    void check() const;

    Commitment commit_phi(const Decomposition& decomposition, const Fr& r) const;
    Commitment commit_j(const Decomposition& decomposition, const Fr& r) const;

    // Fiat-Shamir transcript contribution
    void pack(std::stringstream& os) const;
};

/**
 * Commitment to a message given as a single field element, through its
 * digits: sum m_i G_i + r H == m G + r H.
 */
class ChunkedCommitment{
    public:
    static Commitment create(const Fr& message, const Fr& blinding, const G1Element& g,
        const G1Element& h, uint32_t radix, size_t n);
};

}

#endif
