#ifndef SAVER_CURVE_G2ELEMENT_H_
#define SAVER_CURVE_G2ELEMENT_H_
#include "libsaver/curve/G1Element.h"

using namespace mcl::bn;

class G2Element{
    private:
    G2 point;

    public:
    static size_t length() { return G2::getSerializedByteSize(); }

    const G2& getPoint() const { return point; }

    // set by G1Element::init once the pairing is ready
    static void init_generator();
    static G2Element generator();

    G2Element();
    G2Element(const G2Element& other);
    explicit G2Element(const G2& p);
    // generator * scalar
    G2Element(const Fr& scalar);

    G2Element& operator=(const G2Element& other);

    G2Element operator+(const G2Element& other) const;
    G2Element operator*(const Fr& other) const;

    G2Element& operator+=(const G2Element& other);

    bool operator==(const G2Element& other) const;
    bool operator!=(const G2Element& other) const;

    static G2Element mulVec(const std::vector<G2Element>& bases, const std::vector<Fr>& scalars);

    void pack(std::stringstream& os) const;
    void unpack(std::stringstream& os);

    std::string to_bytes() const;
    bool from_bytes(const std::string& bytes);
};

// e(p, q)
GT pair_of(const G1Element& p, const G2Element& q);

#endif
