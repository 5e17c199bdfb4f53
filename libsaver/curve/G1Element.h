#ifndef SAVER_CURVE_G1ELEMENT_H_
#define SAVER_CURVE_G1ELEMENT_H_
#include <mcl/bls12_381.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace mcl::bn;

// pairing-friendly curves mcl is initialised with
enum class CurveType { BLS12_381, BN254 };

class G1Element{
    private:
    G1 point;

    public:
    static size_t length() { return G1::getSerializedByteSize(); }
    static std::string type_string();

    const G1& getPoint() const { return point; }
    G1& getPoint() { return point; }

    /**
     * Initialise the pairing for `curve`. Safe to call repeatedly with the
     * same curve; asking for a different curve once initialised throws.
     */
    static void init(CurveType curve = CurveType::BLS12_381);
    static CurveType curve();

    static G1Element generator();
    // point with unknown discrete log w.r.t. the generator
    static G1Element hash_to_point(const std::string& tag);

    G1Element();
    G1Element(const G1Element& other);
    explicit G1Element(const G1& p);
    // generator * scalar
    G1Element(const Fr& scalar);
    ~G1Element();

    G1Element& operator=(const G1Element& other);

    bool is_zero() const { return point.isZero(); }
    bool is_valid() const { return point.isValid(); }

    G1Element operator+(const G1Element& other) const;
    G1Element operator*(const Fr& other) const;
    G1Element negate() const;
    G1Element dbl() const;

    G1Element& operator+=(const G1Element& other);
    G1Element& operator-=(const G1Element& other);

    bool operator==(const G1Element& other) const;
    bool operator!=(const G1Element& other) const;

    // sum scalars[i] * bases[i]; sizes must agree
    static G1Element mulVec(const std::vector<G1Element>& bases, const std::vector<Fr>& scalars);

    void pack(std::stringstream& os) const;
    void unpack(std::stringstream& os);

    // canonical compressed encoding, fixed size per curve
    std::string to_bytes() const;
    bool from_bytes(const std::string& bytes);
};

#endif
