#ifndef SAVER_DECOMPOSE_H_
#define SAVER_DECOMPOSE_H_

#include <mcl/bls12_381.hpp>
#include <cstdint>
#include <vector>

using namespace mcl::bn;

namespace saver {

/**
 * Big-endian digits (m_1, .., m_n) of a message in base `radix`, so that
 * m = sum m_i * radix^{n-i}. Every digit is checked to be below the radix
 * on construction.
 */
class Decomposition{
    std::vector<uint64_t> digits_;
    uint32_t radix_;

    public:
    Decomposition() : radix_(2) {}
    Decomposition(const std::vector<uint64_t>& digits, uint32_t radix);

    size_t size() const { return digits_.size(); }
    uint32_t radix() const { return radix_; }
    uint64_t operator[](size_t i) const { return digits_[i]; }
    const std::vector<uint64_t>& digits() const { return digits_; }

    std::vector<Fr> to_scalars() const;
    Fr reconstruct() const;

    bool operator==(const Decomposition& other) const{
        return radix_ == other.radix_ && digits_ == other.digits_;
    }
    bool operator!=(const Decomposition& other) const{
        return !(*this == other);
    }
};

// throws RangeError if m >= radix^n, radix < 2 or n == 0
Decomposition decompose(const Fr& m, uint32_t radix, size_t n);

// Horner evaluation in Fr; throws RangeError for a digit >= radix
Fr reconstruct(const std::vector<uint64_t>& digits, uint32_t radix);
// same, over the integers without reducing mod the field order
mpz_class reconstruct_integer(const std::vector<uint64_t>& digits, uint32_t radix);

// radix^n
mpz_class capacity(uint32_t radix, size_t n);
// radix^n - 1, the largest message n digits hold
mpz_class max_message(uint32_t radix, size_t n);

// digits of chunk_bit_size bits needed to hold any element of Fr
size_t chunks_count(uint8_t chunk_bit_size);

}

#endif
