#ifndef SAVER_PARAMS_H_
#define SAVER_PARAMS_H_

#include "libsaver/curve/G1Element.h"
#include "libsaver/saver/Errors.h"
#include <cstdint>
#include <string>

namespace saver {

// largest radix for which per-digit decryption tables are built
const uint32_t MAX_RADIX = 1u << 16;

/**
 * Scheme configuration: messages are split into `digits` chunks in base
 * `radix`. Power-of-two radixes need one bit decomposition per digit in the
 * circuit, others need two. When radix^digits exceeds the field order the
 * circuit still accepts every digit vector, and decrypt() refuses those whose
 * value is not a field element.
 */
struct Params{
    uint32_t radix;
    uint32_t digits;
    CurveType curve;

    Params(uint32_t radix_, uint32_t digits_, CurveType curve_ = CurveType::BLS12_381) :
            radix(radix_), digits(digits_), curve(curve_)
    {
        if (radix < 2 || radix > MAX_RADIX){
            throw RangeError("radix must lie in [2, " + std::to_string(MAX_RADIX) + "]");
        }
        if (digits == 0){
            throw RangeError("digit count must be positive");
        }
    }

    bool radix_is_power_of_two() const{
        return (radix & (radix - 1)) == 0;
    }

    // bits needed for the largest digit, radix - 1
    uint32_t digit_bits() const{
        uint32_t bits = 0;
        for (uint32_t v = radix - 1; v != 0; v >>= 1){
            bits++;
        }
        return bits;
    }
};

}

#endif
