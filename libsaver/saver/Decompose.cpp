#include "libsaver/saver/Decompose.h"
#include "libsaver/saver/Errors.h"
#include <string>

namespace saver {

Decomposition::Decomposition(const std::vector<uint64_t>& digits, uint32_t radix) :
        digits_(digits), radix_(radix)
{
    if (radix_ < 2){
        throw RangeError("radix must be at least 2");
    }
    for (size_t i = 0; i < digits_.size(); i++){
        if (digits_[i] >= radix_){
            throw RangeError("digit " + std::to_string(i) + " is not below the radix");
        }
    }
}

std::vector<Fr> Decomposition::to_scalars() const{
    std::vector<Fr> res(digits_.size());
    for (size_t i = 0; i < digits_.size(); i++){
        res[i].setStr(std::to_string(digits_[i]), 10);
    }
    return res;
}

Fr Decomposition::reconstruct() const{
    return saver::reconstruct(digits_, radix_);
}

mpz_class capacity(uint32_t radix, size_t n){
    mpz_class b, res;
    b.setStr(std::to_string(radix), 10);
    res = mpz_class(1);
    for (size_t i = 0; i < n; i++){
        res *= b;
    }
    return res;
}

mpz_class max_message(uint32_t radix, size_t n){
    return capacity(radix, n) - mpz_class(1);
}

Decomposition decompose(const Fr& m, uint32_t radix, size_t n){
    if (radix < 2){
        throw RangeError("radix must be at least 2");
    }
    if (n == 0){
        throw RangeError("digit count must be positive");
    }
    mpz_class x;
    m.getMpz(x);
    if (x >= capacity(radix, n)){
        throw RangeError("message does not fit in " + std::to_string(n) + " digits of radix " + std::to_string(radix));
    }

    mpz_class b, rem;
    b.setStr(std::to_string(radix), 10);
    // least significant digit goes last
    std::vector<uint64_t> digits(n, 0);
    for (size_t i = n; i-- > 0;){
        rem = x % b;
        x /= b;
        digits[i] = std::stoull(rem.getStr(10));
    }
    return Decomposition(digits, radix);
}

Fr reconstruct(const std::vector<uint64_t>& digits, uint32_t radix){
    if (radix < 2){
        throw RangeError("radix must be at least 2");
    }
    Fr b, d, acc;
    b.setStr(std::to_string(radix), 10);
    acc.clear();
    for (size_t i = 0; i < digits.size(); i++){
        if (digits[i] >= radix){
            throw RangeError("digit " + std::to_string(i) + " is not below the radix");
        }
        d.setStr(std::to_string(digits[i]), 10);
        acc = acc * b + d;
    }
    return acc;
}

mpz_class reconstruct_integer(const std::vector<uint64_t>& digits, uint32_t radix){
    if (radix < 2){
        throw RangeError("radix must be at least 2");
    }
    mpz_class b, d, acc;
    b.setStr(std::to_string(radix), 10);
    acc = mpz_class(0);
    for (size_t i = 0; i < digits.size(); i++){
        if (digits[i] >= radix){
            throw RangeError("digit " + std::to_string(i) + " is not below the radix");
        }
        d.setStr(std::to_string(digits[i]), 10);
        acc = acc * b + d;
    }
    return acc;
}

size_t chunks_count(uint8_t chunk_bit_size){
    if (chunk_bit_size == 0){
        throw RangeError("chunk size must be positive");
    }
    size_t bits = Fr::getBitSize();
    return (bits + chunk_bit_size - 1) / chunk_bit_size;
}

}
