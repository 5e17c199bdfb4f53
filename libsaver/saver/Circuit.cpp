#include "libsaver/saver/Circuit.h"
#include "libsaver/saver/Errors.h"
#include <string>

namespace saver {

namespace {

Fr power_of_two(uint32_t j){
    Fr res(1), two(2);
    for (uint32_t i = 0; i < j; i++){
        res *= two;
    }
    return res;
}

Fr from_u64(uint64_t v){
    Fr res;
    res.setStr(std::to_string(v), 10);
    return res;
}

}

SaverCircuit::SaverCircuit(const Params& params_) :
        params(params_)
{
    synthesize();
}

void SaverCircuit::synthesize(){
    size_t n = params.digits;
    uint32_t k = params.digit_bits();
    bool upper_bound = !params.radix_is_power_of_two();

    inputs.resize(n);
    for (size_t i = 0; i < n; i++){
        inputs[i] = cs.alloc_input();
    }
    low_bits.assign(n, std::vector<size_t>());
    high_bits.assign(n, std::vector<size_t>());

    Fr one(1), minus_one;
    Fr::neg(minus_one, one);
    Fr top = from_u64(params.radix - 1);

    for (size_t i = 0; i < n; i++){
        // x_i - sum 2^j bit_j = 0
        LinearCombination low;
        low.push_back(std::make_pair(inputs[i], one));
        // (b - 1 - x_i) - sum 2^j bit_j = 0
        LinearCombination high;
        high.push_back(std::make_pair(ConstraintSystem::ONE, top));
        high.push_back(std::make_pair(inputs[i], minus_one));

        for (int pass = 0; pass < (upper_bound ? 2 : 1); pass++){
            std::vector<size_t>& bits = pass == 0 ? low_bits[i] : high_bits[i];
            LinearCombination& packing = pass == 0 ? low : high;
            for (uint32_t j = 0; j < k; j++){
                size_t bit = cs.alloc_aux();
                bits.push_back(bit);
                // bit * (bit - 1) = 0
                LinearCombination a, b, c;
                a.push_back(std::make_pair(bit, one));
                b.push_back(std::make_pair(bit, one));
                b.push_back(std::make_pair(ConstraintSystem::ONE, minus_one));
                cs.enforce(a, b, c);

                Fr coeff;
                Fr::neg(coeff, power_of_two(j));
                packing.push_back(std::make_pair(bit, coeff));
            }
            LinearCombination unit, zero;
            unit.push_back(std::make_pair(ConstraintSystem::ONE, one));
            cs.enforce(packing, unit, zero);
        }
    }
}

std::vector<Fr> SaverCircuit::assign(const Decomposition& decomposition) const{
    if (decomposition.size() != params.digits || decomposition.radix() != params.radix){
        throw RangeError("decomposition has " + std::to_string(decomposition.size()) + " digits of radix "
            + std::to_string(decomposition.radix()) + ", circuit expects " + std::to_string(params.digits)
            + " of radix " + std::to_string(params.radix));
    }
    std::vector<Fr> z(cs.num_variables());
    for (size_t v = 0; v < z.size(); v++){
        z[v].clear();
    }
    z[ConstraintSystem::ONE] = Fr(1);

    for (size_t i = 0; i < params.digits; i++){
        uint64_t x = decomposition[i];
        z[inputs[i]] = from_u64(x);
        for (size_t j = 0; j < low_bits[i].size(); j++){
            z[low_bits[i][j]] = Fr(static_cast<int>((x >> j) & 1));
        }
        uint64_t rest = params.radix - 1 - x;
        for (size_t j = 0; j < high_bits[i].size(); j++){
            z[high_bits[i][j]] = Fr(static_cast<int>((rest >> j) & 1));
        }
    }
    return z;
}

}
