#ifndef SAVER_CIRCUIT_H_
#define SAVER_CIRCUIT_H_

#include "libsaver/saver/Decompose.h"
#include "libsaver/saver/Params.h"
#include "libsaver/zk/ConstraintSystem.h"
#include <vector>

namespace saver {

/**
 * Range circuit over the digits of one message. The n digits are the public
 * inputs; each is bound to [0, radix) by a bit decomposition, plus a second
 * decomposition of radix-1-digit when the radix is not a power of two.
 * Encryption and the phi consistency are not part of the circuit: the key
 * structure moves them into the verification equation.
 */
class SaverCircuit{
    Params params;
    ConstraintSystem cs;
    std::vector<size_t> inputs;
    // per digit, the bits of the digit then the bits of radix-1-digit
    std::vector<std::vector<size_t>> low_bits;
    std::vector<std::vector<size_t>> high_bits;

    void synthesize();

    public:
    explicit SaverCircuit(const Params& params_);

    const Params& get_params() const { return params; }
    const ConstraintSystem& constraint_system() const { return cs; }

    // full assignment (ONE, digits, bits); throws RangeError on a foreign decomposition
    std::vector<Fr> assign(const Decomposition& decomposition) const;

    std::vector<Fr> public_inputs(const Decomposition& decomposition) const{
        return decomposition.to_scalars();
    }
};

}

#endif
