#ifndef SAVER_ZK_CONSTRAINTSYSTEM_H_
#define SAVER_ZK_CONSTRAINTSYSTEM_H_

#include <mcl/bls12_381.hpp>
#include <utility>
#include <vector>

using namespace mcl::bn;

namespace saver {

// (variable index, coefficient) pairs
typedef std::vector<std::pair<size_t, Fr>> LinearCombination;

struct Constraint{
    LinearCombination a;
    LinearCombination b;
    LinearCombination c;
};

/**
 * Rank-1 constraint system <a, z> * <b, z> = <c, z>.
 * Variable 0 is the constant one, then the public inputs, then the private
 * (auxiliary) variables. Inputs have to be allocated before any aux variable.
 */
class ConstraintSystem{
    size_t num_inputs_;
    size_t num_aux_;
    std::vector<Constraint> constraints_;

    public:
    static const size_t ONE = 0;

    ConstraintSystem() : num_inputs_(0), num_aux_(0) {}

    size_t alloc_input();
    size_t alloc_aux();

    void enforce(const LinearCombination& a, const LinearCombination& b, const LinearCombination& c);

    size_t num_inputs() const { return num_inputs_; }
    size_t num_aux() const { return num_aux_; }
    size_t num_variables() const { return 1 + num_inputs_ + num_aux_; }
    size_t num_constraints() const { return constraints_.size(); }
    const std::vector<Constraint>& constraints() const { return constraints_; }

    static Fr evaluate(const LinearCombination& lc, const std::vector<Fr>& assignment);

    // first unsatisfied constraint is reported through `failing` when given
    bool is_satisfied(const std::vector<Fr>& assignment, size_t* failing = nullptr) const;
};

}

#endif
