#include "libsaver/zk/ConstraintSystem.h"
#include <stdexcept>

namespace saver {

size_t ConstraintSystem::alloc_input(){
    if (num_aux_ != 0){
        throw std::logic_error("ConstraintSystem: inputs must be allocated before aux variables");
    }
    num_inputs_++;
    return num_inputs_;
}

size_t ConstraintSystem::alloc_aux(){
    num_aux_++;
    return num_inputs_ + num_aux_;
}

void ConstraintSystem::enforce(const LinearCombination& a, const LinearCombination& b, const LinearCombination& c){
    size_t n = num_variables();
    const LinearCombination* lcs[3] = {&a, &b, &c};
    for (int k = 0; k < 3; k++){
        for (size_t i = 0; i < lcs[k]->size(); i++){
            if ((*lcs[k])[i].first >= n){
                throw std::out_of_range("ConstraintSystem: unknown variable in constraint");
            }
        }
    }
    Constraint con;
    con.a = a;
    con.b = b;
    con.c = c;
    constraints_.push_back(con);
}

Fr ConstraintSystem::evaluate(const LinearCombination& lc, const std::vector<Fr>& assignment){
    Fr acc;
    acc.clear();
    for (size_t i = 0; i < lc.size(); i++){
        acc += lc[i].second * assignment[lc[i].first];
    }
    return acc;
}

bool ConstraintSystem::is_satisfied(const std::vector<Fr>& assignment, size_t* failing) const{
    if (assignment.size() != num_variables() || !assignment[ONE].isOne()){
        if (failing) *failing = 0;
        return false;
    }
    for (size_t j = 0; j < constraints_.size(); j++){
        const Constraint& con = constraints_[j];
        if (evaluate(con.a, assignment) * evaluate(con.b, assignment) != evaluate(con.c, assignment)){
            if (failing) *failing = j;
            return false;
        }
    }
    return true;
}

}
