#ifndef SAVER_ZK_GROTH16_H_
#define SAVER_ZK_GROTH16_H_

#include "libsaver/curve/G1Element.h"
#include "libsaver/curve/G2Element.h"
#include "libsaver/curve/Random.h"
#include "libsaver/zk/ConstraintSystem.h"
#include <emp-tool/utils/ThreadPool.h>
#include <sstream>
#include <string>
#include <vector>

namespace saver {

class Groth16Proof{
    public:
    G1Element A;
    G2Element B;
    G1Element C;

    static size_t length() { return 2 * G1Element::length() + G2Element::length(); }

    // A || B || C, compressed
    std::string to_bytes() const;
    // false unless exactly length() bytes of valid subgroup points
    bool from_bytes(const std::string& bytes);

    void pack(std::stringstream& os) const;
    void unpack(std::stringstream& os);

    bool operator==(const Groth16Proof& other) const{
        return A == other.A && B == other.B && C == other.C;
    }
};

/**
 * gamma_abc_g1[0] is the constant term, gamma_abc_g1[i] the base of public
 * input i. gamma_g1 and delta_g1 are not needed by plain Groth16 but are
 * published so that the input term can be moved into C.
 */
class Groth16VerifyingKey{
    public:
    G1Element alpha_g1;
    G2Element beta_g2;
    G2Element gamma_g2;
    G2Element delta_g2;
    std::vector<G1Element> gamma_abc_g1;
    G1Element gamma_g1;
    G1Element delta_g1;

    size_t num_inputs() const { return gamma_abc_g1.empty() ? 0 : gamma_abc_g1.size() - 1; }
};

class Groth16ProvingKey{
    public:
    Groth16VerifyingKey vk;
    G1Element beta_g1;
    // indexed by variable, ONE and inputs included
    std::vector<G1Element> a_query;
    std::vector<G1Element> b_g1_query;
    std::vector<G2Element> b_g2_query;
    // tau^i * Z(tau) / delta, i = 0 .. N-2
    std::vector<G1Element> h_query;
    // (beta*a_j + alpha*b_j + c_j) / delta for the aux variables
    std::vector<G1Element> l_query;
    size_t domain_size;

    Groth16ProvingKey() : domain_size(0) {}
};

/**
 * Zero-knowledge proof system the encryption circuit is proven with.
 * Only the public-input accumulator is exposed besides prove and verify,
 * which is what allows the ciphertext to replace the inputs. Keys and
 * proofs are Groth16's: an implementation must share its key layout.
 */
class ProofBackend{
    public:
    virtual ~ProofBackend() {}

    virtual Groth16ProvingKey setup(const ConstraintSystem& cs, RandomSource& rng) = 0;

    // throws EncodingError when the assignment does not satisfy cs
    virtual Groth16Proof prove(const Groth16ProvingKey& pk, const ConstraintSystem& cs,
        const std::vector<Fr>& assignment, RandomSource& rng) = 0;

    // gamma_abc[0] + sum x_i gamma_abc[i]; throws EncodingError on a length mismatch
    virtual G1Element prepare_inputs(const Groth16VerifyingKey& vk, const std::vector<Fr>& public_inputs) = 0;

    // e(A, B) == e(alpha, beta) e(prepared, gamma) e(C, delta)
    virtual bool verify_prepared(const Groth16VerifyingKey& vk, const G1Element& prepared, const Groth16Proof& proof) = 0;

    bool verify(const Groth16VerifyingKey& vk, const std::vector<Fr>& public_inputs, const Groth16Proof& proof){
        return verify_prepared(vk, prepare_inputs(vk, public_inputs), proof);
    }
};

class Groth16 : public ProofBackend{
    emp::ThreadPool* pool;

    public:
    explicit Groth16(emp::ThreadPool* pool_ = nullptr) : pool(pool_) {}

    Groth16ProvingKey setup(const ConstraintSystem& cs, RandomSource& rng) override;
    Groth16Proof prove(const Groth16ProvingKey& pk, const ConstraintSystem& cs,
        const std::vector<Fr>& assignment, RandomSource& rng) override;
    G1Element prepare_inputs(const Groth16VerifyingKey& vk, const std::vector<Fr>& public_inputs) override;
    bool verify_prepared(const Groth16VerifyingKey& vk, const G1Element& prepared, const Groth16Proof& proof) override;

    // coefficients of h(X) = (a(X) b(X) - c(X)) / Z(X), N-1 of them
    std::vector<Fr> witness_map(const ConstraintSystem& cs, const std::vector<Fr>& assignment, size_t domain_size) const;
};

}

#endif
