#ifndef SAVER_KEYS_H_
#define SAVER_KEYS_H_

#include "libsaver/curve/G1Element.h"
#include "libsaver/curve/G2Element.h"
#include "libsaver/curve/Random.h"
#include "libsaver/zk/Groth16.h"
#include <emp-tool/utils/ThreadPool.h>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace saver {

/**
 * Public encryption key for n digits. G_0 and G_in are copies of the
 * Groth16 input bases, X_0 = delta_g1 and X_i = s_i X_0.
 */
class EncryptionKey{
    public:
    G1Element X_0;
    std::vector<G1Element> X;
    G1Element G_0;
    std::vector<G1Element> G_in;
    // Y_i = t_i G_in_i
    std::vector<G1Element> Y;
    // Z_0 .. Z_n in G2, Z_i = t_i H
    std::vector<G2Element> Z;
    // -(1 + sum s_i) gamma_g1, moves the input term into C
    G1Element P_1;
    // (t_0 + sum s_i t_i) delta_g1, blinding base of phi
    G1Element P_2;

    size_t digits() const { return X.size(); }

    // throws GeneratorMismatchError when the vectors disagree in length
    void check() const;
    // ek was derived from this verifying key
    bool matches(const Groth16VerifyingKey& vk) const;

    void pack(std::stringstream& os) const;
    void unpack(std::stringstream& os, size_t n);

    static bool SerializeToFile(const std::string& filepath, const EncryptionKey& ek);
    // false for a missing, truncated or corrupt file; ek is then left as it was
    static bool DeserializFromFile(const std::string& filepath, EncryptionKey& ek, size_t n);
};

/**
 * e(G_in_i, V_2)^j for j in [0, radix), per digit, keyed by the hex form of
 * the GT element.
 */
class DecryptionTable{
    uint32_t radix;
    std::vector<std::unordered_map<std::string, uint32_t>> tables;

    public:
    DecryptionTable() : radix(0) {}

    static std::shared_ptr<const DecryptionTable> build(const std::vector<G1Element>& G_in,
        const G2Element& V_2, uint32_t radix, emp::ThreadPool* pool = nullptr);

    static std::string key_of(const GT& x) { return x.getStr(16); }

    uint32_t get_radix() const { return radix; }
    size_t digits() const { return tables.size(); }

    // false when v is not a power below the radix
    bool lookup(size_t i, const GT& v, uint64_t& digit) const;
};

class DecryptionKey{
    public:
    // v H
    G2Element V_2;
    // s_i v H
    std::vector<G2Element> V_1;
    std::shared_ptr<const DecryptionTable> table;

    size_t digits() const { return V_1.size(); }

    void pack(std::stringstream& os) const;
    // the table is not serialized; rebuild it with the matching encryption key
    void unpack(std::stringstream& os, size_t n);
    void build_table(const EncryptionKey& ek, uint32_t radix, emp::ThreadPool* pool = nullptr);

    static bool SerializeToFile(const std::string& filepath, const DecryptionKey& dk);
    static bool DeserializFromFile(const std::string& filepath, DecryptionKey& dk, size_t n);
};

/**
 * Derives the SAVER keys on top of a Groth16 verifying key whose public
 * inputs are the n digits. Builds the decryption table for `radix`.
 */
void KeyGen(EncryptionKey& ek, DecryptionKey& dk, const Groth16VerifyingKey& vk, uint32_t radix,
    RandomSource& rng, emp::ThreadPool* pool = nullptr);

}

#endif
