#include "libsaver/saver/Keys.h"
#include "libsaver/saver/Errors.h"
#include "libsaver/zk/Parallel.h"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace saver {

namespace {

bool write_file(const std::string& filepath, const std::stringstream& ss){
    std::ofstream file(filepath, std::ios::binary);
    if (!file.is_open()){
        std::cerr << "Unable to open file " << filepath << std::endl;
        return false;
    }
    file << ss.str();
    return file.good();
}

bool read_file(const std::string& filepath, std::stringstream& ss){
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()){
        std::cerr << "Unable to open file " << filepath << std::endl;
        return false;
    }
    ss << file.rdbuf();
    return true;
}

bool fully_read(std::stringstream& ss){
    return ss.peek() == std::char_traits<char>::eof();
}

}

void EncryptionKey::check() const{
    size_t n = X.size();
    if (n == 0){
        throw GeneratorMismatchError("encryption key has no digits");
    }
    if (G_in.size() != n || Y.size() != n || Z.size() != n + 1){
        throw GeneratorMismatchError("encryption key vectors disagree in length");
    }
}

bool EncryptionKey::matches(const Groth16VerifyingKey& vk) const{
    if (vk.gamma_abc_g1.size() != G_in.size() + 1){
        return false;
    }
    if (X_0 != vk.delta_g1 || G_0 != vk.gamma_abc_g1[0]){
        return false;
    }
    for (size_t i = 0; i < G_in.size(); i++){
        if (G_in[i] != vk.gamma_abc_g1[i + 1]){
            return false;
        }
    }
    return true;
}

void EncryptionKey::pack(std::stringstream& os) const{
    X_0.pack(os);
    for (auto& x : X) x.pack(os);
    G_0.pack(os);
    for (auto& g : G_in) g.pack(os);
    for (auto& y : Y) y.pack(os);
    for (auto& z : Z) z.pack(os);
    P_1.pack(os);
    P_2.pack(os);
}

void EncryptionKey::unpack(std::stringstream& os, size_t n){
    X.resize(n);
    G_in.resize(n);
    Y.resize(n);
    Z.resize(n + 1);
    X_0.unpack(os);
    for (auto& x : X) x.unpack(os);
    G_0.unpack(os);
    for (auto& g : G_in) g.unpack(os);
    for (auto& y : Y) y.unpack(os);
    for (auto& z : Z) z.unpack(os);
    P_1.unpack(os);
    P_2.unpack(os);
}

bool EncryptionKey::SerializeToFile(const std::string& filepath, const EncryptionKey& ek){
    std::stringstream ss;
    ek.pack(ss);
    return write_file(filepath, ss);
}

bool EncryptionKey::DeserializFromFile(const std::string& filepath, EncryptionKey& ek, size_t n){
    std::stringstream ss;
    if (!read_file(filepath, ss)){
        return false;
    }
    EncryptionKey tmp;
    try {
        tmp.unpack(ss, n);
    } catch (const std::runtime_error& e) {
        std::cerr << "Malformed encryption key in " << filepath << ": " << e.what() << std::endl;
        return false;
    }
    if (!fully_read(ss)){
        std::cerr << "Trailing bytes after encryption key in " << filepath << std::endl;
        return false;
    }
    ek = tmp;
    return true;
}

std::shared_ptr<const DecryptionTable> DecryptionTable::build(const std::vector<G1Element>& G_in,
        const G2Element& V_2, uint32_t radix, emp::ThreadPool* pool){
    std::shared_ptr<DecryptionTable> res = std::make_shared<DecryptionTable>();
    res->radix = radix;
    res->tables.resize(G_in.size());
    parallel_for(pool, G_in.size(), [&](size_t i) {
        GT base = pair_of(G_in[i], V_2);
        GT cur;
        cur.setOne();
        std::unordered_map<std::string, uint32_t>& t = res->tables[i];
        t.reserve(radix);
        for (uint32_t j = 0; j < radix; j++){
            t[key_of(cur)] = j;
            GT::mul(cur, cur, base);
        }
    });
    return res;
}

bool DecryptionTable::lookup(size_t i, const GT& v, uint64_t& digit) const{
    if (i >= tables.size()){
        return false;
    }
    auto it = tables[i].find(key_of(v));
    if (it == tables[i].end()){
        return false;
    }
    digit = it->second;
    return true;
}

void DecryptionKey::pack(std::stringstream& os) const{
    V_2.pack(os);
    for (auto& v : V_1) v.pack(os);
}

void DecryptionKey::unpack(std::stringstream& os, size_t n){
    V_1.resize(n);
    V_2.unpack(os);
    for (auto& v : V_1) v.unpack(os);
    table.reset();
}

void DecryptionKey::build_table(const EncryptionKey& ek, uint32_t radix, emp::ThreadPool* pool){
    if (ek.G_in.size() != V_1.size()){
        throw GeneratorMismatchError("decryption key and encryption key disagree in digit count");
    }
    table = DecryptionTable::build(ek.G_in, V_2, radix, pool);
}

bool DecryptionKey::SerializeToFile(const std::string& filepath, const DecryptionKey& dk){
    std::stringstream ss;
    dk.pack(ss);
    return write_file(filepath, ss);
}

bool DecryptionKey::DeserializFromFile(const std::string& filepath, DecryptionKey& dk, size_t n){
    std::stringstream ss;
    if (!read_file(filepath, ss)){
        return false;
    }
    DecryptionKey tmp;
    try {
        tmp.unpack(ss, n);
    } catch (const std::runtime_error& e) {
        std::cerr << "Malformed decryption key in " << filepath << ": " << e.what() << std::endl;
        return false;
    }
    if (!fully_read(ss)){
        std::cerr << "Trailing bytes after decryption key in " << filepath << std::endl;
        return false;
    }
    dk = tmp;
    return true;
}

void KeyGen(EncryptionKey& ek, DecryptionKey& dk, const Groth16VerifyingKey& vk, uint32_t radix,
        RandomSource& rng, emp::ThreadPool* pool){
    size_t n = vk.num_inputs();
    if (n == 0){
        throw GeneratorMismatchError("verifying key has no public inputs");
    }
    std::vector<Fr> s(n), t(n + 1);
    for (size_t i = 0; i < n; i++){
        s[i] = rng.next_nonzero();
    }
    for (size_t i = 0; i <= n; i++){
        t[i] = rng.next_nonzero();
    }
    Fr v = rng.next_nonzero();

    G2Element H = G2Element::generator();

    ek.X_0 = vk.delta_g1;
    ek.G_0 = vk.gamma_abc_g1[0];
    ek.X.resize(n);
    ek.G_in.resize(n);
    ek.Y.resize(n);
    ek.Z.resize(n + 1);
    dk.V_1.resize(n);

    ek.Z[0] = H * t[0];
    parallel_for(pool, n, [&](size_t i) {
        ek.X[i] = vk.delta_g1 * s[i];
        ek.G_in[i] = vk.gamma_abc_g1[i + 1];
        ek.Y[i] = ek.G_in[i] * t[i + 1];
        ek.Z[i + 1] = H * t[i + 1];
        dk.V_1[i] = H * (s[i] * v);
    });

    Fr sum_s(1), p2 = t[0];
    for (size_t i = 0; i < n; i++){
        sum_s += s[i];
        p2 += s[i] * t[i + 1];
    }
    ek.P_1 = (vk.gamma_g1 * sum_s).negate();
    ek.P_2 = vk.delta_g1 * p2;

    dk.V_2 = H * v;
    dk.build_table(ek, radix, pool);
}

}
