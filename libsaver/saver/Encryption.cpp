#include "libsaver/saver/Encryption.h"
#include "libsaver/saver/Errors.h"
#include "libsaver/zk/Parallel.h"
#include <string>

namespace saver {

Ciphertext encrypt_digits(const Decomposition& decomposition, const Fr& r, const EncryptionKey& ek){
    size_t n = ek.digits();
    if (decomposition.size() != n){
        throw GeneratorMismatchError("encryption key holds " + std::to_string(n) + " digits, message has "
            + std::to_string(decomposition.size()));
    }
    std::vector<Fr> m = decomposition.to_scalars();
    std::vector<G1Element> c(n);
    for (size_t i = 0; i < n; i++){
        c[i] = ek.X[i] * r + ek.G_in[i] * m[i];
    }
    return Ciphertext(ek.X_0 * r, c);
}

Groth16Proof randomize_proof(const Groth16Proof& proof, const Fr& r, const EncryptionKey& ek){
    Groth16Proof res = proof;
    res.C += ek.P_1 * r;
    return res;
}

EncryptionResult encrypt(const Fr& m, const SaverCircuit& circuit, const EncryptionKey& ek,
        const Groth16ProvingKey& pk, ProofBackend& backend, RandomSource& rng){
    const Params& params = circuit.get_params();
    ek.check();
    if (ek.digits() != params.digits){
        throw GeneratorMismatchError("encryption key is for " + std::to_string(ek.digits())
            + " digits, circuit for " + std::to_string(params.digits));
    }
    Decomposition d = decompose(m, params.radix, params.digits);

    Fr r = rng.next_nonzero();
    EncryptionResult res;
    res.ciphertext = encrypt_digits(d, r, ek);
    res.commitment = commit(d, r, ek.Y, ek.P_2);

    std::vector<Fr> assignment = circuit.assign(d);
    Groth16Proof proof = backend.prove(pk, circuit.constraint_system(), assignment, rng);
    res.proof = randomize_proof(proof, r, ek);
    return res;
}

bool verify_ciphertext_commitment(const Ciphertext& ct, const G1Element& phi, const EncryptionKey& ek){
    size_t n = ek.digits();
    if (ct.digits() != n || ek.Z.size() != n + 1){
        return false;
    }
    std::vector<G1> ps(n + 2);
    std::vector<G2> qs(n + 2);
    ps[0] = ct.get_c0().getPoint();
    qs[0] = ek.Z[0].getPoint();
    for (size_t i = 0; i < n; i++){
        ps[i + 1] = ct.get_c()[i].getPoint();
        qs[i + 1] = ek.Z[i + 1].getPoint();
    }
    ps[n + 1] = phi.negate().getPoint();
    qs[n + 1] = G2Element::generator().getPoint();

    GT f;
    millerLoopVec(f, ps.data(), qs.data(), n + 2);
    finalExp(f, f);
    return f.isOne();
}

bool verify_encryption(const Ciphertext& ct, const G1Element& phi, const Groth16Proof& proof,
        const Groth16VerifyingKey& vk, const EncryptionKey& ek, ProofBackend& backend){
    ek.check();
    if (!ek.matches(vk)){
        throw GeneratorMismatchError("encryption key was not derived from this verifying key");
    }
    if (ct.digits() != ek.digits()){
        return false;
    }
    // the ciphertext stands in for the public input term
    G1Element prepared = ek.G_0 + ct.get_c0();
    for (size_t i = 0; i < ct.digits(); i++){
        prepared += ct.get_c()[i];
    }
    if (!backend.verify_prepared(vk, prepared, proof)){
        return false;
    }
    return verify_ciphertext_commitment(ct, phi, ek);
}

std::vector<uint64_t> decrypt_digits(const Ciphertext& ct, const DecryptionKey& dk, emp::ThreadPool* pool){
    if (!dk.table){
        throw DecryptionError("decryption table has not been built");
    }
    size_t n = dk.digits();
    if (ct.digits() != n || dk.table->digits() != n){
        throw DecryptionError("ciphertext does not match the decryption key");
    }
    G1 minus_c0 = ct.get_c0().negate().getPoint();
    std::vector<uint64_t> digits(n, 0);
    std::vector<char> found(n, 0);
    parallel_for(pool, n, [&](size_t i) {
        // e(c_i, V_2) e(-c_0, V_1[i]) = e(G_in_i, V_2)^{m_i}
        G1 ps[2] = {ct.get_c()[i].getPoint(), minus_c0};
        G2 qs[2] = {dk.V_2.getPoint(), dk.V_1[i].getPoint()};
        GT f;
        millerLoopVec(f, ps, qs, 2);
        finalExp(f, f);
        found[i] = dk.table->lookup(i, f, digits[i]) ? 1 : 0;
    });
    for (size_t i = 0; i < n; i++){
        if (!found[i]){
            throw DecryptionError("ciphertext does not decrypt under this key");
        }
    }
    return digits;
}

Fr decrypt(const Ciphertext& ct, const DecryptionKey& dk, emp::ThreadPool* pool){
    std::vector<uint64_t> digits = decrypt_digits(ct, dk, pool);
    mpz_class m = reconstruct_integer(digits, dk.table->get_radix());
    std::string p;
    Fr::getModulo(p);
    mpz_class p_mpz;
    p_mpz.setStr(p, 10);
    // radix^n may exceed the field order; such digits name no field element
    if (m >= p_mpz){
        throw DecryptionError("decrypted digits exceed the scalar field order");
    }
    Fr res;
    res.setMpz(m);
    return res;
}

}
