#ifndef SAVER_ENCRYPTION_H_
#define SAVER_ENCRYPTION_H_

#include "libsaver/saver/Ciphertext.h"
#include "libsaver/saver/Circuit.h"
#include "libsaver/saver/Commitment.h"
#include "libsaver/saver/Keys.h"
#include "libsaver/zk/Groth16.h"

namespace saver {

class EncryptionResult{
    public:
    Ciphertext ciphertext;
    // phi, blinded with the encryption randomness
    Commitment commitment;
    Groth16Proof proof;
};

Ciphertext encrypt_digits(const Decomposition& decomposition, const Fr& r, const EncryptionKey& ek);

// C' = C + r P_1
Groth16Proof randomize_proof(const Groth16Proof& proof, const Fr& r, const EncryptionKey& ek);

/**
 * Encrypts m digit-wise with fresh randomness r, commits to the digits as
 * phi = r P_2 + sum m_i Y_i and proves the digits in range.
 * Throws RangeError if m does not fit, GeneratorMismatchError if ek is not
 * for the circuit's digit count.
 */
EncryptionResult encrypt(const Fr& m, const SaverCircuit& circuit, const EncryptionKey& ek,
    const Groth16ProvingKey& pk, ProofBackend& backend, RandomSource& rng);

// e(c_0, Z_0) prod e(c_i, Z_i) == e(phi, H)
bool verify_ciphertext_commitment(const Ciphertext& ct, const G1Element& phi, const EncryptionKey& ek);

/**
 * Both pairing checks. Rejections are returned as false; a key pair that
 * does not belong together throws GeneratorMismatchError.
 */
bool verify_encryption(const Ciphertext& ct, const G1Element& phi, const Groth16Proof& proof,
    const Groth16VerifyingKey& vk, const EncryptionKey& ek, ProofBackend& backend);

// throws DecryptionError for a wrong key or a corrupted ciphertext
std::vector<uint64_t> decrypt_digits(const Ciphertext& ct, const DecryptionKey& dk, emp::ThreadPool* pool = nullptr);
// also throws DecryptionError when the digits' value is not below the field order
Fr decrypt(const Ciphertext& ct, const DecryptionKey& dk, emp::ThreadPool* pool = nullptr);

}

#endif
