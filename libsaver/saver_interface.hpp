#pragma once

#include "libsaver/curve/G1Element.h"
#include "libsaver/curve/G2Element.h"
#include "libsaver/curve/Random.h"
#include "libsaver/saver/Params.h"
#include "libsaver/saver/Errors.h"
#include "libsaver/saver/Decompose.h"
#include "libsaver/saver/Commitment.h"
#include "libsaver/saver/Circuit.h"
#include "libsaver/saver/Keys.h"
#include "libsaver/saver/Ciphertext.h"
#include "libsaver/saver/Encryption.h"
#include "libsaver/saveroffline/Equality_proof.h"
#include "libsaver/saveroffline/Equality_prover.h"
#include "libsaver/saveroffline/Equality_verifier.h"
#include "libsaver/zk/Groth16.h"

#include <emp-tool/utils/ThreadPool.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace saver {

    // tags of the commitment generators of J, nobody knows their discrete logs
    const std::string COMMITMENT_G_TAG = "libsaver commitment G";
    const std::string COMMITMENT_H_TAG = "libsaver commitment H";

    class VerifyingKey{
        public:
            Groth16VerifyingKey snark_vk;
            EncryptionKey ek;
    };

    class SetupResult{
        public:
            Groth16ProvingKey pk;
            VerifyingKey vk;
            EncryptionKey ek;
            DecryptionKey dk;
            GeneratorSet gens;
    };

    class SAVER{
        private:
            emp::ThreadPool* pool;
            bool verbose;
            Groth16 backend;
            std::unique_ptr<SaverCircuit> circuit;

            typedef std::chrono::high_resolution_clock clock;

            void log(const std::string& what, const clock::time_point& start) const{
                if (!verbose){
                    return;
                }
                auto end = clock::now();
                std::cout << "[saver] " << what << ": "
                          << std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count()
                          << " ms" << std::endl;
            }

        public:
            Params params;

            SAVER(const Params& params, emp::ThreadPool* pool = nullptr, bool verbose = false) :
                pool(pool), verbose(verbose), backend(pool), params(params)
            {
                G1Element::init(params.curve);
                circuit.reset(new SaverCircuit(params));
                if (verbose){
                    std::cout << "[saver] " << G1Element::type_string() << ", radix " << params.radix
                              << ", " << params.digits << " digits, "
                              << circuit->constraint_system().num_constraints() << " constraints" << std::endl;
                }
            }

            const SaverCircuit& get_circuit() const { return *circuit; }

            SetupResult setup(RandomSource& rng){
                auto start = clock::now();
                SetupResult res;
                res.pk = backend.setup(circuit->constraint_system(), rng);
                log("groth16 setup", start);

                start = clock::now();
                KeyGen(res.ek, res.dk, res.pk.vk, params.radix, rng, pool);
                log("saver keygen", start);

                res.vk.snark_vk = res.pk.vk;
                res.vk.ek = res.ek;
                res.gens = GeneratorSet::create(res.ek.Y, res.ek.P_2, G1Element::hash_to_point(COMMITMENT_G_TAG),
                    G1Element::hash_to_point(COMMITMENT_H_TAG), params.radix, params.digits);
                return res;
            }

            SetupResult setup(){
                SystemRandom rng;
                return setup(rng);
            }

            EncryptionResult encrypt(const Fr& message, const EncryptionKey& ek, const Groth16ProvingKey& pk, RandomSource& rng){
                auto start = clock::now();
                EncryptionResult res = saver::encrypt(message, *circuit, ek, pk, backend, rng);
                log("encrypt", start);
                return res;
            }

            EncryptionResult encrypt(const Fr& message, const EncryptionKey& ek, const Groth16ProvingKey& pk){
                SystemRandom rng;
                return encrypt(message, ek, pk, rng);
            }

            Fr decrypt(const Ciphertext& ct, const DecryptionKey& dk){
                auto start = clock::now();
                Fr m = saver::decrypt(ct, dk, pool);
                log("decrypt", start);
                return m;
            }

            bool verify(const Ciphertext& ct, const G1Element& phi, const Groth16Proof& proof, const VerifyingKey& vk){
                auto start = clock::now();
                bool ok = verify_encryption(ct, phi, proof, vk.snark_vk, vk.ek, backend);
                log(ok ? "verify (accepted)" : "verify (rejected)", start);
                return ok;
            }

            // J = m G + r' H through the digits of m
            Commitment commit_message(const Fr& message, const Fr& blinding, const GeneratorSet& gens) const{
                return gens.commit_j(decompose(message, params.radix, params.digits), blinding);
            }

            EqualityOpening opening(const Fr& message, const Commitment& phi, const Commitment& J) const{
                EqualityOpening res;
                res.digits = decompose(message, params.radix, params.digits);
                res.phi_blinding = phi.get_blinding();
                res.j_blinding = J.get_blinding();
                return res;
            }

            EqualityProof prove_equal_opening(const G1Element& phi, const G1Element& J, const EqualityOpening& openings,
                    const GeneratorSet& gens, RandomSource& rng){
                EqualityProof proof(gens.digits);
                EqualityProver prover(proof, gens);
                prover.NIZKPoK(phi, J, openings, rng);
                return proof;
            }

            EqualityProof prove_equal_opening(const G1Element& phi, const G1Element& J, const EqualityOpening& openings,
                    const GeneratorSet& gens){
                SystemRandom rng;
                return prove_equal_opening(phi, J, openings, gens, rng);
            }

            bool verify_equal_opening(const G1Element& phi, const G1Element& J, const EqualityProof& proof,
                    const GeneratorSet& gens){
                EqualityProof copy = proof;
                EqualityVerifier verifier(copy, gens);
                try {
                    verifier.NIZKPoK(phi, J);
                } catch (const SaverError&) {
                    throw;
                } catch (const std::runtime_error& e) {
                    if (verbose){
                        std::cout << "[saver] equality proof: " << e.what() << std::endl;
                    }
                    return false;
                }
                return true;
            }
    };
}
