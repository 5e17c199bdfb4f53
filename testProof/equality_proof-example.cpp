#include "libsaver/saver.h"
#include <chrono>
using namespace std;
using namespace saver;

int main(){
    Params params(16, 16);
    SAVER scheme(params);
    SetupResult keys = scheme.setup();

    SystemRandom rng;
    Fr m;
    m.setStr("123456789", 10);
    EncryptionResult enc = scheme.encrypt(m, keys.ek, keys.pk);

    // J = m G + r' H
    Commitment J = scheme.commit_message(m, rng.next(), keys.gens);
    EqualityOpening opening = scheme.opening(m, enc.commitment, J);
    std::cout << "finish statement gen" << std::endl;

    std::cout << "prove start" << std::endl;
    EqualityProof proof(keys.gens.digits);
    EqualityProver prover(proof, keys.gens);
    auto start = std::chrono::high_resolution_clock::now();
    prover.NIZKPoK(enc.commitment.get_point(), J.get_point(), opening, rng);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;
    std::cout << "Time taken for prover.NIZKPoK: " << elapsed.count() << " seconds" << std::endl;
    std::cout << "prove finish, " << proof.to_bytes().size() << " bytes" << std::endl;

    std::cout << "verify start" << std::endl;
    EqualityProof received(keys.gens.digits);
    if (!received.from_bytes(proof.to_bytes())){
        std::cout << "malformed proof" << std::endl;
        return 1;
    }
    EqualityVerifier verifier(received, keys.gens);
    start = std::chrono::high_resolution_clock::now();
    verifier.NIZKPoK(enc.commitment.get_point(), J.get_point());
    end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed2 = end - start;
    std::cout << "Time taken for verifier.NIZKPoK: " << elapsed2.count() << " seconds" << std::endl;
    std::cout << "valid proof" << std::endl;
}
