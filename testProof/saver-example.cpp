#include "libsaver/saver.h"
#include <chrono>
#include <cstdlib>
using namespace std;
using namespace saver;

// end to end: setup, encrypt, verify, decrypt
int main(int argc, char** argv){
    uint32_t radix = 16;
    uint32_t digits = 8;
    int threads = 4;
    if (argc > 1) radix = atoi(argv[1]);
    if (argc > 2) digits = atoi(argv[2]);
    if (argc > 3) threads = atoi(argv[3]);

    emp::ThreadPool pool(threads);
    Params params(radix, digits);
    SAVER scheme(params, &pool, true);

    auto start = std::chrono::high_resolution_clock::now();
    SetupResult keys = scheme.setup();
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;
    std::cout << "Time taken for setup: " << elapsed.count() << " seconds" << std::endl;

    SystemRandom rng;
    mpz_class cap = capacity(radix, digits);
    // a message below radix^digits, or any field element when that is larger
    Fr m = rng.next();
    mpz_class m_mpz;
    m.getMpz(m_mpz);
    std::string p;
    Fr::getModulo(p);
    mpz_class p_mpz;
    p_mpz.setStr(p, 10);
    if (cap < p_mpz){
        m_mpz = m_mpz % cap;
        m.setMpz(m_mpz);
    }

    start = std::chrono::high_resolution_clock::now();
    EncryptionResult enc = scheme.encrypt(m, keys.ek, keys.pk);
    end = std::chrono::high_resolution_clock::now();
    elapsed = end - start;
    std::cout << "Time taken for encrypt: " << elapsed.count() << " seconds" << std::endl;
    std::cout << "ciphertext: " << enc.ciphertext.to_bytes().size() << " bytes, proof: "
              << enc.proof.to_bytes().size() << " bytes" << std::endl;

    start = std::chrono::high_resolution_clock::now();
    bool ok = scheme.verify(enc.ciphertext, enc.commitment.get_point(), enc.proof, keys.vk);
    end = std::chrono::high_resolution_clock::now();
    elapsed = end - start;
    std::cout << "Time taken for verify: " << elapsed.count() << " seconds" << std::endl;
    if (!ok){
        std::cout << "invalid proof" << std::endl;
        return 1;
    }
    std::cout << "valid proof" << std::endl;

    start = std::chrono::high_resolution_clock::now();
    Fr dec = scheme.decrypt(enc.ciphertext, keys.dk);
    end = std::chrono::high_resolution_clock::now();
    elapsed = end - start;
    std::cout << "Time taken for decrypt: " << elapsed.count() << " seconds" << std::endl;

    if (dec != m){
        std::cout << "decryption mismatch" << std::endl;
        return 1;
    }
    std::cout << "decryption ok" << std::endl;
    return 0;
}
