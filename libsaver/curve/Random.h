#ifndef SAVER_CURVE_RANDOM_H_
#define SAVER_CURVE_RANDOM_H_

#include <mcl/bls12_381.hpp>
#include <emp-tool/utils/prg.h>
#include <mutex>

using namespace mcl::bn;

/**
 * Source of uniformly random scalars. Every protocol step that needs
 * randomness takes one of these, so callers decide where it comes from.
 * An instance must not be shared between threads unless documented safe.
 */
class RandomSource{
    public:
    virtual ~RandomSource() {}

    virtual void sample(Fr& x) = 0;

    Fr next(){
        Fr x;
        sample(x);
        return x;
    }

    // uniform and never zero
    Fr next_nonzero(){
        Fr x;
        do {
            sample(x);
        } while (x.isZero());
        return x;
    }
};

// mcl's CSPRNG; safe to share between threads
class SystemRandom : public RandomSource{
    static std::mutex& lock(){
        static std::mutex m;
        return m;
    }
    public:
    void sample(Fr& x) override{
        std::lock_guard<std::mutex> guard(lock());
        x.setByCSPRNG();
    }
};

// AES-CTR stream from emp-tool, reproducible from a 64-bit seed
class SeededRandom : public RandomSource{
    emp::PRG prg;
    public:
    explicit SeededRandom(uint64_t seed){
        emp::block s = emp::makeBlock(0, seed);
        prg.reseed(&s);
    }

    void sample(Fr& x) override{
        unsigned char buf[64];
        prg.random_data(buf, sizeof(buf));
        x.setHashOf(buf, sizeof(buf));
    }
};

#endif
