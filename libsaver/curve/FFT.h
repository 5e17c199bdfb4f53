#ifndef _FFT
#define _FFT

#include <mcl/bls12_381.hpp>
#include <vector>

using namespace mcl::bn;

/**
 * Radix-2 FFT over the scalar field Fr.
 * @param input coefficients, length n.
 * @param output evaluations at omega^0 .. omega^{n-1}, length n.
 * @param omega primitive n-th root of unity.
 * @param n sequence length, a power of two.
 */
void FFT(const std::vector<Fr>& input,
    std::vector<Fr>& output,
    const Fr& omega,
    size_t n);

// same as FFT, the two top level halves run on separate threads
void FFT_Para(const std::vector<Fr>& input, std::vector<Fr>& output, const Fr &omega, size_t n);

/**
 * Multiplicative subgroup {omega^i} of Fr of power-of-two size, used to
 * turn constraint rows into polynomials (QAP).
 */
class EvaluationDomain{
    size_t size_;
    unsigned log_size_;
    Fr omega_;
    Fr omega_inv_;
    Fr size_inv_;
    // multiplicative generator of Fr*, shifts the domain onto a coset
    Fr coset_gen_;
    Fr coset_gen_inv_;

    public:
    // smallest power-of-two domain holding at least min_size points
    explicit EvaluationDomain(size_t min_size);

    size_t size() const { return size_; }
    const Fr& omega() const { return omega_; }

    void fft(std::vector<Fr>& a) const;
    void ifft(std::vector<Fr>& a) const;
    void coset_fft(std::vector<Fr>& a) const;
    void icoset_fft(std::vector<Fr>& a) const;

    // Z(tau) = tau^N - 1
    Fr vanishing_at(const Fr& tau) const;
    // Z on the coset g*H, constant g^N - 1
    Fr vanishing_on_coset() const;
    // L_j(tau) for every j
    std::vector<Fr> lagrange_at(const Fr& tau) const;

    // two-adicity and multiplicative generator of the initialised curve's Fr
    static unsigned two_adicity();
    static Fr multiplicative_generator();
};

#endif
