#include "libsaver/curve/FFT.h"
#include "libsaver/curve/G1Element.h"
#include <future>
#include <stdexcept>
#include <string>

using namespace std;
using namespace mcl::bn;

void FFT_recursive(const vector<Fr>& a, vector<Fr>& A, const Fr &omega, size_t n) {
    if (n == 1) {
        A[0] = a[0];
        return;
    }
    size_t m = n / 2;
    vector<Fr> a_even(m), a_odd(m);
    for (size_t i = 0; i < m; i++) {
        a_even[i] = a[2 * i];
        a_odd[i] = a[2 * i + 1];
    }
    vector<Fr> A_even(m), A_odd(m);
    Fr omegaSquared = omega * omega;
    FFT_recursive(a_even, A_even, omegaSquared, m);
    FFT_recursive(a_odd, A_odd, omegaSquared, m);
    Fr w(1);
    for (size_t j = 0; j < m; j++) {
        Fr t = A_odd[j] * w;
        A[j] = A_even[j] + t;
        A[j + m] = A_even[j] - t;
        w *= omega;
    }
}

void FFT(const vector<Fr>& input, vector<Fr>& output, const Fr &omega, size_t n) {
    if (n != input.size()) {
        throw invalid_argument("FFT: input length does not match n");
    }
    output.resize(n);
    FFT_recursive(input, output, omega, n);
}

void FFT_Para(const vector<Fr>& input, vector<Fr>& output, const Fr &omega, size_t n) {
    if (n != input.size()) {
        throw invalid_argument("FFT_Para: input length does not match n");
    }
    output.resize(n);
    if (n < 4) {
        FFT_recursive(input, output, omega, n);
        return;
    }
    size_t m = n / 2;
    vector<Fr> a_even(m), a_odd(m);
    for (size_t i = 0; i < m; i++) {
        a_even[i] = input[2 * i];
        a_odd[i] = input[2 * i + 1];
    }
    vector<Fr> A_even(m), A_odd(m);

    Fr omegaSquared = omega * omega;

    auto future_even = std::async(std::launch::async, [&]() {
        FFT_recursive(a_even, A_even, omegaSquared, m);
    });
    auto future_odd = std::async(std::launch::async, [&]() {
        FFT_recursive(a_odd, A_odd, omegaSquared, m);
    });
    future_even.get();
    future_odd.get();

    Fr w(1);
    for (size_t j = 0; j < m; j++) {
        Fr t = A_odd[j] * w;
        output[j] = A_even[j] + t;
        output[j + m] = A_even[j] - t;
        w *= omega;
    }
}

unsigned EvaluationDomain::two_adicity() {
    return G1Element::curve() == CurveType::BLS12_381 ? 32 : 28;
}

Fr EvaluationDomain::multiplicative_generator() {
    return G1Element::curve() == CurveType::BLS12_381 ? Fr(7) : Fr(5);
}

EvaluationDomain::EvaluationDomain(size_t min_size) :
        size_(1), log_size_(0)
{
    while (size_ < min_size) {
        size_ <<= 1;
        log_size_++;
    }
    if (log_size_ > two_adicity()) {
        throw runtime_error("EvaluationDomain: requested size exceeds the two-adicity of Fr");
    }

    // omega = g^((p - 1) / N)
    std::string p;
    Fr::getModulo(p);
    mpz_class p_mpz, n_mpz, g_mpz, exp, omega_mpz;
    p_mpz.setStr(p, 10);
    n_mpz.setStr(std::to_string(size_), 10);
    multiplicative_generator().getMpz(g_mpz);
    exp = (p_mpz - mpz_class(1)) / n_mpz;
    mcl::gmp::powMod(omega_mpz, g_mpz, exp, p_mpz);
    omega_.setMpz(omega_mpz);

    // omega must have order exactly N
    if (log_size_ > 0) {
        Fr half = omega_;
        for (unsigned i = 1; i < log_size_; i++) {
            Fr::sqr(half, half);
        }
        Fr minus_one;
        Fr::neg(minus_one, Fr(1));
        if (half != minus_one) {
            throw runtime_error("EvaluationDomain: bad root of unity");
        }
    }

    Fr::inv(omega_inv_, omega_);
    Fr n_fr;
    n_fr.setStr(std::to_string(size_), 10);
    Fr::inv(size_inv_, n_fr);
    coset_gen_ = multiplicative_generator();
    Fr::inv(coset_gen_inv_, coset_gen_);
}

void EvaluationDomain::fft(vector<Fr>& a) const {
    if (a.size() != size_) {
        throw invalid_argument("EvaluationDomain::fft: wrong length");
    }
    vector<Fr> out;
    FFT(a, out, omega_, size_);
    a.swap(out);
}

void EvaluationDomain::ifft(vector<Fr>& a) const {
    if (a.size() != size_) {
        throw invalid_argument("EvaluationDomain::ifft: wrong length");
    }
    vector<Fr> out;
    FFT(a, out, omega_inv_, size_);
    for (size_t i = 0; i < size_; i++) {
        out[i] *= size_inv_;
    }
    a.swap(out);
}

void EvaluationDomain::coset_fft(vector<Fr>& a) const {
    Fr shift(1);
    for (size_t i = 0; i < a.size(); i++) {
        a[i] *= shift;
        shift *= coset_gen_;
    }
    fft(a);
}

void EvaluationDomain::icoset_fft(vector<Fr>& a) const {
    ifft(a);
    Fr shift(1);
    for (size_t i = 0; i < a.size(); i++) {
        a[i] *= shift;
        shift *= coset_gen_inv_;
    }
}

Fr EvaluationDomain::vanishing_at(const Fr& tau) const {
    Fr t = tau;
    for (unsigned i = 0; i < log_size_; i++) {
        Fr::sqr(t, t);
    }
    return t - Fr(1);
}

Fr EvaluationDomain::vanishing_on_coset() const {
    return vanishing_at(coset_gen_);
}

vector<Fr> EvaluationDomain::lagrange_at(const Fr& tau) const {
    Fr z = vanishing_at(tau);
    if (z.isZero()) {
        throw runtime_error("EvaluationDomain::lagrange_at: point lies in the domain");
    }
    // L_j(tau) = Z(tau) * omega^j / (N * (tau - omega^j))
    vector<Fr> res(size_);
    Fr scale = z * size_inv_;
    Fr w(1);
    Fr denom;
    for (size_t j = 0; j < size_; j++) {
        Fr::inv(denom, tau - w);
        res[j] = scale * w * denom;
        w *= omega_;
    }
    return res;
}
