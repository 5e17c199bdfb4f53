#include <vector>
#include "libsaver/curve/FFT.h"
#include "libsaver/curve/G1Element.h"
#include "libsaver/curve/Random.h"
#include <mcl/bls12_381.hpp>
#include <chrono>
#include <iostream>
using namespace std;

// compares the serial and the two-thread FFT on the QAP domain
int main() {
    G1Element::init();

    size_t N = 65536;
    EvaluationDomain domain(N);
    cout << "domain size: " << domain.size() << endl;
    cout << "omega: " << domain.omega().getStr(16) << endl;

    SystemRandom rng;
    vector<Fr> a(N);
    for (size_t i = 0; i < N; i++) {
        a[i] = rng.next();
    }

    vector<Fr> A, B;
    auto start = std::chrono::high_resolution_clock::now();
    FFT(a, A, domain.omega(), N);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;
    cout << "Time taken for FFT: " << elapsed.count() << " seconds" << endl;

    start = std::chrono::high_resolution_clock::now();
    FFT_Para(a, B, domain.omega(), N);
    end = std::chrono::high_resolution_clock::now();
    elapsed = end - start;
    cout << "Time taken for FFT_Para: " << elapsed.count() << " seconds" << endl;

    if (A != B) {
        cout << "FFT and FFT_Para disagree" << endl;
        return 1;
    }

    vector<Fr> back = A;
    domain.ifft(back);
    if (back != a) {
        cout << "ifft(fft(a)) != a" << endl;
        return 1;
    }
    cout << "FFT ok" << endl;
    return 0;
}
