#include "libsaver/zk/Groth16.h"
#include "libsaver/zk/Parallel.h"
#include "libsaver/curve/FFT.h"
#include "libsaver/saver/Errors.h"
#include <string>

using namespace std;

namespace saver {

namespace {

// sum scalars[i] * bases[i], in blocks on the pool
G1Element msm_g1(emp::ThreadPool* pool, const vector<G1Element>& bases, const vector<Fr>& scalars){
    const size_t block = 256;
    size_t n = bases.size();
    size_t blocks = (n + block - 1) / block;
    vector<G1Element> partial(blocks);
    parallel_for(pool, blocks, [&](size_t b) {
        size_t start = b * block;
        size_t end = std::min(n, start + block);
        vector<G1Element> bs(bases.begin() + start, bases.begin() + end);
        vector<Fr> ss(scalars.begin() + start, scalars.begin() + end);
        partial[b] = G1Element::mulVec(bs, ss);
    });
    G1Element acc;
    for (size_t b = 0; b < blocks; b++){
        acc += partial[b];
    }
    return acc;
}

G2Element msm_g2(emp::ThreadPool* pool, const vector<G2Element>& bases, const vector<Fr>& scalars){
    const size_t block = 256;
    size_t n = bases.size();
    size_t blocks = (n + block - 1) / block;
    vector<G2Element> partial(blocks);
    parallel_for(pool, blocks, [&](size_t b) {
        size_t start = b * block;
        size_t end = std::min(n, start + block);
        vector<G2Element> bs(bases.begin() + start, bases.begin() + end);
        vector<Fr> ss(scalars.begin() + start, scalars.begin() + end);
        partial[b] = G2Element::mulVec(bs, ss);
    });
    G2Element acc;
    for (size_t b = 0; b < blocks; b++){
        acc += partial[b];
    }
    return acc;
}

// domain rows: constraints first, then one row z_i per input (ONE included)
size_t domain_rows(const ConstraintSystem& cs){
    return cs.num_constraints() + cs.num_inputs() + 1;
}

}

string Groth16Proof::to_bytes() const{
    return A.to_bytes() + B.to_bytes() + C.to_bytes();
}

bool Groth16Proof::from_bytes(const string& bytes){
    size_t g1 = G1Element::length();
    size_t g2 = G2Element::length();
    if (bytes.size() != length()){
        return false;
    }
    return A.from_bytes(bytes.substr(0, g1))
        && B.from_bytes(bytes.substr(g1, g2))
        && C.from_bytes(bytes.substr(g1 + g2, g1));
}

void Groth16Proof::pack(stringstream& os) const{
    A.pack(os);
    B.pack(os);
    C.pack(os);
}

void Groth16Proof::unpack(stringstream& os){
    A.unpack(os);
    B.unpack(os);
    C.unpack(os);
}

Groth16ProvingKey Groth16::setup(const ConstraintSystem& cs, RandomSource& rng){
    Fr tau = rng.next_nonzero();
    Fr alpha = rng.next_nonzero();
    Fr beta = rng.next_nonzero();
    Fr gamma = rng.next_nonzero();
    Fr delta = rng.next_nonzero();

    EvaluationDomain domain(domain_rows(cs));
    size_t N = domain.size();
    size_t m = cs.num_constraints();
    size_t num_inputs = cs.num_inputs();
    size_t num_vars = cs.num_variables();

    // tau must stay outside the domain for the Lagrange basis
    while (domain.vanishing_at(tau).isZero()){
        tau = rng.next_nonzero();
    }
    vector<Fr> lagrange = domain.lagrange_at(tau);

    // a_j(tau), b_j(tau), c_j(tau) for each variable
    vector<Fr> at(num_vars), bt(num_vars), ct(num_vars);
    for (size_t j = 0; j < num_vars; j++){
        at[j].clear();
        bt[j].clear();
        ct[j].clear();
    }
    const vector<Constraint>& rows = cs.constraints();
    for (size_t k = 0; k < m; k++){
        for (auto& t : rows[k].a) at[t.first] += t.second * lagrange[k];
        for (auto& t : rows[k].b) bt[t.first] += t.second * lagrange[k];
        for (auto& t : rows[k].c) ct[t.first] += t.second * lagrange[k];
    }
    for (size_t i = 0; i <= num_inputs; i++){
        at[i] += lagrange[m + i];
    }

    Fr gamma_inv, delta_inv;
    Fr::inv(gamma_inv, gamma);
    Fr::inv(delta_inv, delta);

    Groth16ProvingKey pk;
    pk.domain_size = N;
    Groth16VerifyingKey& vk = pk.vk;
    G1Element g1 = G1Element::generator();
    G2Element g2 = G2Element::generator();

    vk.alpha_g1 = g1 * alpha;
    vk.beta_g2 = g2 * beta;
    vk.gamma_g2 = g2 * gamma;
    vk.delta_g2 = g2 * delta;
    vk.gamma_g1 = g1 * gamma;
    vk.delta_g1 = g1 * delta;
    pk.beta_g1 = g1 * beta;

    pk.a_query.resize(num_vars);
    pk.b_g1_query.resize(num_vars);
    pk.b_g2_query.resize(num_vars);
    parallel_for(pool, num_vars, [&](size_t j) {
        pk.a_query[j] = g1 * at[j];
        pk.b_g1_query[j] = g1 * bt[j];
        pk.b_g2_query[j] = g2 * bt[j];
    });

    vk.gamma_abc_g1.resize(num_inputs + 1);
    parallel_for(pool, num_inputs + 1, [&](size_t i) {
        Fr v = beta * at[i] + alpha * bt[i] + ct[i];
        vk.gamma_abc_g1[i] = g1 * (v * gamma_inv);
    });

    size_t num_aux = cs.num_aux();
    pk.l_query.resize(num_aux);
    parallel_for(pool, num_aux, [&](size_t j) {
        size_t var = num_inputs + 1 + j;
        Fr v = beta * at[var] + alpha * bt[var] + ct[var];
        pk.l_query[j] = g1 * (v * delta_inv);
    });

    vector<Fr> powers(N - 1);
    Fr cur = domain.vanishing_at(tau) * delta_inv;
    for (size_t i = 0; i + 1 < N; i++){
        powers[i] = cur;
        cur *= tau;
    }
    pk.h_query.resize(N - 1);
    parallel_for(pool, N - 1, [&](size_t i) {
        pk.h_query[i] = g1 * powers[i];
    });
    return pk;
}

vector<Fr> Groth16::witness_map(const ConstraintSystem& cs, const vector<Fr>& assignment, size_t domain_size) const{
    EvaluationDomain domain(domain_size);
    size_t N = domain.size();
    size_t m = cs.num_constraints();

    vector<Fr> a(N), b(N), c(N);
    for (size_t k = 0; k < N; k++){
        a[k].clear();
        b[k].clear();
        c[k].clear();
    }
    const vector<Constraint>& rows = cs.constraints();
    for (size_t k = 0; k < m; k++){
        a[k] = ConstraintSystem::evaluate(rows[k].a, assignment);
        b[k] = ConstraintSystem::evaluate(rows[k].b, assignment);
        c[k] = ConstraintSystem::evaluate(rows[k].c, assignment);
    }
    for (size_t i = 0; i <= cs.num_inputs(); i++){
        a[m + i] = assignment[i];
    }

    domain.ifft(a);
    domain.ifft(b);
    domain.ifft(c);
    domain.coset_fft(a);
    domain.coset_fft(b);
    domain.coset_fft(c);

    Fr z_inv;
    Fr::inv(z_inv, domain.vanishing_on_coset());
    vector<Fr> h(N);
    for (size_t k = 0; k < N; k++){
        h[k] = (a[k] * b[k] - c[k]) * z_inv;
    }
    domain.icoset_fft(h);
    // deg h <= N - 2
    h.resize(N - 1);
    return h;
}

Groth16Proof Groth16::prove(const Groth16ProvingKey& pk, const ConstraintSystem& cs,
        const vector<Fr>& assignment, RandomSource& rng){
    size_t failing = 0;
    if (!cs.is_satisfied(assignment, &failing)){
        throw EncodingError("witness does not satisfy constraint " + to_string(failing));
    }
    if (pk.a_query.size() != cs.num_variables() || pk.l_query.size() != cs.num_aux()
            || pk.domain_size < domain_rows(cs)){
        throw EncodingError("proving key does not match the constraint system");
    }

    vector<Fr> h = witness_map(cs, assignment, pk.domain_size);
    Fr r = rng.next();
    Fr s = rng.next();

    const Groth16VerifyingKey& vk = pk.vk;
    size_t first_aux = cs.num_inputs() + 1;
    vector<Fr> aux(assignment.begin() + first_aux, assignment.end());

    Groth16Proof proof;
    proof.A = vk.alpha_g1 + msm_g1(pool, pk.a_query, assignment) + vk.delta_g1 * r;
    proof.B = vk.beta_g2 + msm_g2(pool, pk.b_g2_query, assignment) + vk.delta_g2 * s;
    G1Element B1 = pk.beta_g1 + msm_g1(pool, pk.b_g1_query, assignment) + vk.delta_g1 * s;

    proof.C = msm_g1(pool, pk.l_query, aux) + msm_g1(pool, pk.h_query, h);
    proof.C += proof.A * s;
    proof.C += B1 * r;
    proof.C -= vk.delta_g1 * (r * s);
    return proof;
}

G1Element Groth16::prepare_inputs(const Groth16VerifyingKey& vk, const vector<Fr>& public_inputs){
    if (public_inputs.size() != vk.num_inputs()){
        throw EncodingError("expected " + to_string(vk.num_inputs()) + " public inputs, got "
            + to_string(public_inputs.size()));
    }
    vector<G1Element> bases(vk.gamma_abc_g1.begin() + 1, vk.gamma_abc_g1.end());
    return vk.gamma_abc_g1[0] + G1Element::mulVec(bases, public_inputs);
}

bool Groth16::verify_prepared(const Groth16VerifyingKey& vk, const G1Element& prepared, const Groth16Proof& proof){
    if (!proof.A.is_valid() || !proof.C.is_valid()){
        return false;
    }
    // e(-A, B) e(alpha, beta) e(prepared, gamma) e(C, delta) == 1
    G1 ps[4] = {proof.A.negate().getPoint(), vk.alpha_g1.getPoint(), prepared.getPoint(), proof.C.getPoint()};
    G2 qs[4] = {proof.B.getPoint(), vk.beta_g2.getPoint(), vk.gamma_g2.getPoint(), vk.delta_g2.getPoint()};
    GT f;
    millerLoopVec(f, ps, qs, 4);
    finalExp(f, f);
    return f.isOne();
}

}
