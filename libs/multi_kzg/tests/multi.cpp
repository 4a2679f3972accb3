/*
 * Multi KZG
 * Copyright (C) 2025 Joshua Olson
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "tests.h"
#include "constants.h"

static EvaluationSet make_set(const scalar_vec &zs, const scalar_vec &ys) {
    EvaluationSet set;
    for (size_t i = 0; i < zs.size(); i++) set.push_back({ zs[i], ys[i] });
    return set;
}

static KZGCodes error_code(const Result<MultiProof, KZGError> &res) {
    assert(res.is_err());
    return res.unwrap_err().code;
}

static bool verify_native(const MultiProof &proof, const SRS &srs) {
    NativePairing pairing;
    Verifier verifier(srs.g2_generator(), pairing);
    return verifier.verify(proof);
}

/*
 * P(X) = 3X^3 + 2X^2 + X + 1 opened at {1, 2, 3}
 */
void test_cubic_scenario() {
    SRS S(3, test_tau());
    Polynomial P = scalars({1, 1, 2, 3});
    scalar_vec zs = scalars({1, 2, 3});
    scalar_vec ys = scalars({7, 35, 103});

    auto C = commit(P, S);
    assert(C.is_ok());

    auto res = generate_multi_proof(P, make_set(zs, ys), S);
    assert(res.is_ok());
    MultiProof proof = res.unwrap();
    assert(verify_native(proof, S));
    assert(verify_against_commitment(C.unwrap(), zs, ys, proof.proof, S));

    // neg == -(C - [I(tau)]_1)
    blst_p1 I_tau = commit_g1_projective(derive_I(zs, ys), S);
    blst_p1 expected = p1_neg(p1_sub(p1_from_affine(C.unwrap()), I_tau));
    assert(p1_equal(proof.neg_commitment_minus_i_tau, p1_to_affine(expected)));
    assert(p1_equal(proof.z_commit, commit_g1(derive_Z(zs), S)));

    // Y' = [7, 35, 104]
    scalar_vec ys_bad = scalars({7, 35, 104});
    auto bad = generate_multi_proof(P, make_set(zs, ys_bad), S);
    assert(error_code(bad) == EVALUATION_MISMATCH);

    // forced proof: keep the quotient and drop the remainder
    Polynomial I_bad = derive_I(zs, ys_bad);
    auto [Q_forced, R] = divmod_by_roots(poly_sub(P, I_bad), zs);
    assert(!R.empty());

    MultiProof forced;
    forced.z_commit = commit_g1(derive_Z(zs), S);
    forced.proof = commit_g2(Q_forced, S);
    blst_p1 I_bad_tau = commit_g1_projective(I_bad, S);
    forced.neg_commitment_minus_i_tau = p1_to_affine(p1_neg(p1_sub(p1_from_affine(C.unwrap()), I_bad_tau)));
    forced.z_values = zs;
    forced.y_values = ys_bad;

    assert(!verify_native(forced, S));
    assert(!verify_against_commitment(C.unwrap(), zs, ys_bad, forced.proof, S));
    assert(!verify_against_commitment(C.unwrap(), zs, ys_bad, proof.proof, S));
}

void test_input_validation() {
    SRS S(8, test_tau());
    Polynomial P = seeded_poly(6, 20);

    // k == 0
    assert(error_code(generate_multi_proof(P, {}, S)) == INPUT_VALIDATION);

    // k > 128, checked before anything else
    scalar_vec many = seeded_points(MAX_EVALUATION_POINTS + 1, 21);
    assert(error_code(open_multi_proof(P, many, S)) == INPUT_VALIDATION);

    // duplicate z
    assert(error_code(open_multi_proof(P, scalars({4, 5, 4}), S)) == DUPLICATE_POINT);

    // zero polynomial, also after trimming
    assert(error_code(open_multi_proof({}, scalars({1}), S)) == INPUT_VALIDATION);
    assert(error_code(open_multi_proof(scalars({0, 0}), scalars({1}), S)) == INPUT_VALIDATION);

    // deg(P) < k leaves a zero quotient
    Polynomial quad = scalars({1, 2, 3});
    assert(error_code(open_multi_proof(quad, scalars({1, 2, 3}), S)) == INPUT_VALIDATION);
    assert(open_multi_proof(quad, scalars({1, 2}), S).is_ok());

    // a false claim is a mismatch even when deg(P) < k, P(3) is 34
    EvaluationSet wrong_low = {
        { new_scalar(1), new_scalar(6) },
        { new_scalar(2), new_scalar(17) },
        { new_scalar(3), new_scalar(35) },
    };
    assert(error_code(generate_multi_proof(quad, wrong_low, S)) == EVALUATION_MISMATCH);

    // same for the zero polynomial claiming a nonzero value
    EvaluationSet wrong_zero = { { new_scalar(1), new_scalar(5) } };
    assert(error_code(generate_multi_proof({}, wrong_zero, S)) == EVALUATION_MISMATCH);

    // P larger than the setup
    Polynomial big = seeded_poly(9, 22);
    assert(error_code(open_multi_proof(big, scalars({1, 2}), S)) == DEGREE_OVERFLOW);

    auto C = commit(big, S);
    assert(C.is_err());
    assert(C.unwrap_err().code == DEGREE_OVERFLOW);

    // quotient larger than the G2 side
    SRS short_g2(8, 1, test_tau());
    Polynomial P8 = seeded_poly(8, 23);
    assert(error_code(open_multi_proof(P8, scalars({1, 2}), short_g2)) == DEGREE_OVERFLOW);
    // deg Q == 1 fits
    assert(open_multi_proof(P8, seeded_points(7, 23), short_g2).is_ok());
}

void test_single_point_equivalence() {
    SRS S(8, test_tau());
    Polynomial P = seeded_poly(8, 30);
    blst_fr z = scalar_from_hash(seeded_hash(31));
    blst_fr y = eval_poly(P, z);

    MultiProof proof = honest_proof(P, { z }, S);
    assert(verify_native(proof, S));
    assert(equal_scalars(proof.y_values[0], y));

    // Z(X) = X - z, Q is the single point quotient
    auto [q, r] = divide_by_linear(P, z);
    assert(equal_scalars(r, y));
    assert(p2_equal(proof.proof, commit_g2(q, S)));
    assert(p1_equal(proof.z_commit, commit_g1({ neg_scalar(z), new_scalar(1) }, S)));

    // same opening as a G1 single point proof
    blst_p1_affine C = commit_g1(P, S);
    blst_p1_affine Pi = prove_single(P, z, S);
    assert(verify_single(C, z, y, Pi, S));
    assert(!verify_single(C, z, scalar_add(y, new_scalar(1)), Pi, S));
}

void test_max_points() {
    printf("building degree 128 setup\n");
    SRS S(MAX_EVALUATION_POINTS, test_tau());
    Polynomial P = seeded_poly(MAX_EVALUATION_POINTS, 40);
    scalar_vec zs = seeded_points(MAX_EVALUATION_POINTS, 40);

    MultiProof proof = honest_proof(P, zs, S);
    assert(proof.z_values.size() == MAX_EVALUATION_POINTS);
    assert(verify_native(proof, S));

    auto C = commit(P, S);
    assert(C.is_ok());
    assert(verify_against_commitment(C.unwrap(), zs, proof.y_values, proof.proof, S));
}

void test_prover() {
    SRS S(16, test_tau());
    MultiProver prover(S);

    Polynomial P = seeded_poly(12, 50);
    scalar_vec zs = seeded_points(5, 50);

    auto C = prover.commit(P);
    assert(C.is_ok());

    auto opened = prover.open(P, zs);
    assert(opened.is_ok());

    EvaluationSet set;
    for (auto &z : zs) set.push_back({ z, eval_poly(P, z) });
    auto proved = prover.prove(P, set);
    assert(proved.is_ok());

    // deterministic
    assert(p2_equal(opened.unwrap().proof, proved.unwrap().proof));
    assert(p1_equal(opened.unwrap().neg_commitment_minus_i_tau, proved.unwrap().neg_commitment_minus_i_tau));
    assert(verify_against_commitment(C.unwrap(), zs, proved.unwrap().y_values, proved.unwrap().proof, S));
}

void main_multi() {
    printf("TESTING MULTI_POINT PROOFS\n");
    test_cubic_scenario();
    test_prover();
    printf("SUCCESS\n\n");

    printf("TESTING MULTI_POINT EDGES\n");
    test_input_validation();
    test_single_point_equivalence();
    test_max_points();
    printf("SUCCESS\n\n");
}
