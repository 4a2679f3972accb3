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

#include "kzg.h"
#include "constants.h"

// ======================================================
// ========== MULTI POINT PROVER ========================
// ======================================================

static void check_evaluations(const Polynomial &P, const scalar_vec &zs, const SRS &srs) {
    size_t k = zs.size();
    if (k == 0 || k > MAX_EVALUATION_POINTS)
        throw KZGException(make_error(
            INPUT_VALIDATION,
            "evaluation count " + std::to_string(k) + " outside [1, "
            + std::to_string(MAX_EVALUATION_POINTS) + "]"));

    if (P.size() > srs.g1_size())
        throw KZGException(make_error(
            DEGREE_OVERFLOW,
            "degree " + std::to_string(poly_degree(P)) + " exceeds setup degree "
            + std::to_string(srs.max_degree())));

    // Z(X) has k + 1 coefficients
    if (k + 1 > srs.g1_size())
        throw KZGException(make_error(
            DEGREE_OVERFLOW,
            "setup too small for " + std::to_string(k) + " evaluation points"));

    for (size_t i = 0; i < k; i++) {
        for (size_t j = i + 1; j < k; j++) {
            if (equal_scalars(zs[i], zs[j]))
                throw KZGException(make_error(
                    DUPLICATE_POINT,
                    "evaluation points " + std::to_string(i) + " and "
                    + std::to_string(j) + " coincide"));
        }
    }
}

static MultiProof build_multi_proof(
    const Polynomial &P,
    const scalar_vec &zs,
    const scalar_vec &ys,
    const SRS &srs
) {
    // Z(X) = prod (X - z_i),  I(z_i) = y_i
    Polynomial Z = derive_Z(zs);
    Polynomial I = derive_I(zs, ys);

    // Q(X) = (P(X) - I(X)) / Z(X), exact when every y_i == P(z_i)
    Polynomial Q = divide_by_vanishing(poly_sub(P, I), zs);

    // claims hold but P is zero or deg(P) < k
    if (Q.empty())
        throw KZGException(make_error(
            INPUT_VALIDATION,
            "quotient is zero, degree of P must be at least the "
            + std::to_string(zs.size()) + " evaluation points"));

    MultiProof out;
    out.proof = commit_g2(Q, srs);
    out.z_commit = commit_g1(Z, srs);

    // -(C - [I(tau)]_1)
    blst_p1 C = commit_g1_projective(P, srs);
    blst_p1 I_tau = commit_g1_projective(I, srs);
    out.neg_commitment_minus_i_tau = p1_to_affine(p1_neg(p1_sub(C, I_tau)));

    out.z_values = zs;
    out.y_values = ys;
    return out;
}

Result<MultiProof, KZGError> generate_multi_proof(
    const Polynomial &P,
    const EvaluationSet &evaluations,
    const SRS &srs
) {
    scalar_vec zs, ys;
    zs.reserve(evaluations.size());
    ys.reserve(evaluations.size());
    for (const Evaluation &e : evaluations) {
        zs.push_back(e.z);
        ys.push_back(e.y);
    }

    try {
        Polynomial Px = P;
        poly_normalize(Px);
        check_evaluations(Px, zs, srs);
        return build_multi_proof(Px, zs, ys, srs);
    } catch (const KZGException &e) {
        return e.error();
    }
}

Result<MultiProof, KZGError> open_multi_proof(
    const Polynomial &P,
    const scalar_vec &zs,
    const SRS &srs
) {
    EvaluationSet evaluations;
    evaluations.reserve(zs.size());
    for (const blst_fr &z : zs) {
        evaluations.push_back({ z, eval_poly(P, z) });
    }
    return generate_multi_proof(P, evaluations, srs);
}

// ================== PROVER ==================

Result<Commitment, KZGError> MultiProver::commit(const Polynomial &P) const {
    return ::commit(P, srs_);
}

Result<MultiProof, KZGError> MultiProver::prove(
    const Polynomial &P,
    const EvaluationSet &evaluations
) const {
    return generate_multi_proof(P, evaluations, srs_);
}

Result<MultiProof, KZGError> MultiProver::open(const Polynomial &P, const scalar_vec &zs) const {
    return open_multi_proof(P, zs, srs_);
}
