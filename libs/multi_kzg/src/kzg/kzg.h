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

#pragma once
#include "blst.h"
#include "points.h"
#include "polynomial.h"
#include "settings.h"

struct Evaluation {
    blst_fr z;
    blst_fr y;
};
using EvaluationSet = std::vector<Evaluation>;

// Opens a committed P at z_values. Checked by
//   e(z_commit, proof) * e(neg_commitment_minus_i_tau, g2) == 1
struct MultiProof {
    blst_p1_affine z_commit;                    // [Z(tau)]_1
    blst_p1_affine neg_commitment_minus_i_tau;  // -([P(tau)]_1 - [I(tau)]_1)
    blst_p2_affine proof;                       // [Q(tau)]_2
    scalar_vec z_values;
    scalar_vec y_values;
};

// ================== COMMIT POLYNOMIAL ==================
//
// SUM( coeffs_i * powers_i ). throws KZGException(DEGREE_OVERFLOW) when the
// polynomial has more coefficients than the SRS has powers.

blst_p1 commit_g1_projective(const Polynomial &coeffs, const SRS &srs);
blst_p1_affine commit_g1(const Polynomial &coeffs, const SRS &srs);
blst_p2_affine commit_g2(const Polynomial &coeffs, const SRS &srs);

Result<Commitment, KZGError> commit(const Polynomial &coeffs, const SRS &srs);

// ================== MULTI POINT PROVER ==================

Result<MultiProof, KZGError> generate_multi_proof(
    const Polynomial &P,
    const EvaluationSet &evaluations,
    const SRS &srs
);

// evaluates P at every z and proves those values
Result<MultiProof, KZGError> open_multi_proof(
    const Polynomial &P,
    const scalar_vec &zs,
    const SRS &srs
);

class MultiProver {
public:
    explicit MultiProver(const SRS &srs) : srs_(srs) {}

    Result<Commitment, KZGError> commit(const Polynomial &P) const;
    Result<MultiProof, KZGError> prove(const Polynomial &P, const EvaluationSet &evaluations) const;
    Result<MultiProof, KZGError> open(const Polynomial &P, const scalar_vec &zs) const;

private:
    const SRS &srs_;
};

// ================== SINGLE POINT ==================

// Q(x) = (f(x) - f(z)) / (x - z), committed in G1
blst_p1_affine prove_single(const Polynomial &P, const blst_fr &z, const SRS &srs);

// e(C - [y]_1, g2) == e(Pi, [tau - z]_2)
bool verify_single(
    const blst_p1_affine &C,
    const blst_fr &z,
    const blst_fr &y,
    const blst_p1_affine &Pi,
    const SRS &srs
);
