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
#include "pairing.h"

// ================== COMMIT POLYNOMIAL ==================

// commits to f(x) via evaluating f(tau)
blst_p1 commit_g1_projective(
    const Polynomial &coeffs,
    const SRS &srs
) {
    if (coeffs.size() > srs.g1_size())
        throw KZGException(make_error(
            DEGREE_OVERFLOW,
            "polynomial with " + std::to_string(coeffs.size())
            + " coefficients exceeds " + std::to_string(srs.g1_size()) + " G1 powers"));

    const auto &powers = srs.g1_powers();
    blst_p1 C = new_p1();
    blst_p1 tmp;
    for (size_t i = 0; i < coeffs.size(); i++) {
        if (scalar_is_zero(coeffs[i])) continue;
        p1_mult(tmp, powers[i], coeffs[i]);
        blst_p1_add_or_double(&C, &C, &tmp);
    }
    return C;
}

blst_p1_affine commit_g1(
    const Polynomial &coeffs,
    const SRS &srs
) {
    blst_p1 C = commit_g1_projective(coeffs, srs);
    return p1_to_affine(C);
}

blst_p2_affine commit_g2(
    const Polynomial &coeffs,
    const SRS &srs
) {
    if (coeffs.size() > srs.g2_size())
        throw KZGException(make_error(
            DEGREE_OVERFLOW,
            "polynomial with " + std::to_string(coeffs.size())
            + " coefficients exceeds " + std::to_string(srs.g2_size()) + " G2 powers"));

    const auto &powers = srs.g2_powers();
    blst_p2 C = new_p2();
    blst_p2 tmp;
    for (size_t i = 0; i < coeffs.size(); i++) {
        if (scalar_is_zero(coeffs[i])) continue;
        p2_mult(tmp, powers[i], coeffs[i]);
        blst_p2_add_or_double(&C, &C, &tmp);
    }
    return p2_to_affine(C);
}

Result<Commitment, KZGError> commit(const Polynomial &coeffs, const SRS &srs) {
    try {
        return commit_g1(coeffs, srs);
    } catch (const KZGException &e) {
        return e.error();
    }
}

// ============= OPEN SINGLE (synthetic) =================

blst_p1_affine prove_single(
    const Polynomial &P,
    const blst_fr &z,
    const SRS &srs
) {
    // remainder is f(z), dropping it leaves (f(x) - f(z)) / (x - z)
    auto [q, y] = divide_by_linear(P, z);
    return commit_g1(q, srs);
}

// ============= VERIFY SINGLE POINT ====================

bool verify_single(
    const blst_p1_affine &C,
    const blst_fr &z,
    const blst_fr &y,
    const blst_p1_affine &Pi,
    const SRS &srs
) {
    if (srs.g2_size() < 2) return false;

    // C - gY
    blst_p1 C_Y;
    p1_mult(C_Y, srs.g1_powers()[0], y);
    blst_p1_cneg(&C_Y, true);
    blst_p1_add_or_double_affine(&C_Y, &C_Y, &C);
    blst_p1_affine C_Y_aff = p1_to_affine(C_Y);

    // g2(tau - z)
    blst_p2 R_Z;
    p2_mult(R_Z, srs.g2_powers()[0], z);
    blst_p2_cneg(&R_Z, true);
    blst_p2_add_or_double(&R_Z, &R_Z, &srs.g2_powers()[1]);
    blst_p2_affine R_Z_aff = p2_to_affine(R_Z);

    // e(C - gY, g2) == e(pi, g2(tau - z))
    blst_p1_affine neg_pi = p1_to_affine(p1_neg(p1_from_affine(Pi)));
    std::vector<PairingInput> pairs = {
        { C_Y_aff, srs.g2_generator() },
        { neg_pi, R_Z_aff },
    };
    return NativePairing().multi_pairing_check(pairs);
}
