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

#include "pairing.h"
#include "padding.h"
#include "points.h"
#include <cstring>

// =======================================
// ============== NATIVE =================
// =======================================

bool NativePairing::multi_pairing_check(const std::vector<PairingInput> &pairs) const {
    blst_fp12 acc = *blst_fp12_one();
    blst_fp12 ml;
    size_t used = 0;

    for (const PairingInput &pair : pairs) {
        if (p1_is_inf(pair.p) || p2_is_inf(pair.q)) continue;
        blst_miller_loop(&ml, &pair.q, &pair.p);
        blst_fp12_mul(&acc, &acc, &ml);
        used++;
    }
    if (used == 0) return true;

    blst_final_exp(&acc, &acc);
    return blst_fp12_is_one(&acc);
}

// =======================================
// ============= DELEGATING ==============
// =======================================

bool DelegatingPairing::multi_pairing_check(const std::vector<PairingInput> &pairs) const {
    std::vector<byte> input;
    input.reserve(pairs.size() * PAIR_PADDED_SIZE);

    for (const PairingInput &pair : pairs) {
        if (p1_is_inf(pair.p) || p2_is_inf(pair.q)) continue;
        g1_padded p = encode_g1_padded(pair.p);
        g2_padded q = encode_g2_padded(pair.q);
        input.insert(input.end(), p.begin(), p.end());
        input.insert(input.end(), q.begin(), q.end());
    }
    if (input.empty()) return true;

    byte out[32];
    std::memset(out, 0, sizeof(out));
    if (!host_.pairing_check(out, input.data(), input.size())) return false;

    // 31 zero bytes then 0x01
    for (size_t i = 0; i < 31; i++) {
        if (out[i] != 0) return false;
    }
    return out[31] == 1;
}

// =======================================
// ============== HOST CURVE =============
// =======================================

Result<blst_p1_affine, KZGError> HostCurve::add(
    const blst_p1_affine &a,
    const blst_p1_affine &b
) const {
    g1_padded pa = encode_g1_padded(a);
    g1_padded pb = encode_g1_padded(b);
    g1_padded out;

    if (!host_.g1_add(out.data(), pa.data(), pb.data()))
        return make_error(INPUT_VALIDATION, "host rejected g1_add");
    return decode_g1_padded(out);
}

Result<blst_p1_affine, KZGError> HostCurve::neg(const blst_p1_affine &a) const {
    g1_padded pa = encode_g1_padded(a);
    g1_padded out;

    if (host_.has_g1_neg()) {
        if (!host_.g1_neg(out.data(), pa.data()))
            return make_error(INPUT_VALIDATION, "host rejected g1_neg");
        return decode_g1_padded(out);
    }

    // [r - 1]P == -P
    if (!host_.g1_mul(out.data(), pa.data(), FR_ORDER_MINUS_ONE_BE))
        return make_error(INPUT_VALIDATION, "host rejected g1_mul");
    return decode_g1_padded(out);
}

Result<blst_p1_affine, KZGError> HostCurve::sub(
    const blst_p1_affine &a,
    const blst_p1_affine &b
) const {
    auto neg_b = neg(b);
    if (neg_b.is_err()) return neg_b.unwrap_err();
    return add(a, neg_b.unwrap());
}
