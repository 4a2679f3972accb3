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

#include "scalars.h"
#include <cstring>

// =======================================
// =============== SCALAR ================
// =======================================

blst_fr new_scalar(const uint64_t v) {
    blst_fr s;
    uint64_t a[4] = {v, 0, 0, 0};
    blst_fr_from_uint64(&s, a);
    return s;
}

blst_fr scalar_from_hash(const Hash &h) {
    blst_scalar s;
    blst_scalar_from_le_bytes(&s, h.data(), h.size());
    blst_fr out;
    blst_fr_from_scalar(&out, &s);
    return out;
}

blst_fr scalar_mul(const blst_fr &a, const blst_fr &b) {
    blst_fr res;
    blst_fr_mul(&res, &a, &b);
    return res;
}

blst_fr scalar_add(const blst_fr &a, const blst_fr &b) {
    blst_fr res;
    blst_fr_add(&res, &a, &b);
    return res;
}

blst_fr scalar_sub(const blst_fr &a, const blst_fr &b) {
    blst_fr res;
    blst_fr_sub(&res, &a, &b);
    return res;
}

blst_fr neg_scalar(const blst_fr &a) {
    blst_fr res;
    blst_fr_cneg(&res, &a, true);
    return res;
}

blst_fr inv_scalar(const blst_fr &a) {
    if (scalar_is_zero(a))
        throw KZGException(make_error(DUPLICATE_POINT, "inverse of zero"));

    blst_fr res;
    blst_fr_eucl_inverse(&res, &a);
    return res;
}

void scalar_add_inplace(blst_fr &dst, const blst_fr &src) {
    blst_fr_add(&dst, &dst, &src);
}
void scalar_sub_inplace(blst_fr &dst, const blst_fr &src) {
    blst_fr_sub(&dst, &dst, &src);
}
void scalar_mul_inplace(blst_fr &dst, const blst_fr &mult) {
    blst_fr_mul(&dst, &dst, &mult);
}

bool scalar_is_zero(const blst_fr &s) {
    limb_t acc = 0;
    for (auto l : s.l) acc |= l;
    return acc == 0;
}

bool equal_scalars(const blst_fr &a, const blst_fr &b) {
    return std::memcmp(a.l, b.l, sizeof(a.l)) == 0;
}

void scalar_pow(blst_fr &out, const blst_fr &base, uint64_t exp) {
    blst_fr tmp = base;
    blst_fr result = new_scalar(1);

    while (exp > 0) {
        if (exp & 1) {
            blst_fr_mul(&result, &result, &tmp);
        }
        blst_fr_sqr(&tmp, &tmp);
        exp >>= 1;
    }
    out = result;
}

// left to right square and multiply over the big-endian bits
void scalar_pow_bytes(blst_fr &out, const blst_fr &base, const bytes32 &exp_be) {
    blst_fr result = new_scalar(1);
    for (byte b : exp_be) {
        for (int bit = 7; bit >= 0; bit--) {
            blst_fr_sqr(&result, &result);
            if ((b >> bit) & 1) {
                blst_fr_mul(&result, &result, &base);
            }
        }
    }
    out = result;
}

bool batch_inv(scalar_vec &out, const scalar_vec &in) {
    out.resize(in.size());
    if (in.empty()) return true;

    blst_fr accumulator = new_scalar(1);
    for (size_t i = 0; i < in.size(); i++) {
        out[i] = accumulator;
        blst_fr_mul(&accumulator, &accumulator, &in[i]);
    }

    if (scalar_is_zero(accumulator)) return false;

    blst_fr_eucl_inverse(&accumulator, &accumulator);

    for (size_t i = in.size(); i-- > 0;) {
        blst_fr_mul(&out[i], &out[i], &accumulator);
        blst_fr_mul(&accumulator, &accumulator, &in[i]);
    }
    return true;
}

// ---------------- ENCODING ----------------

Result<blst_fr, KZGError> scalar_from_bytes(const byte* src) {
    blst_scalar tmp;
    blst_scalar_from_bendian(&tmp, src);
    if (!blst_scalar_fr_check(&tmp))
        return make_error(INPUT_VALIDATION, "scalar not below field order");

    blst_fr out;
    blst_fr_from_scalar(&out, &tmp);
    return out;
}

bytes32 scalar_to_bytes(const blst_fr &s) {
    blst_scalar tmp;
    blst_scalar_from_fr(&tmp, &s);
    bytes32 out;
    blst_bendian_from_scalar(out.data(), &tmp);
    return out;
}

blst_scalar to_blst_scalar(const blst_fr &s) {
    blst_scalar out;
    blst_scalar_from_fr(&out, &s);
    return out;
}
