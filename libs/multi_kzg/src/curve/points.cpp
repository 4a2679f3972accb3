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

#include "points.h"
#include "fp.h"
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>

// =======================================
// =============== POINTS ================
// =======================================

// -------------------- P1 ---------------------------

blst_p1 new_p1() {
    blst_p1 p;
    memset(&p, 0, sizeof(p));
    return p;
}

blst_p1_affine p1_to_affine(const blst_p1 &p1) {
    blst_p1_affine aff;
    if (blst_p1_is_inf(&p1)) {
        memset(&aff, 0, sizeof(aff));
        return aff;
    }
    blst_p1_to_affine(&aff, &p1);
    return aff;
}

blst_p1 p1_from_affine(const blst_p1_affine &aff) {
    blst_p1 p1;
    blst_p1_from_affine(&p1, &aff);
    return p1;
}

blst_p1_affine p1_generator() { return *blst_p1_affine_generator(); }

blst_p1 p1_add(const blst_p1 &a, const blst_p1 &b) {
    blst_p1 out;
    blst_p1_add_or_double(&out, &a, &b);
    return out;
}

blst_p1 p1_neg(const blst_p1 &a) {
    blst_p1 out = a;
    blst_p1_cneg(&out, true);
    return out;
}

blst_p1 p1_sub(const blst_p1 &a, const blst_p1 &b) {
    blst_p1 neg_b = p1_neg(b);
    return p1_add(a, neg_b);
}

void p1_mult(blst_p1& dst, const blst_p1 &a, const blst_fr &b) {
    blst_scalar s = to_blst_scalar(b);
    blst_p1_mult(&dst, &a, s.b, SCALAR_BITS);
}

bool p1_equal(const blst_p1_affine &a, const blst_p1_affine &b) {
    return blst_p1_affine_is_equal(&a, &b);
}

bool p1_is_inf(const blst_p1_affine &a) { return blst_p1_affine_is_inf(&a); }

// -------------------- P2 ---------------------------

blst_p2 new_p2() {
    blst_p2 p;
    memset(&p, 0, sizeof(p));
    return p;
}

blst_p2_affine p2_to_affine(const blst_p2 &p2) {
    blst_p2_affine aff;
    if (blst_p2_is_inf(&p2)) {
        memset(&aff, 0, sizeof(aff));
        return aff;
    }
    blst_p2_to_affine(&aff, &p2);
    return aff;
}

blst_p2 p2_from_affine(const blst_p2_affine &aff) {
    blst_p2 p2;
    blst_p2_from_affine(&p2, &aff);
    return p2;
}

blst_p2_affine p2_generator() { return *blst_p2_affine_generator(); }

blst_p2 p2_add(const blst_p2 &a, const blst_p2 &b) {
    blst_p2 out;
    blst_p2_add_or_double(&out, &a, &b);
    return out;
}

blst_p2 p2_neg(const blst_p2 &a) {
    blst_p2 out = a;
    blst_p2_cneg(&out, true);
    return out;
}

blst_p2 p2_sub(const blst_p2 &a, const blst_p2 &b) {
    blst_p2 neg_b = p2_neg(b);
    return p2_add(a, neg_b);
}

void p2_mult(blst_p2& dst, const blst_p2 &a, const blst_fr &b) {
    blst_scalar s = to_blst_scalar(b);
    blst_p2_mult(&dst, &a, s.b, SCALAR_BITS);
}

bool p2_equal(const blst_p2_affine &a, const blst_p2_affine &b) {
    return blst_p2_affine_is_equal(&a, &b);
}

bool p2_is_inf(const blst_p2_affine &a) { return blst_p2_affine_is_inf(&a); }

// =======================================
// ============ SERIALIZATION ============
// =======================================

static bool all_zero(const byte* src, size_t len) {
    byte acc = 0;
    for (size_t i = 0; i < len; i++) acc |= src[i];
    return acc == 0;
}

// compressed x with the three flag bits cleared
static bool masked_x_in_range(const byte* src) {
    byte x[FP_SIZE];
    std::memcpy(x, src, FP_SIZE);
    x[0] &= 0x1f;
    return fp_in_range(x);
}

static KZGError from_blst_error(BLST_ERROR err) {
    switch (err) {
        case BLST_POINT_NOT_ON_CURVE:
            return decode_error(NOT_ON_CURVE, "point does not satisfy the curve equation");
        case BLST_POINT_NOT_IN_GROUP:
            return decode_error(NOT_IN_SUBGROUP, "point outside the prime order subgroup");
        default:
            return decode_error(BAD_FLAGS, "malformed compressed encoding");
    }
}

// -------------------- COMPRESSED ---------------------------

g1_compressed compress_p1(const blst_p1_affine &p) {
    g1_compressed out;
    blst_p1_affine_compress(out.data(), &p);
    return out;
}

g2_compressed compress_p2(const blst_p2_affine &p) {
    g2_compressed out;
    blst_p2_affine_compress(out.data(), &p);
    return out;
}

Result<blst_p1_affine, KZGError> p1_uncompress(const byte* src, size_t len) {
    if (len != G1_COMPRESSED_SIZE)
        return decode_error(BAD_LENGTH, "compressed G1 must be 48 bytes");
    if (!(src[0] & 0x80))
        return decode_error(BAD_FLAGS, "compression flag not set");
    if (!masked_x_in_range(src))
        return decode_error(COORD_RANGE, "x not below field modulus");

    blst_p1_affine out;
    BLST_ERROR err = blst_p1_uncompress(&out, src);
    if (err != BLST_SUCCESS) return from_blst_error(err);

    // infinity is accepted
    if (blst_p1_affine_is_inf(&out)) return out;

    if (!blst_p1_affine_in_g1(&out))
        return decode_error(NOT_IN_SUBGROUP, "G1 point outside the prime order subgroup");
    return out;
}

Result<blst_p2_affine, KZGError> p2_uncompress(const byte* src, size_t len) {
    if (len != G2_COMPRESSED_SIZE)
        return decode_error(BAD_LENGTH, "compressed G2 must be 96 bytes");
    if (!(src[0] & 0x80))
        return decode_error(BAD_FLAGS, "compression flag not set");
    if (!masked_x_in_range(src) || !fp_in_range(src + FP_SIZE))
        return decode_error(COORD_RANGE, "x not below field modulus");

    blst_p2_affine out;
    BLST_ERROR err = blst_p2_uncompress(&out, src);
    if (err != BLST_SUCCESS) return from_blst_error(err);

    if (blst_p2_affine_is_inf(&out)) return out;

    if (!blst_p2_affine_in_g2(&out))
        return decode_error(NOT_IN_SUBGROUP, "G2 point outside the prime order subgroup");
    return out;
}

// -------------------- UNCOMPRESSED ---------------------------

g1_bytes serialize_p1(const blst_p1_affine &p) {
    g1_bytes out;
    out.fill(0);
    if (blst_p1_affine_is_inf(&p)) return out;

    fp_to_bytes(out.data(), p.x);
    fp_to_bytes(out.data() + FP_SIZE, p.y);
    return out;
}

g2_bytes serialize_p2(const blst_p2_affine &p) {
    g2_bytes out;
    out.fill(0);
    if (blst_p2_affine_is_inf(&p)) return out;

    byte* cursor = out.data();
    fp_to_bytes(cursor, p.x.fp[0]); cursor += FP_SIZE;
    fp_to_bytes(cursor, p.x.fp[1]); cursor += FP_SIZE;
    fp_to_bytes(cursor, p.y.fp[0]); cursor += FP_SIZE;
    fp_to_bytes(cursor, p.y.fp[1]);
    return out;
}

Result<blst_p1_affine, KZGError> p1_deserialize(const byte* src, size_t len) {
    if (len != G1_SIZE)
        return decode_error(BAD_LENGTH, "uncompressed G1 must be 96 bytes");

    blst_p1_affine out;
    if (all_zero(src, len)) {
        memset(&out, 0, sizeof(out));
        return out;
    }

    if (!fp_from_bytes(out.x, src) || !fp_from_bytes(out.y, src + FP_SIZE))
        return decode_error(COORD_RANGE, "G1 coordinate not below field modulus");

    if (!blst_p1_affine_on_curve(&out))
        return decode_error(NOT_ON_CURVE, "G1 point does not satisfy the curve equation");

    if (!blst_p1_affine_in_g1(&out))
        return decode_error(NOT_IN_SUBGROUP, "G1 point outside the prime order subgroup");
    return out;
}

Result<blst_p2_affine, KZGError> p2_deserialize(const byte* src, size_t len) {
    if (len != G2_SIZE)
        return decode_error(BAD_LENGTH, "uncompressed G2 must be 192 bytes");

    blst_p2_affine out;
    if (all_zero(src, len)) {
        memset(&out, 0, sizeof(out));
        return out;
    }

    const byte* cursor = src;
    bool in_range = fp_from_bytes(out.x.fp[0], cursor);
    cursor += FP_SIZE;
    in_range = in_range && fp_from_bytes(out.x.fp[1], cursor);
    cursor += FP_SIZE;
    in_range = in_range && fp_from_bytes(out.y.fp[0], cursor);
    cursor += FP_SIZE;
    in_range = in_range && fp_from_bytes(out.y.fp[1], cursor);
    if (!in_range)
        return decode_error(COORD_RANGE, "G2 coordinate not below field modulus");

    if (!blst_p2_affine_on_curve(&out))
        return decode_error(NOT_ON_CURVE, "G2 point does not satisfy the curve equation");

    if (!blst_p2_affine_in_g2(&out))
        return decode_error(NOT_IN_SUBGROUP, "G2 point outside the prime order subgroup");
    return out;
}

// =======================================
// ================ DEBUG ================
// =======================================

template <size_t N>
static std::string to_hex(const std::array<byte, N> &buff) {
    std::ostringstream os;
    for (auto b : buff)
        os << std::hex << std::setw(2) << std::setfill('0') << (int)b;
    return os.str();
}

std::string p1_hex(const blst_p1_affine &p) { return to_hex(compress_p1(p)); }
std::string p2_hex(const blst_p2_affine &p) { return to_hex(compress_p2(p)); }

void print_p1(const blst_p1_affine &p) { std::cout << p1_hex(p) << std::endl; }
