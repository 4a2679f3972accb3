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
#include "constants.h"
#include "errors.h"
#include "result.h"
#include "scalars.h"
#include <array>
#include <string>

using Commitment = blst_p1_affine;

using g1_compressed = std::array<byte, G1_COMPRESSED_SIZE>;
using g2_compressed = std::array<byte, G2_COMPRESSED_SIZE>;
using g1_bytes = std::array<byte, G1_SIZE>;
using g2_bytes = std::array<byte, G2_SIZE>;

// =======================================
// =============== POINTS ================
// =======================================

// -------------------- P1 ---------------------------

blst_p1 new_p1();   // point at infinity
blst_p1_affine p1_to_affine(const blst_p1 &p1);
blst_p1 p1_from_affine(const blst_p1_affine &aff);
blst_p1_affine p1_generator();

blst_p1 p1_add(const blst_p1 &a, const blst_p1 &b);
blst_p1 p1_sub(const blst_p1 &a, const blst_p1 &b);
blst_p1 p1_neg(const blst_p1 &a);
void p1_mult(blst_p1& dst, const blst_p1 &a, const blst_fr &b);
bool p1_equal(const blst_p1_affine &a, const blst_p1_affine &b);
bool p1_is_inf(const blst_p1_affine &a);

// -------------------- P2 ---------------------------

blst_p2 new_p2();   // point at infinity
blst_p2_affine p2_to_affine(const blst_p2 &p2);
blst_p2 p2_from_affine(const blst_p2_affine &aff);
blst_p2_affine p2_generator();

blst_p2 p2_add(const blst_p2 &a, const blst_p2 &b);
blst_p2 p2_sub(const blst_p2 &a, const blst_p2 &b);
blst_p2 p2_neg(const blst_p2 &a);
void p2_mult(blst_p2& dst, const blst_p2 &a, const blst_fr &b);
bool p2_equal(const blst_p2_affine &a, const blst_p2_affine &b);
bool p2_is_inf(const blst_p2_affine &a);

// =======================================
// ============ SERIALIZATION ============
// =======================================
//
// compressed:    flag bits + x, blst (ZCash) layout, 48 / 96 bytes
// uncompressed:  raw big-endian coordinates, 96 / 192 bytes
//                G1: x || y,  G2: x_c0 || x_c1 || y_c0 || y_c1
//                infinity is all zero bytes
//
// Every decode checks coordinate range, the curve equation and subgroup
// membership. Failures carry the DecodeReason.

g1_compressed compress_p1(const blst_p1_affine &p);
g2_compressed compress_p2(const blst_p2_affine &p);
Result<blst_p1_affine, KZGError> p1_uncompress(const byte* src, size_t len);
Result<blst_p2_affine, KZGError> p2_uncompress(const byte* src, size_t len);

g1_bytes serialize_p1(const blst_p1_affine &p);
g2_bytes serialize_p2(const blst_p2_affine &p);
Result<blst_p1_affine, KZGError> p1_deserialize(const byte* src, size_t len);
Result<blst_p2_affine, KZGError> p2_deserialize(const byte* src, size_t len);

// ---------------- DEBUG ----------------

std::string p1_hex(const blst_p1_affine &p);
std::string p2_hex(const blst_p2_affine &p);
void print_p1(const blst_p1_affine &p);
