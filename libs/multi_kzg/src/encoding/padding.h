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
#include "fp.h"
#include "hashing.h"
#include "points.h"
#include "result.h"
#include <array>

using fp_padded = std::array<byte, FP_PADDED_SIZE>;
using g1_padded = std::array<byte, G1_PADDED_SIZE>;
using g2_padded = std::array<byte, G2_PADDED_SIZE>;

// =======================================
// ============ PADDED CODEC =============
// =======================================
//
// Each 48 byte Fp element widens to 64 bytes with 16 leading zero bytes.
// Every function here fails with ENCODING_ERR on a length mismatch, and
// the unpad side also rejects nonzero padding.

Result<fp_padded, KZGError> pad_fp(const ByteSlice &src);
Result<bytes48, KZGError> unpad_fp(const ByteSlice &src);

// 96 -> 128
Result<g1_padded, KZGError> pad_g1(const ByteSlice &src);
Result<g1_bytes, KZGError> unpad_g1(const ByteSlice &src);

// 192 -> 256, coordinate order x_c0 x_c1 y_c0 y_c1 is kept
Result<g2_padded, KZGError> pad_g2(const ByteSlice &src);
Result<g2_bytes, KZGError> unpad_g2(const ByteSlice &src);

// ---------------- POINTS ----------------

g1_padded encode_g1_padded(const blst_p1_affine &p);
g2_padded encode_g2_padded(const blst_p2_affine &p);

// unpad then full point validation (range, curve, subgroup)
Result<blst_p1_affine, KZGError> decode_g1_padded(const ByteSlice &src);
Result<blst_p2_affine, KZGError> decode_g2_padded(const ByteSlice &src);
