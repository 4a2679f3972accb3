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
#include <cstddef>
#include <cstdint>

// =======================================
// ============ BLS12-381 ================
// =======================================

// base field modulus p, big-endian
inline constexpr uint8_t FP_MODULUS_BE[48] = {
    0x1a, 0x01, 0x11, 0xea, 0x39, 0x7f, 0xe6, 0x9a,
    0x4b, 0x1b, 0xa7, 0xb6, 0x43, 0x4b, 0xac, 0xd7,
    0x64, 0x77, 0x4b, 0x84, 0xf3, 0x85, 0x12, 0xbf,
    0x67, 0x30, 0xd2, 0xa0, 0xf6, 0xb0, 0xf6, 0x24,
    0x1e, 0xab, 0xff, 0xfe, 0xb1, 0x53, 0xff, 0xff,
    0xb9, 0xfe, 0xff, 0xff, 0xff, 0xff, 0xaa, 0xab
};

// r - 1, big-endian. [r - 1]P == -P for any P in the prime order subgroup
inline constexpr uint8_t FR_ORDER_MINUS_ONE_BE[32] = {
    0x73, 0xed, 0xa7, 0x53, 0x29, 0x9d, 0x7d, 0x48,
    0x33, 0x39, 0xd8, 0x08, 0x09, 0xa1, 0xd8, 0x05,
    0x53, 0xbd, 0xa4, 0x02, 0xff, 0xfe, 0x5b, 0xfe,
    0xff, 0xff, 0xff, 0xff, 0x00, 0x00, 0x00, 0x00
};

// =======================================
// ============ SIZES ====================
// =======================================

const size_t SCALAR_SIZE = 32;
const size_t FP_SIZE = 48;
const size_t FP_PADDED_SIZE = 64;
const size_t FP_PAD = FP_PADDED_SIZE - FP_SIZE;

const size_t G1_COMPRESSED_SIZE = 48;
const size_t G2_COMPRESSED_SIZE = 96;
const size_t G1_SIZE = 2 * FP_SIZE;               // x || y
const size_t G2_SIZE = 4 * FP_SIZE;               // x_c0 || x_c1 || y_c0 || y_c1
const size_t G1_PADDED_SIZE = 2 * FP_PADDED_SIZE;
const size_t G2_PADDED_SIZE = 4 * FP_PADDED_SIZE;
const size_t PAIR_PADDED_SIZE = G1_PADDED_SIZE + G2_PADDED_SIZE;

const size_t SCALAR_BITS = 256;

// =======================================
// ============ PROTOCOL =================
// =======================================

const size_t MAX_EVALUATION_POINTS = 128;

// neg || z_commit || proof, scalars excluded
const size_t PROOF_FIXED_SIZE = G1_SIZE + G1_SIZE + G2_SIZE;

// =======================================
// ============ SRS FILE =================
// =======================================

inline constexpr char SRS_MAGIC[8] = {'M', 'K', 'Z', 'G', 'S', 'R', 'S', '1'};
const size_t SRS_HEADER_SIZE = sizeof(SRS_MAGIC) + 4 + 4;
const size_t SRS_DIGEST_SIZE = 32;
