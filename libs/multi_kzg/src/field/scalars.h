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
#include "errors.h"
#include "hashing.h"
#include "result.h"
#include <array>
#include <vector>

using bytes32 = std::array<byte, 32>;
using scalar_vec = std::vector<blst_fr>;

// =======================================
// =============== SCALARS ===============
// =======================================
//
// Elements of Fr, the BLS12-381 scalar field. Values are kept in blst's
// Montgomery form, which is fully reduced, so equality is a limb compare.

blst_fr new_scalar(const uint64_t v = 0);
blst_fr scalar_from_hash(const Hash &h);
bool scalar_is_zero(const blst_fr &s);
bool equal_scalars(const blst_fr &a, const blst_fr &b);

blst_fr scalar_mul(const blst_fr &a, const blst_fr &b);
blst_fr scalar_add(const blst_fr &a, const blst_fr &b);
blst_fr scalar_sub(const blst_fr &a, const blst_fr &b);
void scalar_add_inplace(blst_fr &dst, const blst_fr &src);
void scalar_sub_inplace(blst_fr &dst, const blst_fr &src);
void scalar_mul_inplace(blst_fr &dst, const blst_fr &mult);
void scalar_pow(blst_fr &out, const blst_fr &base, uint64_t exp);
void scalar_pow_bytes(blst_fr &out, const blst_fr &base, const bytes32 &exp_be);

blst_fr neg_scalar(const blst_fr &a);

// throws KZGException(DUPLICATE_POINT) on zero
blst_fr inv_scalar(const blst_fr &a);

// out[i] = 1 / in[i], one inversion total. false if any input is zero
bool batch_inv(scalar_vec &out, const scalar_vec &in);

// ---------------- ENCODING ----------------

// 32 bytes big-endian, rejects values >= r
Result<blst_fr, KZGError> scalar_from_bytes(const byte* src);
bytes32 scalar_to_bytes(const blst_fr &s);

// canonical little-endian form blst expects for point multiplication
blst_scalar to_blst_scalar(const blst_fr &s);
