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
#include "errors.h"
#include "hashing.h"
#include "kzg.h"
#include "result.h"
#include <vector>

// =======================================
// ========= MULTIPROOF WIRE =============
// =======================================
//
// neg (96) || z_commit (96) || z_values (k * 32) || y_values (k * 32) || proof (192)
// points uncompressed, scalars 32 byte big-endian, 1 <= k <= 128.
// k is implied by the total length.

size_t proof_wire_size(size_t k);

// z_values and y_values must have the same length k, 1 <= k <= 128,
// otherwise INPUT_VALIDATION
Result<std::vector<byte>, KZGError> marshal_multi_proof(const MultiProof &proof);

// malformed length or k out of range -> INPUT_VALIDATION,
// bad point -> POINT_DECODE, scalar >= r -> INPUT_VALIDATION
Result<MultiProof, KZGError> unmarshal_multi_proof(const ByteSlice &src);
