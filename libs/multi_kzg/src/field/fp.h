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
#include <array>

using bytes48 = std::array<byte, 48>;

// =======================================
// ============ BASE FIELD ===============
// =======================================

// big-endian src is strictly below the modulus p
bool fp_in_range(const byte* src);

// false if src >= p, dst untouched in that case
bool fp_from_bytes(blst_fp &dst, const byte* src);
void fp_to_bytes(byte* dst, const blst_fp &src);

bool fp_is_zero(const blst_fp &a);
