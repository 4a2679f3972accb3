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

#include "fp.h"
#include "constants.h"
#include <cstring>

bool fp_in_range(const byte* src) {
    return std::memcmp(src, FP_MODULUS_BE, FP_SIZE) < 0;
}

bool fp_from_bytes(blst_fp &dst, const byte* src) {
    if (!fp_in_range(src)) return false;
    blst_fp_from_bendian(&dst, src);
    return true;
}

void fp_to_bytes(byte* dst, const blst_fp &src) {
    blst_bendian_from_fp(dst, &src);
}

bool fp_is_zero(const blst_fp &a) {
    limb_t acc = 0;
    for (auto l : a.l) acc |= l;
    return acc == 0;
}
