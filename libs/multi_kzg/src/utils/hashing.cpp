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

#include "hashing.h"

Hash derive_hash(const ByteSlice &value) {
    BlakeHasher hasher;
    hasher.update(value);
    return hasher.finalize();
}

Hash seeded_hash(uint64_t i) {
    byte seed[8];
    for (int b = 0; b < 8; b++) {
        seed[b] = static_cast<byte>(i >> (8 * (7 - b)));
    }

    BlakeHasher hasher;
    hasher.update(reinterpret_cast<const byte*>("multi-kzg-seed"), 14);
    hasher.update(seed, sizeof(seed));
    return hasher.finalize();
}
