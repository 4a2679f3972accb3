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
#include "blake3.h"
#include "blst.h"
#include <array>
#include <cstdint>
#include <span>

using Hash = std::array<byte, 32>;
using ByteSlice = std::span<const byte>;

class BlakeHasher {
private: blake3_hasher h_;
public:
    BlakeHasher() { blake3_hasher_init(&h_); }
    ~BlakeHasher() = default;

    void update(const byte* data, const size_t size) {
        blake3_hasher_update(&h_, data, size);
    }
    void update(const ByteSlice &data) {
        blake3_hasher_update(&h_, data.data(), data.size());
    }
    Hash finalize() {
        Hash out;
        blake3_hasher_finalize(&h_, out.data(), out.size());
        return out;
    }
};

Hash derive_hash(const ByteSlice &value);

// deterministic hash of i, used to derive reproducible test inputs
Hash seeded_hash(uint64_t i);
