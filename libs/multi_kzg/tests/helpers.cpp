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

#include "tests.h"

blst_fr test_tau() {
    bytes32 tau = {
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03,
        0xa0, 0xc9, 0x20, 0x75, 0xc0, 0xdb, 0xf3, 0xb8,
        0xac, 0xbc, 0x5f, 0x96, 0xce, 0x3f, 0x0a, 0xd2
    };
    return scalar_from_bytes(tau.data()).unwrap();
}

Polynomial seeded_poly(size_t degree, uint64_t seed) {
    Polynomial P;
    P.reserve(degree + 1);
    for (size_t i = 0; i <= degree; i++) {
        P.push_back(scalar_from_hash(seeded_hash(seed * 1000 + i)));
    }
    if (scalar_is_zero(P.back())) P.back() = new_scalar(1);
    return P;
}

scalar_vec seeded_points(size_t k, uint64_t seed) {
    scalar_vec zs;
    zs.reserve(k);
    uint64_t i = 0;
    while (zs.size() < k) {
        blst_fr z = scalar_from_hash(seeded_hash(seed * 1000 + 500 + i++));
        bool fresh = !scalar_is_zero(z);
        for (auto &prev : zs) fresh = fresh && !equal_scalars(prev, z);
        if (fresh) zs.push_back(z);
    }
    return zs;
}

scalar_vec scalars(std::initializer_list<uint64_t> values) {
    scalar_vec out;
    for (uint64_t v : values) out.push_back(new_scalar(v));
    return out;
}

MultiProof honest_proof(const Polynomial &P, const scalar_vec &zs, const SRS &srs) {
    auto res = open_multi_proof(P, zs, srs);
    if (res.is_err()) printf("unexpected: %s\n", describe(res.unwrap_err()).c_str());
    assert(res.is_ok());
    return res.unwrap();
}
