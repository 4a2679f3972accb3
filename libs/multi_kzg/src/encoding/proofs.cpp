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

#include "proofs.h"
#include "constants.h"
#include <cstring>

size_t proof_wire_size(size_t k) {
    return PROOF_FIXED_SIZE + 2 * SCALAR_SIZE * k;
}

Result<std::vector<byte>, KZGError> marshal_multi_proof(const MultiProof &proof) {
    size_t k = proof.z_values.size();
    if (k != proof.y_values.size())
        return make_error(INPUT_VALIDATION,
            std::to_string(k) + " z values but " + std::to_string(proof.y_values.size())
            + " y values");
    if (k == 0 || k > MAX_EVALUATION_POINTS)
        return make_error(INPUT_VALIDATION,
            "evaluation count " + std::to_string(k) + " outside [1, "
            + std::to_string(MAX_EVALUATION_POINTS) + "]");

    std::vector<byte> out(proof_wire_size(k));
    byte* cursor = out.data();

    g1_bytes neg = serialize_p1(proof.neg_commitment_minus_i_tau);
    std::memcpy(cursor, neg.data(), G1_SIZE); cursor += G1_SIZE;

    g1_bytes z_commit = serialize_p1(proof.z_commit);
    std::memcpy(cursor, z_commit.data(), G1_SIZE); cursor += G1_SIZE;

    for (auto &z : proof.z_values) {
        bytes32 b = scalar_to_bytes(z);
        std::memcpy(cursor, b.data(), SCALAR_SIZE); cursor += SCALAR_SIZE;
    }

    for (auto &y : proof.y_values) {
        bytes32 b = scalar_to_bytes(y);
        std::memcpy(cursor, b.data(), SCALAR_SIZE); cursor += SCALAR_SIZE;
    }

    g2_bytes pi = serialize_p2(proof.proof);
    std::memcpy(cursor, pi.data(), G2_SIZE);
    return out;
}

static Result<scalar_vec, KZGError> read_scalars(const byte* cursor, size_t k) {
    scalar_vec out;
    out.reserve(k);
    for (size_t i = 0; i < k; i++) {
        auto s = scalar_from_bytes(cursor);
        if (s.is_err()) return s.unwrap_err();
        out.push_back(s.unwrap());
        cursor += SCALAR_SIZE;
    }
    return out;
}

Result<MultiProof, KZGError> unmarshal_multi_proof(const ByteSlice &src) {
    size_t size = src.size();
    if (size < proof_wire_size(1) || (size - PROOF_FIXED_SIZE) % (2 * SCALAR_SIZE) != 0)
        return make_error(INPUT_VALIDATION,
            "proof length " + std::to_string(size) + " is not a valid multiproof encoding");

    size_t k = (size - PROOF_FIXED_SIZE) / (2 * SCALAR_SIZE);
    if (k > MAX_EVALUATION_POINTS)
        return make_error(INPUT_VALIDATION,
            "proof carries " + std::to_string(k) + " evaluations, limit is "
            + std::to_string(MAX_EVALUATION_POINTS));

    const byte* cursor = src.data();
    MultiProof out;

    auto neg = p1_deserialize(cursor, G1_SIZE);
    if (neg.is_err()) return neg.unwrap_err();
    out.neg_commitment_minus_i_tau = neg.unwrap();
    cursor += G1_SIZE;

    auto z_commit = p1_deserialize(cursor, G1_SIZE);
    if (z_commit.is_err()) return z_commit.unwrap_err();
    out.z_commit = z_commit.unwrap();
    cursor += G1_SIZE;

    auto zs = read_scalars(cursor, k);
    if (zs.is_err()) return zs.unwrap_err();
    out.z_values = std::move(zs.unwrap());
    cursor += k * SCALAR_SIZE;

    auto ys = read_scalars(cursor, k);
    if (ys.is_err()) return ys.unwrap_err();
    out.y_values = std::move(ys.unwrap());
    cursor += k * SCALAR_SIZE;

    auto pi = p2_deserialize(cursor, G2_SIZE);
    if (pi.is_err()) return pi.unwrap_err();
    out.proof = pi.unwrap();

    return out;
}
