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

#include "extern.h"
#include "constants.h"
#include "kzg.h"
#include "padding.h"
#include "proofs.h"
#include "verifier.h"
#include <cstdlib>
#include <cstring>

static Result<scalar_vec, KZGError> read_scalars(const unsigned char* src, size_t n) {
    scalar_vec out;
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        auto s = scalar_from_bytes(src + i * SCALAR_SIZE);
        if (s.is_err()) return s.unwrap_err();
        out.push_back(s.unwrap());
    }
    return out;
}

int mkzg_srs_load(void** out, const unsigned char* setup, size_t setup_size) {
    if (!out || !setup) return NULL_PARAMETER;

    auto srs = load_srs({(const byte*)setup, setup_size});
    if (srs.is_err()) return srs.unwrap_err().code;

    *out = new SRS(std::move(srs.unwrap()));
    return OK;
}

void mkzg_srs_free(void* srs) {
    delete reinterpret_cast<SRS*>(srs);
}

int mkzg_srs_max_degree(void* srs, size_t* out) {
    if (!srs || !out) return NULL_PARAMETER;
    *out = reinterpret_cast<SRS*>(srs)->max_degree();
    return OK;
}

int mkzg_commit(
    void* srs,
    const unsigned char* coeffs, size_t n_coeffs,
    unsigned char* out
) {
    if (!srs || !coeffs || !out) return NULL_PARAMETER;

    auto P = read_scalars(coeffs, n_coeffs);
    if (P.is_err()) return P.unwrap_err().code;

    auto C = commit(P.unwrap(), *reinterpret_cast<SRS*>(srs));
    if (C.is_err()) return C.unwrap_err().code;

    g1_bytes raw = serialize_p1(C.unwrap());
    std::memcpy(out, raw.data(), G1_SIZE);
    return OK;
}

int mkzg_generate(
    void* srs,
    const unsigned char* coeffs, size_t n_coeffs,
    const unsigned char* zs,
    const unsigned char* ys,
    size_t k,
    void** out,
    size_t* out_size
) {
    if (!srs || !coeffs || !zs || !ys || !out || !out_size) return NULL_PARAMETER;

    auto P = read_scalars(coeffs, n_coeffs);
    if (P.is_err()) return P.unwrap_err().code;

    auto z_values = read_scalars(zs, k);
    if (z_values.is_err()) return z_values.unwrap_err().code;

    auto y_values = read_scalars(ys, k);
    if (y_values.is_err()) return y_values.unwrap_err().code;

    EvaluationSet evaluations(k);
    for (size_t i = 0; i < k; i++) {
        evaluations[i] = { z_values.unwrap()[i], y_values.unwrap()[i] };
    }

    auto proof = generate_multi_proof(P.unwrap(), evaluations, *reinterpret_cast<SRS*>(srs));
    if (proof.is_err()) return proof.unwrap_err().code;

    auto marshalled = marshal_multi_proof(proof.unwrap());
    if (marshalled.is_err()) return marshalled.unwrap_err().code;

    const std::vector<byte> &wire = marshalled.unwrap();
    *out = malloc(wire.size());
    if (!*out) return ENCODING_ERR;

    std::memcpy(*out, wire.data(), wire.size());
    *out_size = wire.size();
    return OK;
}

int mkzg_verify(
    const unsigned char* proof, size_t proof_size,
    const unsigned char* g2_generator, size_t g2_size
) {
    if (!proof || !g2_generator) return 0;

    auto g2 = p2_deserialize(g2_generator, g2_size);
    if (g2.is_err()) return 0;

    NativePairing pairing;
    Verifier verifier(g2.unwrap(), pairing);
    return verifier.verify_wire({(const byte*)proof, proof_size}) ? 1 : 0;
}

int mkzg_pad_g1(const unsigned char* point, size_t point_size, unsigned char* out) {
    if (!point || !out) return NULL_PARAMETER;
    auto padded = pad_g1({(const byte*)point, point_size});
    if (padded.is_err()) return padded.unwrap_err().code;
    std::memcpy(out, padded.unwrap().data(), G1_PADDED_SIZE);
    return OK;
}

int mkzg_pad_g2(const unsigned char* point, size_t point_size, unsigned char* out) {
    if (!point || !out) return NULL_PARAMETER;
    auto padded = pad_g2({(const byte*)point, point_size});
    if (padded.is_err()) return padded.unwrap_err().code;
    std::memcpy(out, padded.unwrap().data(), G2_PADDED_SIZE);
    return OK;
}

int mkzg_unpad_g1(const unsigned char* padded, size_t padded_size, unsigned char* out) {
    if (!padded || !out) return NULL_PARAMETER;
    auto raw = unpad_g1({(const byte*)padded, padded_size});
    if (raw.is_err()) return raw.unwrap_err().code;
    std::memcpy(out, raw.unwrap().data(), G1_SIZE);
    return OK;
}

int mkzg_unpad_g2(const unsigned char* padded, size_t padded_size, unsigned char* out) {
    if (!padded || !out) return NULL_PARAMETER;
    auto raw = unpad_g2({(const byte*)padded, padded_size});
    if (raw.is_err()) return raw.unwrap_err().code;
    std::memcpy(out, raw.unwrap().data(), G2_SIZE);
    return OK;
}

void mkzg_free(void* buff) {
    free(buff);
}
