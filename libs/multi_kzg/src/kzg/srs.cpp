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

#include "settings.h"
#include "constants.h"
#include "points.h"
#include <cstring>
#include <fstream>
#include <iterator>

// =======================================
// ============= SRS =====================
// =======================================

SRS::SRS(size_t g1_degree, size_t g2_degree, const blst_fr &tau) {
    if (g1_degree < 1)
        throw KZGException(make_error(INVALID_SETUP, "g1 degree must be at least 1"));
    if (g2_degree > g1_degree)
        throw KZGException(make_error(
            INVALID_SETUP,
            "g2 degree " + std::to_string(g2_degree) + " exceeds g1 degree "
            + std::to_string(g1_degree)));

    g1_powers_jacob.resize(g1_degree + 1);
    g1_powers_aff.resize(g1_degree + 1);

    g2_powers_jacob.resize(g2_degree + 1);
    g2_powers_aff.resize(g2_degree + 1);

    blst_p1 g = *blst_p1_generator();
    blst_p2 h = *blst_p2_generator();

    // s(0) = 1
    blst_fr pow_s = new_scalar(1);

    // Compute Jacobian powers
    for (size_t i = 0; i <= g1_degree; i++) {
        p1_mult(g1_powers_jacob[i], g, pow_s);
        if (i <= g2_degree) p2_mult(g2_powers_jacob[i], h, pow_s);
        scalar_mul_inplace(pow_s, tau);
    }

    // Convert all to affine in a separate loop
    for (size_t i = 0; i <= g1_degree; i++) {
        g1_powers_aff[i] = p1_to_affine(g1_powers_jacob[i]);
    }
    for (size_t i = 0; i <= g2_degree; i++) {
        g2_powers_aff[i] = p2_to_affine(g2_powers_jacob[i]);
    }
}

SRS::SRS(std::vector<blst_p1_affine> &&g1s, std::vector<blst_p2_affine> &&g2s)
    : g1_powers_aff(std::move(g1s)), g2_powers_aff(std::move(g2s)) {

    g1_powers_jacob.reserve(g1_powers_aff.size());
    for (auto &p : g1_powers_aff) g1_powers_jacob.push_back(p1_from_affine(p));

    g2_powers_jacob.reserve(g2_powers_aff.size());
    for (auto &p : g2_powers_aff) g2_powers_jacob.push_back(p2_from_affine(p));
}

// ============= ENCODING =====================

static void put_u32(byte* dst, uint32_t v) {
    dst[0] = static_cast<byte>(v >> 24);
    dst[1] = static_cast<byte>(v >> 16);
    dst[2] = static_cast<byte>(v >> 8);
    dst[3] = static_cast<byte>(v);
}

static uint32_t get_u32(const byte* src) {
    return (uint32_t(src[0]) << 24) | (uint32_t(src[1]) << 16)
         | (uint32_t(src[2]) << 8)  |  uint32_t(src[3]);
}

std::vector<byte> SRS::serialize() const {
    size_t n1 = g1_powers_aff.size();
    size_t n2 = g2_powers_aff.size();

    std::vector<byte> out(
        SRS_HEADER_SIZE
        + n1 * G1_COMPRESSED_SIZE
        + n2 * G2_COMPRESSED_SIZE
        + SRS_DIGEST_SIZE);

    byte* cursor = out.data();
    std::memcpy(cursor, SRS_MAGIC, sizeof(SRS_MAGIC)); cursor += sizeof(SRS_MAGIC);
    put_u32(cursor, static_cast<uint32_t>(n1)); cursor += 4;
    put_u32(cursor, static_cast<uint32_t>(n2)); cursor += 4;

    for (auto &g1 : g1_powers_aff) {
        blst_p1_affine_compress(cursor, &g1);
        cursor += G1_COMPRESSED_SIZE;
    }

    for (auto &g2 : g2_powers_aff) {
        blst_p2_affine_compress(cursor, &g2);
        cursor += G2_COMPRESSED_SIZE;
    }

    Hash digest = derive_hash({out.data(), static_cast<size_t>(cursor - out.data())});
    std::memcpy(cursor, digest.data(), digest.size());
    return out;
}

Result<SRS, KZGError> load_srs(const ByteSlice &source) {
    if (source.size() < SRS_HEADER_SIZE + SRS_DIGEST_SIZE)
        return make_error(INVALID_SETUP, "setup shorter than its header");

    const byte* cursor = source.data();
    if (std::memcmp(cursor, SRS_MAGIC, sizeof(SRS_MAGIC)) != 0)
        return make_error(INVALID_SETUP, "bad setup magic");
    cursor += sizeof(SRS_MAGIC);

    size_t n1 = get_u32(cursor); cursor += 4;
    size_t n2 = get_u32(cursor); cursor += 4;

    if (n1 < 2 || n2 < 1 || n2 > n1)
        return make_error(INVALID_SETUP, "setup point counts out of range");

    size_t expected = SRS_HEADER_SIZE
        + n1 * G1_COMPRESSED_SIZE
        + n2 * G2_COMPRESSED_SIZE
        + SRS_DIGEST_SIZE;
    if (source.size() != expected)
        return make_error(INVALID_SETUP, "setup length does not match its advertised degree");

    size_t body = expected - SRS_DIGEST_SIZE;
    Hash digest = derive_hash(source.first(body));
    if (std::memcmp(digest.data(), source.data() + body, SRS_DIGEST_SIZE) != 0)
        return make_error(INVALID_SETUP, "setup digest mismatch");

    std::vector<blst_p1_affine> g1s;
    g1s.reserve(n1);
    for (size_t i = 0; i < n1; i++) {
        auto r = p1_uncompress(cursor, G1_COMPRESSED_SIZE);
        if (r.is_err()) return r.unwrap_err();
        g1s.push_back(r.unwrap());
        cursor += G1_COMPRESSED_SIZE;
    }

    std::vector<blst_p2_affine> g2s;
    g2s.reserve(n2);
    for (size_t i = 0; i < n2; i++) {
        auto r = p2_uncompress(cursor, G2_COMPRESSED_SIZE);
        if (r.is_err()) return r.unwrap_err();
        g2s.push_back(r.unwrap());
        cursor += G2_COMPRESSED_SIZE;
    }

    if (!p1_equal(g1s[0], p1_generator()))
        return make_error(INVALID_SETUP, "first G1 power is not the generator");
    if (!p2_equal(g2s[0], p2_generator()))
        return make_error(INVALID_SETUP, "first G2 power is not the generator");

    return SRS(std::move(g1s), std::move(g2s));
}

Result<SRS, KZGError> load_srs_file(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return make_error(INVALID_SETUP, "cannot open setup file " + path);

    std::vector<byte> buff(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());
    if (in.bad()) return make_error(INVALID_SETUP, "cannot read setup file " + path);

    return load_srs(buff);
}
