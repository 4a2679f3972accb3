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

#include "padding.h"
#include <cstring>

// widens n consecutive 48 byte words to 64 bytes each
template <size_t N>
static Result<std::array<byte, N * FP_PADDED_SIZE>, KZGError> pad_words(
    const ByteSlice &src,
    const char* what
) {
    if (src.size() != N * FP_SIZE)
        return make_error(ENCODING_ERR,
            std::string(what) + ": expected " + std::to_string(N * FP_SIZE)
            + " bytes, got " + std::to_string(src.size()));

    std::array<byte, N * FP_PADDED_SIZE> out;
    out.fill(0);
    for (size_t i = 0; i < N; i++) {
        std::memcpy(out.data() + i * FP_PADDED_SIZE + FP_PAD, src.data() + i * FP_SIZE, FP_SIZE);
    }
    return out;
}

template <size_t N>
static Result<std::array<byte, N * FP_SIZE>, KZGError> unpad_words(
    const ByteSlice &src,
    const char* what
) {
    if (src.size() != N * FP_PADDED_SIZE)
        return make_error(ENCODING_ERR,
            std::string(what) + ": expected " + std::to_string(N * FP_PADDED_SIZE)
            + " bytes, got " + std::to_string(src.size()));

    std::array<byte, N * FP_SIZE> out;
    for (size_t i = 0; i < N; i++) {
        const byte* word = src.data() + i * FP_PADDED_SIZE;
        for (size_t j = 0; j < FP_PAD; j++) {
            if (word[j] != 0)
                return make_error(ENCODING_ERR, std::string(what) + ": nonzero padding byte");
        }
        std::memcpy(out.data() + i * FP_SIZE, word + FP_PAD, FP_SIZE);
    }
    return out;
}

Result<fp_padded, KZGError> pad_fp(const ByteSlice &src) { return pad_words<1>(src, "pad_fp"); }
Result<bytes48, KZGError> unpad_fp(const ByteSlice &src) { return unpad_words<1>(src, "unpad_fp"); }

Result<g1_padded, KZGError> pad_g1(const ByteSlice &src) { return pad_words<2>(src, "pad_g1"); }
Result<g1_bytes, KZGError> unpad_g1(const ByteSlice &src) { return unpad_words<2>(src, "unpad_g1"); }

Result<g2_padded, KZGError> pad_g2(const ByteSlice &src) { return pad_words<4>(src, "pad_g2"); }
Result<g2_bytes, KZGError> unpad_g2(const ByteSlice &src) { return unpad_words<4>(src, "unpad_g2"); }

// ---------------- POINTS ----------------

g1_padded encode_g1_padded(const blst_p1_affine &p) {
    g1_bytes raw = serialize_p1(p);
    // raw is always G1_SIZE, padding cannot fail
    return pad_g1(raw).unwrap();
}

g2_padded encode_g2_padded(const blst_p2_affine &p) {
    g2_bytes raw = serialize_p2(p);
    return pad_g2(raw).unwrap();
}

Result<blst_p1_affine, KZGError> decode_g1_padded(const ByteSlice &src) {
    auto raw = unpad_g1(src);
    if (raw.is_err()) return raw.unwrap_err();
    return p1_deserialize(raw.unwrap().data(), G1_SIZE);
}

Result<blst_p2_affine, KZGError> decode_g2_padded(const ByteSlice &src) {
    auto raw = unpad_g2(src);
    if (raw.is_err()) return raw.unwrap_err();
    return p2_deserialize(raw.unwrap().data(), G2_SIZE);
}
