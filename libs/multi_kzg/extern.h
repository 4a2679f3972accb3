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

// extern.h
#include <cstddef>
#include <cstdint>

// Return codes are KZGCodes. Scalars are 32 byte big-endian, points are
// uncompressed (G1 96, G2 192) unless named padded.

extern "C" {

    // setup bytes as written by SRS::serialize
    int mkzg_srs_load(void** out, const unsigned char* setup, size_t setup_size);
    void mkzg_srs_free(void* srs);
    int mkzg_srs_max_degree(void* srs, size_t* out);

    // out is 96 bytes
    int mkzg_commit(
        void* srs,
        const unsigned char* coeffs, size_t n_coeffs,
        unsigned char* out
    );

    // zs and ys hold k scalars each. *out is malloc'd wire proof bytes,
    // release it with mkzg_free
    int mkzg_generate(
        void* srs,
        const unsigned char* coeffs, size_t n_coeffs,
        const unsigned char* zs,
        const unsigned char* ys,
        size_t k,
        void** out,
        size_t* out_size
    );

    // 1 accepted, 0 rejected (NULL input included)
    int mkzg_verify(
        const unsigned char* proof, size_t proof_size,
        const unsigned char* g2_generator, size_t g2_size
    );

    // out is 128 / 256 bytes
    int mkzg_pad_g1(const unsigned char* point, size_t point_size, unsigned char* out);
    int mkzg_pad_g2(const unsigned char* point, size_t point_size, unsigned char* out);

    // out is 96 / 192 bytes
    int mkzg_unpad_g1(const unsigned char* padded, size_t padded_size, unsigned char* out);
    int mkzg_unpad_g2(const unsigned char* padded, size_t padded_size, unsigned char* out);

    void mkzg_free(void* buff);

} // extern "C"
