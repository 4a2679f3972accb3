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
#include "errors.h"
#include "hashing.h"
#include "result.h"
#include "scalars.h"
#include <string>
#include <vector>

// =======================================
// ============= SRS =====================
// =======================================
//
// { tau^i * G1 } and { tau^i * G2 }. The G2 side may be shorter than the
// G1 side. Loaded once and shared by const reference; nothing mutates it
// after construction.

class SRS {
public:
    // tau is known to the caller: tests and local tooling only
    SRS(size_t g1_degree, size_t g2_degree, const blst_fr &tau);
    SRS(size_t degree, const blst_fr &tau) : SRS(degree, degree, tau) {}

    size_t max_degree() const { return g1_powers_jacob.size() - 1; }
    size_t g1_size() const { return g1_powers_jacob.size(); }
    size_t g2_size() const { return g2_powers_jacob.size(); }

    const std::vector<blst_p1>& g1_powers() const { return g1_powers_jacob; }
    const std::vector<blst_p2>& g2_powers() const { return g2_powers_jacob; }
    const std::vector<blst_p1_affine>& g1_affine() const { return g1_powers_aff; }
    const std::vector<blst_p2_affine>& g2_affine() const { return g2_powers_aff; }

    const blst_p2_affine& g2_generator() const { return g2_powers_aff[0]; }

    // "MKZGSRS1" || n1 || n2 || n1 * G1 (48) || n2 * G2 (96) || blake3
    std::vector<byte> serialize() const;

private:
    std::vector<blst_p1> g1_powers_jacob;
    std::vector<blst_p1_affine> g1_powers_aff;

    std::vector<blst_p2> g2_powers_jacob;
    std::vector<blst_p2_affine> g2_powers_aff;

    SRS(std::vector<blst_p1_affine> &&g1s, std::vector<blst_p2_affine> &&g2s);

    friend Result<SRS, KZGError> load_srs(const ByteSlice &source);
};

Result<SRS, KZGError> load_srs(const ByteSlice &source);
Result<SRS, KZGError> load_srs_file(const std::string &path);
