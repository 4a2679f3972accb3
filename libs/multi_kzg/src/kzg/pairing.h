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
#include "constants.h"
#include "errors.h"
#include "result.h"
#include <vector>

// =======================================
// ============== PAIRING ================
// =======================================

struct PairingInput {
    blst_p1_affine p;
    blst_p2_affine q;
};

// PRODUCT_i e(p_i, q_i) == 1
// Pairs with a point at infinity on either side contribute 1 and are skipped.
class Pairing {
public:
    virtual ~Pairing() = default;
    virtual bool multi_pairing_check(const std::vector<PairingInput> &pairs) const = 0;
};

// Miller loops and one final exponentiation via blst
class NativePairing : public Pairing {
public:
    bool multi_pairing_check(const std::vector<PairingInput> &pairs) const override;
};

// =======================================
// ============ HOST BACKEND =============
// =======================================
//
// Curve primitives exposed by an execution environment, with EIP-2537 style
// padded encodings: Fp is 64 bytes (16 zero bytes + 48), G1 128, G2 256.
// Each call returns false when the host rejects the input.

class HostBackend {
public:
    virtual ~HostBackend() = default;

    // pairs: n * (G1 128 || G2 256). out is 32 bytes, last byte 1 on success
    virtual bool pairing_check(byte out[32], const byte* pairs, size_t size) = 0;

    virtual bool g1_add(byte out[G1_PADDED_SIZE],
                        const byte a[G1_PADDED_SIZE],
                        const byte b[G1_PADDED_SIZE]) = 0;

    // scalar is 32 bytes big-endian
    virtual bool g1_mul(byte out[G1_PADDED_SIZE],
                        const byte p[G1_PADDED_SIZE],
                        const byte scalar[SCALAR_SIZE]) = 0;

    virtual bool has_g1_neg() const { return false; }
    virtual bool g1_neg(byte out[G1_PADDED_SIZE], const byte p[G1_PADDED_SIZE]) {
        (void)out; (void)p;
        return false;
    }
};

// forwards the product check to HostBackend::pairing_check
class DelegatingPairing : public Pairing {
public:
    explicit DelegatingPairing(HostBackend &host) : host_(host) {}
    bool multi_pairing_check(const std::vector<PairingInput> &pairs) const override;

private:
    HostBackend &host_;
};

// G1 arithmetic through the host. Negation uses the host's own primitive
// when it has one, otherwise multiplies by r - 1.
class HostCurve {
public:
    explicit HostCurve(HostBackend &host) : host_(host) {}

    Result<blst_p1_affine, KZGError> add(const blst_p1_affine &a, const blst_p1_affine &b) const;
    Result<blst_p1_affine, KZGError> neg(const blst_p1_affine &a) const;
    Result<blst_p1_affine, KZGError> sub(const blst_p1_affine &a, const blst_p1_affine &b) const;

private:
    HostBackend &host_;
};
