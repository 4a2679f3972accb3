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
#include "hashing.h"
#include "kzg.h"
#include "pairing.h"
#include "scalars.h"
#include "settings.h"
#include <thread>
#include <vector>

// =======================================
// ============== VERIFIER ===============
// =======================================
//
// e(z_commit, proof) * e(neg_commitment_minus_i_tau, g2) == 1
//
// Every path returns false on malformed input, never throws.

class Verifier {
public:
    Verifier(const blst_p2_affine &g2_generator, const Pairing &pairing)
        : g2_(g2_generator), pairing_(pairing) {}

    bool verify(const MultiProof &proof) const;

    // uncompressed points (96 / 192 bytes), scalars 32 bytes big-endian
    bool verify(
        const ByteSlice &neg_commitment_minus_i_tau,
        const ByteSlice &z_commit,
        const std::vector<bytes32> &z_values,
        const std::vector<bytes32> &y_values,
        const ByteSlice &proof
    ) const;

    bool verify_wire(const ByteSlice &wire) const;

private:
    blst_p2_affine g2_;
    const Pairing &pairing_;
};

// native pairing, g2_generator is 192 uncompressed bytes
bool verify(
    const ByteSlice &neg_commitment_minus_i_tau,
    const ByteSlice &z_commit,
    const std::vector<bytes32> &z_values,
    const std::vector<bytes32> &y_values,
    const ByteSlice &proof,
    const ByteSlice &g2_generator
);

// recomputes z_commit and I(tau) from the setup, so the claimed values are
// bound to the commitment C rather than trusted from the prover
bool verify_against_commitment(
    const Commitment &C,
    const scalar_vec &zs,
    const scalar_vec &ys,
    const blst_p2_affine &proof,
    const SRS &srs
);

// AND over all proofs, spread across workers. empty -> false
bool batch_verify(
    const std::vector<MultiProof> &proofs,
    const Verifier &verifier,
    size_t workers = std::thread::hardware_concurrency()
);

// =======================================
// ============ HOSTED ===================
// =======================================
//
// Same check with every pairing and G1 operation delegated to a host.

class HostedVerifier {
public:
    HostedVerifier(const blst_p2_affine &g2_generator, HostBackend &host)
        : pairing_(host), curve_(host), verifier_(g2_generator, pairing_) {}

    bool verify_wire(const ByteSlice &wire) const { return verifier_.verify_wire(wire); }

    // neg_commitment_minus_i_tau = -(C - I_tau), derived through the host
    bool verify_with_commitment(
        const Commitment &C,
        const blst_p1_affine &I_tau,
        const blst_p1_affine &z_commit,
        const scalar_vec &z_values,
        const scalar_vec &y_values,
        const blst_p2_affine &proof
    ) const;

private:
    DelegatingPairing pairing_;
    HostCurve curve_;
    Verifier verifier_;
};
