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

#include "verifier.h"
#include "constants.h"
#include "proofs.h"
#include <algorithm>
#include <atomic>
#include <future>
#include <system_error>

// ========== STRUCTURE ==================

static bool valid_evaluations(const scalar_vec &zs, const scalar_vec &ys) {
    size_t k = zs.size();
    if (k != ys.size()) return false;
    if (k == 0 || k > MAX_EVALUATION_POINTS) return false;

    for (size_t i = 0; i < k; i++)
        for (size_t j = i + 1; j < k; j++)
            if (equal_scalars(zs[i], zs[j])) return false;
    return true;
}

static bool valid_g1(const blst_p1_affine &p) {
    if (p1_is_inf(p)) return true;
    return blst_p1_affine_on_curve(&p) && blst_p1_affine_in_g1(&p);
}

static bool valid_g2(const blst_p2_affine &p) {
    if (p2_is_inf(p)) return true;
    return blst_p2_affine_on_curve(&p) && blst_p2_affine_in_g2(&p);
}

// ========== VERIFY MULTI_POINT_PROOF ==================

bool Verifier::verify(const MultiProof &proof) const {
    if (!valid_evaluations(proof.z_values, proof.y_values)) return false;

    if (!valid_g1(proof.z_commit) || !valid_g1(proof.neg_commitment_minus_i_tau)) return false;
    if (!valid_g2(proof.proof) || !valid_g2(g2_)) return false;

    // Z(tau) and Q(tau) are nonzero for any honest opening. With either at
    // infinity the first pairing drops out and the check is vacuous.
    if (p1_is_inf(proof.z_commit) || p2_is_inf(proof.proof) || p2_is_inf(g2_)) return false;

    // e(z_commit, proof) * e(neg_commitment_minus_i_tau, g2) == 1
    std::vector<PairingInput> pairs = {
        { proof.z_commit, proof.proof },
        { proof.neg_commitment_minus_i_tau, g2_ },
    };
    return pairing_.multi_pairing_check(pairs);
}

bool Verifier::verify(
    const ByteSlice &neg_commitment_minus_i_tau,
    const ByteSlice &z_commit,
    const std::vector<bytes32> &z_values,
    const std::vector<bytes32> &y_values,
    const ByteSlice &proof
) const {
    if (z_values.size() != y_values.size()) return false;

    MultiProof decoded;

    auto neg = p1_deserialize(neg_commitment_minus_i_tau.data(), neg_commitment_minus_i_tau.size());
    if (neg.is_err()) return false;
    decoded.neg_commitment_minus_i_tau = neg.unwrap();

    auto zc = p1_deserialize(z_commit.data(), z_commit.size());
    if (zc.is_err()) return false;
    decoded.z_commit = zc.unwrap();

    auto pi = p2_deserialize(proof.data(), proof.size());
    if (pi.is_err()) return false;
    decoded.proof = pi.unwrap();

    decoded.z_values.reserve(z_values.size());
    for (auto &b : z_values) {
        auto z = scalar_from_bytes(b.data());
        if (z.is_err()) return false;
        decoded.z_values.push_back(z.unwrap());
    }

    decoded.y_values.reserve(y_values.size());
    for (auto &b : y_values) {
        auto y = scalar_from_bytes(b.data());
        if (y.is_err()) return false;
        decoded.y_values.push_back(y.unwrap());
    }

    return verify(decoded);
}

bool Verifier::verify_wire(const ByteSlice &wire) const {
    auto proof = unmarshal_multi_proof(wire);
    if (proof.is_err()) return false;
    return verify(proof.unwrap());
}

bool verify(
    const ByteSlice &neg_commitment_minus_i_tau,
    const ByteSlice &z_commit,
    const std::vector<bytes32> &z_values,
    const std::vector<bytes32> &y_values,
    const ByteSlice &proof,
    const ByteSlice &g2_generator
) {
    auto g2 = p2_deserialize(g2_generator.data(), g2_generator.size());
    if (g2.is_err()) return false;

    NativePairing pairing;
    Verifier verifier(g2.unwrap(), pairing);
    return verifier.verify(neg_commitment_minus_i_tau, z_commit, z_values, y_values, proof);
}

// ========== AGAINST A KNOWN COMMITMENT ==================

bool verify_against_commitment(
    const Commitment &C,
    const scalar_vec &zs,
    const scalar_vec &ys,
    const blst_p2_affine &proof,
    const SRS &srs
) {
    if (!valid_evaluations(zs, ys)) return false;
    if (!valid_g1(C)) return false;
    if (zs.size() + 1 > srs.g1_size()) return false;

    MultiProof rebuilt;
    try {
        Polynomial Z = derive_Z(zs);
        Polynomial I = derive_I(zs, ys);

        rebuilt.z_commit = commit_g1(Z, srs);
        blst_p1 I_tau = commit_g1_projective(I, srs);
        rebuilt.neg_commitment_minus_i_tau = p1_to_affine(p1_neg(p1_sub(p1_from_affine(C), I_tau)));
    } catch (const KZGException &) {
        return false;
    }
    rebuilt.proof = proof;
    rebuilt.z_values = zs;
    rebuilt.y_values = ys;

    NativePairing pairing;
    Verifier verifier(srs.g2_generator(), pairing);
    return verifier.verify(rebuilt);
}

// ========== BATCH ==================

bool batch_verify(
    const std::vector<MultiProof> &proofs,
    const Verifier &verifier,
    size_t workers
) {
    size_t n = proofs.size();
    if (n == 0) return false;

    workers = std::clamp<size_t>(workers, 1, n);
    size_t chunk = (n + workers - 1) / workers;

    std::vector<std::future<void>> futures;
    futures.reserve(workers);

    std::atomic<bool> all_ok(true);
    auto run_chunk = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; i++) {
            if (!all_ok.load()) return;
            if (!verifier.verify(proofs[i])) {
                all_ok.store(false);
                return;
            }
        }
    };

    for (size_t w = 0; w < workers; w++) {
        size_t begin = w * chunk;
        size_t end = std::min(n, begin + chunk);
        if (begin >= end) break;

        try {
            futures.push_back(std::async(std::launch::async, run_chunk, begin, end));
        } catch (const std::system_error &) {
            // no thread available, verify this chunk on the caller
            run_chunk(begin, end);
        }
    }

    for (auto &f : futures) f.get();
    return all_ok.load();
}

// =======================================
// ============ HOSTED ===================
// =======================================

bool HostedVerifier::verify_with_commitment(
    const Commitment &C,
    const blst_p1_affine &I_tau,
    const blst_p1_affine &z_commit,
    const scalar_vec &z_values,
    const scalar_vec &y_values,
    const blst_p2_affine &proof
) const {
    if (!valid_g1(C) || !valid_g1(I_tau)) return false;

    auto diff = curve_.sub(C, I_tau);
    if (diff.is_err()) return false;

    auto neg = curve_.neg(diff.unwrap());
    if (neg.is_err()) return false;

    MultiProof assembled;
    assembled.z_commit = z_commit;
    assembled.neg_commitment_minus_i_tau = neg.unwrap();
    assembled.proof = proof;
    assembled.z_values = z_values;
    assembled.y_values = y_values;
    return verifier_.verify(assembled);
}
