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
#include "scalars.h"
#include <utility>

// coefficients, index == power of X. The zero polynomial is empty.
using Polynomial = scalar_vec;

// ================== BASICS ==================

void poly_normalize(Polynomial &P);     // trims trailing zeros
size_t poly_degree(const Polynomial &P); // P must be normalized and nonzero
blst_fr eval_poly(const Polynomial &P, const blst_fr &x);

Polynomial poly_add(const Polynomial &a, const Polynomial &b);
Polynomial poly_sub(const Polynomial &a, const Polynomial &b);
Polynomial poly_scale(const Polynomial &P, const blst_fr &s);
Polynomial poly_mul(const Polynomial &a, const Polynomial &b);

// P(X) * (X + w)
Polynomial multiply_binomial(const Polynomial &P, const blst_fr &w);
Polynomial differentiate_polynomial(const Polynomial &f);

// ================== MULTI POINT ==================

// Z(X) = prod_i (X - z_i)
Polynomial derive_Z(const scalar_vec &zs);

// unique I(X) of degree < len(zs) with I(z_i) = y_i.
// throws KZGException(DUPLICATE_POINT) when two z_i coincide
Polynomial derive_I(const scalar_vec &zs, const scalar_vec &ys);

// P(X) = Q(X) * (X - z) + r
std::pair<Polynomial, blst_fr> divide_by_linear(const Polynomial &P, const blst_fr &z);

// P(X) = Q(X) * prod_i (X - roots_i) + R(X), deg R < len(roots)
std::pair<Polynomial, Polynomial> divmod_by_roots(const Polynomial &P, const scalar_vec &roots);

// exact division by prod_i (X - roots_i).
// throws KZGException(EVALUATION_MISMATCH) on a nonzero remainder
Polynomial divide_by_vanishing(const Polynomial &P, const scalar_vec &roots);
