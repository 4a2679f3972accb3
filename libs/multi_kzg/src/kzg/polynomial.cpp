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

#include "polynomial.h"
#include <algorithm>

// ================== BASICS ==================

void poly_normalize(Polynomial &P) {
    while (!P.empty() && scalar_is_zero(P.back())) P.pop_back();
}

size_t poly_degree(const Polynomial &P) {
    return P.empty() ? 0 : P.size() - 1;
}

// Horner
blst_fr eval_poly(const Polynomial &P, const blst_fr &x) {
    blst_fr acc = new_scalar();
    for (size_t i = P.size(); i-- > 0;) {
        blst_fr_mul(&acc, &acc, &x);
        blst_fr_add(&acc, &acc, &P[i]);
    }
    return acc;
}

Polynomial poly_add(const Polynomial &a, const Polynomial &b) {
    Polynomial out(std::max(a.size(), b.size()), new_scalar());
    for (size_t i = 0; i < a.size(); i++) scalar_add_inplace(out[i], a[i]);
    for (size_t i = 0; i < b.size(); i++) scalar_add_inplace(out[i], b[i]);
    poly_normalize(out);
    return out;
}

Polynomial poly_sub(const Polynomial &a, const Polynomial &b) {
    Polynomial out(std::max(a.size(), b.size()), new_scalar());
    for (size_t i = 0; i < a.size(); i++) scalar_add_inplace(out[i], a[i]);
    for (size_t i = 0; i < b.size(); i++) scalar_sub_inplace(out[i], b[i]);
    poly_normalize(out);
    return out;
}

Polynomial poly_scale(const Polynomial &P, const blst_fr &s) {
    Polynomial out(P.size());
    for (size_t i = 0; i < P.size(); i++) blst_fr_mul(&out[i], &P[i], &s);
    poly_normalize(out);
    return out;
}

// schoolbook convolution, k <= 128 keeps this cheap
Polynomial poly_mul(const Polynomial &a, const Polynomial &b) {
    if (a.empty() || b.empty()) return {};

    Polynomial out(a.size() + b.size() - 1, new_scalar());
    blst_fr tmp;
    for (size_t i = 0; i < a.size(); i++) {
        for (size_t j = 0; j < b.size(); j++) {
            blst_fr_mul(&tmp, &a[i], &b[j]);
            scalar_add_inplace(out[i + j], tmp);
        }
    }
    poly_normalize(out);
    return out;
}

Polynomial multiply_binomial(const Polynomial &P, const blst_fr &w) {
    size_t d = P.size();
    Polynomial Q(d + 1, new_scalar());

    // Q[i+1] = P[i] (shift)
    // Q[i]  += P[i] * w
    blst_fr tmp;
    for (size_t i = 0; i < d; i++) {
        blst_fr_mul(&tmp, &P[i], &w);
        scalar_add_inplace(Q[i], tmp);
        scalar_add_inplace(Q[i + 1], P[i]);
    }
    poly_normalize(Q);
    return Q;
}

Polynomial differentiate_polynomial(const Polynomial &f) {
    if (f.size() <= 1) return {};
    Polynomial df(f.size() - 1);

    for (size_t i = 0; i < df.size(); i++) {
        blst_fr pow = new_scalar(i + 1);
        blst_fr_mul(&df[i], &f[i + 1], &pow);
    }
    poly_normalize(df);
    return df;
}

// ================== MULTI POINT ==================

Polynomial derive_Z(const scalar_vec &zs) {
    Polynomial Z = { new_scalar(1) };
    for (const blst_fr &z : zs) {
        Z = multiply_binomial(Z, neg_scalar(z));
    }
    return Z;
}

// I(X) = SUM( y_i * L_i(X) )
// L_i(X) = (Z(X) / (X - z_i)) / Z'(z_i)
Polynomial derive_I(const scalar_vec &zs, const scalar_vec &ys) {
    size_t n = zs.size();
    if (n != ys.size())
        throw KZGException(make_error(INPUT_VALIDATION, "derive_I: point/value length mismatch"));
    if (n == 0) return {};

    Polynomial Z = derive_Z(zs);
    Polynomial dZ = differentiate_polynomial(Z);

    // Z'(z_i) = PRODUCT_[j != i] (z_i - z_j), zero iff z_i is repeated
    scalar_vec denominators(n);
    for (size_t i = 0; i < n; i++) {
        denominators[i] = eval_poly(dZ, zs[i]);
    }

    scalar_vec inv_denominators;
    if (!batch_inv(inv_denominators, denominators))
        throw KZGException(make_error(DUPLICATE_POINT, "derive_I: duplicate interpolation points"));

    Polynomial I(n, new_scalar());
    blst_fr coeff, tmp;
    for (size_t i = 0; i < n; i++) {
        if (scalar_is_zero(ys[i])) continue;

        auto [numerator, rem] = divide_by_linear(Z, zs[i]);
        blst_fr_mul(&coeff, &ys[i], &inv_denominators[i]);

        for (size_t j = 0; j < numerator.size(); j++) {
            blst_fr_mul(&tmp, &numerator[j], &coeff);
            scalar_add_inplace(I[j], tmp);
        }
    }
    poly_normalize(I);
    return I;
}

// synthetic division
std::pair<Polynomial, blst_fr> divide_by_linear(const Polynomial &P, const blst_fr &z) {
    if (P.empty()) return { {}, new_scalar() };

    size_t n = P.size();
    Polynomial Q(n - 1);
    blst_fr carry = new_scalar();

    for (size_t j = n; j-- > 0;) {
        blst_fr_mul(&carry, &carry, &z);
        blst_fr_add(&carry, &carry, &P[j]);
        if (j > 0) Q[j - 1] = carry;
    }

    poly_normalize(Q);
    return { Q, carry };
}

// P = (X - z_1) Q_1 + r_1,  Q_1 = (X - z_2) Q_2 + r_2, ...
// so R = r_1 + (X - z_1) r_2 + (X - z_1)(X - z_2) r_3 + ...
// and R == 0 iff every r_i == 0
std::pair<Polynomial, Polynomial> divmod_by_roots(const Polynomial &P, const scalar_vec &roots) {
    Polynomial Q = P;
    poly_normalize(Q);

    Polynomial R;
    Polynomial basis = { new_scalar(1) };

    for (const blst_fr &z : roots) {
        auto [next, r] = divide_by_linear(Q, z);
        Q = std::move(next);

        if (!scalar_is_zero(r)) R = poly_add(R, poly_scale(basis, r));
        basis = multiply_binomial(basis, neg_scalar(z));
    }
    return { Q, R };
}

Polynomial divide_by_vanishing(const Polynomial &P, const scalar_vec &roots) {
    Polynomial Q = P;
    poly_normalize(Q);

    for (const blst_fr &z : roots) {
        auto [next, r] = divide_by_linear(Q, z);
        if (!scalar_is_zero(r))
            throw KZGException(make_error(
                EVALUATION_MISMATCH,
                "non-zero remainder dividing by Z(X), claimed values do not match the polynomial"));
        Q = std::move(next);
    }
    return Q;
}
