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

#include "tests.h"
#include "constants.h"
#include "fp.h"
#include <cstring>

void test_scalar_arithmetic() {
    blst_fr a = new_scalar(7);
    blst_fr b = new_scalar(10);

    assert(equal_scalars(scalar_add(a, b), new_scalar(17)));
    assert(equal_scalars(scalar_mul(a, b), new_scalar(70)));

    // 7 - 10 + 3 == 0
    blst_fr c = scalar_sub(a, b);
    scalar_add_inplace(c, new_scalar(3));
    assert(scalar_is_zero(c));

    assert(equal_scalars(scalar_add(a, neg_scalar(a)), new_scalar()));

    blst_fr p;
    scalar_pow(p, new_scalar(2), 10);
    assert(equal_scalars(p, new_scalar(1024)));
}

void test_inverse() {
    blst_fr a = scalar_from_hash(seeded_hash(1));
    blst_fr a_inv = inv_scalar(a);
    assert(equal_scalars(scalar_mul(a, a_inv), new_scalar(1)));

    bool threw = false;
    try {
        inv_scalar(new_scalar());
    } catch (const KZGException &e) {
        threw = e.code() == DUPLICATE_POINT;
    }
    assert(threw);

    scalar_vec in = { new_scalar(2), new_scalar(3), a, new_scalar(1) };
    scalar_vec out;
    assert(batch_inv(out, in));
    for (size_t i = 0; i < in.size(); i++) {
        assert(equal_scalars(out[i], inv_scalar(in[i])));
    }

    in.push_back(new_scalar());
    assert(!batch_inv(out, in));
}

void test_fermat() {
    // a^(r-1) == 1
    bytes32 exp;
    std::memcpy(exp.data(), FR_ORDER_MINUS_ONE_BE, 32);

    blst_fr a = scalar_from_hash(seeded_hash(2));
    blst_fr out;
    scalar_pow_bytes(out, a, exp);
    assert(equal_scalars(out, new_scalar(1)));
}

void test_scalar_bytes() {
    bytes32 five = scalar_to_bytes(new_scalar(5));
    for (size_t i = 0; i < 31; i++) assert(five[i] == 0);
    assert(five[31] == 5);

    auto back = scalar_from_bytes(five.data());
    assert(back.is_ok());
    assert(equal_scalars(back.unwrap(), new_scalar(5)));

    // r - 1 is the largest canonical scalar, and equals -1
    auto r_minus_one = scalar_from_bytes(FR_ORDER_MINUS_ONE_BE);
    assert(r_minus_one.is_ok());
    assert(equal_scalars(r_minus_one.unwrap(), neg_scalar(new_scalar(1))));

    // r itself is rejected
    bytes32 r;
    std::memcpy(r.data(), FR_ORDER_MINUS_ONE_BE, 32);
    r[31] = 0x01;
    auto bad = scalar_from_bytes(r.data());
    assert(bad.is_err());
    assert(bad.unwrap_err().code == INPUT_VALIDATION);

    bytes32 ff;
    ff.fill(0xff);
    assert(scalar_from_bytes(ff.data()).is_err());
}

void test_base_field_range() {
    byte p[FP_SIZE];
    std::memcpy(p, FP_MODULUS_BE, FP_SIZE);
    assert(!fp_in_range(p));

    blst_fp out;
    assert(!fp_from_bytes(out, p));

    // p - 1
    p[FP_SIZE - 1] -= 1;
    assert(fp_in_range(p));
    assert(fp_from_bytes(out, p));

    byte round_trip[FP_SIZE];
    fp_to_bytes(round_trip, out);
    assert(std::memcmp(round_trip, p, FP_SIZE) == 0);

    byte zero[FP_SIZE] = {0};
    assert(fp_from_bytes(out, zero));
    assert(fp_is_zero(out));
}

void main_field() {
    printf("TESTING SCALAR ARITHMETIC\n");
    test_scalar_arithmetic();
    test_inverse();
    test_fermat();
    printf("SUCCESS\n\n");

    printf("TESTING SCALAR ENCODING\n");
    test_scalar_bytes();
    test_base_field_range();
    printf("SUCCESS\n\n");
}
