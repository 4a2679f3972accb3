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

void test_group_ops() {
    blst_p1 g = p1_from_affine(p1_generator());
    blst_p1 two_g;
    p1_mult(two_g, g, new_scalar(2));
    assert(p1_equal(p1_to_affine(p1_add(g, g)), p1_to_affine(two_g)));
    assert(p1_equal(p1_to_affine(p1_sub(two_g, g)), p1_generator()));
    assert(p1_is_inf(p1_to_affine(p1_add(g, p1_neg(g)))));

    blst_p2 h = p2_from_affine(p2_generator());
    blst_p2 three_h;
    p2_mult(three_h, h, new_scalar(3));
    assert(p2_equal(p2_to_affine(p2_sub(three_h, h)), p2_to_affine(p2_add(h, h))));
    assert(p2_is_inf(p2_to_affine(p2_sub(h, h))));

    assert(p1_is_inf(p1_to_affine(new_p1())));
    assert(p2_is_inf(p2_to_affine(new_p2())));
}

void test_compressed() {
    blst_p1 g = p1_from_affine(p1_generator());
    blst_p1 P;
    p1_mult(P, g, scalar_from_hash(seeded_hash(10)));
    blst_p1_affine Pa = p1_to_affine(P);

    g1_compressed c1 = compress_p1(Pa);
    auto back1 = p1_uncompress(c1.data(), c1.size());
    assert(back1.is_ok());
    assert(p1_equal(back1.unwrap(), Pa));

    blst_p2 h = p2_from_affine(p2_generator());
    blst_p2 Q;
    p2_mult(Q, h, scalar_from_hash(seeded_hash(11)));
    blst_p2_affine Qa = p2_to_affine(Q);

    g2_compressed c2 = compress_p2(Qa);
    auto back2 = p2_uncompress(c2.data(), c2.size());
    assert(back2.is_ok());
    assert(p2_equal(back2.unwrap(), Qa));

    // hex of the compressed form
    std::string h1 = p1_hex(Pa);
    std::string h2 = p2_hex(Qa);
    assert(h1.size() == 2 * c1.size() && h2.size() == 2 * c2.size());
    assert(h1.find_first_not_of("0123456789abcdef") == std::string::npos);
    char lead[3];
    snprintf(lead, sizeof(lead), "%02x", c2[0]);
    assert(h2.compare(0, 2, lead) == 0);

    // infinity: 0xc0 then zeros
    g1_compressed inf = compress_p1(p1_to_affine(new_p1()));
    assert(inf[0] == 0xc0);
    auto inf_back = p1_uncompress(inf.data(), inf.size());
    assert(inf_back.is_ok());
    assert(p1_is_inf(inf_back.unwrap()));

    // missing compression flag
    g1_compressed no_flag = c1;
    no_flag[0] &= 0x7f;
    auto bad_flag = p1_uncompress(no_flag.data(), no_flag.size());
    assert(bad_flag.is_err());
    assert(bad_flag.unwrap_err().reason == BAD_FLAGS);

    auto short_len = p2_uncompress(c2.data(), c2.size() - 1);
    assert(short_len.is_err());
    assert(short_len.unwrap_err().code == POINT_DECODE);
    assert(short_len.unwrap_err().reason == BAD_LENGTH);
}

void test_uncompressed() {
    blst_p1_affine g = p1_generator();
    g1_bytes raw = serialize_p1(g);

    auto back = p1_deserialize(raw.data(), raw.size());
    assert(back.is_ok());
    assert(p1_equal(back.unwrap(), g));

    blst_p2_affine h = p2_generator();
    g2_bytes raw2 = serialize_p2(h);
    auto back2 = p2_deserialize(raw2.data(), raw2.size());
    assert(back2.is_ok());
    assert(p2_equal(back2.unwrap(), h));

    // x_c0 leads: first 48 bytes are the real part of x
    byte x_c0[FP_SIZE];
    fp_to_bytes(x_c0, h.x.fp[0]);
    assert(std::memcmp(raw2.data(), x_c0, FP_SIZE) == 0);

    // infinity is all zeros
    g1_bytes inf = serialize_p1(p1_to_affine(new_p1()));
    for (byte b : inf) assert(b == 0);
    auto inf_back = p1_deserialize(inf.data(), inf.size());
    assert(inf_back.is_ok());
    assert(p1_is_inf(inf_back.unwrap()));

    g2_bytes inf2 = serialize_p2(p2_to_affine(new_p2()));
    auto inf2_back = p2_deserialize(inf2.data(), inf2.size());
    assert(inf2_back.is_ok());
    assert(p2_is_inf(inf2_back.unwrap()));
}

void test_decode_failures() {
    g1_bytes raw = serialize_p1(p1_generator());

    auto short_len = p1_deserialize(raw.data(), raw.size() - 1);
    assert(short_len.is_err());
    assert(short_len.unwrap_err().reason == BAD_LENGTH);

    // x == p
    g1_bytes out_of_range = raw;
    std::memcpy(out_of_range.data(), FP_MODULUS_BE, FP_SIZE);
    auto range = p1_deserialize(out_of_range.data(), out_of_range.size());
    assert(range.is_err());
    assert(range.unwrap_err().reason == COORD_RANGE);

    // y + 1 breaks y^2 = x^3 + 4
    g1_bytes off_curve = raw;
    off_curve[G1_SIZE - 1] ^= 0x01;
    auto curve = p1_deserialize(off_curve.data(), off_curve.size());
    assert(curve.is_err());
    assert(curve.unwrap_err().reason == NOT_ON_CURVE);

    g2_bytes raw2 = serialize_p2(p2_generator());
    raw2[G2_SIZE - 1] ^= 0x01;
    auto curve2 = p2_deserialize(raw2.data(), raw2.size());
    assert(curve2.is_err());
    assert(curve2.unwrap_err().reason == NOT_ON_CURVE);
}

// a point on E(Fp) outside the order r subgroup: smallest x with x^3 + 4 square
void test_subgroup_check() {
    uint64_t four_limbs[6] = {4, 0, 0, 0, 0, 0};
    blst_fp four;
    blst_fp_from_uint64(&four, four_limbs);

    blst_p1_affine P;
    for (uint64_t i = 1; ; i++) {
        uint64_t limbs[6] = {i, 0, 0, 0, 0, 0};
        blst_fp x, rhs;
        blst_fp_from_uint64(&x, limbs);
        blst_fp_sqr(&rhs, &x);
        blst_fp_mul(&rhs, &rhs, &x);
        blst_fp_add(&rhs, &rhs, &four);

        blst_fp y;
        if (blst_fp_sqrt(&y, &rhs)) {
            P.x = x;
            P.y = y;
            break;
        }
    }
    assert(blst_p1_affine_on_curve(&P));

    g1_bytes raw;
    fp_to_bytes(raw.data(), P.x);
    fp_to_bytes(raw.data() + FP_SIZE, P.y);

    auto res = p1_deserialize(raw.data(), raw.size());
    assert(res.is_err());
    assert(res.unwrap_err().code == POINT_DECODE);
    assert(res.unwrap_err().reason == NOT_IN_SUBGROUP);
}

void main_points() {
    printf("TESTING CURVE POINTS\n");
    test_group_ops();
    printf("G1 generator: ");
    print_p1(p1_generator());
    printf("SUCCESS\n\n");

    printf("TESTING POINT CODECS\n");
    test_compressed();
    test_uncompressed();
    test_decode_failures();
    test_subgroup_check();
    printf("SUCCESS\n\n");
}
