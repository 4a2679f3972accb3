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
#include <cstring>
#include <fstream>

static void reseal(std::vector<byte> &buff) {
    size_t body = buff.size() - SRS_DIGEST_SIZE;
    Hash digest = derive_hash({buff.data(), body});
    std::memcpy(buff.data() + body, digest.data(), SRS_DIGEST_SIZE);
}

void test_powers() {
    blst_fr tau = test_tau();
    SRS S(4, tau);
    assert(S.g1_size() == 5);
    assert(S.g2_size() == 5);
    assert(S.max_degree() == 4);

    assert(p1_equal(S.g1_affine()[0], p1_generator()));
    assert(p2_equal(S.g2_generator(), p2_generator()));

    // [tau^2]_1
    blst_fr tau2;
    scalar_pow(tau2, tau, 2);
    blst_p1 expected;
    p1_mult(expected, p1_from_affine(p1_generator()), tau2);
    assert(p1_equal(S.g1_affine()[2], p1_to_affine(expected)));

    SRS short_g2(8, 2, tau);
    assert(short_g2.g1_size() == 9);
    assert(short_g2.g2_size() == 3);

    std::string msg;
    try {
        SRS bad(2, 5, tau);
    } catch (const KZGException &e) {
        assert(e.code() == INVALID_SETUP);
        msg = e.error().msg;
    }
    assert(msg.find("g2 degree") != std::string::npos);

    msg.clear();
    try {
        SRS empty(0, 0, tau);
    } catch (const KZGException &e) {
        assert(e.code() == INVALID_SETUP);
        msg = e.error().msg;
    }
    assert(msg.find("g1 degree must be at least 1") != std::string::npos);
}

void test_round_trip() {
    SRS S(6, 3, test_tau());
    std::vector<byte> buff = S.serialize();
    assert(buff.size() == SRS_HEADER_SIZE + 7 * G1_COMPRESSED_SIZE + 4 * G2_COMPRESSED_SIZE + SRS_DIGEST_SIZE);

    auto loaded = load_srs(buff);
    assert(loaded.is_ok());
    const SRS &L = loaded.unwrap();
    assert(L.g1_size() == 7);
    assert(L.g2_size() == 4);
    for (size_t i = 0; i < L.g1_size(); i++) assert(p1_equal(L.g1_affine()[i], S.g1_affine()[i]));
    for (size_t i = 0; i < L.g2_size(); i++) assert(p2_equal(L.g2_affine()[i], S.g2_affine()[i]));

    // file path
    std::string path = "/tmp/multi_kzg_test.srs";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(buff.data()), buff.size());
    }
    auto from_file = load_srs_file(path);
    assert(from_file.is_ok());
    assert(from_file.unwrap().max_degree() == 6);

    auto missing = load_srs_file("/tmp/multi_kzg_missing/none.srs");
    assert(missing.is_err());
    assert(missing.unwrap_err().code == INVALID_SETUP);
}

void test_tampered() {
    SRS S(4, test_tau());
    std::vector<byte> good = S.serialize();

    // digest no longer matches
    std::vector<byte> flipped = good;
    flipped[SRS_HEADER_SIZE + G1_COMPRESSED_SIZE + 5] ^= 0x01;
    auto r1 = load_srs(flipped);
    assert(r1.is_err());
    assert(r1.unwrap_err().code == INVALID_SETUP);

    // truncated
    std::vector<byte> truncated(good.begin(), good.end() - 1);
    auto r2 = load_srs(truncated);
    assert(r2.is_err());
    assert(r2.unwrap_err().code == INVALID_SETUP);

    // bad magic
    std::vector<byte> magic = good;
    magic[0] = 'X';
    assert(load_srs(magic).is_err());

    // degree claims more points than present
    std::vector<byte> degree = good;
    degree[11] += 1;
    reseal(degree);
    auto r3 = load_srs(degree);
    assert(r3.is_err());
    assert(r3.unwrap_err().code == INVALID_SETUP);

    // valid digest but G1[0] is not the generator
    std::vector<byte> not_gen = good;
    blst_p1 two_g;
    p1_mult(two_g, p1_from_affine(p1_generator()), new_scalar(2));
    g1_compressed c = compress_p1(p1_to_affine(two_g));
    std::memcpy(not_gen.data() + SRS_HEADER_SIZE, c.data(), G1_COMPRESSED_SIZE);
    reseal(not_gen);
    auto r4 = load_srs(not_gen);
    assert(r4.is_err());
    assert(r4.unwrap_err().code == INVALID_SETUP);

    // valid digest but a point fails to decode
    std::vector<byte> bad_point = good;
    bad_point[SRS_HEADER_SIZE + G1_COMPRESSED_SIZE] &= 0x7f;
    reseal(bad_point);
    auto r5 = load_srs(bad_point);
    assert(r5.is_err());
    assert(r5.unwrap_err().code == POINT_DECODE);
}

void main_srs() {
    printf("TESTING SRS\n");
    test_powers();
    test_round_trip();
    test_tampered();
    printf("SUCCESS\n\n");
}
