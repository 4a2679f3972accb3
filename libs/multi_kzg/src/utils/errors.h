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
#include <stdexcept>
#include <string>
#include <utility>

// shared with the C bindings, values are stable
enum KZGCodes {
    OK = 0,
    INPUT_VALIDATION = 1,
    POINT_DECODE = 2,
    EVALUATION_MISMATCH = 3,
    DEGREE_OVERFLOW = 4,
    DUPLICATE_POINT = 5,
    ENCODING_ERR = 6,
    INVALID_SETUP = 7,
    NULL_PARAMETER = 8,
};

enum DecodeReason {
    DECODE_NONE = 0,
    BAD_LENGTH = 1,
    BAD_FLAGS = 2,
    COORD_RANGE = 3,
    NOT_ON_CURVE = 4,
    NOT_IN_SUBGROUP = 5,
};

struct KZGError {
    KZGCodes code;
    DecodeReason reason;
    std::string msg;
};

KZGError make_error(KZGCodes code, std::string msg);
KZGError decode_error(DecodeReason reason, std::string msg);

const char* code_name(KZGCodes code);
const char* reason_name(DecodeReason reason);
std::string describe(const KZGError& err);

// thrown inside the arithmetic layers, caught at the entry points
class KZGException : public std::runtime_error {
public:
    explicit KZGException(KZGError err)
        : std::runtime_error(describe(err)), err_(std::move(err)) {}

    const KZGError& error() const { return err_; }
    KZGCodes code() const { return err_.code; }

private:
    KZGError err_;
};
