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

#include "errors.h"

KZGError make_error(KZGCodes code, std::string msg) {
    return { code, DECODE_NONE, std::move(msg) };
}

KZGError decode_error(DecodeReason reason, std::string msg) {
    return { POINT_DECODE, reason, std::move(msg) };
}

const char* code_name(KZGCodes code) {
    switch (code) {
        case OK:                  return "OK";
        case INPUT_VALIDATION:    return "INPUT_VALIDATION";
        case POINT_DECODE:        return "POINT_DECODE";
        case EVALUATION_MISMATCH: return "EVALUATION_MISMATCH";
        case DEGREE_OVERFLOW:     return "DEGREE_OVERFLOW";
        case DUPLICATE_POINT:     return "DUPLICATE_POINT";
        case ENCODING_ERR:        return "ENCODING_ERR";
        case INVALID_SETUP:       return "INVALID_SETUP";
        case NULL_PARAMETER:      return "NULL_PARAMETER";
    }
    return "UNKNOWN";
}

const char* reason_name(DecodeReason reason) {
    switch (reason) {
        case DECODE_NONE:     return "NONE";
        case BAD_LENGTH:      return "BAD_LENGTH";
        case BAD_FLAGS:       return "BAD_FLAGS";
        case COORD_RANGE:     return "COORD_RANGE";
        case NOT_ON_CURVE:    return "NOT_ON_CURVE";
        case NOT_IN_SUBGROUP: return "NOT_IN_SUBGROUP";
    }
    return "UNKNOWN";
}

std::string describe(const KZGError& err) {
    std::string out = code_name(err.code);
    if (err.code == POINT_DECODE) {
        out += "(";
        out += reason_name(err.reason);
        out += ")";
    }
    if (!err.msg.empty()) {
        out += ": ";
        out += err.msg;
    }
    return out;
}
