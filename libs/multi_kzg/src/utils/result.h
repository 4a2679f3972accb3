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
#include <utility>
#include <variant>

template <typename T, typename E>
class Result {
private:
    std::variant<T, E> data;

public:
    Result(const T& value) : data(std::in_place_index<0>, value) {}
    Result(T&& value) : data(std::in_place_index<0>, std::move(value)) {}
    Result(const E& error) : data(std::in_place_index<1>, error) {}
    Result(E&& error) : data(std::in_place_index<1>, std::move(error)) {}

    bool is_ok() const { return data.index() == 0; }
    bool is_err() const { return data.index() == 1; }

    T& unwrap() { return std::get<0>(data); }
    const T& unwrap() const { return std::get<0>(data); }
    E& unwrap_err() { return std::get<1>(data); }
    const E& unwrap_err() const { return std::get<1>(data); }
};
