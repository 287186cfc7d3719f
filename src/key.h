/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <type_traits>
#include <variant>

namespace tsbtreedb {

    /**
     * Tree key: a signed or unsigned 64-bit integer, a double or a UTF-8
     * string.
     *
     * Keys are totally ordered. Numeric keys compare by value across the
     * three numeric kinds (Key(15) == Key(15.0), Key(15) < Key(15.5)) and
     * every numeric key orders before every string key. Strings compare
     * bytewise.
     */
    class Key {
    public:
        enum class Kind : uint8_t {
            Int64,
            UInt64,
            Double,
            String
        };

        template <typename T,
                  typename std::enable_if<std::is_integral<T>::value && std::is_signed<T>::value, int>::type = 0>
        Key(T v) : value_(static_cast<int64_t>(v)) {}

        template <typename T,
                  typename std::enable_if<std::is_integral<T>::value && std::is_unsigned<T>::value &&
                                          !std::is_same<T, bool>::value, int>::type = 0>
        Key(T v) : value_(static_cast<uint64_t>(v)) {}

        // Throws std::invalid_argument for NaN
        Key(double v);
        Key(float v) : Key(static_cast<double>(v)) {}

        Key(std::string v) : value_(std::move(v)) {}
        Key(const char* v) : value_(std::string(v)) {}

        Kind kind() const { return static_cast<Kind>(value_.index()); }
        bool is_numeric() const { return kind() != Kind::String; }

        int64_t as_int64() const { return std::get<int64_t>(value_); }
        uint64_t as_uint64() const { return std::get<uint64_t>(value_); }
        double as_double() const { return std::get<double>(value_); }
        const std::string& as_string() const { return std::get<std::string>(value_); }

        // <0, 0, >0 like strcmp
        int compare(const Key& other) const;

        std::string to_string() const;

        // Appends the tagged wire form to out
        void encode(std::string& out) const;

        // Decodes one key from buf, storing the number of bytes used in consumed.
        // Throws MalformedRecord on an unknown tag or a truncated body.
        static Key decode(const uint8_t* buf, size_t len, size_t* consumed);

        friend bool operator==(const Key& a, const Key& b) { return a.compare(b) == 0; }
        friend bool operator!=(const Key& a, const Key& b) { return a.compare(b) != 0; }
        friend bool operator<(const Key& a, const Key& b)  { return a.compare(b) < 0; }
        friend bool operator<=(const Key& a, const Key& b) { return a.compare(b) <= 0; }
        friend bool operator>(const Key& a, const Key& b)  { return a.compare(b) > 0; }
        friend bool operator>=(const Key& a, const Key& b) { return a.compare(b) >= 0; }

    private:
        std::variant<int64_t, uint64_t, double, std::string> value_;
    };

    std::ostream& operator<<(std::ostream& os, const Key& key);

} // namespace tsbtreedb
