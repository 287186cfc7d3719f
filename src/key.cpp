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

#include "key.h"
#include "errors.h"
#include "persistence/config.h"
#include "util/endian.hpp"
#include <cmath>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace tsbtreedb {

    using namespace persist;

    namespace {

        // 2^63 and 2^64 are exactly representable as doubles
        constexpr double kTwo63 = 9223372036854775808.0;
        constexpr double kTwo64 = 18446744073709551616.0;

        template <typename T>
        int three_way(const T& a, const T& b) {
            return (a < b) ? -1 : (b < a) ? 1 : 0;
        }

        int compare_int_uint(int64_t a, uint64_t b) {
            if (a < 0) return -1;
            return three_way(static_cast<uint64_t>(a), b);
        }

        int compare_int_double(int64_t a, double d) {
            if (d >= kTwo63) return -1;
            if (d < -kTwo63) return 1;
            double whole = std::trunc(d);
            int c = three_way(a, static_cast<int64_t>(whole));
            if (c != 0) return c;
            // same integral part, the fraction decides
            return three_way(0.0, d - whole);
        }

        int compare_uint_double(uint64_t a, double d) {
            if (d < 0.0) return 1;
            if (d >= kTwo64) return -1;
            double whole = std::trunc(d);
            int c = three_way(a, static_cast<uint64_t>(whole));
            if (c != 0) return c;
            return three_way(0.0, d - whole);
        }

    } // namespace

    Key::Key(double v) : value_(v) {
        if (std::isnan(v)) {
            throw std::invalid_argument("Key cannot be NaN");
        }
    }

    int Key::compare(const Key& other) const {
        const Kind lk = kind();
        const Kind rk = other.kind();

        if (lk == Kind::String || rk == Kind::String) {
            if (lk != rk) {
                return lk == Kind::String ? 1 : -1;
            }
            int c = as_string().compare(other.as_string());
            return (c < 0) ? -1 : (c > 0) ? 1 : 0;
        }

        switch (lk) {
        case Kind::Int64:
            switch (rk) {
            case Kind::Int64:  return three_way(as_int64(), other.as_int64());
            case Kind::UInt64: return compare_int_uint(as_int64(), other.as_uint64());
            default:           return compare_int_double(as_int64(), other.as_double());
            }
        case Kind::UInt64:
            switch (rk) {
            case Kind::Int64:  return -compare_int_uint(other.as_int64(), as_uint64());
            case Kind::UInt64: return three_way(as_uint64(), other.as_uint64());
            default:           return compare_uint_double(as_uint64(), other.as_double());
            }
        default:
            switch (rk) {
            case Kind::Int64:  return -compare_int_double(other.as_int64(), as_double());
            case Kind::UInt64: return -compare_uint_double(other.as_uint64(), as_double());
            default:           return three_way(as_double(), other.as_double());
            }
        }
    }

    std::string Key::to_string() const {
        switch (kind()) {
        case Kind::Int64:
            return std::to_string(as_int64());
        case Kind::UInt64:
            return std::to_string(as_uint64());
        case Kind::Double: {
            std::ostringstream oss;
            oss.precision(std::numeric_limits<double>::digits10);
            oss << as_double();
            return oss.str();
        }
        default:
            return as_string();
        }
    }

    void Key::encode(std::string& out) const {
        uint8_t body[key_format::kTagSize + key_format::kNumericSize];

        switch (kind()) {
        case Kind::Int64:
            body[0] = key_format::kTagInt64;
            util::store_bei64(body + 1, as_int64());
            break;
        case Kind::UInt64:
            body[0] = key_format::kTagUInt64;
            util::store_be64(body + 1, as_uint64());
            break;
        case Kind::Double:
            body[0] = key_format::kTagDouble;
            util::store_bef64(body + 1, as_double());
            break;
        default: {
            const std::string& s = as_string();
            if (s.size() > std::numeric_limits<uint32_t>::max()) {
                throw std::length_error("string key longer than 4GiB");
            }
            body[0] = key_format::kTagString;
            util::store_be32(body + 1, static_cast<uint32_t>(s.size()));
            out.append(reinterpret_cast<const char*>(body),
                       key_format::kTagSize + key_format::kStringLengthSize);
            out.append(s);
            return;
        }
        }

        out.append(reinterpret_cast<const char*>(body), sizeof(body));
    }

    Key Key::decode(const uint8_t* buf, size_t len, size_t* consumed) {
        if (len < key_format::kTagSize) {
            throw MalformedRecord("truncated key: missing tag");
        }

        const uint8_t tag = buf[0];
        const uint8_t* body = buf + key_format::kTagSize;
        const size_t avail = len - key_format::kTagSize;

        if (tag == key_format::kTagString) {
            if (avail < key_format::kStringLengthSize) {
                throw MalformedRecord("truncated key: missing string length");
            }
            const size_t n = util::load_be32(body);
            if (avail - key_format::kStringLengthSize < n) {
                throw MalformedRecord("truncated key: string body shorter than its length");
            }
            *consumed = key_format::kTagSize + key_format::kStringLengthSize + n;
            return Key(std::string(reinterpret_cast<const char*>(body + key_format::kStringLengthSize), n));
        }

        if (tag != key_format::kTagInt64 && tag != key_format::kTagUInt64 && tag != key_format::kTagDouble) {
            throw MalformedRecord("unknown key tag " + std::to_string(static_cast<unsigned>(tag)));
        }
        if (avail < key_format::kNumericSize) {
            throw MalformedRecord("truncated key: numeric body");
        }

        *consumed = key_format::kTagSize + key_format::kNumericSize;
        switch (tag) {
        case key_format::kTagInt64:
            return Key(util::load_bei64(body));
        case key_format::kTagUInt64:
            return Key(util::load_be64(body));
        default: {
            double d = util::load_bef64(body);
            if (std::isnan(d)) {
                throw MalformedRecord("NaN key");
            }
            return Key(d);
        }
        }
    }

    std::ostream& operator<<(std::ostream& os, const Key& key) {
        return os << key.to_string();
    }

} // namespace tsbtreedb
