#include <tbson/types.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <chrono>

using namespace tbson;

std::string_view tbson::name_of(element_type t) noexcept {
    switch (t) {
#define X(_code, _type, Name)                                                                      \
    case element_type::Name:                                                                       \
        return #Name;
        TBSON_ELEMENT_TYPE_X_LIST
#undef X
    }
    return "unknown";
}

bool tbson::is_known_type_tag(std::uint8_t tag) noexcept {
    switch (tag) {
#define X(Code, _type, _name) case Code:
        TBSON_ELEMENT_TYPE_X_LIST
#undef X
        return true;
    default:
        return false;
    }
}

namespace {

// Read a fixed number of decimal digits. Returns -1 on failure.
int read_digits(std::string_view& s, std::size_t count) noexcept {
    if (s.size() < count) {
        return -1;
    }
    // Only digits; no sign
    if (not std::ranges::all_of(s.substr(0, count), [](char c) { return c >= '0' and c <= '9'; })) {
        return -1;
    }
    int  value = 0;
    auto end   = s.data() + count;
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} or ptr != end) {
        return -1;
    }
    s.remove_prefix(count);
    return value;
}

bool consume(std::string_view& s, char c) noexcept {
    if (s.empty() or s.front() != c) {
        return false;
    }
    s.remove_prefix(1);
    return true;
}

// Convert a byte array to lowercase hex
template <std::size_t N>
std::string to_hex_string(const std::array<std::byte, N>& arr) {
    std::string out;
    out.reserve(N * 2);
    for (auto b : arr) {
        fmt::format_to(std::back_inserter(out), "{:02x}", std::to_integer<unsigned>(b));
    }
    return out;
}

// Decode exactly 2*N hex digits into `out`
template <std::size_t N>
bool from_hex_string(std::string_view hex, std::array<std::byte, N>& out) noexcept {
    if (hex.size() != N * 2) {
        return false;
    }
    for (std::size_t i = 0; i < N; ++i) {
        const int hi = detail::hex_digit(hex[i * 2]);
        const int lo = detail::hex_digit(hex[i * 2 + 1]);
        if (hi < 0 or lo < 0) {
            return false;
        }
        out[i] = static_cast<std::byte>((hi << 4) | lo);
    }
    return true;
}

}  // namespace

result<datetime> datetime::parse_rfc3339(std::string_view str) {
    using namespace std::chrono;
    auto bad = [&] {
        return decode_error::invalid_value(unexpected::str(str), "an RFC 3339 date-time string");
    };
    auto s = str;

    const int yr = read_digits(s, 4);
    if (yr < 0 or not consume(s, '-')) {
        return error(bad());
    }
    const int mon = read_digits(s, 2);
    if (mon < 0 or not consume(s, '-')) {
        return error(bad());
    }
    const int day = read_digits(s, 2);
    if (day < 0 or not(consume(s, 'T') or consume(s, 't') or consume(s, ' '))) {
        return error(bad());
    }
    const int hr = read_digits(s, 2);
    if (hr < 0 or hr > 23 or not consume(s, ':')) {
        return error(bad());
    }
    const int min = read_digits(s, 2);
    if (min < 0 or min > 59 or not consume(s, ':')) {
        return error(bad());
    }
    const int sec = read_digits(s, 2);
    // Allow a leap second, which is folded into the following second
    if (sec < 0 or sec > 60) {
        return error(bad());
    }

    std::int64_t frac_ms = 0;
    if (consume(s, '.')) {
        int ndigits = 0;
        while (not s.empty() and s.front() >= '0' and s.front() <= '9') {
            if (ndigits < 3) {
                frac_ms = frac_ms * 10 + (s.front() - '0');
            }
            ++ndigits;
            s.remove_prefix(1);
        }
        if (ndigits == 0) {
            return error(bad());
        }
        for (; ndigits < 3; ++ndigits) {
            frac_ms *= 10;
        }
    }

    std::int64_t offset_min = 0;
    if (consume(s, 'Z') or consume(s, 'z')) {
        // UTC
    } else if (not s.empty() and (s.front() == '+' or s.front() == '-')) {
        const int sign = s.front() == '-' ? -1 : 1;
        s.remove_prefix(1);
        const int off_hr = read_digits(s, 2);
        if (off_hr < 0 or off_hr > 23 or not consume(s, ':')) {
            return error(bad());
        }
        const int off_min = read_digits(s, 2);
        if (off_min < 0 or off_min > 59) {
            return error(bad());
        }
        offset_min = sign * (off_hr * 60 + off_min);
    } else {
        return error(bad());
    }
    if (not s.empty()) {
        return error(bad());
    }

    const year_month_day ymd{year{yr}, month{static_cast<unsigned>(mon)},
                             std::chrono::day{static_cast<unsigned>(day)}};
    if (not ymd.ok()) {
        return error(bad());
    }
    const auto tp = sys_days(ymd) + hours(hr) + minutes(min) + seconds(sec)
        + milliseconds(frac_ms) - minutes(offset_min);
    return datetime::from_millis(
        duration_cast<milliseconds>(tp.time_since_epoch()).count());
}

std::string datetime::to_rfc3339() const {
    using namespace std::chrono;
    const auto tp = sys_time<milliseconds>(milliseconds(_ms));
    const auto dp = floor<days>(tp);
    const year_month_day ymd{dp};
    const hh_mm_ss       hms{tp - dp};
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count(),
                       hms.subseconds().count());
}

result<decimal128> decimal128::from_bytes(std::span<const std::byte> bytes) {
    if (bytes.size() != 16) {
        return error(decode_error::invalid_length(bytes.size(), "16 bytes"));
    }
    decimal128 r;
    std::ranges::copy(bytes, r._bytes.begin());
    return r;
}

result<object_id> object_id::parse_str(std::string_view hex) {
    object_id r;
    if (not from_hex_string(hex, r._bytes)) {
        return error(decode_error::invalid_value(unexpected::str(hex),
                                                 "24-character, big-endian hex string"));
    }
    return r;
}

result<object_id> object_id::from_bytes(std::span<const std::byte> bytes) {
    if (bytes.size() != 12) {
        return error(decode_error::invalid_length(bytes.size(), "12 bytes"));
    }
    object_id r;
    std::ranges::copy(bytes, r._bytes.begin());
    return r;
}

std::string object_id::to_hex() const { return to_hex_string(_bytes); }

result<uuid> uuid::parse_str(std::string_view str) {
    std::string plain;
    if (str.size() == 36) {
        // 8-4-4-4-12
        for (std::size_t i = 0; i < str.size(); ++i) {
            const bool hyphen_pos = i == 8 or i == 13 or i == 18 or i == 23;
            if (hyphen_pos != (str[i] == '-')) {
                return error(
                    decode_error::invalid_value(unexpected::str(str), "a hyphenated UUID string"));
            }
            if (not hyphen_pos) {
                plain.push_back(str[i]);
            }
        }
    } else {
        plain = str;
    }
    uuid r;
    if (not from_hex_string(plain, r._bytes)) {
        return error(decode_error::invalid_value(unexpected::str(str), "a UUID string"));
    }
    return r;
}

result<uuid> uuid::from_bytes(std::span<const std::byte> bytes) {
    if (bytes.size() != 16) {
        return error(decode_error::invalid_length(bytes.size(), "16 bytes"));
    }
    uuid r;
    std::ranges::copy(bytes, r._bytes.begin());
    return r;
}

std::string uuid::to_string() const {
    auto hex = to_hex_string(_bytes);
    return fmt::format("{}-{}-{}-{}-{}",
                       std::string_view(hex).substr(0, 8),
                       std::string_view(hex).substr(8, 4),
                       std::string_view(hex).substr(12, 4),
                       std::string_view(hex).substr(16, 4),
                       std::string_view(hex).substr(20));
}
