#include "castor/core/formats.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <system_error>

namespace castor::formats {

namespace {

bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

// Reads exactly `count` digits starting at `pos`.
std::optional<unsigned> read_digits(std::string_view v, size_t pos, size_t count) noexcept {
    if (pos + count > v.size()) {
        return std::nullopt;
    }
    unsigned out = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!is_digit(v[i])) {
            return std::nullopt;
        }
        out = out * 10 + static_cast<unsigned>(v[i] - '0');
    }
    return out;
}

void append_padded(std::string& out, long long n, int width) {
    std::array<char, 24> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), n < 0 ? -n : n);
    if (ec != std::errc()) {
        return;
    }
    if (n < 0) {
        out.push_back('-');
    }
    const auto digits = static_cast<int>(end - buf.data());
    for (int i = digits; i < width; ++i) {
        out.push_back('0');
    }
    out.append(buf.data(), end);
}

} // namespace

std::optional<std::chrono::year_month_day> parse_date(std::string_view v) noexcept {
    if (v.size() != 10 || v[4] != '-' || v[7] != '-') {
        return std::nullopt;
    }
    auto y = read_digits(v, 0, 4);
    auto m = read_digits(v, 5, 2);
    auto d = read_digits(v, 8, 2);
    if (!y || !m || !d) {
        return std::nullopt;
    }
    std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(*y)},
                                    std::chrono::month{*m},
                                    std::chrono::day{*d}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return ymd;
}

std::optional<date_time> parse_date_time(std::string_view v) noexcept {
    using namespace std::chrono;

    if (v.size() < 20) {
        return std::nullopt;
    }
    auto date = parse_date(v.substr(0, 10));
    if (!date) {
        return std::nullopt;
    }
    if (v[10] != 'T' && v[10] != 't') {
        return std::nullopt;
    }
    if (v[13] != ':' || v[16] != ':') {
        return std::nullopt;
    }
    auto hh = read_digits(v, 11, 2);
    auto mm = read_digits(v, 14, 2);
    auto ss = read_digits(v, 17, 2);
    if (!hh || !mm || !ss || *hh > 23 || *mm > 59 || *ss > 60) {
        return std::nullopt;
    }

    size_t pos = 19;
    int64_t micros = 0;
    if (pos < v.size() && v[pos] == '.') {
        ++pos;
        const size_t frac_start = pos;
        int64_t scale = 100000;
        while (pos < v.size() && is_digit(v[pos])) {
            if (scale > 0) {
                micros += (v[pos] - '0') * scale;
                scale /= 10;
            }
            ++pos;
        }
        if (pos == frac_start) {
            return std::nullopt;
        }
    }
    if (pos >= v.size()) {
        return std::nullopt;
    }

    minutes offset{0};
    if (v[pos] == 'Z' || v[pos] == 'z') {
        if (pos + 1 != v.size()) {
            return std::nullopt;
        }
    } else if (v[pos] == '+' || v[pos] == '-') {
        if (pos + 6 != v.size() || v[pos + 3] != ':') {
            return std::nullopt;
        }
        auto oh = read_digits(v, pos + 1, 2);
        auto om = read_digits(v, pos + 4, 2);
        if (!oh || !om || *oh > 23 || *om > 59) {
            return std::nullopt;
        }
        offset = hours{*oh} + minutes{*om};
        if (v[pos] == '-') {
            offset = -offset;
        }
    } else {
        return std::nullopt;
    }

    date_time out;
    out.offset = offset;
    out.instant = time_point_cast<microseconds>(sys_days{*date}) + hours{*hh} + minutes{*mm} +
                  seconds{*ss} + microseconds{micros} - offset;
    return out;
}

bool is_valid_email(std::string_view v) noexcept {
    auto at = v.find('@');
    if (at == std::string_view::npos || at == 0 || at + 1 >= v.size()) {
        return false;
    }
    if (v.find('@', at + 1) != std::string_view::npos) {
        return false;
    }
    for (char c : v) {
        if (std::isspace(static_cast<unsigned char>(c)) || static_cast<unsigned char>(c) < 0x20) {
            return false;
        }
    }
    auto domain = v.substr(at + 1);
    auto dot = domain.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= domain.size()) {
        return false;
    }
    return true;
}

bool is_valid_uri(std::string_view v) noexcept {
    auto colon = v.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= v.size()) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(v[0]))) {
        return false;
    }
    for (size_t i = 1; i < colon; ++i) {
        char c = v[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    for (size_t i = colon + 1; i < v.size(); ++i) {
        auto c = static_cast<unsigned char>(v[i]);
        if (c <= 0x20 || c == 0x7F || c == '<' || c == '>' || c == '\"' || c == '\\') {
            return false;
        }
    }
    return true;
}

bool is_valid_uuid(std::string_view v) noexcept {
    if (v.size() != 36) {
        return false;
    }
    auto is_hex = [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; };
    for (size_t i = 0; i < v.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (v[i] != '-') {
                return false;
            }
        } else if (!is_hex(v[i])) {
            return false;
        }
    }
    return true;
}

bool is_valid_base64(std::string_view v) noexcept {
    if (v.size() % 4 != 0) {
        return false;
    }
    size_t padding = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (c == '=') {
            ++padding;
            if (i < v.size() - 2) {
                return false;
            }
            continue;
        }
        if (padding > 0) {
            return false;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '/') {
            return false;
        }
    }
    return padding <= 2;
}

std::string format_date(std::chrono::year_month_day d) {
    std::string out;
    out.reserve(10);
    append_padded(out, static_cast<int>(d.year()), 4);
    out.push_back('-');
    append_padded(out, static_cast<unsigned>(d.month()), 2);
    out.push_back('-');
    append_padded(out, static_cast<unsigned>(d.day()), 2);
    return out;
}

std::string format_date_time(const date_time& dt) {
    using namespace std::chrono;

    const auto local = dt.instant + dt.offset;
    const auto day = floor<days>(local);
    hh_mm_ss<microseconds> tod{local - day};

    std::string out = format_date(year_month_day{day});
    out.push_back('T');
    append_padded(out, tod.hours().count(), 2);
    out.push_back(':');
    append_padded(out, tod.minutes().count(), 2);
    out.push_back(':');
    append_padded(out, tod.seconds().count(), 2);
    if (tod.subseconds().count() != 0) {
        out.push_back('.');
        append_padded(out, tod.subseconds().count(), 6);
    }
    if (dt.offset == minutes{0}) {
        out.push_back('Z');
    } else {
        const auto total = dt.offset.count();
        out.push_back(total < 0 ? '-' : '+');
        const auto magnitude = total < 0 ? -total : total;
        append_padded(out, magnitude / 60, 2);
        out.push_back(':');
        append_padded(out, magnitude % 60, 2);
    }
    return out;
}

std::string format_number(double d) {
    if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 1e15) {
        std::string out;
        append_padded(out, static_cast<long long>(d), 1);
        return out;
    }
    std::array<char, 32> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
    if (ec != std::errc()) {
        return "0";
    }
    return std::string(buf.data(), end);
}

size_t utf8_length(std::string_view v) noexcept {
    size_t count = 0;
    for (char c : v) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace castor::formats
