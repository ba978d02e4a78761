#include "./escape.hpp"

#include <neo/utility.hpp>

using namespace urnkit;

namespace {

constexpr char hex_digits[] = "0123456789ABCDEF";

bool is_alnum(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool is_hex(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool passes_through(char c) noexcept {
    return is_alnum(c) || c == neo::oper::any_of('-', '.', '_', '~', '$', '&', '+', '=', '@');
}

bool starts_triplet(std::string_view s, std::size_t pos) noexcept {
    return s[pos] == '%' && pos + 2 < s.size() && is_hex(s[pos + 1]) && is_hex(s[pos + 2]);
}

}  // namespace

std::string urnkit::escape_component(std::string_view s) {
    std::string ret;
    ret.reserve(s.size());
    for (std::size_t pos = 0; pos < s.size(); ++pos) {
        const char c = s[pos];
        if (passes_through(c) || starts_triplet(s, pos)) {
            ret.push_back(c);
            continue;
        }
        const auto byte = static_cast<unsigned char>(c);
        ret.push_back('%');
        ret.push_back(hex_digits[byte >> 4]);
        ret.push_back(hex_digits[byte & 0xf]);
    }
    return ret;
}

bool urnkit::is_escaped(std::string_view s) noexcept {
    for (std::size_t pos = 0; pos < s.size(); ++pos) {
        if (!passes_through(s[pos]) && !starts_triplet(s, pos)) {
            return false;
        }
    }
    return true;
}
