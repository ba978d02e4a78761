#include "./uuid.hpp"

#include "./urn.hpp"

#include <urnkit/error/errors.hpp>
#include <urnkit/error/on_error.hpp>

#include <fmt/core.h>

#include <array>
#include <cstdint>
#include <random>

using namespace urnkit;

namespace {

std::mt19937_64& thread_engine() {
    thread_local std::mt19937_64 engine = [] {
        std::random_device              rd;
        std::seed_seq                   seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64{seq};
    }();
    return engine;
}

}  // namespace

std::string urnkit::random_uuid() {
    std::array<std::uint8_t, 16> bytes;
    auto&                        engine = thread_engine();
    const std::uint64_t          hi     = engine();
    const std::uint64_t          lo     = engine();
    for (int i = 0; i < 8; ++i) {
        bytes[i]     = static_cast<std::uint8_t>(hi >> (56 - 8 * i));
        bytes[i + 8] = static_cast<std::uint8_t>(lo >> (56 - 8 * i));
    }
    // Version 4, RFC 4122 variant
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3f) | 0x80);

    constexpr char hex[] = "0123456789abcdef";
    std::string    ret;
    ret.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ret.push_back('-');
        }
        ret.push_back(hex[bytes[i] >> 4]);
        ret.push_back(hex[bytes[i] & 0xf]);
    }
    return ret;
}

std::string urnkit::generate_uuid_urn(std::string_view entity, const uuid_source& source) {
    auto id = source();
    URNKIT_E_SCOPE(e_urn_string{fmt::format("urn:{}:{}", entity, id)});
    return compose(entity, id);
}
