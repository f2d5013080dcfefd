#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <optional>
#include <functional>
#include <chrono>
#include <array>
#include <random>
#include <sstream>
#include <iomanip>

namespace tether {

// Timestamp type (system clock, millisecond precision on the wire)
using timestamp_t = std::chrono::system_clock::time_point;

// Injectable time source. Tests substitute a settable clock.
using clock_fn = std::function<timestamp_t()>;

inline timestamp_t system_now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

// UUID type (stored as TEXT, lowercase hyphenated)
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    uuid_t() = default;

    explicit uuid_t(const std::array<uint8_t, 16>& b) : bytes(b) {}

    // Convert to lowercase hyphenated string (e.g., "550e8400-e29b-41d4-a716-446655440000")
    std::string to_string() const {
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    // Parse from string (accepts with or without hyphens). Returns nullopt on malformed input.
    static std::optional<uuid_t> from_string(const std::string& s) {
        std::string hex;
        for (char c : s) {
            if (c == '-') continue;
            if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
            hex += c;
        }
        if (hex.size() != 32) return std::nullopt;
        uuid_t result;
        for (size_t i = 0; i < 16; ++i) {
            result.bytes[i] = static_cast<uint8_t>(std::stoi(hex.substr(i * 2, 2), nullptr, 16));
        }
        return result;
    }

    // Generate a random UUID (v4)
    static uuid_t generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dis;

        uuid_t result;
        uint64_t a = dis(gen);
        uint64_t b = dis(gen);

        for (int i = 0; i < 8; ++i) {
            result.bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
            result.bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
        }

        // Set version (4) and variant (RFC 4122)
        result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;
        result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;

        return result;
    }

    bool operator==(const uuid_t& other) const { return bytes == other.bytes; }
    bool operator!=(const uuid_t& other) const { return bytes != other.bytes; }

    bool is_nil() const {
        for (auto b : bytes) if (b != 0) return false;
        return true;
    }
};

inline std::string generate_id() {
    return uuid_t::generate().to_string();
}

// ISO-8601 UTC with milliseconds: "2025-09-13T10:29:14.123Z"
std::string format_timestamp(timestamp_t ts);

// Accepts "...Z", "...+00:00" style offsets and any fractional-second precision.
std::optional<timestamp_t> parse_timestamp(const std::string& text);

inline int64_t to_millis(timestamp_t ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline timestamp_t from_millis(int64_t ms) {
    return timestamp_t(std::chrono::milliseconds(ms));
}

// Trim ASCII whitespace from both ends
std::string trim(const std::string& s);

// Number of code points in a UTF-8 string (continuation bytes are not counted)
size_t utf8_length(const std::string& s);

} // namespace tether
