#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>

namespace mindsync {

/**
 * Uuid - 128-bit random identifier used for vault, map, node and lock ids.
 *
 * Ids travel as strings everywhere (SQLite rows, remote file names, JSON),
 * so the class mostly exists to generate and validate them.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a new random UUID (version 4).
     */
    [[nodiscard]] static Uuid generate() {
        static thread_local std::mt19937_64 gen{std::random_device{}()};
        std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes;
        for (size_t half = 0; half < 2; ++half) {
            uint64_t word = dist(gen);
            for (size_t i = 0; i < 8; ++i) {
                bytes[half * 8 + i] = static_cast<uint8_t>(word >> (i * 8));
            }
        }
        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;
        return Uuid(bytes);
    }

    /**
     * Parse hyphenated or plain hex. Returns nullopt on anything else.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str) {
        std::string clean;
        clean.reserve(32);
        for (char c : str) {
            if (c != '-') clean += c;
        }
        if (clean.size() != 32) return std::nullopt;

        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };

        Bytes bytes;
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            int hi = nibble(clean[i * 2]);
            int lo = nibble(clean[i * 2 + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return Uuid(bytes);
    }

    /**
     * xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase.
     */
    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
            oss << std::setw(2) << static_cast<int>(bytes_[i]);
        }
        return oss.str();
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Fresh string id for a new vault, map, node, edge or lock.
 */
[[nodiscard]] inline std::string new_id() {
    return Uuid::generate().to_string();
}

/**
 * Timestamp - milliseconds since the Unix epoch.
 *
 * All persisted times (SQLite INTEGER columns, JSON payloads) use this unit.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using SystemClock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<SystemClock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        auto tp = std::chrono::time_point_cast<Duration>(SystemClock::now());
        return Timestamp(tp.time_since_epoch().count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    /**
     * Format as ISO 8601 (UTC, millisecond precision).
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = SystemClock::to_time_t(TimePoint(Duration(millis_)));
        std::tm tm{};
        gmtime_r(&time_t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

/**
 * Clock - source of "now" for everything that stamps or compares times.
 *
 * Injected so lock expiry, backoff and latest-write-wins can be driven
 * deterministically in tests.
 */
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const override { return Timestamp::now(); }
};

/**
 * ManualClock - only moves when told to. Safe to read from the worker thread.
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp(1)) : millis_(start.millis()) {}

    [[nodiscard]] Timestamp now() const override { return Timestamp(millis_.load()); }

    void set(Timestamp t) { millis_.store(t.millis()); }
    void advance(Timestamp::Duration d) { millis_.fetch_add(d.count()); }

private:
    std::atomic<int64_t> millis_;
};

} // namespace mindsync
