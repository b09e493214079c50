#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <compare>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace atelier {

/**
 * EntityId - Identifier of a project, history item or wardrobe item.
 *
 * History item ids end in a creation timestamp ("gen-1718000000000"),
 * which older records rely on for ordering.
 */
using EntityId = std::string;

/**
 * Timestamp - Represents a point in time.
 *
 * Stored as milliseconds since Unix epoch for SQLite and JSON compatibility.
 * A zero timestamp means "unset".
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    [[nodiscard]] constexpr bool is_set() const noexcept {
        return millis_ != 0;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * Format as ISO 8601 string.
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto tp = to_time_point();
        auto time_t = Clock::to_time_t(tp);
        std::ostringstream oss;
        oss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
        auto ms = millis_ % 1000;
        oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Timestamp operator-(Duration d) const {
        return Timestamp(millis_ - d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

/**
 * Parse the timestamp encoded in the last '-' separated segment of an id.
 * Returns 0 when the suffix is missing or not a decimal number.
 */
[[nodiscard]] inline int64_t id_suffix_millis(std::string_view id) noexcept {
    const auto dash = id.rfind('-');
    const auto suffix = dash == std::string_view::npos ? id : id.substr(dash + 1);
    if (suffix.empty() || suffix.size() > 18) return 0;
    int64_t value = 0;
    for (const char c : suffix) {
        if (c < '0' || c > '9') return 0;
        value = value * 10 + (c - '0');
    }
    return value;
}

/**
 * Build an id of the form "<prefix>-<millis>".
 */
[[nodiscard]] inline EntityId make_entity_id(std::string_view prefix, Timestamp at) {
    std::string id(prefix);
    id += '-';
    id += std::to_string(at.millis());
    return id;
}

} // namespace atelier
