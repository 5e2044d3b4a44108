#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace crossover::domain {

/**
 * @brief Момент времени бара или события
 *
 * Биржа и файлы воспроизведения отдают время в Unix-миллисекундах,
 * точнее миллисекунды время не хранится.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : Timestamp(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp)
        : value(std::chrono::time_point_cast<std::chrono::milliseconds>(tp)) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromUnixMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
    }

    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    }

    /**
     * @brief Сколько прошло от earlier до этого момента (отрицательно, если earlier позже)
     */
    std::chrono::milliseconds millisSince(const Timestamp& earlier) const {
        return std::chrono::milliseconds(toUnixMillis() - earlier.toUnixMillis());
    }

    /**
     * @brief UTC в ISO 8601: "2023-11-14T22:13:20.250Z"
     */
    std::string toString() const {
        int64_t millis = toUnixMillis();
        int64_t seconds = millis / 1000;
        int64_t fraction = millis % 1000;
        if (fraction < 0) {
            fraction += 1000;
            --seconds;
        }

        std::time_t t = static_cast<std::time_t>(seconds);
        std::tm tm{};
        gmtime_r(&t, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << fraction << 'Z';
        return ss.str();
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace crossover::domain
