#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>
#include <stdexcept>

namespace checkout::domain {

/**
 * @brief Временная метка (UTC)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromEpochSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::seconds(seconds)));
    }

    /**
     * @brief ISO 8601 в UTC: "2025-01-31T12:00:00Z" или "2025-01-31 12:00:00"
     *
     * Строка без зоны трактуется как UTC (timegm, не mktime).
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        if (str.size() > 10 && str[10] == ' ') {
            ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        }
        if (ss.fail()) {
            throw std::invalid_argument("invalid timestamp: " + str);
        }
        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    int64_t epochSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(value.time_since_epoch()).count();
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    Timestamp operator-(std::chrono::seconds d) const {
        return Timestamp(value - d);
    }

    Timestamp operator+(std::chrono::seconds d) const {
        return Timestamp(value + d);
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
};

} // namespace checkout::domain
