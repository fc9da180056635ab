#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdint>
#include <optional>
#include <cctype>

namespace sandbox::domain {

/**
 * @brief Временная метка в ISO 8601 формате (всегда UTC)
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Разобрать ISO 8601 строку
     *
     * Принимает "2025-12-16T10:30:00Z", "2025-12-16T10:30:00.123456+00:00"
     * и смещения вида "+03:00". Дробная часть секунд отбрасывается.
     *
     * @return Timestamp или nullopt если строка не разбирается
     */
    static std::optional<Timestamp> fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            return std::nullopt;
        }

        auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

        // Остаток: [.fraction][Z|+HH:MM|-HH:MM]
        std::string rest;
        std::getline(ss, rest);
        size_t pos = 0;
        if (pos < rest.size() && rest[pos] == '.') {
            ++pos;
            while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
                ++pos;
            }
        }
        if (pos < rest.size() && (rest[pos] == '+' || rest[pos] == '-')) {
            int sign = rest[pos] == '+' ? 1 : -1;
            if (rest.size() < pos + 6) {
                return std::nullopt;
            }
            try {
                int hours = std::stoi(rest.substr(pos + 1, 2));
                int minutes = std::stoi(rest.substr(pos + 4, 2));
                tp -= sign * (std::chrono::hours(hours) + std::chrono::minutes(minutes));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }

        return Timestamp(tp);
    }

    /**
     * @brief Преобразовать в ISO 8601 строку
     */
    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /**
     * @brief Формат для людей: "2025-12-16 10:30:00 UTC"
     */
    std::string toDisplayString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S UTC");
        return ss.str();
    }

    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    Timestamp addHours(int64_t hours) const {
        return Timestamp(value + std::chrono::hours(hours));
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

/**
 * @brief Остаток времени в виде "5h 59m"
 */
inline std::string formatRemaining(std::chrono::seconds remaining) {
    if (remaining.count() < 0) {
        remaining = std::chrono::seconds(0);
    }
    auto hours = remaining.count() / 3600;
    auto minutes = (remaining.count() % 3600) / 60;
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

} // namespace sandbox::domain
