#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

namespace sandbox::domain {

/**
 * @brief IPv4 блок адресов в CIDR-нотации (например, 172.20.5.0/24)
 *
 * Сравнение блоков идёт по пересечению диапазонов,
 * а не по строковому равенству: 172.20.0.0/16 пересекается с 172.20.5.0/24.
 */
struct Subnet {
    uint32_t network = 0;   ///< Адрес сети (host byte order, хостовые биты обнулены)
    int prefixLength = 24;

    Subnet() = default;

    Subnet(uint32_t address, int prefix)
        : network(address & maskFor(prefix))
        , prefixLength(prefix)
    {}

    /**
     * @brief Разобрать "a.b.c.d/nn"
     * @return Subnet или nullopt, если строка не является IPv4 CIDR
     */
    static std::optional<Subnet> parse(const std::string& cidr) {
        auto slash = cidr.find('/');
        if (slash == std::string::npos) {
            return std::nullopt;
        }

        auto address = parseAddress(cidr.substr(0, slash));
        if (!address) {
            return std::nullopt;
        }

        int prefix = 0;
        try {
            size_t consumed = 0;
            std::string prefixText = cidr.substr(slash + 1);
            prefix = std::stoi(prefixText, &consumed);
            if (consumed != prefixText.size()) {
                return std::nullopt;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (prefix < 0 || prefix > 32) {
            return std::nullopt;
        }

        return Subnet(*address, prefix);
    }

    static Subnet fromOctets(int a, int b, int c, int d, int prefix) {
        uint32_t address = (static_cast<uint32_t>(a) << 24)
                         | (static_cast<uint32_t>(b) << 16)
                         | (static_cast<uint32_t>(c) << 8)
                         | static_cast<uint32_t>(d);
        return Subnet(address, prefix);
    }

    uint32_t first() const { return network; }

    uint32_t last() const { return network | ~maskFor(prefixLength); }

    bool overlaps(const Subnet& other) const {
        return first() <= other.last() && other.first() <= last();
    }

    std::string toString() const {
        std::ostringstream ss;
        ss << ((network >> 24) & 0xFF) << '.'
           << ((network >> 16) & 0xFF) << '.'
           << ((network >> 8) & 0xFF) << '.'
           << (network & 0xFF) << '/' << prefixLength;
        return ss.str();
    }

    bool operator==(const Subnet& other) const {
        return network == other.network && prefixLength == other.prefixLength;
    }

private:
    static uint32_t maskFor(int prefix) {
        if (prefix <= 0) return 0;
        if (prefix >= 32) return 0xFFFFFFFFu;
        return 0xFFFFFFFFu << (32 - prefix);
    }

    static std::optional<uint32_t> parseAddress(const std::string& text) {
        uint32_t result = 0;
        int octets = 0;
        std::istringstream ss(text);
        std::string part;
        while (std::getline(ss, part, '.')) {
            if (part.empty() || part.size() > 3 || ++octets > 4) {
                return std::nullopt;
            }
            for (char c : part) {
                if (c < '0' || c > '9') {
                    return std::nullopt;
                }
            }
            int value = std::stoi(part);
            if (value > 255) {
                return std::nullopt;
            }
            result = (result << 8) | static_cast<uint32_t>(value);
        }
        if (octets != 4) {
            return std::nullopt;
        }
        return result;
    }
};

} // namespace sandbox::domain
