#pragma once

#include "ports/output/ITokenProvider.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <mutex>
#include <unordered_set>

namespace sandbox::adapters::secondary
{

    /**
     * @brief Токены сессии без подписи: "eyJ.<base64url(payload)>.sig"
     *
     * payload: {"sub": username, "session_id": ..., "exp": unix seconds}
     * Отозванные токены держатся в blacklist до перезапуска процесса.
     */
    class FakeJwtAdapter : public ports::output::ITokenProvider
    {
    public:
        FakeJwtAdapter() = default;

        std::string issue(const std::string &subject,
                          const std::string &sessionId,
                          std::chrono::seconds lifetime) override
        {
            auto exp = domain::Timestamp::now().toUnixSeconds() + lifetime.count();

            nlohmann::json payload;
            payload["sub"] = subject;
            payload["session_id"] = sessionId;
            payload["exp"] = exp;

            return "eyJ." + base64UrlEncode(payload.dump()) + ".sig";
        }

        std::optional<domain::TokenClaims> verify(const std::string &token) override
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (blacklist_.count(token) > 0)
                    return std::nullopt;
            }

            auto payload = decodePayload(token);
            if (!payload)
                return std::nullopt;

            int64_t exp = payload->value("exp", int64_t{0});
            if (exp <= domain::Timestamp::now().toUnixSeconds())
                return std::nullopt;

            domain::TokenClaims claims;
            claims.subject = payload->value("sub", "");
            claims.sessionId = payload->value("session_id", "");
            claims.expiresAt = domain::Timestamp::fromUnixSeconds(exp);
            if (claims.sessionId.empty())
                return std::nullopt;
            return claims;
        }

        void revoke(const std::string &token) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            blacklist_.insert(token);
        }

    private:
        std::unordered_set<std::string> blacklist_;
        mutable std::mutex mutex_;

        static std::optional<nlohmann::json> decodePayload(const std::string &token)
        {
            size_t first = token.find('.');
            size_t last = token.rfind('.');
            if (first == std::string::npos || first == last)
                return std::nullopt;

            std::string payload = token.substr(first + 1, last - first - 1);
            auto json = nlohmann::json::parse(base64UrlDecode(payload), nullptr, false);
            if (json.is_discarded() || !json.is_object())
                return std::nullopt;
            return json;
        }

        static std::string base64UrlEncode(const std::string &input)
        {
            static const char *chars =
                "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
            std::string result;
            int val = 0, valb = -6;
            for (unsigned char c : input)
            {
                val = (val << 8) + c;
                valb += 8;
                while (valb >= 0)
                {
                    result.push_back(chars[(val >> valb) & 0x3F]);
                    valb -= 6;
                }
            }
            if (valb > -6)
                result.push_back(chars[((val << 8) >> (valb + 8)) & 0x3F]);
            return result;
        }

        static std::string base64UrlDecode(const std::string &input)
        {
            std::string result;
            int val = 0, valb = -8;
            for (unsigned char c : input)
            {
                int digit = decodeChar(c);
                if (digit < 0)
                    continue;
                val = (val << 6) + digit;
                valb += 6;
                if (valb >= 0)
                {
                    result.push_back(char((val >> valb) & 0xFF));
                    valb -= 8;
                }
            }
            return result;
        }

        static int decodeChar(unsigned char c)
        {
            if (c >= 'A' && c <= 'Z') return c - 'A';
            if (c >= 'a' && c <= 'z') return c - 'a' + 26;
            if (c >= '0' && c <= '9') return c - '0' + 52;
            if (c == '-') return 62;
            if (c == '_') return 63;
            return -1;
        }
    };

} // namespace sandbox::adapters::secondary
