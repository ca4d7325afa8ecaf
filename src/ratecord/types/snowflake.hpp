#ifndef RATECORD_TYPES_SNOWFLAKE_HPP
#define RATECORD_TYPES_SNOWFLAKE_HPP

#include <cstdint>                     // uint64_t
#include <ctime>                       // time_t
#include <string>                      // std::string
#include <functional>                  // std::hash
#include <nlohmann/json.hpp>           // nlohmann::json

namespace Ratecord {
    /**
     * Discord's 64-bit entity ID.
     *
     * API transfers snowflakes as decimal strings, so that is what
     * to_json produces.
     */
    struct Snowflake {
        constexpr Snowflake() : value(0) {}
        constexpr Snowflake(uint64_t value) : value(value) {}
        explicit Snowflake(const std::string& strvalue) : value(std::stoull(strvalue)) {}
        explicit Snowflake(const char* strvalue) : value(std::stoull(strvalue)) {}

        uint64_t value;

        static constexpr uint64_t discordEpochMs = 1420070400000;

        inline constexpr unsigned long long unixTimestampMs() const {
            return (value >> 22) + discordEpochMs;
        }

        inline constexpr time_t unixTimestamp() const {
            return static_cast<time_t>(unixTimestampMs() / 1000);
        }

        inline std::string str() const { return std::to_string(value); }

        inline constexpr operator uint64_t() const { return value; }
    };

    inline void to_json(nlohmann::json& json, const Snowflake& snowflake) {
        json = snowflake.str();
    }

    inline void from_json(const nlohmann::json& json, Snowflake& snowflake) {
        snowflake.value = json.is_string() ? std::stoull(json.get<std::string>()) : json.get<uint64_t>();
    }
} // namespace Ratecord

namespace std {
    template<>
    class hash<Ratecord::Snowflake> {
    public:
        inline size_t operator()(const Ratecord::Snowflake& snowflake) const {
            return std::hash<uint64_t>()(snowflake.value);
        }
    };
}

#endif // RATECORD_TYPES_SNOWFLAKE_HPP
