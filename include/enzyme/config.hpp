// Enzyme fee engine - Configuration
// Builder pattern for fluent configuration

#ifndef ENZYME_CONFIG_HPP
#define ENZYME_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include "fee.hpp"
#include "log.hpp"

namespace enzyme {

// One configured fee. Rates are wad decimals; the management fee's annual
// rate is converted to a per-second rate when settings are produced.
struct FeeEntryConfig {
    FeeKind kind = FeeKind::MANAGEMENT;
    U256 rate = 0;
    SettlementPolicy policy = SettlementPolicy::MINT;  // management only
    uint64_t period = 0;                               // performance only

    // Throws RateOutOfRangeError for an unusable management rate
    FeeSettings to_settings() const;
};

class FeeConfig {
public:
    std::string log_level = "warn";
    std::vector<FeeEntryConfig> fees;

    FeeConfig() = default;

    // Load from JSON file. Throws ConfigError.
    static FeeConfig from_file(std::string_view path);

    // Load from JSON string. Throws ConfigError.
    static FeeConfig from_json_string(std::string_view content);

    // Builder methods
    FeeConfig& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    FeeConfig& with_management(const U256& annual_rate, SettlementPolicy policy = SettlementPolicy::MINT) {
        FeeEntryConfig entry;
        entry.kind = FeeKind::MANAGEMENT;
        entry.rate = annual_rate;
        entry.policy = policy;
        fees.push_back(entry);
        return *this;
    }

    FeeConfig& with_performance(const U256& rate, uint64_t period) {
        FeeEntryConfig entry;
        entry.kind = FeeKind::PERFORMANCE;
        entry.rate = rate;
        entry.period = period;
        fees.push_back(entry);
        return *this;
    }

    FeeConfig& with_entrance_rate(FeeKind kind, const U256& rate) {
        FeeEntryConfig entry;
        entry.kind = kind;
        entry.rate = rate;
        fees.push_back(entry);
        return *this;
    }

    [[nodiscard]] std::vector<FeeSettings> to_settings() const;

    [[nodiscard]] log::LogLevel level() const { return log::level_from_string(log_level); }
};

} // namespace enzyme

#endif // ENZYME_CONFIG_HPP
