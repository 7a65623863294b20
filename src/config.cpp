// Enzyme fee engine - Configuration Implementation

#include "enzyme/config.hpp"
#include "enzyme/errors.hpp"
#include "enzyme/ray_math.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace enzyme {

namespace {

using json = nlohmann::json;

// Decimal rate given as "0.02" or 0.02
U256 parse_rate(const json& j, const std::string& key) {
    if (!j.contains(key)) {
        throw ConfigError("missing \"" + key + "\"");
    }
    const json& value = j.at(key);
    std::string text;
    if (value.is_string()) {
        text = value.get<std::string>();
    } else if (value.is_number()) {
        text = value.dump();
    } else {
        throw ConfigError("\"" + key + "\" must be a decimal string");
    }

    try {
        return wad::from_string(text);
    } catch (const std::invalid_argument& e) {
        throw ConfigError("\"" + key + "\": " + e.what());
    }
}

SettlementPolicy parse_policy(const json& j) {
    const std::string policy = j.value("policy", std::string("mint"));
    if (policy == "mint") return SettlementPolicy::MINT;
    if (policy == "mint_shares_outstanding") return SettlementPolicy::MINT_SHARES_OUTSTANDING;
    throw ConfigError("unknown settlement policy: " + policy);
}

FeeEntryConfig parse_fee(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("fee entry must be an object");
    }

    FeeEntryConfig entry;
    try {
        entry.kind = fee_kind_from_string(j.at("kind").get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    switch (entry.kind) {
        case FeeKind::MANAGEMENT:
            entry.rate = parse_rate(j, "annual_rate");
            entry.policy = parse_policy(j);
            break;
        case FeeKind::PERFORMANCE: {
            entry.rate = parse_rate(j, "rate");
            const json& period = j.at("period");
            if (!period.is_number_unsigned()) {
                throw ConfigError("\"period\" must be a positive integer");
            }
            entry.period = period.get<uint64_t>();
            break;
        }
        case FeeKind::ENTRANCE_RATE_BURN:
        case FeeKind::ENTRANCE_RATE_DIRECT:
            entry.rate = parse_rate(j, "rate");
            break;
    }
    return entry;
}

}  // namespace

// =============================================================================
// FeeEntryConfig
// =============================================================================

FeeSettings FeeEntryConfig::to_settings() const {
    switch (kind) {
        case FeeKind::MANAGEMENT: {
            I128 annual_rate = 0;
            try {
                annual_rate = to_i128(rate);
            } catch (const std::overflow_error&) {
                throw RateOutOfRangeError("annual rate too large: " + wad::to_string(rate));
            }
            return FeeSettings::management(to_per_second_rate(annual_rate), policy);
        }
        case FeeKind::PERFORMANCE:
            return FeeSettings::performance(rate, period);
        case FeeKind::ENTRANCE_RATE_BURN:
            return FeeSettings::entrance_rate_burn(rate);
        case FeeKind::ENTRANCE_RATE_DIRECT:
            return FeeSettings::entrance_rate_direct(rate);
    }
    throw InvalidSettingsError("unknown fee kind");
}

// =============================================================================
// FeeConfig
// =============================================================================

FeeConfig FeeConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
}

FeeConfig FeeConfig::from_json_string(std::string_view content) {
    json j;
    try {
        j = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("config must be a JSON object");
    }

    FeeConfig config;
    try {
        if (j.contains("log_level")) {
            config.log_level = j.at("log_level").get<std::string>();
        }
        if (j.contains("fees")) {
            const json& fees = j.at("fees");
            if (!fees.is_array()) {
                throw ConfigError("\"fees\" must be an array");
            }
            for (const auto& fee : fees) {
                config.fees.push_back(parse_fee(fee));
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(e.what());
    }

    return config;
}

std::vector<FeeSettings> FeeConfig::to_settings() const {
    std::vector<FeeSettings> settings;
    settings.reserve(fees.size());
    for (const auto& fee : fees) {
        settings.push_back(fee.to_settings());
    }
    return settings;
}

}  // namespace enzyme
