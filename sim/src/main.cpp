// Enzyme fee simulator
//
// Replays a JSON scenario (fee configuration plus a list of fund events)
// against the fee engine and prints the resulting share ledger as JSON.

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "enzyme/clock.hpp"
#include "enzyme/config.hpp"
#include "enzyme/entrance_rate_fee.hpp"
#include "enzyme/errors.hpp"
#include "enzyme/fee_manager.hpp"
#include "enzyme/fund.hpp"
#include "enzyme/log.hpp"
#include "enzyme/management_fee.hpp"
#include "enzyme/performance_fee.hpp"
#include "enzyme/vault.hpp"

using json = nlohmann::json;
using namespace enzyme;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::string scenario_path;
    bool verbose = false;
    bool trace = false;  // print the ledger after every event
};

namespace {

constexpr Address FUND_ID = addresses::from_u16(0x1000);
constexpr Address FUND_OWNER = addresses::from_u16(0x1001);
constexpr Address VAULT_ADDRESS = addresses::from_u16(0x1002);
constexpr Address DEFAULT_RECIPIENT = addresses::from_u16(0x1003);
constexpr Address FEE_MANAGER = addresses::from_u16(0x2000);
constexpr Address MANAGEMENT_FEE = addresses::from_u16(0x2001);
constexpr Address PERFORMANCE_FEE = addresses::from_u16(0x2002);
constexpr Address ENTRANCE_BURN_FEE = addresses::from_u16(0x2003);
constexpr Address ENTRANCE_DIRECT_FEE = addresses::from_u16(0x2004);

//------------------------------------------------------------------------------
// Scenario parsing helpers
//------------------------------------------------------------------------------

// "0x..." or an integer id up to 0xFFFF
Address parse_address(const json& j) {
    if (j.is_number_unsigned()) {
        return addresses::from_id(j.get<uint64_t>());
    }
    return addresses::from_hex(j.get<std::string>());
}

U256 parse_amount(const json& j) {
    if (j.is_string()) return wad::from_string(j.get<std::string>());
    return wad::from_string(j.dump());
}

std::vector<FeeKind> parse_kinds(const json& j) {
    std::vector<FeeKind> kinds;
    for (const auto& name : j) {
        kinds.push_back(fee_kind_from_string(name.get<std::string>()));
    }
    return kinds;
}

//------------------------------------------------------------------------------
// Simulation
//------------------------------------------------------------------------------

class Simulation {
public:
    Simulation(const FeeConfig& config, uint64_t start_time, const Address& recipient)
        : clock_(start_time),
          fee_manager_(FEE_MANAGER, clock_),
          vault_(VAULT_ADDRESS, FUND_OWNER) {
        fee_manager_.register_fee(std::make_unique<ManagementFee>(MANAGEMENT_FEE, FEE_MANAGER));
        fee_manager_.register_fee(std::make_unique<PerformanceFee>(PERFORMANCE_FEE, FEE_MANAGER));
        fee_manager_.register_fee(
            std::make_unique<EntranceRateFee>(FeeKind::ENTRANCE_RATE_BURN, ENTRANCE_BURN_FEE, FEE_MANAGER));
        fee_manager_.register_fee(
            std::make_unique<EntranceRateFee>(FeeKind::ENTRANCE_RATE_DIRECT, ENTRANCE_DIRECT_FEE, FEE_MANAGER));

        fee_manager_.set_event_callback([this](const FeeEvent& event) { events_.push_back(to_json(event)); });

        vault_.add_accessor(FUND_OWNER, FUND_ID);
        vault_.add_accessor(FUND_OWNER, FEE_MANAGER);

        fund_ = std::make_unique<Fund>(FUND_ID, FUND_OWNER, fee_manager_, vault_, clock_);
        fee_manager_.configure_fund(FUND_ID, vault_, recipient, config.to_settings());
    }

    // Throws on any rejected event; the engine has already rolled it back
    json apply(const json& event) {
        const std::string type = event.at("type").get<std::string>();
        json result = {{"type", type}, {"time", clock_.now()}};

        if (type == "buy") {
            U256 min_shares = event.contains("min_shares") ? parse_amount(event.at("min_shares")) : U256(0);
            U256 received = fund_->buy_shares(parse_address(event.at("investor")),
                                              parse_amount(event.at("amount")), min_shares);
            result["shares_received"] = wad::to_string(received);
        } else if (type == "redeem") {
            U256 paid = fund_->redeem_shares(parse_address(event.at("investor")), parse_amount(event.at("shares")));
            result["asset_paid"] = wad::to_string(paid);
        } else if (type == "warp") {
            clock_.advance(event.at("seconds").get<uint64_t>());
            result["time"] = clock_.now();
        } else if (type == "continuous") {
            result["settlements"] = fund_->invoke_continuous_hook().size();
        } else if (type == "payout") {
            std::vector<FeeKind> kinds = event.contains("kinds") ? parse_kinds(event.at("kinds"))
                                                                 : fee_manager_.enabled_fees(FUND_ID);
            json paid = json::array();
            for (FeeKind kind : fund_->payout_outstanding(kinds)) {
                paid.push_back(to_string(kind));
            }
            result["paid"] = paid;
        } else if (type == "set_gav") {
            const U256 gav = parse_amount(event.at("gav"));
            fund_->set_gav_source([gav](const FundId&) { return std::optional<U256>(gav); });
        } else if (type == "migrate") {
            fund_->migrate(FUND_OWNER);
        } else {
            throw std::invalid_argument("unknown event type: " + type);
        }
        return result;
    }

    json report() const {
        json balances = json::object();
        for (const auto& [account, balance] : vault_.holders()) {
            balances[addresses::to_hex(account)] = wad::to_string(balance);
        }

        json fees = json::array();
        for (FeeKind kind : fee_manager_.enabled_fees(FUND_ID)) {
            const FeeLedgerEntry info = fee_manager_.get_fee_info_for_fund(FUND_ID, kind);
            fees.push_back({
                {"kind", to_string(kind)},
                {"rate", info.rate.str()},
                {"last_settled", info.last_settled},
                {"shares_outstanding", wad::to_string(fee_manager_.get_shares_outstanding(FUND_ID, kind))}
            });
        }

        const std::optional<U256> gav = fund_->gross_asset_value();
        const FeeManager::Stats stats = fee_manager_.get_stats();

        return {
            {"time", clock_.now()},
            {"total_supply", wad::to_string(vault_.total_supply())},
            {"shares_outstanding", wad::to_string(vault_.shares_outstanding())},
            {"holdings", wad::to_string(fund_->holdings())},
            {"gav", gav ? json(wad::to_string(*gav)) : json(nullptr)},
            {"gross_share_value", wad::to_string(fund_->gross_share_value())},
            {"balances", balances},
            {"fees", fees},
            {"events", events_},
            {"stats", {
                {"dispatches", stats.total_dispatches},
                {"settlements", stats.total_settlements},
                {"payouts", stats.total_payouts},
                {"rollbacks", stats.total_rollbacks}
            }}
        };
    }

private:
    static json to_json(const FeeEvent& event) {
        json j = {
            {"kind", to_string(event.kind)},
            {"shares", wad::to_string(event.shares)}
        };
        if (event.type == FeeEvent::Type::FeeSettled) {
            j["event"] = "FeeSettled";
            j["hook"] = to_string(event.hook);
            j["settlement"] = to_string(event.settlement);
            j["seconds_since_settlement"] = event.seconds_since_settlement;
        } else {
            j["event"] = "SharesOutstandingPaidOut";
        }
        return j;
    }

    ChainClock clock_;
    FeeManager fee_manager_;
    ShareVault vault_;
    std::unique_ptr<Fund> fund_;
    json events_ = json::array();
};

json load_scenario(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw ConfigError("Cannot open scenario file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid scenario JSON: ") + e.what());
    }
}

}  // namespace

//------------------------------------------------------------------------------
// Command line
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "Enzyme fee simulator\n\n"
              << "Usage: " << prog << " [options] <scenario.json>\n\n"
              << "Options:\n"
              << "  -t, --trace          Print the ledger after every event\n"
              << "  -v, --verbose        Debug logging to stderr\n"
              << "  -h, --help           Show this help message\n\n"
              << "Scenario:\n"
              << "  {\"config\": {\"log_level\": \"info\", \"fees\": [...]},\n"
              << "   \"start_time\": 1600000000, \"fee_recipient\": \"0x...\",\n"
              << "   \"events\": [{\"type\": \"buy\", \"investor\": 1, \"amount\": \"100\"},\n"
              << "              {\"type\": \"warp\", \"seconds\": 31536000},\n"
              << "              {\"type\": \"continuous\"}, ...]}\n\n"
              << "Events: buy, redeem, warp, continuous, payout, set_gav, migrate\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-t" || arg == "--trace") {
            options.trace = true;
        } else if (arg[0] != '-' && options.scenario_path.empty()) {
            options.scenario_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
    }

    if (options.scenario_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }
    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        const json scenario = load_scenario(options.scenario_path);

        FeeConfig config;
        if (scenario.contains("config")) {
            config = FeeConfig::from_json_string(scenario.at("config").dump());
        }
        log::set_level(options.verbose ? log::LogLevel::Debug : config.level());

        const uint64_t start_time = scenario.value("start_time", uint64_t{1});
        const Address recipient =
            scenario.contains("fee_recipient") ? parse_address(scenario.at("fee_recipient")) : DEFAULT_RECIPIENT;

        Simulation sim(config, start_time, recipient);

        json steps = json::array();
        if (scenario.contains("events")) {
            for (const auto& event : scenario.at("events")) {
                json step = sim.apply(event);
                if (options.trace) step["ledger"] = sim.report();
                steps.push_back(step);
            }
        }

        json output = sim.report();
        output["steps"] = steps;
        std::cout << output.dump(2) << "\n";
    } catch (const FeeError& e) {
        std::cerr << "Error (" << e.code() << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
