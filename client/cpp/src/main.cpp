// peg-cli - scenario runner for the accounting engine
//
// Loads an engine configuration and a JSON scenario, runs the scenario's
// steps against in-memory collaborators and prints the outcome as JSON.

#include "peg/config.hpp"
#include "peg/engine.hpp"
#include "peg/errors.hpp"
#include "peg/json.hpp"
#include "peg/ledger.hpp"
#include "peg/oracle.hpp"
#include "peg/sim.hpp"
#include "peg/x18.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace peg;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string scenario_path;
    bool verbose = false;
};

void print_usage(const char* prog) {
    std::cout << "peg-cli - collateralized debt engine scenario runner\n\n"
              << "Usage: " << prog << " [options] <config.json> <scenario.json>\n\n"
              << "Options:\n"
              << "  -v, --verbose        Debug logging (overrides config log_level)\n"
              << "  -h, --help           Show this help message\n\n"
              << "Scenario steps (\"op\"):\n"
              << "  deposit            account asset amount\n"
              << "  deposit_and_mint   account asset collateral debt\n"
              << "  mint | burn        account amount\n"
              << "  redeem             account asset amount [to]\n"
              << "  redeem_for_debt    account asset collateral debt\n"
              << "  liquidate          liquidator asset target debt\n"
              << "  set_price          feed price [updated_at]\n"
              << "  advance            seconds\n"
              << "  transfer_debt      from to amount\n"
              << "  query              account\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        std::exit(1);
    }
    options.config_path = positional[0];
    options.scenario_path = positional[1];
    return options;
}

json read_json_file(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open scenario file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return json::parse(buffer.str());
}

//------------------------------------------------------------------------------
// Scenario
//------------------------------------------------------------------------------

// Feed-native answer for a decimal USD price
I128 feed_answer(const std::string& price, uint8_t decimals) {
    if (decimals > 18) {
        throw ValidationError(ErrorCode::INVALID_CONFIG, "feed decimals must be at most 18");
    }
    return static_cast<I128>(x18::parse(price) / x18::pow10(18u - decimals));
}

class Scenario {
public:
    Scenario(const EngineConfig& config, const json& scenario)
        : config_(config),
          registry_(config.make_registry()),
          clock_(scenario.value("now", uint64_t{0})),
          debt_token_(config.debt_token) {
        PriceFeedMap feeds;
        for (const auto& item : scenario.at("feeds").items()) {
            const json& entry = item.value();
            auto feed = std::make_shared<sim::SimPriceFeed>(
                entry.value("decimals", uint8_t{8}),
                feed_answer(entry.at("price").get<std::string>(), entry.value("decimals", uint8_t{8})),
                entry.value("updated_at", clock_.now()));
            PriceFeedId id = PriceFeedId::from_hex(item.key());
            feeds_[id] = feed;
            feeds[id] = feed;
        }

        oracle_ = std::make_unique<PriceOracleAdapter>(registry_, feeds, config.oracle, clock_.clock());
        ledger_ = std::make_unique<PositionLedger>(registry_);
        engine_ = std::make_unique<AccountingEngine>(*ledger_, *oracle_, debt_token_, bank_, config.engine);

        ledger_->subscribe([this](const LedgerEvent& event) { events_.push_back(event); });

        if (scenario.contains("wallets")) {
            for (const auto& w : scenario.at("wallets")) {
                AccountId holder = account(w, "account");
                bank_.fund(AssetId::from_hex(w.at("asset").get<std::string>()), holder,
                           x18::parse(w.at("amount").get<std::string>()));
            }
        }
    }

    json run(const json& steps) {
        json results = json::array();
        for (const auto& step : steps) {
            json out{{"op", step.at("op")}};
            try {
                json result = apply(step);
                out["ok"] = true;
                if (!result.is_null()) out["result"] = result;
            } catch (const Error& e) {
                out["ok"] = false;
                out["error"] = error_to_json(e);
            }
            results.push_back(out);
        }
        return results;
    }

    json report() const {
        json accounts = json::object();
        for (const auto& acct : accounts_) {
            json entry = account_json(acct);
            accounts[addresses::to_hex(acct)] = entry;
        }

        json events = json::array();
        for (const auto& event : events_) {
            events.push_back(json(event));
        }

        return json{
            {"events", events},
            {"accounts", accounts},
            {"debt_token_supply", x18::to_string(debt_token_.total_supply())}
        };
    }

private:
    const EngineConfig& config_;
    CollateralRegistry registry_;
    sim::ManualClock clock_;
    sim::SimDebtToken debt_token_;
    sim::SimCollateralBank bank_;
    std::map<PriceFeedId, std::shared_ptr<sim::SimPriceFeed>> feeds_;
    std::unique_ptr<PriceOracleAdapter> oracle_;
    std::unique_ptr<PositionLedger> ledger_;
    std::unique_ptr<AccountingEngine> engine_;
    std::vector<LedgerEvent> events_;
    std::set<AccountId> accounts_;

    AccountId account(const json& step, const char* key) {
        AccountId id = addresses::from_hex(step.at(key).get<std::string>());
        accounts_.insert(id);
        return id;
    }

    static AssetId asset(const json& step) {
        return AssetId::from_hex(step.at("asset").get<std::string>());
    }

    static U128 amount(const json& step, const char* key) {
        return x18::parse(step.at(key).get<std::string>());
    }

    json account_json(const AccountId& acct) const {
        json collateral = json::object();
        for (const auto& a : engine_->collateral_assets()) {
            U128 balance = engine_->collateral_balance(acct, a);
            if (balance != 0) collateral[config_.symbol_of(a)] = x18::to_string(balance);
        }

        json entry{
            {"collateral", collateral},
            {"debt_token_balance", x18::to_string(debt_token_.balance_of(acct))}
        };
        try {
            entry["info"] = engine_->account_information(acct);
            entry["health_factor"] = health_factor_string(engine_->health_factor(acct));
        } catch (const OracleError& e) {
            entry["valuation_error"] = error_to_json(e);
        }
        return entry;
    }

    json apply(const json& step) {
        const std::string op = step.at("op").get<std::string>();

        if (op == "deposit") {
            engine_->deposit_collateral(account(step, "account"), asset(step), amount(step, "amount"));
        } else if (op == "deposit_and_mint") {
            engine_->deposit_collateral_and_mint(account(step, "account"), asset(step),
                                                 amount(step, "collateral"), amount(step, "debt"));
        } else if (op == "mint") {
            engine_->mint(account(step, "account"), amount(step, "amount"));
        } else if (op == "burn") {
            engine_->burn(account(step, "account"), amount(step, "amount"));
        } else if (op == "redeem") {
            AccountId from = account(step, "account");
            AccountId to = step.contains("to") ? account(step, "to") : from;
            engine_->redeem_collateral(from, to, asset(step), amount(step, "amount"));
        } else if (op == "redeem_for_debt") {
            engine_->redeem_collateral_for_debt(account(step, "account"), asset(step),
                                                amount(step, "collateral"), amount(step, "debt"));
        } else if (op == "liquidate") {
            return engine_->liquidate(account(step, "liquidator"), asset(step),
                                      account(step, "target"), amount(step, "debt"));
        } else if (op == "set_price") {
            PriceFeedId id = PriceFeedId::from_hex(step.at("feed").get<std::string>());
            auto it = feeds_.find(id);
            if (it == feeds_.end()) {
                throw ValidationError(ErrorCode::INVALID_CONFIG, "unknown feed " + id.to_hex());
            }
            it->second->update_answer(feed_answer(step.at("price").get<std::string>(), it->second->decimals()),
                                      step.value("updated_at", clock_.now()));
        } else if (op == "advance") {
            clock_.advance(step.at("seconds").get<uint64_t>());
        } else if (op == "transfer_debt") {
            AccountId from = account(step, "from");
            AccountId to = account(step, "to");
            if (!debt_token_.transfer(from, to, amount(step, "amount"))) {
                throw CollaboratorError(ErrorCode::TRANSFER_FAILED, "debt token transfer refused");
            }
        } else if (op == "query") {
            return account_json(account(step, "account"));
        } else {
            throw ValidationError(ErrorCode::INVALID_CONFIG, "unknown op: " + op);
        }
        return nullptr;
    }
};

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        EngineConfig config = EngineConfig::from_file(options.config_path);
        configure_logging(options.verbose ? "debug" : config.log_level);

        json scenario = read_json_file(options.scenario_path);

        Scenario runner(config, scenario);
        json output{{"steps", runner.run(scenario.at("steps"))}};
        output.update(runner.report());

        std::cout << output.dump(2) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
