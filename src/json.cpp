// =============================================================================
// json.cpp - JSON Serialization of Engine Results
// =============================================================================

#include "peg/json.hpp"
#include "peg/x18.hpp"

namespace peg {

std::string health_factor_string(U128 health_factor_x18) {
    return health_factor_x18 == U128_MAX ? "max" : x18::to_string(health_factor_x18);
}

void to_json(nlohmann::json& j, const CollateralDeposited& event) {
    j = nlohmann::json{
        {"event", "CollateralDeposited"},
        {"account", addresses::to_hex(event.account)},
        {"asset", event.asset.to_hex()},
        {"amount", x18::to_string(event.amount_x18)}
    };
}

void to_json(nlohmann::json& j, const CollateralRedeemed& event) {
    j = nlohmann::json{
        {"event", "CollateralRedeemed"},
        {"from", addresses::to_hex(event.from)},
        {"to", addresses::to_hex(event.to)},
        {"asset", event.asset.to_hex()},
        {"amount", x18::to_string(event.amount_x18)}
    };
}

void to_json(nlohmann::json& j, const LedgerEvent& event) {
    std::visit([&j](const auto& e) { to_json(j, e); }, event);
}

void to_json(nlohmann::json& j, const AccountInfo& info) {
    j = nlohmann::json{
        {"debt", x18::to_string(info.debt_x18)},
        {"collateral_value_usd", x18::to_string(info.collateral_value_usd_x18)}
    };
}

void to_json(nlohmann::json& j, const LiquidationResult& result) {
    j = nlohmann::json{
        {"liquidator", addresses::to_hex(result.liquidator)},
        {"target", addresses::to_hex(result.target)},
        {"asset", result.asset.to_hex()},
        {"debt_covered", x18::to_string(result.debt_covered_x18)},
        {"collateral_seized", x18::to_string(result.collateral_seized_x18)},
        {"bonus", x18::to_string(result.bonus_x18)},
        {"health_factor_before", health_factor_string(result.health_factor_before_x18)},
        {"health_factor_after", health_factor_string(result.health_factor_after_x18)}
    };
}

nlohmann::json error_to_json(const Error& error) {
    nlohmann::json j{
        {"code", to_string(error.code())},
        {"message", error.what()}
    };
    if (const auto* iv = dynamic_cast<const InvariantViolation*>(&error)) {
        j["health_factor"] = health_factor_string(iv->health_factor());
    } else if (const auto* le = dynamic_cast<const LiquidationError*>(&error)) {
        j["health_factor"] = health_factor_string(le->health_factor());
    }
    return j;
}

} // namespace peg
