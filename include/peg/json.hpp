#ifndef PEG_JSON_HPP
#define PEG_JSON_HPP

#include <nlohmann/json.hpp>

#include "types.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "ledger.hpp"

namespace peg {

// =============================================================================
// JSON Views
// =============================================================================

// Amounts are rendered as decimal strings ("2000.5"); health factors equal to
// U128_MAX are rendered as "max".

std::string health_factor_string(U128 health_factor_x18);

void to_json(nlohmann::json& j, const CollateralDeposited& event);
void to_json(nlohmann::json& j, const CollateralRedeemed& event);
void to_json(nlohmann::json& j, const LedgerEvent& event);
void to_json(nlohmann::json& j, const AccountInfo& info);
void to_json(nlohmann::json& j, const LiquidationResult& result);

nlohmann::json error_to_json(const Error& error);

} // namespace peg

#endif // PEG_JSON_HPP
