// =============================================================================
// config.cpp - Engine Configuration Loading
// =============================================================================

#include "peg/config.hpp"
#include "peg/errors.hpp"
#include "peg/x18.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace peg {

namespace {

using json = nlohmann::json;

std::vector<std::string> string_array(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;

    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw ValidationError(ErrorCode::INVALID_CONFIG, std::string(key) + " must be an array");
    }
    for (const auto& item : arr) {
        out.push_back(item.get<std::string>());
    }
    return out;
}

uint32_t percent(const json& j, const char* key, uint32_t fallback) {
    if (!j.contains(key)) return fallback;
    int64_t v = j.at(key).get<int64_t>();
    if (v < 0 || v > 100) {
        throw ValidationError(ErrorCode::INVALID_CONFIG, std::string(key) + " must be a percentage");
    }
    return static_cast<uint32_t>(v);
}

} // anonymous namespace

EngineConfig EngineConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ValidationError(ErrorCode::INVALID_CONFIG, "Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

EngineConfig EngineConfig::from_json(std::string_view content) {
    EngineConfig config;

    try {
        json j = json::parse(content);

        config.log_level = j.value("log_level", config.log_level);
        if (j.contains("debt_token")) {
            config.debt_token = addresses::from_hex(j.at("debt_token").get<std::string>());
        }

        for (const auto& hex : string_array(j, "collateral_assets")) {
            config.collateral_assets.push_back(AssetId::from_hex(hex));
        }
        for (const auto& hex : string_array(j, "price_feeds")) {
            config.price_feeds.push_back(PriceFeedId::from_hex(hex));
        }
        config.symbols = string_array(j, "symbols");

        config.engine.liquidation_threshold =
            percent(j, "liquidation_threshold", config.engine.liquidation_threshold);
        config.engine.liquidation_bonus =
            percent(j, "liquidation_bonus", config.engine.liquidation_bonus);
        if (j.contains("min_health_factor")) {
            config.engine.min_health_factor_x18 = x18::parse(j.at("min_health_factor").get<std::string>());
        }

        if (j.contains("oracle")) {
            const json& oracle = j.at("oracle");
            config.oracle.max_staleness =
                oracle.value("max_staleness_seconds", config.oracle.max_staleness);
        }
    } catch (const json::exception& e) {
        throw ValidationError(ErrorCode::INVALID_CONFIG, std::string("malformed config: ") + e.what());
    }

    if (!config.symbols.empty() && config.symbols.size() != config.collateral_assets.size()) {
        throw ValidationError(ErrorCode::LENGTH_MISMATCH, "symbols and collateral_assets differ in length");
    }

    spdlog::debug("loaded config: {} collateral assets, {} price feeds",
                  config.collateral_assets.size(), config.price_feeds.size());
    return config;
}

CollateralRegistry EngineConfig::make_registry() const {
    return CollateralRegistry(collateral_assets, price_feeds);
}

std::string EngineConfig::symbol_of(const AssetId& asset) const {
    for (size_t i = 0; i < collateral_assets.size() && i < symbols.size(); ++i) {
        if (collateral_assets[i] == asset) return symbols[i];
    }
    return asset.to_hex();
}

void configure_logging(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        throw ValidationError(ErrorCode::INVALID_CONFIG, "unknown log level: " + level);
    }
    spdlog::set_level(lvl);
}

} // namespace peg
