#include "strategy/StrategyJson.h"
#include "common/Errors.h"

#include <fstream>

namespace strategylab {
namespace strategy {

namespace {
template <typename T>
T requireEnum(const std::optional<T>& parsed, const std::string& field, const std::string& text) {
    if (!parsed) {
        throw StrategyValidationError("unknown " + field + " '" + text + "'");
    }
    return *parsed;
}

std::optional<double> optionalNumber(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}

analytics::IndicatorSpec indicatorFromJson(const nlohmann::json& j,
                                           const std::string& type_key,
                                           const std::string& suffix) {
    analytics::IndicatorSpec spec;
    spec.name = j.at(type_key).get<std::string>();
    spec.type = analytics::parseIndicatorType(spec.name);
    spec.parameter1 = optionalNumber(j, ("parameter1" + suffix).c_str());
    spec.parameter2 = optionalNumber(j, ("parameter2" + suffix).c_str());
    spec.parameter3 = optionalNumber(j, ("parameter3" + suffix).c_str());
    return spec;
}

void indicatorToJson(nlohmann::json& j, const analytics::IndicatorSpec& spec,
                     const std::string& type_key, const std::string& suffix) {
    j[type_key] = spec.name.empty() ? std::string(analytics::indicatorTypeToString(spec.type)) : spec.name;
    if (spec.parameter1) j["parameter1" + suffix] = *spec.parameter1;
    if (spec.parameter2) j["parameter2" + suffix] = *spec.parameter2;
    if (spec.parameter3) j["parameter3" + suffix] = *spec.parameter3;
}

Condition conditionFromJson(const nlohmann::json& j, size_t index) {
    Condition c;
    c.id = j.value("id", "condition_" + std::to_string(index + 1));
    c.left = indicatorFromJson(j, "indicatorType", "");

    const std::string op = j.at("operator").get<std::string>();
    c.op = requireEnum(parseComparisonOperator(op), "operator", op);

    c.value = optionalNumber(j, "value");
    if (j.contains("valueRange") && !j["valueRange"].is_null()) {
        const auto& range = j["valueRange"];
        if (!range.is_array() || range.size() != 2) {
            throw StrategyValidationError("valueRange must be [low, high]");
        }
        c.value_range = ValueRange{range[0].get<double>(), range[1].get<double>()};
    }
    if (j.contains("indicatorTypeRight") && !j["indicatorTypeRight"].is_null()) {
        c.right = indicatorFromJson(j, "indicatorTypeRight", "Right");
    }
    return c;
}

std::vector<Condition> conditionsFromJson(const nlohmann::json& j, const char* key) {
    std::vector<Condition> out;
    if (!j.contains(key)) {
        return out;
    }
    const auto& list = j[key];
    if (!list.is_array()) {
        throw StrategyValidationError(std::string(key) + " must be an array");
    }
    for (size_t i = 0; i < list.size(); ++i) {
        out.push_back(conditionFromJson(list[i], i));
    }
    return out;
}

Strategy parseStrategy(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw StrategyValidationError("strategy document must be a JSON object");
    }

    Strategy s;
    s.id = j.value("id", "");
    s.name = j.value("name", "");
    s.description = j.value("description", "");
    s.symbols = j.value("symbols", std::vector<std::string>{});

    const std::string timeframe = j.value("timeframe", "daily");
    s.timeframe = requireEnum(parseTimeframe(timeframe), "timeframe", timeframe);

    const std::string direction = j.value("direction", "long");
    s.direction = requireEnum(parseStrategyDirection(direction), "direction", direction);

    s.entry_conditions = conditionsFromJson(j, "entryConditions");
    s.exit_conditions = conditionsFromJson(j, "exitConditions");

    if (j.contains("positionSizing")) {
        const auto& ps = j["positionSizing"];
        const std::string mode = ps.value("type", "percentage_of_equity");
        s.position_sizing.mode = requireEnum(parsePositionSizingMode(mode), "positionSizing.type", mode);
        s.position_sizing.value = ps.value("value", 0.0);
        s.position_sizing.max_position_size = optionalNumber(ps, "maxPositionSize");
        if (ps.contains("maxPositionsOpen") && !ps["maxPositionsOpen"].is_null()) {
            s.position_sizing.max_positions_open = ps["maxPositionsOpen"].get<int>();
        }
    }

    if (j.contains("riskManagement")) {
        const auto& rm = j["riskManagement"];
        const std::string stop_mode = rm.value("stopLossType", "percentage");
        s.risk_management.stop_loss_mode =
            requireEnum(parseStopLossMode(stop_mode), "riskManagement.stopLossType", stop_mode);
        s.risk_management.stop_loss_value = rm.value("stopLossValue", 0.0);

        const std::string target_mode = rm.value("takeProfitType", "percentage");
        s.risk_management.take_profit_mode =
            requireEnum(parseTakeProfitMode(target_mode), "riskManagement.takeProfitType", target_mode);
        s.risk_management.take_profit_value = rm.value("takeProfitValue", 0.0);

        s.risk_management.trailing_stop = rm.value("trailingStop", false);
        s.risk_management.trailing_stop_value = optionalNumber(rm, "trailingStopValue");
        s.risk_management.max_drawdown = optionalNumber(rm, "maxDrawdown");
    }
    return s;
}
} // namespace

Strategy strategyFromJson(const nlohmann::json& j) {
    try {
        return parseStrategy(j);
    } catch (const nlohmann::json::exception& e) {
        throw StrategyValidationError(std::string("malformed strategy document: ") + e.what());
    }
}

nlohmann::json toJson(const Condition& condition) {
    nlohmann::json j;
    j["id"] = condition.id;
    indicatorToJson(j, condition.left, "indicatorType", "");
    j["operator"] = comparisonOperatorToString(condition.op);
    if (condition.value) {
        j["value"] = *condition.value;
    }
    if (condition.value_range) {
        j["valueRange"] = {condition.value_range->low, condition.value_range->high};
    }
    if (condition.right) {
        indicatorToJson(j, *condition.right, "indicatorTypeRight", "Right");
    }
    return j;
}

nlohmann::json toJson(const Strategy& strategy) {
    nlohmann::json j;
    j["id"] = strategy.id;
    j["name"] = strategy.name;
    j["description"] = strategy.description;
    j["symbols"] = strategy.symbols;
    j["timeframe"] = timeframeToString(strategy.timeframe);
    j["direction"] = strategyDirectionToString(strategy.direction);

    j["entryConditions"] = nlohmann::json::array();
    for (const auto& c : strategy.entry_conditions) {
        j["entryConditions"].push_back(toJson(c));
    }
    j["exitConditions"] = nlohmann::json::array();
    for (const auto& c : strategy.exit_conditions) {
        j["exitConditions"].push_back(toJson(c));
    }

    const auto& ps = strategy.position_sizing;
    nlohmann::json sizing = {
        {"type", positionSizingModeToString(ps.mode)},
        {"value", ps.value}
    };
    if (ps.max_position_size) sizing["maxPositionSize"] = *ps.max_position_size;
    if (ps.max_positions_open) sizing["maxPositionsOpen"] = *ps.max_positions_open;
    j["positionSizing"] = sizing;

    const auto& rm = strategy.risk_management;
    nlohmann::json risk = {
        {"stopLossType", stopLossModeToString(rm.stop_loss_mode)},
        {"stopLossValue", rm.stop_loss_value},
        {"takeProfitType", takeProfitModeToString(rm.take_profit_mode)},
        {"takeProfitValue", rm.take_profit_value},
        {"trailingStop", rm.trailing_stop}
    };
    if (rm.trailing_stop_value) risk["trailingStopValue"] = *rm.trailing_stop_value;
    if (rm.max_drawdown) risk["maxDrawdown"] = *rm.max_drawdown;
    j["riskManagement"] = risk;
    return j;
}

Strategy loadStrategyFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw StrategyLabError("cannot open strategy file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw StrategyValidationError("strategy file is not valid JSON (" + path + "): " + e.what());
    }
    return strategyFromJson(j);
}

} // namespace strategy
} // namespace strategylab
