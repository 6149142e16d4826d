#include <arpg/affix/affix_definition.hpp>
#include <arpg/affix/bonus_channel.hpp>
#include <arpg/affix/conditional_routing.hpp>
#include <arpg/data/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <sstream>

namespace arpg::affix {

std::vector<std::string> validate_affix_definition(const AffixDefinition& def) {
    std::vector<std::string> errors;

    if (def.id.empty()) {
        errors.push_back("Affix has an empty id");
    }
    if (def.stat_key.empty()) {
        errors.push_back("Affix '" + def.id + "' has an empty stat key");
    }
    if (!std::isfinite(def.min_value) || !std::isfinite(def.max_value)) {
        errors.push_back("Affix '" + def.id + "' has a non-finite value range");
    } else if (def.min_value > def.max_value) {
        errors.push_back("Affix '" + def.id + "' has min_value greater than max_value");
    }
    if (!std::isfinite(def.buff_duration) || def.buff_duration < 0.0) {
        errors.push_back("Affix '" + def.id + "' has an invalid buff duration");
    }

    if (def.is_conditional()) {
        if (!def.condition) {
            errors.push_back("Conditional affix '" + def.id + "' has no condition");
        } else if (!params_match_condition(def.condition->type, def.condition->params)) {
            errors.push_back("Conditional affix '" + def.id + "' has parameters for the wrong condition type");
        }
        // Every conditional key must land somewhere, otherwise its bonus would vanish silently
        if (!find_conditional_route(def.stat_key)) {
            errors.push_back("Conditional affix '" + def.id + "' stat '" + def.stat_key +
                             "' has no bonus channel or proc route");
        }
    } else {
        if (def.condition) {
            errors.push_back("Affix '" + def.id + "' has a condition but is not conditional");
        }
        if (!find_passive_channel(def.stat_key)) {
            errors.push_back("Affix '" + def.id + "' stat '" + def.stat_key + "' is not a bonus channel");
        }
    }

    return errors;
}

// ============================================================================
// JSON Deserialization
// ============================================================================

namespace {

std::vector<std::string> split_status_names(const std::string& text) {
    std::vector<std::string> names;
    std::stringstream stream(text);
    std::string token;
    while (std::getline(stream, token, ',')) {
        token.erase(0, token.find_first_not_of(' '));
        token.erase(token.find_last_not_of(' ') + 1);
        if (!token.empty()) {
            names.push_back(token);
        }
    }
    return names;
}

std::optional<std::vector<StatusType>> parse_status_list(const std::vector<std::string>& names, std::string& error) {
    std::vector<StatusType> statuses;
    for (const auto& name : names) {
        auto status = parse_status(name);
        if (!status) {
            error = "Unknown status effect '" + name + "'";
            return std::nullopt;
        }
        statuses.push_back(*status);
    }
    return statuses;
}

} // anonymous namespace

std::optional<ConditionParams> parse_condition_params(ConditionType type, const nlohmann::json& j, std::string& error) {
    using namespace data::json_helpers;

    switch (type) {
        case ConditionType::WhileStationary: {
            StationaryParams p;
            p.min_stationary_ms = get_float(j, "minStationaryMs", p.min_stationary_ms);
            return p;
        }
        case ConditionType::LowHp: {
            HealthThresholdParams p;
            p.threshold = get_float(j, "threshold", p.threshold);
            return p;
        }
        case ConditionType::DistanceClose:
        case ConditionType::DistanceFar: {
            DistanceParams p = std::get<DistanceParams>(default_condition_params(type));
            p.tile_radius = get_float(j, "tileRadius", p.tile_radius);
            return p;
        }
        case ConditionType::StatBreakpoint: {
            StatBreakpointParams p;
            std::string stat = get_string(j, "stat");
            auto attribute = parse_attribute(stat);
            if (!attribute) {
                error = "Unknown breakpoint stat '" + stat + "'";
                return std::nullopt;
            }
            p.stat = *attribute;
            if (!require_number(j, "threshold", error)) return std::nullopt;
            p.threshold = j["threshold"].get<float>();
            return p;
        }
        case ConditionType::KillStreak: {
            KillStreakParams p;
            p.kills_required = get_int(j, "killsRequired", p.kills_required);
            p.window_seconds = get_double(j, "windowSeconds", p.window_seconds);
            return p;
        }
        case ConditionType::MultiHit: {
            MultiHitParams p;
            p.hit_threshold = get_int(j, "hitThreshold", p.hit_threshold);
            return p;
        }
        case ConditionType::NoDamageTaken: {
            NoDamageTakenParams p;
            p.seconds = get_double(j, "seconds", p.seconds);
            return p;
        }
        case ConditionType::StatusOnTarget: {
            // "slow,chill" or ["slow", "chill"]
            std::vector<std::string> names = get_string_array(j, "statusEffect");
            if (names.empty()) {
                names = split_status_names(get_string(j, "statusEffect"));
            }
            auto statuses = parse_status_list(names, error);
            if (!statuses) return std::nullopt;
            if (statuses->empty()) {
                error = "status-on-target condition lists no status effect";
                return std::nullopt;
            }
            return StatusOnTargetParams{std::move(*statuses)};
        }
        case ConditionType::OnHit: {
            OnHitParams p;
            p.duration = get_float(j, "duration", p.duration);
            return p;
        }
        default:
            return default_condition_params(type);
    }
}

std::optional<AffixDefinition> deserialize_affix_definition(const nlohmann::json& j, std::string& error) {
    using namespace data::json_helpers;

    if (!require_string(j, "id", error)) return std::nullopt;
    if (!require_string(j, "stat", error)) return std::nullopt;
    if (!require_number(j, "min_value", error)) return std::nullopt;

    AffixDefinition def;
    def.id = j["id"].get<std::string>();
    def.stat_key = j["stat"].get<std::string>();
    def.name = get_string(j, "name", def.id);

    std::string category = get_string(j, "category", "offensive");
    auto parsed_category = items::parse_affix_category(category);
    if (!parsed_category) {
        error = "Unknown category '" + category + "' in affix '" + def.id + "'";
        return std::nullopt;
    }
    def.category = *parsed_category;

    def.min_value = j["min_value"].get<float>();
    def.max_value = get_float(j, "max_value", def.min_value);
    def.weight = get_int(j, "weight", 0);
    def.buff_duration = get_double(j, "buff_duration", 0.0);

    if (j.contains("condition")) {
        const auto& cond = j["condition"];
        if (!cond.is_object()) {
            error = "Condition of affix '" + def.id + "' must be an object";
            return std::nullopt;
        }
        std::string type_name = get_string(cond, "type");
        auto type = parse_condition_type(type_name);
        if (!type) {
            error = "Unknown condition type '" + type_name + "' in affix '" + def.id + "'";
            return std::nullopt;
        }
        auto params = parse_condition_params(*type, cond, error);
        if (!params) {
            error += " (affix '" + def.id + "')";
            return std::nullopt;
        }
        def.condition = Condition{*type, std::move(*params)};
    }

    return def;
}

} // namespace arpg::affix
