#include "config.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace splitline {

namespace {

FormatSpec format_spec_from_json(const nlohmann::json& j) {
    FormatSpec spec;
    if (!j.is_object()) {
        return spec;
    }

    spec.set_show_hours(j.value("show-hours", spec.show_hours()));
    spec.set_show_minutes(j.value("show-minutes", spec.show_minutes()));
    spec.set_show_seconds(j.value("show-seconds", spec.show_seconds()));
    spec.set_show_decimals(j.value("show-decimals", spec.show_decimals()));
    spec.set_dynamic(j.value("dynamic", spec.is_dynamic()));

    int places = j.value("decimal-places", static_cast<int>(spec.decimal_places()));
    if (places < 0 || places > kMaxDecimalPlaces) {
        std::cerr << "Warning: decimal-places " << places << " out of range, clamping" << std::endl;
        places = places < 0 ? 0 : kMaxDecimalPlaces;
    }
    spec.set_decimal_places(static_cast<uint8_t>(places));

    return spec;
}

nlohmann::json format_spec_to_json(const FormatSpec& spec) {
    nlohmann::json j;
    j["show-hours"] = spec.show_hours();
    j["show-minutes"] = spec.show_minutes();
    j["show-seconds"] = spec.show_seconds();
    j["show-decimals"] = spec.show_decimals();
    j["decimal-places"] = spec.decimal_places();
    j["dynamic"] = spec.is_dynamic();
    return j;
}

} // namespace

Config Config::from_json(const nlohmann::json& j) {
    Config config;

    if (j.contains("general") && j["general"].is_object()) {
        const auto& general = j["general"];

        std::string split_format = general.value("split-format", std::string("Delta"));
        if (split_format == "Time") {
            config.general.split_format = SplitFormat::Time;
        } else if (split_format == "Delta") {
            config.general.split_format = SplitFormat::Delta;
        } else {
            std::cerr << "Unknown split-format: " << split_format << ", using Delta" << std::endl;
        }

        std::string timing_method = general.value("timing-method", std::string("RealTime"));
        if (timing_method == "GameTime") {
            config.general.use_game_time = true;
        } else if (timing_method != "RealTime") {
            std::cerr << "Unknown timing-method: " << timing_method << ", using RealTime" << std::endl;
        }

        config.general.comparison = general.value("comparison", config.general.comparison);
    }

    if (j.contains("format") && j["format"].is_object()) {
        const auto& format = j["format"];
        if (format.contains("timer")) {
            config.format.timer = format_spec_from_json(format["timer"]);
        }
        if (format.contains("split")) {
            config.format.split = format_spec_from_json(format["split"]);
        }
        if (format.contains("segment")) {
            config.format.segment = format_spec_from_json(format["segment"]);
        }
    }

    return config;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    nlohmann::json general_json;
    general_json["split-format"] = general.split_format == SplitFormat::Time ? "Time" : "Delta";
    general_json["timing-method"] = general.use_game_time ? "GameTime" : "RealTime";
    general_json["comparison"] = general.comparison;
    j["general"] = general_json;

    nlohmann::json format_json;
    format_json["timer"] = format_spec_to_json(format.timer);
    format_json["split"] = format_spec_to_json(format.split);
    format_json["segment"] = format_spec_to_json(format.segment);
    j["format"] = format_json;

    return j;
}

bool Config::load(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file) {
            return false;  // No config file exists, use defaults
        }

        nlohmann::json j;
        file >> j;

        *this = from_json(j);
        std::cout << "Loaded config from " << path << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        return false;
    }
}

bool Config::save(const std::string& path) const {
    try {
        std::filesystem::path file_path(path);
        if (file_path.has_parent_path()) {
            std::filesystem::create_directories(file_path.parent_path());
        }

        std::ofstream file(path);
        if (!file) {
            std::cerr << "Failed to open config file for writing: " << path << std::endl;
            return false;
        }

        file << to_json().dump(2);
        std::cout << "Saved config to " << path << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error saving config: " << e.what() << std::endl;
        return false;
    }
}

} // namespace splitline
