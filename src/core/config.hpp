#pragma once

#include "splitline/time_format.hpp"
#include "splitline/timer_source.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>

namespace splitline {

// What completed rows show in the value column
enum class SplitFormat {
    Delta,  // Difference to the comparison
    Time    // Split time of the attempt
};

struct GeneralConfig {
    SplitFormat split_format = SplitFormat::Delta;
    bool use_game_time = false;  // Force game time even if the timer runs on real time
    std::string comparison = kPersonalBestComparison;
};

// One FormatSpec per kind of readout
struct FormatConfig {
    FormatSpec timer;
    FormatSpec split;
    FormatSpec segment;
};

class Config {
public:
    Config() = default;

    GeneralConfig general;
    FormatConfig format;

    bool is_game_time() const { return general.use_game_time; }

    // Load from / save to a JSON file. Missing keys keep their defaults.
    bool load(const std::string& path);
    bool save(const std::string& path) const;

    static Config from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    static std::string get_default_path() { return "config/splitline.json"; }
};

} // namespace splitline
