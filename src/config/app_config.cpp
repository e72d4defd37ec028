#include "config/app_config.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <sys/stat.h>

using json = nlohmann::json;

namespace ag {

namespace {

bool env_flag(const char* value) {
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

}  // namespace

AppConfig AppConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    AppConfig config;
    try {
        if (j.contains("cache_path")) config.cache_path = j["cache_path"].get<std::string>();
        if (j.contains("use_sample_fallback")) config.use_sample_fallback = j["use_sample_fallback"].get<bool>();
        if (j.contains("persist_cache")) config.persist_cache = j["persist_cache"].get<bool>();

        if (j.contains("relationship_rules")) {
            config.relationship_rules = j["relationship_rules"].get<std::vector<std::string>>();
        }

        if (j.contains("layout")) config.layout = j["layout"].get<std::string>();
        if (j.contains("relationship_filters")) {
            config.relationship_filters = j["relationship_filters"].get<RelationshipFilters>();
        }
        if (j.contains("show_direction_markers")) {
            config.show_direction_markers = j["show_direction_markers"].get<bool>();
        }
        if (j.contains("title")) config.title = j["title"].get<std::string>();
        if (j.contains("output_directory")) config.output_directory = j["output_directory"].get<std::string>();

        if (j.contains("verbose")) config.verbose = j["verbose"].get<bool>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid field type: ") + e.what());
    }

    return config;
}

AppConfig AppConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Failed to parse config file " + path + ": " + e.what());
    }

    return from_json(j);
}

json AppConfig::to_json() const {
    json j;

    // Data source
    j["cache_path"] = cache_path;
    j["use_sample_fallback"] = use_sample_fallback;
    j["persist_cache"] = persist_cache;

    // Inference
    j["relationship_rules"] = relationship_rules;

    // Rendering
    j["layout"] = layout;
    j["relationship_filters"] = relationship_filters;
    j["show_direction_markers"] = show_direction_markers;
    j["title"] = title;
    j["output_directory"] = output_directory;

    j["verbose"] = verbose;
    return j;
}

void AppConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file for writing: " + path);
    }
    file << to_json().dump(2);
}

AppConfig AppConfig::from_environment() {
    AppConfig config;

    const char* cache_path = std::getenv("ASSETGRAPH_CACHE_PATH");
    if (cache_path) config.cache_path = cache_path;

    const char* output_dir = std::getenv("ASSETGRAPH_OUTPUT_DIR");
    if (output_dir) config.output_directory = output_dir;

    const char* layout = std::getenv("ASSETGRAPH_LAYOUT");
    if (layout) config.layout = layout;

    const char* verbose = std::getenv("ASSETGRAPH_VERBOSE");
    if (verbose) config.verbose = env_flag(verbose);

    return config;
}

bool AppConfig::validate(std::string& error_message) const {
    if (layout != "spring" && layout != "circular" && layout != "grid") {
        error_message = "Invalid layout: " + layout;
        return false;
    }

    const auto known = available_rule_names();
    for (const auto& rule : relationship_rules) {
        if (std::find(known.begin(), known.end(), rule) == known.end()) {
            error_message = "Unknown relationship rule: " + rule;
            return false;
        }
    }

    if (cache_path.empty() && !use_sample_fallback) {
        error_message = "No data source: cache_path is empty and sample fallback is disabled";
        return false;
    }

    if (title.empty()) {
        error_message = "Title must not be empty";
        return false;
    }

    if (output_directory.empty()) {
        error_message = "Output directory must not be empty";
        return false;
    }

    return true;
}

std::vector<RulePtr> AppConfig::create_rules() const {
    std::vector<RulePtr> rules;
    for (const auto& name : relationship_rules) {
        try {
            rules.push_back(create_rule(name));
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }
    return rules;
}

AppConfig load_config_with_fallback(const std::string& config_path) {
    std::vector<std::string> paths_to_try;

    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }
    paths_to_try.push_back("assetgraph.json");
    paths_to_try.push_back(".assetgraph.json");

    for (const auto& path : paths_to_try) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) {
            continue;
        }
        try {
            auto config = AppConfig::from_json_file(path);
            std::string error;
            if (config.validate(error)) {
                return config;
            }
            std::cerr << "Warning: ignoring " << path << ": " << error << "\n";
        } catch (const ConfigError& e) {
            std::cerr << "Warning: " << e.what() << "\n";
        }
    }

    return AppConfig::from_environment();
}

} // namespace ag
