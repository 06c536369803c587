#include "coloc/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

#include "coloc/core/types/Errors.hpp"

namespace coloc::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw ConfigError("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

int int_or(const nlohmann::json& m, const char* key, int def, const std::string& context)
{
    auto it = m.find(key);
    if (it == m.end()) return def;
    if (!it->is_number_integer()) {
        throw ConfigError(context + " field '" + std::string(key) + "' must be an integer");
    }
    return it->get<int>();
}

bool bool_or(const nlohmann::json& m, const char* key, bool def, const std::string& context)
{
    auto it = m.find(key);
    if (it == m.end()) return def;
    if (!it->is_boolean()) {
        throw ConfigError(context + " field '" + std::string(key) + "' must be a boolean");
    }
    return it->get<bool>();
}

}  // namespace coloc::json
