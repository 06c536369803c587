// LoadJson.hpp - JSON loading and typed field access
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <string>

namespace coloc::json {

/**
 * Parse a JSON file.
 * @throws ConfigError if the file is missing, unreadable or not valid JSON
 */
nlohmann::json load_json_file(const std::filesystem::path& path);

// ============ TYPED ACCESS ============
// Each helper returns def if the key is absent and throws ConfigError
// naming context and key if it is present with the wrong type.

int int_or(const nlohmann::json& m, const char* key, int def, const std::string& context);

bool bool_or(const nlohmann::json& m, const char* key, bool def, const std::string& context);

}  // namespace coloc::json
