// LoadJson.hpp - JSON loading and validation utilities for h5cx
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <string>
#include <initializer_list>

namespace h5cx::json {

/** @throws ConfigError when the file is missing, unreadable or not JSON */
nlohmann::json load_json_file(const std::filesystem::path& path);

// ============ VALIDATION ============

/**
 * Ensure all required fields exist in a JSON object.
 * @param json The JSON object to validate
 * @param fields List of required field names
 * @param context Description for error messages (e.g., file path)
 * @throws ConfigError naming the first missing field
 */
void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context);

// ============ TYPED ACCESS HELPERS ============
// Missing keys return def. A key of the wrong JSON type throws ConfigError.

bool bool_or(const nlohmann::json& m, const char* key, bool def, const std::string& context);

std::string string_or(
    const nlohmann::json& m, const char* key, const std::string& def, const std::string& context);

} // namespace h5cx::json
