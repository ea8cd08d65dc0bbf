#include "h5cx/core/util/LoadJson.hpp"

#include "h5cx/core/util/Errors.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

namespace h5cx::json {

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

void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context)
{
    for (const char* field : fields) {
        if (!json.contains(field)) {
            throw ConfigError(context + " missing required field: " + field);
        }
    }
}

bool bool_or(const nlohmann::json& m, const char* key, bool def, const std::string& context)
{
    if (!m.is_object()) return def;
    auto it = m.find(key);
    if (it == m.end()) return def;
    if (!it->is_boolean()) {
        throw ConfigError(context + " field '" + std::string(key) + "' must be a boolean");
    }
    return it->get<bool>();
}

std::string string_or(
    const nlohmann::json& m, const char* key, const std::string& def, const std::string& context)
{
    if (!m.is_object()) return def;
    auto it = m.find(key);
    if (it == m.end()) return def;
    if (!it->is_string()) {
        throw ConfigError(context + " field '" + std::string(key) + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace h5cx::json
