#include "io/JsonIO.hpp"

#include "core/Errors.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace jsonio {

json read_json_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw core::ConfigError("failed to open JSON file: " + path.string());
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw core::ConfigError("failed to parse JSON " + path.string() + ": " + e.what());
    }
    return j;
}

void write_json_file(const fs::path& path, const json& j) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::binary);
    if (!out) throw std::runtime_error("failed to open output file: " + path.string());
    out << j.dump(2) << "\n";
    if (!out) throw std::runtime_error("failed to write output file: " + path.string());
}

void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw core::ConfigError(where + " must be an object");
    }
}

void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw core::ConfigError(where + " must be an array");
    }
}

const json& require_field(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw core::ConfigError(where + " missing required field: " + std::string(key));
    }
    return j.at(key);
}

std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_string()) {
        throw core::ConfigError(where + "." + std::string(key) + " must be a string");
    }
    return v.get<std::string>();
}

static std::vector<std::string> string_array(const json& arr, const char* key, const std::string& where) {
    if (!arr.is_array()) {
        throw core::ConfigError(where + "." + std::string(key) + " must be an array");
    }
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw core::ConfigError(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

std::vector<std::string> require_string_array(const json& j, const char* key, const std::string& where) {
    return string_array(require_field(j, key, where), key, where);
}

int64_t require_int(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_number_integer()) {
        throw core::ConfigError(where + "." + std::string(key) + " must be an integer");
    }
    return v.get<int64_t>();
}

double require_number(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_number()) {
        throw core::ConfigError(where + "." + std::string(key) + " must be a number");
    }
    return v.get<double>();
}

static bool absent(const json& j, const char* key) {
    return !j.is_object() || !j.contains(key) || j.at(key).is_null();
}

std::string get_string_or(const json& j, const char* key, const std::string& def, const std::string& where) {
    if (absent(j, key)) return def;
    return require_string(j, key, where);
}

std::vector<std::string> get_string_array_or(const json& j, const char* key, const std::string& where) {
    if (absent(j, key)) return {};
    return string_array(j.at(key), key, where);
}

int64_t get_int_or(const json& j, const char* key, int64_t def, const std::string& where) {
    if (absent(j, key)) return def;
    return require_int(j, key, where);
}

double get_number_or(const json& j, const char* key, double def, const std::string& where) {
    if (absent(j, key)) return def;
    return require_number(j, key, where);
}

bool get_bool_or(const json& j, const char* key, bool def, const std::string& where) {
    if (absent(j, key)) return def;
    const json& v = j.at(key);
    if (!v.is_boolean()) {
        throw core::ConfigError(where + "." + std::string(key) + " must be a boolean");
    }
    return v.get<bool>();
}

std::string index_path(const std::string& where, size_t i) {
    std::ostringstream oss;
    oss << where << "[" << i << "]";
    return oss.str();
}

}  // namespace jsonio
