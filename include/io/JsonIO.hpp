#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

// Schema helpers shared by the config, rubric, manifest and store loaders.
// Every failure throws core::ConfigError naming the JSON path ("where").
namespace jsonio {

using json = nlohmann::json;

json read_json_file(const std::filesystem::path& path);

// create parent dirs, dump with 2-space indent
void write_json_file(const std::filesystem::path& path, const json& j);

void require_object(const json& j, const std::string& where);
void require_array(const json& j, const std::string& where);

const json& require_field(const json& j, const char* key, const std::string& where);
std::string require_string(const json& j, const char* key, const std::string& where);
std::vector<std::string> require_string_array(const json& j, const char* key, const std::string& where);
int64_t require_int(const json& j, const char* key, const std::string& where);
double require_number(const json& j, const char* key, const std::string& where);

// optional fields: absent or null -> def, present with the wrong type -> throw
std::string get_string_or(const json& j, const char* key, const std::string& def, const std::string& where);
std::vector<std::string> get_string_array_or(const json& j, const char* key, const std::string& where);
int64_t get_int_or(const json& j, const char* key, int64_t def, const std::string& where);
double get_number_or(const json& j, const char* key, double def, const std::string& where);
bool get_bool_or(const json& j, const char* key, bool def, const std::string& where);

std::string index_path(const std::string& where, size_t i);

}  // namespace jsonio
