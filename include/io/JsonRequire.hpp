#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace io {
namespace detail {

inline void require_object(const nlohmann::json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

inline void require_array(const nlohmann::json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

inline const nlohmann::json& require_field(const nlohmann::json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    return j.at(key);
}

inline std::string require_string(const nlohmann::json& j, const char* key, const std::string& where) {
    const auto& v = require_field(j, key, where);
    if (!v.is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return v.get<std::string>();
}

inline double require_number(const nlohmann::json& j, const char* key, const std::string& where) {
    const auto& v = require_field(j, key, where);
    if (!v.is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return v.get<double>();
}

inline bool require_bool(const nlohmann::json& j, const char* key, const std::string& where) {
    const auto& v = require_field(j, key, where);
    if (!v.is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
    }
    return v.get<bool>();
}

inline std::string optional_string(const nlohmann::json& j, const char* key, const std::string& where,
                                   const std::string& def = {}) {
    if (!j.contains(key) || j.at(key).is_null()) return def;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

inline double optional_number(const nlohmann::json& j, const char* key, const std::string& where, double def) {
    if (!j.contains(key) || j.at(key).is_null()) return def;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

inline bool optional_bool(const nlohmann::json& j, const char* key, const std::string& where, bool def) {
    if (!j.contains(key) || j.at(key).is_null()) return def;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
    }
    return j.at(key).get<bool>();
}

inline std::vector<std::string> optional_string_array(const nlohmann::json& j, const char* key,
                                                      const std::string& where) {
    std::vector<std::string> out;
    if (!j.contains(key) || j.at(key).is_null()) return out;

    const auto& arr = j.at(key);
    require_array(arr, where + "." + key);
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

} // namespace detail
} // namespace io
