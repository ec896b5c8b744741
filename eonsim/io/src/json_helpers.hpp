#pragma once

// Field accessors shared by the JSON loaders. Every failure is reported as a
// LoaderError carrying the path of the offending element.

#include <eonsim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace eonsim::io::detail {

inline const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                          const std::string& context) {
    if (!obj.IsObject()) {
        throw LoaderError("expected an object", context);
    }
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

inline double get_double(const rapidjson::Value& obj, const char* name,
                         const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

inline uint64_t get_uint64(const rapidjson::Value& obj, const char* name,
                           const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer",
                          context);
    }
    return member.GetUint64();
}

inline std::string get_string(const rapidjson::Value& obj, const char* name,
                              const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

inline const rapidjson::Value& get_array(const rapidjson::Value& obj, const char* name,
                                         const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

// Optional fields: absent keeps the default, present with the wrong type throws
inline double get_double_or(const rapidjson::Value& obj, const char* name, double fallback,
                            const std::string& context) {
    return obj.HasMember(name) ? get_double(obj, name, context) : fallback;
}

inline uint64_t get_uint64_or(const rapidjson::Value& obj, const char* name, uint64_t fallback,
                              const std::string& context) {
    return obj.HasMember(name) ? get_uint64(obj, name, context) : fallback;
}

inline rapidjson::Document parse_document(std::string_view json, const char* what) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", what);
    }
    return doc;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

inline std::ofstream open_for_writing(const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    return file;
}

} // namespace eonsim::io::detail
