#include "cache_settings.h"
#include "cache_error.h"
#include <fstream>

using json = nlohmann::json;

namespace {

uint64_t read_positive(const json& j, const char* key){
    const auto& v = j.at(key);
    // Parsed non-negative literals are unsigned; values built in code may be signed
    bool positive = v.is_number_unsigned() ? v.get<uint64_t>() > 0
                                           : v.is_number_integer() && v.get<int64_t>() > 0;
    if(!positive){
        throw CacheConfigError(std::string("'") + key + "' must be a positive integer");
    }
    return v.get<uint64_t>();
}

bool read_bool(const json& j, const char* key){
    const auto& v = j.at(key);
    if(!v.is_boolean()){
        throw CacheConfigError(std::string("'") + key + "' must be true or false");
    }
    return v.get<bool>();
}

std::string read_string(const json& j, const char* key){
    const auto& v = j.at(key);
    if(!v.is_string()){
        throw CacheConfigError(std::string("'") + key + "' must be a string");
    }
    return v.get<std::string>();
}

} // namespace

CacheSettings parse_settings(const json& j){
    if(!j.is_object()){
        throw CacheConfigError("settings must be a JSON object");
    }

    CacheSettings s;
    if(j.contains("ttl_ms")) s.ttl_ms = read_positive(j, "ttl_ms");
    if(j.contains("max_size") && !j.at("max_size").is_null()){
        s.max_size = static_cast<size_t>(read_positive(j, "max_size"));
    }
    if(j.contains("reset_ttl_on_get")) s.reset_ttl_on_get = read_bool(j, "reset_ttl_on_get");
    if(j.contains("revalidate_on_get")) s.revalidate_on_get = read_bool(j, "revalidate_on_get");
    if(j.contains("origin")) s.origin = read_string(j, "origin");
    if(j.contains("log_level")) s.log_level = parse_log_level(read_string(j, "log_level"));
    return s;
}

CacheSettings load_settings(const std::string& path){
    std::ifstream in(path);
    if(!in){
        throw CacheConfigError("cannot open settings file '" + path + "'");
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw CacheConfigError("invalid JSON in '" + path + "': " + e.what());
    }
    return parse_settings(j);
}
