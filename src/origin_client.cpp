#include "origin_client.h"
#include "cache_error.h"
#include "logger.h"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <stdexcept>

using json = nlohmann::json;

OriginClient::OriginClient(const std::string& base_url, uint64_t timeout_ms)
    : timeout_ms_(timeout_ms)
{
    auto scheme_end = base_url.find("://");
    if(scheme_end == std::string::npos ||
       (base_url.compare(0, scheme_end, "http") != 0 && base_url.compare(0, scheme_end, "https") != 0)){
        throw CacheConfigError("origin '" + base_url + "' must start with http:// or https://");
    }

    auto path_start = base_url.find('/', scheme_end + 3);
    if(path_start == std::string::npos){
        host_ = base_url;
    }
    else{
        host_ = base_url.substr(0, path_start);
        path_prefix_ = base_url.substr(path_start);
    }
    while(!path_prefix_.empty() && path_prefix_.back() == '/'){
        path_prefix_.pop_back();
    }
}

std::optional<std::string> OriginClient::fetch(const std::string& key) const{
    httplib::Client cli(host_);
    cli.set_connection_timeout(std::chrono::milliseconds(timeout_ms_));
    cli.set_read_timeout(std::chrono::milliseconds(timeout_ms_));
    cli.set_write_timeout(std::chrono::milliseconds(timeout_ms_));

    const std::string path = path_prefix_ + "/" + key;
    auto res = cli.Get(path);
    if(!res){
        throw std::runtime_error("origin " + host_ + " unreachable: " + httplib::to_string(res.error()));
    }

    if(res->status == 404){
        log_debug("origin", "GET " + path + " -> 404");
        return std::nullopt;
    }
    if(res->status != 200){
        throw std::runtime_error("origin GET " + path + " returned " + std::to_string(res->status));
    }

    json body = json::parse(res->body, nullptr, false);
    if(body.is_discarded() || !body.is_object() || !body.contains("value") || !body["value"].is_string()){
        throw std::runtime_error("origin GET " + path + " returned a body without a string 'value'");
    }
    log_debug("origin", "GET " + path + " -> 200");
    return body["value"].get<std::string>();
}

OriginClient::Filler OriginClient::as_filler() const{
    OriginClient self = *this;
    return [self](const std::string& key) {
        return self.fetch(key);
    };
}
