#include "api.h"
#include "cache_error.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
const char* kKeyPattern = R"(/cache/([\w\-\.]+))";
const char* kRevalidatePattern = R"(/cache/([\w\-\.]+)/revalidate)";

void set_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(json{{"error", message}}.dump(), "application/json");
}
}

CacheAPI::CacheAPI(std::shared_ptr<StringCache> cache)
    : cache_(std::move(cache)) {}

void CacheAPI::logRequest(const std::string& method, const std::string& path, int status) {
    log_info("api", method + " " + path + " -> " + std::to_string(status));
}

std::string make_prometheus_metrics(const StringCache &cache) {
    const CacheStats stats = cache.stats();
    std::ostringstream ss;
    ss << "# HELP cache_hits_total Total number of cache hits\n";
    ss << "# TYPE cache_hits_total counter\n";
    ss << "cache_hits_total " << stats.hits << "\n\n";

    ss << "# HELP cache_misses_total Total number of cache misses\n";
    ss << "# TYPE cache_misses_total counter\n";
    ss << "cache_misses_total " << stats.misses << "\n\n";

    ss << "# HELP cache_resolutions_total Misses filled by a resolver\n";
    ss << "# TYPE cache_resolutions_total counter\n";
    ss << "cache_resolutions_total " << stats.resolutions << "\n\n";

    ss << "# HELP cache_revalidations_total Completed revalidation runs\n";
    ss << "# TYPE cache_revalidations_total counter\n";
    ss << "cache_revalidations_total " << stats.revalidations << "\n\n";

    ss << "# HELP cache_evictions_total Least-recently-written entries evicted for capacity\n";
    ss << "# TYPE cache_evictions_total counter\n";
    ss << "cache_evictions_total " << stats.evictions << "\n\n";

    ss << "# HELP cache_expirations_total Expired entries removed\n";
    ss << "# TYPE cache_expirations_total counter\n";
    ss << "cache_expirations_total " << stats.expirations << "\n\n";

    ss << "# HELP cache_size Number of items currently stored in cache (including expired)\n";
    ss << "# TYPE cache_size gauge\n";
    ss << "cache_size " << cache.size() << "\n\n";

    ss << "# HELP cache_ttl_ms Configured entry TTL in ms\n";
    ss << "# TYPE cache_ttl_ms gauge\n";
    ss << "cache_ttl_ms " << cache.ttl().count() << "\n";

    if (cache.max_size().has_value()) {
        ss << "\n# HELP cache_max_size Configured cache capacity\n";
        ss << "# TYPE cache_max_size gauge\n";
        ss << "cache_max_size " << *cache.max_size() << "\n";
    }
    return ss.str();
}

void CacheAPI::registerRoutes() {
    // GET /cache/<key>
    server_.Get(kKeyPattern, [this](const httplib::Request& req, httplib::Response& res) {
        std::string key = req.matches[1];
        auto val = cache_->get(key);
        if (val.has_value()) {
            json j = {{"key", key}, {"value", val.value()}};
            res.set_content(j.dump(), "application/json");
            res.status = 200;
        } else {
            set_error(res, 404, "not found");
        }
        logRequest("GET", req.path, res.status);
    });

    // PUT /cache/<key>
    server_.Put(kKeyPattern, [this](const httplib::Request& req, httplib::Response& res) {
        std::string key = req.matches[1];
        json body_json = json::parse(req.body, nullptr, false);

        if (body_json.is_discarded() || !body_json.is_object()) {
            set_error(res, 400, "body must be a JSON object");
        } else if (!body_json.contains("value") || !body_json["value"].is_string()) {
            set_error(res, 400, "missing string 'value'");
        } else {
            cache_->set(key, body_json["value"].get<std::string>());
            res.set_content(R"({"status": "ok"})", "application/json");
            res.status = 200;
        }
        logRequest("PUT", req.path, res.status);
    });

    // DELETE /cache/<key>
    server_.Delete(kKeyPattern, [this](const httplib::Request& req, httplib::Response& res) {
        std::string key = req.matches[1];
        if (cache_->erase(key)) {
            res.set_content(R"({"status": "deleted"})", "application/json");
            res.status = 200;
        } else {
            set_error(res, 404, "not found");
        }
        logRequest("DELETE", req.path, res.status);
    });

    // POST /cache/<key>/revalidate
    server_.Post(kRevalidatePattern, [this](const httplib::Request& req, httplib::Response& res) {
        std::string key = req.matches[1];
        try {
            cache_->revalidate(key);
            json j = {{"key", key}, {"present", cache_->contains(key)}};
            res.set_content(j.dump(), "application/json");
            res.status = 200;
        } catch (const CacheConfigError& e) {
            set_error(res, 409, e.what());
        }
        logRequest("POST", req.path, res.status);
    });

    // GET /metrics
    server_.Get("/metrics", [this](const httplib::Request& req, httplib::Response& res) {
        auto body = make_prometheus_metrics(*cache_);
        res.set_content(body, "text/plain; version=0.0.4; charset=utf-8");
        res.status = 200;
        logRequest("GET", req.path, res.status);
    });

    server_.Get("/healthz", [this](const httplib::Request& req, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
        res.status = 200;
        logRequest("GET", req.path, res.status);
    });
}

void CacheAPI::start(const std::string& host, int port) {
    registerRoutes();

    log_info("api", "starting REST API on " + host + ":" + std::to_string(port));

    if (!server_.bind_to_port(host.c_str(), port)) {
        throw std::runtime_error("Failed to bind server to port " + std::to_string(port));
    }

    server_.listen_after_bind();
}

void CacheAPI::stop() {
    server_.stop();
}
