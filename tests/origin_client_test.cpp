#include <gtest/gtest.h>
#include <httplib.h>
#include "cache.h"
#include "cache_error.h"
#include "origin_client.h"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>
using json = nlohmann::json;

// A tiny fake origin serving a fixed key -> value table under /items
class FakeOrigin {
public:
    FakeOrigin(int port) : port_(port) {}

    void start() {
        server_.Get("/items/(.*)", [&](const httplib::Request& req, httplib::Response& res) {
            requests++;
            std::string key = req.matches[1];
            std::lock_guard<std::mutex> lock(mtx_);
            if (key == "broken") {
                res.status = 500;
                res.set_content(R"({"error":"internal"})", "application/json");
                return;
            }
            if (key == "garbled") {
                res.set_content("not-json", "application/json");
                return;
            }
            auto it = values_.find(key);
            if (it == values_.end()) {
                res.status = 404;
                res.set_content(R"({"error":"not found"})", "application/json");
                return;
            }
            res.set_content(json{{"value", it->second}}.dump(), "application/json");
        });

        thread_ = std::thread([&]() {
            server_.listen("127.0.0.1", port_);
        });

        // Allow server time to bind
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    void stop() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    void put(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = value;
    }

    void remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.erase(key);
    }

    std::atomic<int> requests{0};

private:
    httplib::Server server_;
    int port_;
    std::thread thread_;
    std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

TEST(OriginClientTest, SplitsBaseUrl) {
    OriginClient plain("http://127.0.0.1:8080");
    EXPECT_EQ(plain.host(), "http://127.0.0.1:8080");
    EXPECT_EQ(plain.path_prefix(), "");

    OriginClient prefixed("http://origin:8080/items/");
    EXPECT_EQ(prefixed.host(), "http://origin:8080");
    EXPECT_EQ(prefixed.path_prefix(), "/items");
}

TEST(OriginClientTest, RejectsUrlWithoutScheme) {
    EXPECT_THROW(OriginClient("127.0.0.1:8080"), CacheConfigError);
    EXPECT_THROW(OriginClient("ftp://host/items"), CacheConfigError);
}

TEST(OriginClientTest, MapsStatusCodes) {
    FakeOrigin origin(6101);
    origin.put("foo", "bar");
    origin.start();

    OriginClient client("http://127.0.0.1:6101/items", 500);
    EXPECT_EQ(client.fetch("foo").value_or(""), "bar");
    EXPECT_FALSE(client.fetch("missing").has_value());
    EXPECT_THROW(client.fetch("broken"), std::runtime_error);
    EXPECT_THROW(client.fetch("garbled"), std::runtime_error);

    origin.stop();
}

TEST(OriginClientTest, UnreachableOriginThrows) {
    OriginClient client("http://127.0.0.1:6999", 300); // Port not in use
    EXPECT_THROW(client.fetch("foo"), std::runtime_error);
}

TEST(OriginClientTest, FillsCacheMissesAndRevalidates) {
    FakeOrigin origin(6102);
    origin.put("foo", "bar");
    origin.start();

    OriginClient client("http://127.0.0.1:6102/items", 500);
    CacheOptions<std::string, std::string> options;
    options.ttl = std::chrono::milliseconds(5000);
    options.resolvers.push_back(client.as_filler());
    options.revalidators.push_back(client.as_filler());
    Cache<std::string, std::string> cache(std::move(options));

    EXPECT_EQ(cache.get("foo").value_or(""), "bar");
    EXPECT_EQ(cache.get("foo").value_or(""), "bar");
    EXPECT_EQ(origin.requests.load(), 1); // second read served from cache

    origin.put("foo", "baz");
    cache.revalidate("foo");
    EXPECT_EQ(cache.get("foo").value_or(""), "baz");

    origin.remove("foo");
    cache.revalidate("foo");
    EXPECT_FALSE(cache.contains("foo"));

    origin.stop();
}

TEST(OriginClientTest, UnreachableOriginIsAbsorbedByCache) {
    OriginClient client("http://127.0.0.1:6998", 300);
    CacheOptions<std::string, std::string> options;
    options.ttl = std::chrono::milliseconds(5000);
    options.resolvers.push_back(client.as_filler());
    Cache<std::string, std::string> cache(std::move(options));

    std::optional<std::string> value;
    EXPECT_NO_THROW(value = cache.get("foo"));
    EXPECT_FALSE(value.has_value());
}
