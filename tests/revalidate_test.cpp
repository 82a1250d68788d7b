#include "background_tasks.h"
#include "cache.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

using StringCache = Cache<std::string, std::string>;
using Options = CacheOptions<std::string, std::string>;

TEST(RevalidateTest, RevalidateOnGetUpdatesInBackground) {
    BackgroundTasks tasks;
    Options options{1000ms};
    options.revalidate_on_get = true;
    options.revalidators.push_back([](const std::string&) { return std::optional<std::string>("baz"); });
    options.keep_alive = tasks.hook();
    StringCache cache(std::move(options));

    cache.set("foo", "bar");
    EXPECT_EQ(cache.get("foo").value_or(""), "bar"); // stale value served immediately

    EXPECT_EQ(tasks.wait_all(), 1u);
    EXPECT_EQ(cache.get("foo").value_or(""), "baz");
}

TEST(RevalidateTest, RevalidateOnGetDeletesWhenNoValue) {
    BackgroundTasks tasks;
    Options options{1000ms};
    options.revalidate_on_get = true;
    options.revalidators.push_back([](const std::string&) { return std::optional<std::string>(); });
    options.keep_alive = tasks.hook();
    StringCache cache(std::move(options));

    cache.set("foo", "bar");
    EXPECT_EQ(cache.get("foo").value_or(""), "bar");

    tasks.wait_all();
    EXPECT_FALSE(cache.contains("foo"));
    EXPECT_FALSE(cache.get("foo").has_value());
}

TEST(RevalidateTest, GetReturnsBeforeRevalidationFinishes) {
    BackgroundTasks tasks;
    Options options{1000ms};
    options.revalidate_on_get = true;
    options.revalidators.push_back([](const std::string&) {
        std::this_thread::sleep_for(200ms);
        return std::optional<std::string>("fresh");
    });
    options.keep_alive = tasks.hook();
    StringCache cache(std::move(options));
    cache.set("k", "stale");

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(cache.get("k").value_or(""), "stale");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 150ms);
    EXPECT_EQ(tasks.pending(), 1u);

    tasks.wait_all();
    EXPECT_EQ(tasks.pending(), 0u);
}

TEST(RevalidateTest, ExplicitRevalidateWritesValue) {
    Options options{1000ms};
    options.revalidators.push_back([](const std::string& key) {
        return std::optional<std::string>("checked-" + key);
    });
    StringCache cache(std::move(options));
    cache.set("k", "old");

    cache.revalidate("k");
    EXPECT_EQ(cache.get("k").value_or(""), "checked-k");
    EXPECT_EQ(cache.stats().revalidations, 1u);
}

TEST(RevalidateTest, ExplicitRevalidateCanInsertAbsentKey) {
    Options options{1000ms};
    options.revalidators.push_back([](const std::string&) { return std::optional<std::string>("v"); });
    StringCache cache(std::move(options));

    cache.revalidate("new");
    EXPECT_TRUE(cache.contains("new"));
}

TEST(RevalidateTest, LayeredRevalidatorsStopAtFirstValue) {
    std::atomic<int> last_calls{0};
    Options options{1000ms};
    options.revalidators.push_back([](const std::string&) -> std::optional<std::string> {
        throw std::runtime_error("unreachable");
    });
    options.revalidators.push_back([](const std::string&) { return std::optional<std::string>("second"); });
    options.revalidators.push_back([&](const std::string&) {
        last_calls++;
        return std::optional<std::string>("third");
    });
    StringCache cache(std::move(options));
    cache.set("k", "old");

    EXPECT_NO_THROW(cache.revalidate("k"));
    EXPECT_EQ(cache.get("k").value_or(""), "second");
    EXPECT_EQ(last_calls.load(), 0);
}

TEST(RevalidateTest, FailingRevalidatorsDeleteKey) {
    Options options{1000ms};
    options.revalidators.push_back([](const std::string&) -> std::optional<std::string> {
        throw std::runtime_error("boom");
    });
    StringCache cache(std::move(options));
    cache.set("k", "old");

    EXPECT_NO_THROW(cache.revalidate("k"));
    EXPECT_FALSE(cache.contains("k"));
}

TEST(RevalidateTest, NonStandardThrowDeletesKey) {
    Options options{1000ms};
    options.revalidators.push_back([](const std::string&) -> std::optional<std::string> {
        throw 42;
    });
    StringCache cache(std::move(options));
    cache.set("k", "old");

    EXPECT_NO_THROW(cache.revalidate("k"));
    EXPECT_FALSE(cache.contains("k"));
}

TEST(RevalidateTest, NonStandardThrowInBackgroundStaysInBackground) {
    BackgroundTasks tasks;
    Options options{1000ms};
    options.revalidate_on_get = true;
    options.revalidators.push_back([](const std::string&) -> std::optional<std::string> {
        throw 7;
    });
    options.keep_alive = tasks.hook();
    StringCache cache(std::move(options));
    cache.set("k", "v");

    EXPECT_EQ(cache.get("k").value_or(""), "v");
    EXPECT_NO_THROW(tasks.wait_all());
    EXPECT_FALSE(cache.contains("k"));
}

TEST(RevalidateTest, MissingRevalidatorThrowsConfigError) {
    StringCache cache(Options{1000ms});
    cache.set("foo", "bar");

    EXPECT_THROW(cache.revalidate("foo"), CacheConfigError);
    // Nothing ran, the entry is untouched
    EXPECT_EQ(cache.get("foo").value_or(""), "bar");
}

TEST(RevalidateTest, OverrideReplacesConfiguredRevalidators) {
    std::atomic<int> configured_calls{0};
    Options options{1000ms};
    options.revalidators.push_back([&](const std::string&) {
        configured_calls++;
        return std::optional<std::string>("configured");
    });
    StringCache cache(std::move(options));
    cache.set("k", "old");

    std::vector<StringCache::Revalidator> per_call = {
        [](const std::string&) { return std::optional<std::string>("override"); }
    };
    cache.revalidate("k", per_call);
    EXPECT_EQ(cache.get("k").value_or(""), "override");
    EXPECT_EQ(configured_calls.load(), 0);
}

TEST(RevalidateTest, OverrideSatisfiesMissingConfiguration) {
    StringCache cache(Options{1000ms});
    cache.set("k", "old");

    std::vector<StringCache::Revalidator> per_call = {
        [](const std::string&) { return std::optional<std::string>(); }
    };
    EXPECT_NO_THROW(cache.revalidate("k", per_call));
    EXPECT_FALSE(cache.contains("k"));
}

TEST(RevalidateTest, FreshlyResolvedValuesAreNotRevalidated) {
    BackgroundTasks tasks;
    std::atomic<int> revalidations{0};
    Options options{1000ms};
    options.revalidate_on_get = true;
    options.resolvers.push_back([](const std::string&) { return std::optional<std::string>("resolved"); });
    options.revalidators.push_back([&](const std::string&) {
        revalidations++;
        return std::optional<std::string>("revalidated");
    });
    options.keep_alive = tasks.hook();
    StringCache cache(std::move(options));

    EXPECT_EQ(cache.get("k").value_or(""), "resolved");
    EXPECT_EQ(tasks.wait_all(), 0u);
    EXPECT_EQ(revalidations.load(), 0);

    // The next read is an ordinary hit and does revalidate
    EXPECT_EQ(cache.get("k").value_or(""), "resolved");
    tasks.wait_all();
    EXPECT_EQ(revalidations.load(), 1);
    EXPECT_EQ(cache.get("k").value_or(""), "revalidated");
}

TEST(RevalidateTest, MissDoesNotLaunchRevalidation) {
    BackgroundTasks tasks;
    Options options{1000ms};
    options.revalidate_on_get = true;
    options.revalidators.push_back([](const std::string&) { return std::optional<std::string>("x"); });
    options.keep_alive = tasks.hook();
    StringCache cache(std::move(options));

    EXPECT_FALSE(cache.get("absent").has_value());
    EXPECT_EQ(tasks.wait_all(), 0u);
    EXPECT_FALSE(cache.contains("absent"));
}

TEST(RevalidateTest, BackgroundFailureDoesNotReachCaller) {
    BackgroundTasks tasks;
    Options options{1000ms};
    options.revalidate_on_get = true; // but no revalidator configured
    options.keep_alive = tasks.hook();
    StringCache cache(std::move(options));
    cache.set("k", "v");

    std::optional<std::string> value;
    EXPECT_NO_THROW(value = cache.get("k"));
    EXPECT_EQ(value.value_or(""), "v");
    EXPECT_EQ(tasks.wait_all(), 1u);
    EXPECT_EQ(cache.get("k").value_or(""), "v");
}

TEST(RevalidateTest, BackgroundTaskOutlivesCacheHandle) {
    BackgroundTasks tasks;
    std::atomic<bool> finished{false};
    {
        Options options{1000ms};
        options.revalidate_on_get = true;
        options.revalidators.push_back([&finished](const std::string&) {
            std::this_thread::sleep_for(50ms);
            finished = true;
            return std::optional<std::string>("late");
        });
        options.keep_alive = tasks.hook();
        auto cache = std::make_unique<StringCache>(std::move(options));
        cache->set("k", "v");
        cache->get("k");
    } // cache destroyed while the revalidation sleeps

    tasks.wait_all();
    EXPECT_TRUE(finished.load());
}

TEST(RevalidateTest, ResetTtlThenRevalidate) {
    BackgroundTasks tasks;
    Options options{1000ms};
    options.reset_ttl_on_get = true;
    options.revalidate_on_get = true;
    options.revalidators.push_back([](const std::string&) { return std::optional<std::string>("new"); });
    options.keep_alive = tasks.hook();
    StringCache cache(std::move(options));

    cache.set("k", "old");
    EXPECT_EQ(cache.get("k").value_or(""), "old");
    tasks.wait_all();
    EXPECT_EQ(cache.get("k").value_or(""), "new");
    tasks.wait_all();
}
