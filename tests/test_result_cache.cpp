#include <catch2/catch_test_macros.hpp>
#include "cache/result_cache.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace askql;

namespace {

const Identity kAlice{"alice", "analyst"};
const Identity kBob{"bob", "analyst"};

CachedAnswer make_answer(const std::string& sql, std::vector<Row> rows = {{"west", "10"}}) {
    CachedAnswer a;
    a.sql = sql;
    a.column_names = {"region", "total"};
    a.rows = std::move(rows);
    a.explanation = "Retrieved 1 record(s) with columns: region, total";
    a.source = CandidateSource::TEMPLATE;
    return a;
}

ResultCache::Config cache_config(size_t max_entries = 100, size_t shards = 4,
                                 std::chrono::seconds ttl = std::chrono::seconds{60}) {
    ResultCache::Config cfg;
    cfg.enabled = true;
    cfg.max_entries = max_entries;
    cfg.num_shards = shards;
    cfg.ttl = ttl;
    return cfg;
}

} // anonymous namespace

TEST_CASE("ResultCache: disabled returns nullopt", "[cache]") {
    auto cfg = cache_config();
    cfg.enabled = false;
    ResultCache cache(cfg);

    cache.put(kAlice, "q", make_answer("SELECT 1"));
    CHECK_FALSE(cache.get(kAlice, "q").has_value());
    CHECK_FALSE(cache.is_enabled());
    CHECK(cache.get_stats().entry_count == 0);
}

TEST_CASE("ResultCache: put then get returns the stored answer", "[cache]") {
    ResultCache cache(cache_config());
    const auto original = make_answer("SELECT region, SUM(amount) AS total FROM sales GROUP BY region LIMIT 100",
                                      {{"west", "10"}, {"east", std::nullopt}});
    cache.put(kAlice, "total amount by region", original);

    auto cached = cache.get(kAlice, "total amount by region");
    REQUIRE(cached.has_value());
    CHECK(cached->sql == original.sql);
    CHECK(cached->column_names == original.column_names);
    CHECK(cached->rows == original.rows);
    CHECK(cached->explanation == original.explanation);
    CHECK(cached->created_at != std::chrono::system_clock::time_point{});
}

TEST_CASE("ResultCache: question normalization", "[cache]") {
    ResultCache cache(cache_config());
    cache.put(kAlice, "Total  amount\tby Region ", make_answer("SELECT 1"));

    CHECK(cache.get(kAlice, "total amount by region").has_value());
    CHECK(ResultCache::normalize_question("  How   MANY\nusers ") == "how many users");
}

TEST_CASE("ResultCache: entries are isolated per identity", "[cache]") {
    ResultCache cache(cache_config());
    cache.put(kAlice, "show sales", make_answer("SELECT * FROM sales LIMIT 100"));

    CHECK_FALSE(cache.get(kBob, "show sales").has_value());
    CHECK_FALSE(cache.get(Identity{"alice", "admin"}, "show sales").has_value());
    CHECK(cache.get(kAlice, "show sales").has_value());

    CHECK(ResultCache::make_key(kAlice, "q") != ResultCache::make_key(kBob, "q"));
    CHECK(ResultCache::make_key({"ab", "c"}, "q") != ResultCache::make_key({"a", "bc"}, "q"));
}

TEST_CASE("ResultCache: miss counts", "[cache]") {
    ResultCache cache(cache_config());
    CHECK_FALSE(cache.get(kAlice, "nothing here").has_value());
    cache.put(kAlice, "q", make_answer("SELECT 1"));
    CHECK(cache.get(kAlice, "q").has_value());

    auto stats = cache.get_stats();
    CHECK(stats.miss_count == 1);
    CHECK(stats.hit_count == 1);
    CHECK(stats.entry_count == 1);
    CHECK(stats.max_entries == 100);
    CHECK(stats.ttl_seconds == 60);
}

TEST_CASE("ResultCache: expired entry is absent without a sweep", "[cache]") {
    ResultCache cache(cache_config(100, 1, std::chrono::seconds{1}));
    cache.put(kAlice, "q", make_answer("SELECT 1"));
    REQUIRE(cache.get(kAlice, "q").has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    CHECK_FALSE(cache.get(kAlice, "q").has_value());
    CHECK(cache.get_stats().entry_count == 0);
}

TEST_CASE("ResultCache: zero TTL never serves", "[cache]") {
    ResultCache cache(cache_config(100, 1, std::chrono::seconds{0}));
    cache.put(kAlice, "q", make_answer("SELECT 1"));
    CHECK_FALSE(cache.get(kAlice, "q").has_value());
}

TEST_CASE("ResultCache: LRU eviction at capacity", "[cache]") {
    ResultCache cache(cache_config(3, 1));

    cache.put(kAlice, "q1", make_answer("SELECT 1"));
    cache.put(kAlice, "q2", make_answer("SELECT 2"));
    cache.put(kAlice, "q3", make_answer("SELECT 3"));

    // Touch q1 so q2 becomes least recently used
    REQUIRE(cache.get(kAlice, "q1").has_value());
    cache.put(kAlice, "q4", make_answer("SELECT 4"));

    CHECK(cache.get(kAlice, "q1").has_value());
    CHECK_FALSE(cache.get(kAlice, "q2").has_value());
    CHECK(cache.get(kAlice, "q3").has_value());
    CHECK(cache.get(kAlice, "q4").has_value());

    auto stats = cache.get_stats();
    CHECK(stats.entry_count == 3);
    CHECK(stats.evictions == 1);
}

TEST_CASE("ResultCache: shards never hold more than max_entries together", "[cache]") {
    SECTION("more shards than entries") {
        ResultCache cache(cache_config(2, 4));
        for (int i = 0; i < 50; ++i) {
            cache.put(kAlice, "q" + std::to_string(i), make_answer("SELECT 1"));
        }
        CHECK(cache.get_stats().entry_count == 2);
    }
    SECTION("entries that do not divide evenly") {
        ResultCache cache(cache_config(10, 4));
        for (int i = 0; i < 200; ++i) {
            cache.put(kAlice, "q" + std::to_string(i), make_answer("SELECT 1"));
        }
        CHECK(cache.get_stats().entry_count == 10);
    }
}

TEST_CASE("ResultCache: put replaces without evicting", "[cache]") {
    ResultCache cache(cache_config(2, 1));
    cache.put(kAlice, "q", make_answer("SELECT 1"));
    cache.put(kAlice, "q", make_answer("SELECT 2"));

    auto cached = cache.get(kAlice, "q");
    REQUIRE(cached.has_value());
    CHECK(cached->sql == "SELECT 2");
    CHECK(cache.get_stats().entry_count == 1);
    CHECK(cache.get_stats().evictions == 0);
}

TEST_CASE("ResultCache: clear drops entries, keeps counters", "[cache]") {
    ResultCache cache(cache_config());
    for (int i = 0; i < 10; ++i) {
        cache.put(kAlice, "q" + std::to_string(i), make_answer("SELECT 1"));
    }
    CHECK(cache.get(kAlice, "q0").has_value());
    cache.clear();

    CHECK(cache.get_stats().entry_count == 0);
    CHECK_FALSE(cache.get(kAlice, "q0").has_value());
    CHECK(cache.get_stats().hit_count == 1);
}

TEST_CASE("ResultCache: concurrent get/put", "[cache]") {
    ResultCache cache(cache_config(64, 4));
    std::atomic<bool> wrong{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            const Identity id{"user" + std::to_string(t), "analyst"};
            for (int i = 0; i < 500; ++i) {
                const auto q = "q" + std::to_string(i % 40);
                cache.put(id, q, make_answer(id.user_id + ":" + q));
                if (auto hit = cache.get(id, q); hit && hit->sql != id.user_id + ":" + q) {
                    wrong = true;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK_FALSE(wrong.load());
    CHECK(cache.get_stats().entry_count <= 64);
}
