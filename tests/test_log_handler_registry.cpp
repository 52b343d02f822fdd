#include <catch2/catch_test_macros.hpp>
#include "rlog/log.hpp"
#include "recording_handler.hpp"
#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace rlog;

TEST_CASE("Handler registry registration", "[registry]")
{
    log_handler_registry registry;

    SECTION("First registration wins")
    {
        auto first  = std::make_shared<recording_handler>();
        auto second = std::make_shared<recording_handler>();

        REQUIRE(registry.register_handler("audit", first));
        REQUIRE_FALSE(registry.register_handler("audit", second));

        REQUIRE(registry.find_handler("audit") == first);
        REQUIRE(registry.size() == 1);

        registry.get_logger("audit").info("kept");
        REQUIRE(first->count() == 1);
        REQUIRE(second->count() == 0);
    }

    SECTION("Distinct names")
    {
        REQUIRE(registry.register_handler("a", std::make_shared<recording_handler>()));
        REQUIRE(registry.register_handler("b", std::make_shared<recording_handler>()));
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.contains("a"));
        REQUIRE(registry.contains("b"));

        auto names = registry.names();
        std::sort(names.begin(), names.end());
        REQUIRE(names == std::vector<std::string>{"a", "b"});
    }

    SECTION("Null handler is refused")
    {
        REQUIRE_FALSE(registry.register_handler("nothing", nullptr));
        REQUIRE_FALSE(registry.contains("nothing"));

        // The name is still free
        REQUIRE(registry.register_handler("nothing", std::make_shared<recording_handler>()));
    }
}

TEST_CASE("Handler registry lookup", "[registry]")
{
    log_handler_registry registry;
    auto handler = std::make_shared<recording_handler>();
    registry.register_handler("metrics", handler);

    SECTION("Unknown name")
    {
        REQUIRE(registry.find_handler("unknown") == nullptr);
        REQUIRE_FALSE(registry.contains("unknown"));
        REQUIRE_THROWS_AS(registry.get_logger("unknown"), handler_not_set);
    }

    SECTION("Logger is tagged with the registration name")
    {
        auto log = registry.get_logger("metrics");
        REQUIRE(log.module() == "metrics");
        REQUIRE(log.handler() == handler);

        log.info("flushed", "count", 12);

        auto records = handler->records();
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].attrs.size() == 2);
        REQUIRE(records[0].attrs[1].key == "module");
        REQUIRE(records[0].attrs[1].value.to_string() == "metrics");
    }

    SECTION("Independent of the default handler")
    {
        log_context context(std::make_shared<recording_handler>());
        REQUIRE_THROWS_AS(registry.get_logger("ext_default"), handler_not_set);
    }
}

TEST_CASE("Handler registry registration race", "[registry]")
{
    log_handler_registry registry;

    const int num_threads = 16;
    std::vector<std::shared_ptr<recording_handler>> candidates;
    for (int i = 0; i < num_threads; ++i) { candidates.push_back(std::make_shared<recording_handler>()); }

    std::atomic<bool> go{false};
    std::atomic<int> successes{0};
    std::atomic<int> winner{-1};

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i)
    {
        threads.emplace_back([&, i]() {
            while (!go.load()) { std::this_thread::yield(); }
            if (registry.register_handler("contested", candidates[i]))
            {
                ++successes;
                winner = i;
            }
        });
    }

    go = true;
    for (auto &t : threads) { t.join(); }

    REQUIRE(successes.load() == 1);
    REQUIRE(winner.load() >= 0);

    auto stored = registry.find_handler("contested");
    REQUIRE(stored == candidates[winner.load()]);

    // Every logger retrieved under the name reaches the winner
    for (int i = 0; i < 4; ++i) { registry.get_logger("contested").warn("who wins"); }
    REQUIRE(candidates[winner.load()]->count() == 4);
    for (int i = 0; i < num_threads; ++i)
    {
        if (i != winner.load()) { REQUIRE(candidates[i]->count() == 0); }
    }
}

TEST_CASE("Process-wide handler registry", "[registry][global]")
{
    auto handler = std::make_shared<recording_handler>();

    REQUIRE(register_handler("test_global_audit", handler));
    REQUIRE_FALSE(register_handler("test_global_audit", std::make_shared<recording_handler>()));
    REQUIRE(log_handler_registry::instance().find_handler("test_global_audit") == handler);

    get_registered_logger("test_global_audit").info("login", "user", "bob");

    auto records = handler->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].find("user")->value.to_string() == "bob");
    REQUIRE(records[0].find("module")->value.to_string() == "test_global_audit");

    REQUIRE_THROWS_AS(get_registered_logger("test_global_missing"), handler_not_set);
}
