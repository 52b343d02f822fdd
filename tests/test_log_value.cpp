#include <catch2/catch_test_macros.hpp>
#include "rlog/log_value.hpp"
#include "rlog/log_record.hpp"
#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace rlog;

namespace
{
// Too large for the inline buffer of log_value
struct big_payload
{
    std::array<int, 32> values{};
};
} // namespace

template <> struct fmt::formatter<big_payload> : fmt::formatter<int>
{
    auto format(const big_payload &payload, fmt::format_context &ctx) const
    {
        return fmt::formatter<int>::format(payload.values[0], ctx);
    }
};

TEST_CASE("Log value typed access", "[value]")
{
    SECTION("Integers keep their type")
    {
        log_value v{8080};
        REQUIRE(v.holds<int>());
        REQUIRE(*v.get_if<int>() == 8080);
        REQUIRE(v.get_if<long>() == nullptr);
        REQUIRE(v.type() == typeid(int));
    }

    SECTION("String-like values are owned std::string")
    {
        std::string source = "temporary";
        log_value from_view{std::string_view(source)};
        source = "overwritten";

        REQUIRE(from_view.holds<std::string>());
        REQUIRE(*from_view.get_if<std::string>() == "temporary");

        log_value from_literal{"literal"};
        REQUIRE(from_literal.holds<std::string>());
        REQUIRE(from_literal.to_string() == "literal");

        const char *ptr = "pointer";
        log_value from_ptr{ptr};
        REQUIRE(from_ptr.holds<std::string>());
    }

    SECTION("Null C strings")
    {
        const char *missing = nullptr;
        log_value from_null_ptr{missing};
        REQUIRE(*from_null_ptr.get_if<std::string>() == NULL_STRING_VALUE);

        log_value from_nullptr{nullptr};
        REQUIRE(from_nullptr.to_string() == "<null>");
    }

    SECTION("Empty value")
    {
        log_value v;
        REQUIRE(v.empty());
        REQUIRE_FALSE(v);
        REQUIRE(v.get_if<int>() == nullptr);
        REQUIRE(v.to_string().empty());
        REQUIRE(v.type() == typeid(void));
    }
}

TEST_CASE("Log value formatting", "[value]")
{
    REQUIRE(log_value{42}.to_string() == "42");
    REQUIRE(log_value{true}.to_string() == "true");
    REQUIRE(log_value{2.5}.to_string() == "2.5");
    REQUIRE(log_value{'x'}.to_string() == "x");
    REQUIRE(fmt::format("port={}", log_value{8080}) == "port=8080");
}

TEST_CASE("Log value copy and move", "[value]")
{
    SECTION("Inline value")
    {
        log_value original{std::string("hello")};
        log_value copy = original;
        REQUIRE(*copy.get_if<std::string>() == "hello");
        REQUIRE(*original.get_if<std::string>() == "hello");

        log_value moved = std::move(original);
        REQUIRE(*moved.get_if<std::string>() == "hello");
        REQUIRE(original.empty());
    }

    SECTION("Heap value")
    {
        big_payload big;
        big.values[0]  = 7;
        big.values[31] = 9;
        log_value original{big};
        REQUIRE(original.holds<big_payload>());
        REQUIRE(original.to_string() == "7");

        log_value copy = original;
        REQUIRE(copy.get_if<big_payload>()->values[31] == 9);

        log_value moved = std::move(original);
        REQUIRE(moved.get_if<big_payload>()->values[0] == 7);
        REQUIRE(original.empty());
    }

    SECTION("Assignment across storage kinds")
    {
        big_payload big;
        big.values[5] = 5;

        log_value a{1};
        log_value b{big};

        a = b;
        REQUIRE(a.holds<big_payload>());
        REQUIRE(a.get_if<big_payload>()->values[5] == 5);

        b = log_value{"small"};
        REQUIRE(*b.get_if<std::string>() == "small");

        a = std::move(b);
        REQUIRE(*a.get_if<std::string>() == "small");
        REQUIRE(b.empty());
    }

    SECTION("Values in containers")
    {
        std::vector<log_value> values;
        for (int i = 0; i < 100; ++i) { values.emplace_back(i); }
        values.emplace_back("tail");

        REQUIRE(*values[57].get_if<int>() == 57);
        REQUIRE(values.back().to_string() == "tail");
    }
}

TEST_CASE("Log record attribute lookup", "[value]")
{
    log_record record;
    record.message = "m";
    record.attrs.emplace_back("port", 80);
    record.attrs.emplace_back("port", 81);
    record.attrs.emplace_back("host", "example.org");

    const log_attr *port = record.find("port");
    REQUIRE(port != nullptr);
    REQUIRE(*port->value.get_if<int>() == 80);

    REQUIRE(record.find("host")->value.to_string() == "example.org");
    REQUIRE(record.find("missing") == nullptr);
}
