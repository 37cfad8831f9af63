#include <doctest/doctest.h>
#include <snapspec/grammar.hpp>

using namespace snapspec;

namespace {

using Values = std::vector<std::string>;

ResolveResult resolve_on(const char* text, const std::string& build,
                         const std::string& target = "") {
    auto parsed = parse_grammar(json::parse(text), GrammarShape::Array, "build-packages");
    REQUIRE(parsed.ok);
    return resolve_grammar(parsed.node, SelectorContext::cross(build, target), "build-packages");
}

} // namespace

TEST_CASE("plain lists resolve to themselves") {
    auto result = resolve_on(R"(["gcc", "make"])", "amd64");
    CHECK(result.ok);
    CHECK(result.values == Values{"gcc", "make"});
}

TEST_CASE("on clause selects by build architecture") {
    const char* grammar = R"([{"on amd64": ["a", "b"]}])";

    auto amd64 = resolve_on(grammar, "amd64");
    CHECK(amd64.ok);
    CHECK(amd64.values == Values{"a", "b"});

    auto arm64 = resolve_on(grammar, "arm64");
    CHECK(arm64.ok);
    CHECK(arm64.values.empty());
}

TEST_CASE("comma-separated selectors form a logical OR") {
    const char* grammar = R"([{"on amd64,arm64": ["p"]}])";
    CHECK(resolve_on(grammar, "arm64").values == Values{"p"});
    CHECK(resolve_on(grammar, "amd64").values == Values{"p"});
    CHECK(resolve_on(grammar, "i386").values.empty());
}

TEST_CASE("to clause selects by target architecture") {
    const char* grammar = R"([{"to armhf": ["cross-gcc"]}, {"else": ["gcc"]}])";
    CHECK(resolve_on(grammar, "amd64", "armhf").values == Values{"cross-gcc"});
    CHECK(resolve_on(grammar, "amd64", "amd64").values == Values{"gcc"});
    CHECK(resolve_on(grammar, "armhf").values == Values{"cross-gcc"});
}

TEST_CASE("compound on/to keys require both selectors") {
    const char* grammar = R"([{"on amd64 to arm64": ["x"]}])";
    CHECK(resolve_on(grammar, "amd64", "arm64").values == Values{"x"});
    CHECK(resolve_on(grammar, "amd64", "amd64").values.empty());
    CHECK(resolve_on(grammar, "arm64", "arm64").values.empty());
}

TEST_CASE("first matching branch wins") {
    const char* grammar = R"([{"on amd64": ["first"], "on amd64,arm64": ["second"]}])";
    CHECK(resolve_on(grammar, "amd64").values == Values{"first"});
    CHECK(resolve_on(grammar, "arm64").values == Values{"second"});
}

TEST_CASE("else supplies the fallback when no branch matches") {
    const char* grammar = R"([{"on amd64": ["a"], "on arm64": ["b"], "else": ["c"]}])";
    CHECK(resolve_on(grammar, "amd64").values == Values{"a"});
    CHECK(resolve_on(grammar, "arm64").values == Values{"b"});
    CHECK(resolve_on(grammar, "s390x").values == Values{"c"});
}

TEST_CASE("else in the next list item applies to the previous statement") {
    const char* grammar = R"(["gcc", {"on arm64": ["gcc-arm"]}, {"else": ["gcc-x86"]}])";
    CHECK(resolve_on(grammar, "amd64").values == Values{"gcc", "gcc-x86"});
    CHECK(resolve_on(grammar, "arm64").values == Values{"gcc", "gcc-arm"});
}

TEST_CASE("try falls back to else when its body yields nothing") {
    const char* grammar = R"([{"try": [{"on amd64": ["x"]}], "else": ["y"]}])";

    auto arm64 = resolve_on(grammar, "arm64");
    CHECK(arm64.ok);
    CHECK(arm64.values == Values{"y"});

    auto amd64 = resolve_on(grammar, "amd64");
    CHECK(amd64.ok);
    CHECK(amd64.values == Values{"x"});
}

TEST_CASE("try catches a forced failure") {
    const char* grammar = R"([{"try": [{"on arm64": "else fail"}], "else": ["safe"]}])";
    auto result = resolve_on(grammar, "arm64");
    CHECK(result.ok);
    CHECK(result.values == Values{"safe"});
}

TEST_CASE("try without else yields empty when its body fails") {
    auto result = resolve_on(R"([{"try": [{"on arm64": "else fail"}]}])", "arm64");
    CHECK(result.ok);
    CHECK(result.values.empty());
}

TEST_CASE("else fail as the body of the active branch") {
    const char* grammar = R"([{"on amd64": "else fail"}])";

    auto amd64 = resolve_on(grammar, "amd64");
    CHECK_FALSE(amd64.ok);
    REQUIRE(amd64.failure.has_value());
    CHECK(amd64.failure->rule == "else-fail");
    CHECK(amd64.failure->statement == "on amd64");
    CHECK(amd64.failure->path == "build-packages");
    CHECK(amd64.failure->build_arch == "amd64");

    auto arm64 = resolve_on(grammar, "arm64");
    CHECK(arm64.ok);
    CHECK(arm64.values.empty());
}

TEST_CASE("else fail after an unmatched statement fails") {
    const char* grammar = R"([{"on amd64": ["a"]}, "else fail"])";

    CHECK(resolve_on(grammar, "amd64").values == Values{"a"});

    auto arm64 = resolve_on(grammar, "arm64");
    CHECK_FALSE(arm64.ok);
    REQUIRE(arm64.failure.has_value());
    CHECK(arm64.failure->rule == "else-fail");
    CHECK(arm64.failure->message ==
          "build-packages: Unable to satisfy 'on amd64', failure forced (build-on 'arm64', target 'arm64')");
}

TEST_CASE("fallbacks are tried in order") {
    const char* grammar = R"([{"on amd64": ["a"], "else": [{"on arm64": ["b"]}]}, "else fail"])";
    CHECK(resolve_on(grammar, "arm64").values == Values{"b"});
    CHECK_FALSE(resolve_on(grammar, "i386").ok);
}

TEST_CASE("resolution keeps duplicates and order") {
    auto result = resolve_on(R"(["a", {"on amd64": ["a", "b"]}, "c"])", "amd64");
    CHECK(result.values == Values{"a", "a", "b", "c"});
}

TEST_CASE("resolution is deterministic") {
    auto parsed = parse_grammar(
        json::parse(R"(["x", {"on amd64": ["y"], "else": ["z"]}, {"try": ["w"]}])"),
        GrammarShape::Array, "stage-packages");
    REQUIRE(parsed.ok);

    auto ctx = SelectorContext::for_host("amd64");
    auto first = resolve_grammar(parsed.node, ctx, "stage-packages");
    auto second = resolve_grammar(parsed.node, ctx, "stage-packages");
    CHECK(first.ok == second.ok);
    CHECK(first.values == second.values);
}

TEST_CASE("resolve_grammar_string yields at most one value") {
    auto ctx = SelectorContext::for_host("amd64");

    SUBCASE("scalar") {
        auto parsed = parse_grammar(json("https://example.com/a.tar.gz"), GrammarShape::String, "source");
        REQUIRE(parsed.ok);
        auto result = resolve_grammar_string(parsed.node, ctx, "source");
        CHECK(result.ok);
        CHECK(result.value == std::string("https://example.com/a.tar.gz"));
    }

    SUBCASE("nothing matched") {
        auto parsed = parse_grammar(json::parse(R"([{"on arm64": "a"}])"), GrammarShape::String, "source");
        REQUIRE(parsed.ok);
        auto result = resolve_grammar_string(parsed.node, ctx, "source");
        CHECK(result.ok);
        CHECK_FALSE(result.value.has_value());
    }

    SUBCASE("two values") {
        auto parsed = parse_grammar(json::parse(R"([{"on amd64": "a"}, {"on amd64": "b"}])"),
                                    GrammarShape::String, "source");
        REQUIRE(parsed.ok);
        auto result = resolve_grammar_string(parsed.node, ctx, "source");
        CHECK_FALSE(result.ok);
        REQUIRE(result.failure.has_value());
        CHECK(result.failure->rule == "single-value");
    }
}

TEST_CASE("resolve_field turns structural errors into grammar-type failures") {
    auto ctx = SelectorContext::for_host("amd64");

    auto result = resolve_field(json::parse(R"([{"on amd64": {"nested": "object"}}])"),
                                GrammarShape::Array, ctx, "parts.p.build-packages");
    CHECK_FALSE(result.ok);
    REQUIRE(result.failures.size() == 1);
    CHECK(result.failures[0].rule == "grammar-type");
    CHECK(result.failures[0].path == "parts.p.build-packages[0].on amd64");
    CHECK(result.failures[0].build_arch == "amd64");
}

TEST_CASE("resolve_field resolves both shapes") {
    auto ctx = SelectorContext::for_host("arm64");

    auto list = resolve_field(json::parse(R"([{"on arm64": ["a"]}])"), GrammarShape::Array, ctx, "f");
    CHECK(list.ok);
    CHECK(list.values == Values{"a"});

    auto single = resolve_field(json::parse(R"([{"on amd64": "x", "else": "y"}])"),
                                GrammarShape::String, ctx, "g");
    CHECK(single.ok);
    CHECK(single.values == Values{"y"});
}
