#include <doctest/doctest.h>
#include <snapspec/grammar.hpp>

using namespace snapspec;

namespace {

GrammarParseResult parse_array(const char* text) {
    return parse_grammar(json::parse(text), GrammarShape::Array, "build-packages");
}

} // namespace

TEST_CASE("parse_grammar accepts a plain list") {
    auto result = parse_array(R"(["gcc", "make"])");
    REQUIRE(result.ok);
    CHECK(result.node.kind == GrammarKind::Sequence);
    REQUIRE(result.node.items.size() == 2);
    CHECK(result.node.items[0].kind == GrammarKind::Scalar);
    CHECK(result.node.items[1].value == "make");
}

TEST_CASE("parse_grammar builds on clauses with fallbacks") {
    auto result = parse_array(R"([{"on amd64": ["a"], "else": ["b"]}])");
    REQUIRE(result.ok);
    REQUIRE(result.node.items.size() == 1);

    const auto& clause = result.node.items[0];
    CHECK(clause.kind == GrammarKind::OnClause);
    REQUIRE(clause.branches.size() == 1);
    CHECK(clause.branches[0].key == "on amd64");
    REQUIRE(clause.fallbacks.size() == 1);
    CHECK(clause.fallbacks[0].kind == GrammarKind::ElseClause);
}

TEST_CASE("parse_grammar merges consecutive on keys of one object") {
    auto result = parse_array(R"([{"on amd64": ["a"], "on arm64": ["b"]}])");
    REQUIRE(result.ok);
    REQUIRE(result.node.items.size() == 1);
    CHECK(result.node.items[0].branches.size() == 2);
    CHECK(result.node.items[0].describe() == "on amd64, on arm64");
}

TEST_CASE("parse_grammar keeps on and to keys apart") {
    auto result = parse_array(R"([{"on amd64": ["a"], "to arm64": ["b"]}])");
    REQUIRE(result.ok);
    REQUIRE(result.node.items.size() == 2);
    CHECK(result.node.items[0].kind == GrammarKind::OnClause);
    CHECK(result.node.items[1].kind == GrammarKind::ToClause);
}

TEST_CASE("parse_grammar attaches else fail list items to the previous statement") {
    auto result = parse_array(R"([{"on amd64": ["a"]}, "else fail"])");
    REQUIRE(result.ok);
    REQUIRE(result.node.items.size() == 1);
    REQUIRE(result.node.items[0].fallbacks.size() == 1);
    CHECK(result.node.items[0].fallbacks[0].kind == GrammarKind::ElseFail);
}

TEST_CASE("parse_grammar attaches else objects to the previous list item") {
    auto result = parse_array(R"([{"try": ["a"]}, {"else": ["b"]}])");
    REQUIRE(result.ok);
    REQUIRE(result.node.items.size() == 1);
    CHECK(result.node.items[0].kind == GrammarKind::TryClause);
    CHECK(result.node.items[0].fallbacks.size() == 1);
}

TEST_CASE("parse_grammar accepts an else fail key without a body") {
    auto result = parse_array(R"([{"on amd64": ["a"], "else fail": null}])");
    REQUIRE(result.ok);
    CHECK(result.node.items[0].fallbacks[0].kind == GrammarKind::ElseFail);

    auto with_body = parse_array(R"([{"on amd64": ["a"], "else fail": ["x"]}])");
    CHECK_FALSE(with_body.ok);
}

TEST_CASE("parse_grammar rejects dangling else") {
    CHECK_FALSE(parse_array(R"(["else fail"])").ok);
    CHECK_FALSE(parse_array(R"([{"else": ["x"]}])").ok);
    CHECK_FALSE(parse_array(R"(["gcc", {"else": ["x"]}])").ok);
    CHECK_FALSE(parse_grammar(json("else fail"), GrammarShape::String, "source").ok);
}

TEST_CASE("parse_grammar reports unknown statements with their path") {
    auto result = parse_array(R"([{"onn amd64": ["a"]}])");
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].path == "build-packages[0].onn amd64");
}

TEST_CASE("parse_grammar collects every structural error") {
    auto result = parse_array(R"([{"on amd64": [1]}, 2, {}])");
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.errors.size() == 3);
    CHECK(result.errors[0].path == "build-packages[0].on amd64[0]");
    CHECK(result.errors[1].path == "build-packages[1]");
    CHECK(result.errors[2].path == "build-packages[2]");
}

TEST_CASE("parse_grammar enforces the field shape") {
    SUBCASE("array field rejects a bare string") {
        CHECK_FALSE(parse_grammar(json("gcc"), GrammarShape::Array, "f").ok);
    }

    SUBCASE("string field accepts a bare string") {
        auto result = parse_grammar(json("https://example.com/src.tar.gz"), GrammarShape::String, "source");
        REQUIRE(result.ok);
        CHECK(result.node.kind == GrammarKind::Scalar);
    }

    SUBCASE("string field rejects a list of strings") {
        CHECK_FALSE(parse_grammar(json::parse(R"(["a"])"), GrammarShape::String, "source").ok);
    }

    SUBCASE("string field accepts statements with string bodies") {
        auto result = parse_grammar(json::parse(R"([{"on amd64": "a", "else": "b"}])"),
                                    GrammarShape::String, "source");
        CHECK(result.ok);
    }

    SUBCASE("objects are not grammar values") {
        CHECK_FALSE(parse_grammar(json::parse(R"({"on amd64": "a"})"), GrammarShape::String, "source").ok);
    }
}

TEST_CASE("collect_scalars walks every branch in document order") {
    auto result = parse_array(R"(["a", {"on amd64": ["b"], "else": ["c"]}, {"try": ["d"]}])");
    REQUIRE(result.ok);
    CHECK(collect_scalars(result.node) == std::vector<std::string>{"a", "b", "c", "d"});
}
