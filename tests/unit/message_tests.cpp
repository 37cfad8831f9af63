#include <doctest/doctest.h>
#include <snapspec/message.hpp>

using namespace snapspec;

TEST_CASE("render_message substitutes placeholders") {
    MessageFields fields{{"instance", "'x'"}, {"limit", "40"}};
    CHECK(render_message("{instance} is too long (maximum length is {limit})", fields) ==
          "'x' is too long (maximum length is 40)");
}

TEST_CASE("render_message edge cases") {
    MessageFields fields{{"key", "'a'"}};

    SUBCASE("unknown placeholder renders empty") {
        CHECK(render_message("[{missing}]", fields) == "[]");
    }

    SUBCASE("unclosed brace is copied literally") {
        CHECK(render_message("value {key", fields) == "value {key");
    }

    SUBCASE("nested brace is copied literally") {
        CHECK(render_message("{a{key}", fields) == "{a'a'");
    }

    SUBCASE("substituted text is not rescanned") {
        MessageFields recursive{{"key", "{key}"}};
        CHECK(render_message("{key}", recursive) == "{key}");
    }
}

TEST_CASE("render_message truncates oversized output") {
    MessageFields fields{{"big", std::string(MAX_MESSAGE_SIZE + 100, 'x')}};
    auto out = render_message("{big}", fields);
    CHECK(out.size() == MAX_MESSAGE_SIZE + 3);
    CHECK(out.substr(out.size() - 3) == "...");
}

TEST_CASE("repr renders document values") {
    CHECK(repr(json("text")) == "'text'");
    CHECK(repr(json("it's")) == "'it\\'s'");
    CHECK(repr(json(42)) == "42");
    CHECK(repr(json(true)) == "True");
    CHECK(repr(json(nullptr)) == "None");
    CHECK(repr(json::parse(R"(["a", 1])")) == "['a', 1]");
    CHECK(repr(json::parse(R"({"k": "v", "n": false})")) == "{'k': 'v', 'n': False}");
}

TEST_CASE("repr_list renders string lists") {
    CHECK(repr_list({}) == "[]");
    CHECK(repr_list({"a", "b"}) == "['a', 'b']");
}
