#include <catch2/catch_all.hpp>
#include <ms/lexical.h>

using namespace ms;

TEST_CASE("Absolute URLs") {
    REQUIRE(lexical::is_url("http://example.org"));
    REQUIRE(lexical::is_url("https://www.example.org:8080/path?q=1"));
    REQUIRE(lexical::is_url("http://localhost/"));
    REQUIRE(lexical::is_url("http://192.168.0.1/index.html"));
    REQUIRE(lexical::is_url("HTTP://EXAMPLE.ORG"));

    REQUIRE_FALSE(lexical::is_url(""));
    REQUIRE_FALSE(lexical::is_url("example.org"));
    REQUIRE_FALSE(lexical::is_url("http://"));
    REQUIRE_FALSE(lexical::is_url("/foo/bar"));
}

TEST_CASE("Relative URLs") {
    REQUIRE(lexical::is_url("/foo/bar", true));
    REQUIRE(lexical::is_url("/", true));
    REQUIRE(lexical::is_url("http://example.org/foo", true));
    REQUIRE_FALSE(lexical::is_url("foo bar", true));
}

TEST_CASE("URL suggestions") {
    REQUIRE(lexical::suggest_url("example.org") == std::string("http://example.org"));
    REQUIRE_FALSE(lexical::suggest_url("http://example.org"));
    REQUIRE_FALSE(lexical::suggest_url("not a url"));
}

TEST_CASE("Email addresses") {
    REQUIRE(lexical::is_email("monty@python.org"));
    REQUIRE(lexical::is_email("first.last+tag@mail.example.co.uk"));
    REQUIRE(lexical::is_email("\"john.doe\"@example.com"));
    REQUIRE(lexical::is_email("user@localhost"));
    REQUIRE(lexical::is_email("user@[127.0.0.1]"));

    REQUIRE_FALSE(lexical::is_email("monty"));
    REQUIRE_FALSE(lexical::is_email("@python.org"));
    REQUIRE_FALSE(lexical::is_email("monty@"));
    REQUIRE_FALSE(lexical::is_email("monty..python@example.org"));
    REQUIRE_FALSE(lexical::is_email("monty@python"));
}
