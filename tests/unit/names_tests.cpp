#include <doctest/doctest.h>
#include <zshrcman/names.hpp>

using namespace zshrcman;

TEST_CASE("validate_name accepts ordinary names") {
    for (const char* name : {"work", "personal", "node-20", "python3.12", "my_profile",
                             "c++", "gcc@13", "ripgrep", "with space", "caf\xc3\xa9"}) {
        CAPTURE(name);
        CHECK(validate_name("profile", name).isOk());
    }
}

TEST_CASE("validate_name rejects names that escape or inject") {
    const char* bad[] = {
        "",
        ".",
        "..",
        "../../victim",
        "/usr/local",
        "a/b",
        "a\\b",
        "C:evil",
        "-rf",
        "line\nbreak",
        "tab\there",
        "quote\"d",
        "single'quote",
        "back`tick",
        "$HOME",
        "\x7f",
    };
    for (const char* name : bad) {
        CAPTURE(name);
        auto r = validate_name("profile", name);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::INVALID_OPERATION);
    }

    std::string long_name(200, 'x');
    CHECK(validate_name("package", long_name).isErr());
}

TEST_CASE("validate_name names the kind in the message") {
    auto r = validate_name("package", "../x");
    REQUIRE(r.isErr());
    CHECK(r.error().message().find("package") != std::string::npos);
}

TEST_CASE("is_valid_utf8") {
    CHECK(is_valid_utf8(""));
    CHECK(is_valid_utf8("plain ascii"));
    CHECK(is_valid_utf8("caf\xc3\xa9"));
    CHECK(is_valid_utf8("\xe2\x82\xac"));          // euro sign
    CHECK(is_valid_utf8("\xf0\x9f\x90\x8d"));      // 4-byte sequence

    CHECK_FALSE(is_valid_utf8("\xff"));
    CHECK_FALSE(is_valid_utf8("\xc3"));             // truncated
    CHECK_FALSE(is_valid_utf8("\xe2\x82"));         // truncated
    CHECK_FALSE(is_valid_utf8("\xc0\xaf"));         // overlong '/'
    CHECK_FALSE(is_valid_utf8("\xed\xa0\x80"));     // surrogate
    CHECK_FALSE(is_valid_utf8("\xf4\x90\x80\x80")); // above U+10FFFF

    CHECK(validate_name("package", "\xff").isErr());
}

TEST_CASE("parse_alias_definition") {
    SUBCASE("splits at the first '='") {
        auto r = parse_alias_definition("gs=git status --short");
        REQUIRE(r.isOk());
        CHECK(r.value().name == "gs");
        CHECK(r.value().command == "git status --short");

        auto eq = parse_alias_definition("venv=python -m venv --prompt=x .venv");
        REQUIRE(eq.isOk());
        CHECK(eq.value().command == "python -m venv --prompt=x .venv");
    }

    SUBCASE("rejects malformed definitions") {
        for (const char* def : {"no-equals", "=git", "gs=", "g s=git", "g;s=git",
                                "gs=echo 'hi'", "gs=git\nrm -rf ~", "$(x)=y"}) {
            CAPTURE(def);
            auto r = parse_alias_definition(def);
            REQUIRE(r.isErr());
            CHECK(r.error().code() == ErrorCode::INVALID_OPERATION);
        }
    }
}

TEST_CASE("validate_environment") {
    EnvironmentState env;
    env.paths_prepend = {"~/bin", "$HOME/.cargo/bin"};
    env.variables["EDITOR"] = "nvim";
    env.aliases["k"] = "kubectl";
    CHECK(validate_environment(env).isOk());

    SUBCASE("path with a quote") {
        env.paths_append = {"/opt\"; rm -rf ~; echo \""};
        CHECK(validate_environment(env).isErr());
    }
    SUBCASE("path with a newline") {
        env.paths_prepend.push_back("/opt\nexport X=1");
        CHECK(validate_environment(env).isErr());
    }
    SUBCASE("bad variable name") {
        env.variables["1BAD"] = "x";
        CHECK(validate_environment(env).isErr());
    }
    SUBCASE("value with a backtick") {
        env.variables["X"] = "`id`";
        CHECK(validate_environment(env).isErr());
    }
    SUBCASE("alias command with a single quote") {
        env.aliases["x"] = "echo 'boom'";
        CHECK(validate_environment(env).isErr());
    }
}
