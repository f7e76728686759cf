#include "test_support.hpp"
#include <envcast/glob.hpp>

using namespace envcast;
using envcast_test::TempDir;
using envcast_test::fixture_dir;

// ---- Literal matching ----

TEST_CASE("glob literal exact match", "[glob]") {
    REQUIRE(glob_match("html/config.json", "html/config.json"));
    REQUIRE_FALSE(glob_match("html/config.json", "html/config.js"));
    REQUIRE_FALSE(glob_match("Config.json", "config.json"));
}

TEST_CASE("glob absolute paths", "[glob]") {
    REQUIRE(glob_match("/usr/share/nginx/html/*.js", "/usr/share/nginx/html/main.js"));
    REQUIRE_FALSE(glob_match("/usr/share/nginx/html/*.js", "usr/share/nginx/html/main.js"));
}

TEST_CASE("glob leading ./ is ignored", "[glob]") {
    REQUIRE(glob_match("./dist/*.js", "dist/app.js"));
    REQUIRE(glob_match("dist/*.js", "./dist/app.js"));
}

// ---- Wildcards ----

TEST_CASE("glob star stays within a segment", "[glob]") {
    REQUIRE(glob_match("dist/*.js", "dist/main.abc123.js"));
    REQUIRE_FALSE(glob_match("dist/*.js", "dist/assets/main.js"));
}

TEST_CASE("glob question mark single char", "[glob]") {
    REQUIRE(glob_match("chunk-?.js", "chunk-1.js"));
    REQUIRE_FALSE(glob_match("chunk-?.js", "chunk-12.js"));
}

TEST_CASE("glob doublestar", "[glob]") {
    REQUIRE(glob_match("**/*.js", "main.js"));
    REQUIRE(glob_match("**/*.js", "a/b/c/main.js"));
    REQUIRE(glob_match("html/**/config.json", "html/config.json"));
    REQUIRE(glob_match("html/**", "html/a/b.css"));
}

TEST_CASE("glob char classes", "[glob]") {
    REQUIRE(glob_match("main.[jt]s", "main.ts"));
    REQUIRE(glob_match("chunk-[0-9].js", "chunk-7.js"));
    REQUIRE_FALSE(glob_match("chunk-[!0-9].js", "chunk-7.js"));
}

TEST_CASE("glob_has_wildcard", "[glob]") {
    REQUIRE(glob_has_wildcard("*.js"));
    REQUIRE(glob_has_wildcard("a/[ab].js"));
    REQUIRE(glob_has_wildcard("file?.js"));
    REQUIRE_FALSE(glob_has_wildcard("/srv/html/config.json"));
}

// ---- Validation ----

TEST_CASE("glob_validate accepts well-formed patterns", "[glob]") {
    REQUIRE(glob_validate("/srv/**/*.js").is_ok());
    REQUIRE(glob_validate("config.json").is_ok());
    REQUIRE(glob_validate("[!.]*.js").is_ok());
}

TEST_CASE("glob_validate rejects empty pattern", "[glob]") {
    auto st = glob_validate("");
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == EnvcastError::Config);
}

TEST_CASE("glob_validate rejects unclosed class", "[glob]") {
    auto st = glob_validate("dist/[ab.js");
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == EnvcastError::Config);
    REQUIRE(st.error().message.find("unclosed") != std::string::npos);

    REQUIRE(glob_validate("dist/[ab/c].js").is_err());
}

TEST_CASE("glob_validate rejects empty class and negation", "[glob]") {
    REQUIRE(glob_validate("a[].js").is_err());
    REQUIRE(glob_validate("a[!].js").is_err());
    REQUIRE(glob_validate("!*.map").is_err());
}

// ---- Base splitting ----

TEST_CASE("glob_split_base absolute", "[glob]") {
    auto gb = glob_split_base("/usr/share/nginx/html/**/*.js");
    REQUIRE(gb.base.string() == "/usr/share/nginx/html");
    REQUIRE(gb.rest == "**/*.js");
    REQUIRE_FALSE(gb.implicit_base);
}

TEST_CASE("glob_split_base relative and root", "[glob]") {
    auto rel = glob_split_base("*.js");
    REQUIRE(rel.base.string() == ".");
    REQUIRE(rel.rest == "*.js");
    REQUIRE(rel.implicit_base);

    auto nested = glob_split_base("dist/assets/*.js");
    REQUIRE(nested.base.string() == "dist/assets");
    REQUIRE(nested.rest == "*.js");

    auto root = glob_split_base("/*.json");
    REQUIRE(root.base.string() == "/");
    REQUIRE(root.rest == "*.json");
}

TEST_CASE("glob_split_base stops at the first wildcard segment", "[glob]") {
    auto gb = glob_split_base("/srv/app-*/static/*.js");
    REQUIRE(gb.base.string() == "/srv");
    REQUIRE(gb.rest == "app-*/static/*.js");
}

// ---- Filesystem ----

TEST_CASE("glob_expand_pattern on fixture bundle", "[glob]") {
    auto base = fixture_dir() / "bundle";
    auto res = glob_expand_pattern((base / "*.js").string());
    REQUIRE(res.is_ok());
    REQUIRE(res.value().size() == 1);
    REQUIRE(res.value()[0] == (base / "main.js").generic_string());
}

TEST_CASE("glob_expand_pattern recursive is sorted", "[glob]") {
    auto base = fixture_dir() / "bundle";
    auto res = glob_expand_pattern((base / "**/*.js").string());
    REQUIRE(res.is_ok());
    auto& files = res.value();
    REQUIRE(files.size() == 2);
    REQUIRE(files[0] == (base / "assets/chunk-1.js").generic_string());
    REQUIRE(files[1] == (base / "main.js").generic_string());
}

TEST_CASE("glob_expand_pattern literal file", "[glob]") {
    auto path = (fixture_dir() / "bundle" / "config.json").string();
    auto res = glob_expand_pattern(path);
    REQUIRE(res.is_ok());
    REQUIRE(res.value().size() == 1);

    auto missing = glob_expand_pattern((fixture_dir() / "bundle" / "nope.json").string());
    REQUIRE(missing.is_ok());
    REQUIRE(missing.value().empty());
}

TEST_CASE("glob_expand_pattern missing base is empty, not an error", "[glob]") {
    auto res = glob_expand_pattern("/nonexistent_dir_envcast_xyz/*.js");
    REQUIRE(res.is_ok());
    REQUIRE(res.value().empty());

    // a file in place of a directory is also just "no matches"
    auto under_file = glob_expand_pattern((fixture_dir() / "bundle" / "index.html" / "*.js").string());
    REQUIRE(under_file.is_ok());
    REQUIRE(under_file.value().empty());
}

TEST_CASE("glob_expand_pattern invalid pattern is a Config error", "[glob]") {
    auto res = glob_expand_pattern("/srv/[abc");
    REQUIRE(res.is_err());
    REQUIRE(res.error().code == EnvcastError::Config);
}

TEST_CASE("glob_expand_pattern skips directories and respects depth", "[glob]") {
    TempDir tmp("glob");
    tmp.write_file("a.js", "");
    tmp.write_file("b.js", "");
    tmp.write_file("sub/c.js", "");
    std::filesystem::create_directories(tmp.path / "dir.js");

    auto res = glob_expand_pattern((tmp.path / "*.js").string());
    REQUIRE(res.is_ok());
    REQUIRE(res.value().size() == 2);

    auto deep = glob_expand_pattern((tmp.path / "*/*.js").string());
    REQUIRE(deep.is_ok());
    REQUIRE(deep.value().size() == 1);
    REQUIRE(deep.value()[0] == (tmp.path / "sub/c.js").generic_string());
}

// ---- Filter ----

TEST_CASE("glob_is_negation", "[glob]") {
    std::string inner;
    REQUIRE(glob_is_negation("!**/*.map", inner));
    REQUIRE(inner == "**/*.map");
    REQUIRE_FALSE(glob_is_negation("*.js", inner));
}

TEST_CASE("glob_filter include and exclude", "[glob]") {
    std::vector<std::string> patterns = {"**", "!**/*.map", "!**/vendor/**"};
    std::vector<std::string> paths = {
        "/srv/html/main.js",
        "/srv/html/main.js.map",
        "/srv/html/vendor/react.js",
        "/srv/html/config.json"
    };

    auto result = glob_filter(patterns, paths);
    REQUIRE(result == std::vector<std::string>{"/srv/html/main.js", "/srv/html/config.json"});
}
