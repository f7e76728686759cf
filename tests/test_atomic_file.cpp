#include "test_support.hpp"
#include <envcast/atomic_file.hpp>

#include <sys/stat.h>
#include <unistd.h>

using namespace envcast;
using envcast_test::TempDir;

static mode_t mode_of(const std::string& path) {
    struct stat st;
    REQUIRE(::stat(path.c_str(), &st) == 0);
    return st.st_mode & 07777;
}

// ===== read_file =====

TEST_CASE("read_file returns whole contents", "[atomic_file]") {
    TempDir tmp("atomic");
    auto path = tmp.write_file("config.json", std::string("{\"a\":1}\n\0tail", 13));
    auto r = read_file(path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::string("{\"a\":1}\n\0tail", 13));
}

TEST_CASE("read_file on missing file is an IO error", "[atomic_file]") {
    auto r = read_file("/nonexistent_envcast_dir/config.json");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == EnvcastError::IO);
    REQUIRE(r.error().file == "/nonexistent_envcast_dir/config.json");
}

// ===== Staging names =====

TEST_CASE("is_staging_name recognizes temp files", "[atomic_file]") {
    REQUIRE(is_staging_name(".config.json.envcast-a1B2c3"));
    REQUIRE_FALSE(is_staging_name("config.json"));
    REQUIRE_FALSE(is_staging_name("config.json.envcast-a1B2c3"));
    REQUIRE_FALSE(is_staging_name(".config.json.envcast-abc"));
}

// ===== Stage / commit =====

TEST_CASE("write_file_atomic replaces contents", "[atomic_file]") {
    TempDir tmp("atomic");
    auto path = tmp.write_file("config.json", "{\"ENV\":\"$ENV\"}");

    auto st = write_file_atomic(path, "{\"ENV\":\"prod\"}");
    REQUIRE(st.is_ok());
    REQUIRE(tmp.read("config.json") == "{\"ENV\":\"prod\"}");
    REQUIRE(tmp.count_entries("", ".envcast-") == 0);
}

TEST_CASE("write_file_atomic creates a missing file", "[atomic_file]") {
    TempDir tmp("atomic");
    auto path = tmp.file("new.txt");
    REQUIRE(write_file_atomic(path, "hello").is_ok());
    REQUIRE(tmp.read("new.txt") == "hello");
}

TEST_CASE("staged file is invisible until commit", "[atomic_file]") {
    TempDir tmp("atomic");
    auto path = tmp.write_file("main.js", "old");

    auto staged = StagedFile::stage(path, "new");
    REQUIRE(staged.is_ok());
    REQUIRE(tmp.read("main.js") == "old");
    REQUIRE(std::filesystem::exists(staged.value().temp_path()));
    REQUIRE(std::filesystem::path(staged.value().temp_path()).parent_path().string() == tmp.path.string());

    REQUIRE(staged.value().commit().is_ok());
    REQUIRE(staged.value().committed());
    REQUIRE(tmp.read("main.js") == "new");
    REQUIRE(tmp.count_entries("", ".envcast-") == 0);
}

TEST_CASE("crash before rename leaves the original untouched", "[atomic_file]") {
    TempDir tmp("atomic");
    auto path = tmp.write_file("config.json", "original");

    {
        auto staged = StagedFile::stage(path, "partially-configured");
        REQUIRE(staged.is_ok());
        // dropped without commit
    }

    REQUIRE(tmp.read("config.json") == "original");
    REQUIRE(tmp.count_entries("", ".envcast-") == 0);
}

TEST_CASE("commit twice is rejected", "[atomic_file]") {
    TempDir tmp("atomic");
    auto path = tmp.write_file("a.txt", "1");
    auto staged = StagedFile::stage(path, "2");
    REQUIRE(staged.is_ok());
    REQUIRE(staged.value().commit().is_ok());

    auto again = staged.value().commit();
    REQUIRE(again.is_err());
    REQUIRE(again.error().code == EnvcastError::InvalidArg);
}

TEST_CASE("moved-from staged file does not remove the temp", "[atomic_file]") {
    TempDir tmp("atomic");
    auto path = tmp.write_file("a.txt", "1");
    auto staged = StagedFile::stage(path, "2");
    REQUIRE(staged.is_ok());

    StagedFile owner = std::move(staged).value();
    REQUIRE(std::filesystem::exists(owner.temp_path()));
    REQUIRE(owner.commit().is_ok());
    REQUIRE(tmp.read("a.txt") == "2");
}

TEST_CASE("rewrite keeps permission bits", "[atomic_file]") {
    TempDir tmp("atomic");
    auto path = tmp.write_file("index.html", "x");
    REQUIRE(::chmod(path.c_str(), 0644) == 0);

    REQUIRE(write_file_atomic(path, "y").is_ok());
    REQUIRE(mode_of(path) == 0644);

    REQUIRE(::chmod(path.c_str(), 0640) == 0);
    REQUIRE(write_file_atomic(path, "z").is_ok());
    REQUIRE(mode_of(path) == 0640);
}

TEST_CASE("stage into a missing directory is an IO error", "[atomic_file]") {
    auto r = StagedFile::stage("/nonexistent_envcast_dir/config.json", "x");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == EnvcastError::IO);
}

TEST_CASE("stage into a read-only directory is an IO error", "[atomic_file]") {
    if (::geteuid() == 0) {
        // root ignores directory permissions
        SUCCEED("skipped when running as root");
        return;
    }
    TempDir tmp("atomic");
    auto path = tmp.write_file("ro/config.json", "original");
    REQUIRE(::chmod((tmp.path / "ro").c_str(), 0555) == 0);

    auto st = write_file_atomic(path, "new");
    ::chmod((tmp.path / "ro").c_str(), 0755);

    REQUIRE(st.is_err());
    REQUIRE(st.error().code == EnvcastError::IO);
    REQUIRE_FALSE(st.error().hint.empty());
    REQUIRE(tmp.read("ro/config.json") == "original");
}
