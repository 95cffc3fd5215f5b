#include <catch2/catch_test_macros.hpp>

#include "safeterm/sandbox/reversible_deleter.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace safeterm;
using namespace safeterm::sandbox;

namespace {
struct TmpDir {
    fs::path path;
    explicit TmpDir(const fs::path& parent = fs::temp_directory_path()) {
        static int counter = 0;
        auto base = parent /
                    ("test_reversible_deleter_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(base);
        fs::create_directories(base);
        path = fs::canonical(base);
    }
    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

auto make_config(const fs::path& root, bool dry_run = false) -> std::unique_ptr<SandboxConfig> {
    Config cfg;
    cfg.allowed_root = root.string();
    cfg.dry_run = dry_run;
    auto created = SandboxConfig::create(cfg);
    REQUIRE(created.has_value());
    return std::move(*created);
}

auto same_device(const fs::path& a, const fs::path& b) -> bool {
    struct stat sa {};
    struct stat sb {};
    return ::stat(a.c_str(), &sa) == 0 && ::stat(b.c_str(), &sb) == 0 && sa.st_dev == sb.st_dev;
}

auto read_file(const fs::path& path) -> std::string {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}
} // namespace

TEST_CASE("ReversibleDeleter moves a file into the recycle bin", "[sandbox][deleter]") {
    TmpDir tmp;
    std::ofstream(tmp.path / "a.txt") << "payload";
    auto config = make_config(tmp.path);
    PathSandbox paths(*config);
    ReversibleDeleter deleter(*config);

    auto target = paths.resolve("a.txt");
    REQUIRE(target.has_value());

    auto entry = deleter.delete_path(*target);
    REQUIRE(entry.has_value());
    CHECK_FALSE(entry->simulated);
    CHECK(entry->original_path == tmp.path / "a.txt");
    CHECK(entry->recycled_path == config->recycle_dir() / "a.txt");
    CHECK(entry->name() == "a.txt");

    CHECK_FALSE(fs::exists(tmp.path / "a.txt"));
    CHECK(read_file(config->recycle_dir() / "a.txt") == "payload");
}

TEST_CASE("ReversibleDeleter never overwrites earlier entries", "[sandbox][deleter]") {
    TmpDir tmp;
    auto config = make_config(tmp.path);
    PathSandbox paths(*config);
    ReversibleDeleter deleter(*config);

    auto delete_once = [&](const std::string& name, const std::string& content) {
        std::ofstream(tmp.path / name) << content;
        auto target = paths.resolve(name);
        REQUIRE(target.has_value());
        auto entry = deleter.delete_path(*target);
        REQUIRE(entry.has_value());
        return entry->name();
    };

    SECTION("numbered suffix goes before the extension") {
        CHECK(delete_once("a.txt", "first") == "a.txt");
        CHECK(delete_once("a.txt", "second") == "a_1.txt");
        CHECK(delete_once("a.txt", "third") == "a_2.txt");

        CHECK(read_file(config->recycle_dir() / "a.txt") == "first");
        CHECK(read_file(config->recycle_dir() / "a_1.txt") == "second");
        CHECK(read_file(config->recycle_dir() / "a_2.txt") == "third");
    }

    SECTION("only the last extension is split off") {
        CHECK(delete_once("archive.tar.gz", "1") == "archive.tar.gz");
        CHECK(delete_once("archive.tar.gz", "2") == "archive.tar_1.gz");
    }

    SECTION("dotfiles have no extension") {
        CHECK(delete_once(".bashrc", "1") == ".bashrc");
        CHECK(delete_once(".bashrc", "2") == ".bashrc_1");
    }

    SECTION("dangling symlink in the bin still occupies its name") {
        fs::create_symlink(tmp.path / "nowhere", config->recycle_dir() / "b.txt");
        CHECK(delete_once("b.txt", "x") == "b_1.txt");
    }
}

TEST_CASE("ReversibleDeleter dry run touches nothing", "[sandbox][deleter]") {
    TmpDir tmp;
    std::ofstream(tmp.path / "a.txt") << "keep me";
    auto config = make_config(tmp.path, true);
    PathSandbox paths(*config);
    ReversibleDeleter deleter(*config);

    auto target = paths.resolve("a.txt");
    REQUIRE(target.has_value());

    auto first = deleter.delete_path(*target);
    REQUIRE(first.has_value());
    CHECK(first->simulated);
    CHECK(first->recycled_path == config->recycle_dir() / "a.txt");
    CHECK(fs::exists(tmp.path / "a.txt"));
    CHECK(fs::is_empty(config->recycle_dir()));

    SECTION("repeated dry runs report the same name") {
        auto second = deleter.delete_path(*target);
        REQUIRE(second.has_value());
        CHECK(second->recycled_path == first->recycled_path);
    }

    SECTION("turning dry run off applies the move") {
        config->set_dry_run(false);
        auto real = deleter.delete_path(*target);
        REQUIRE(real.has_value());
        CHECK_FALSE(real->simulated);
        CHECK_FALSE(fs::exists(tmp.path / "a.txt"));
    }

    SECTION("missing source still fails") {
        auto missing = paths.resolve("missing.txt");
        REQUIRE(missing.has_value());
        CHECK_FALSE(deleter.delete_path(*missing).has_value());
    }
}

TEST_CASE("ReversibleDeleter recycles whole directory trees", "[sandbox][deleter]") {
    TmpDir tmp;
    fs::create_directories(tmp.path / "project" / "src" / "deep");
    std::ofstream(tmp.path / "project" / "README") << "readme";
    std::ofstream(tmp.path / "project" / "src" / "deep" / "main.cpp") << "int main() {}";
    auto config = make_config(tmp.path);
    PathSandbox paths(*config);
    ReversibleDeleter deleter(*config);

    auto target = paths.resolve("project");
    REQUIRE(target.has_value());

    auto entry = deleter.delete_path(*target);
    REQUIRE(entry.has_value());

    CHECK_FALSE(fs::exists(tmp.path / "project"));
    auto recycled = config->recycle_dir() / "project";
    CHECK(entry->recycled_path == recycled);
    CHECK(read_file(recycled / "README") == "readme");
    CHECK(read_file(recycled / "src" / "deep" / "main.cpp") == "int main() {}");

    SECTION("a second directory of the same name gets a suffix") {
        fs::create_directories(tmp.path / "project" / "other");
        auto again = paths.resolve("project");
        REQUIRE(again.has_value());

        auto second = deleter.delete_path(*again);
        REQUIRE(second.has_value());
        CHECK(second->recycled_path == config->recycle_dir() / "project_1");
        CHECK(fs::is_directory(config->recycle_dir() / "project_1" / "other"));
        CHECK(fs::exists(recycled / "README"));
    }
}

TEST_CASE("ReversibleDeleter removes a symlink, not its target", "[sandbox][deleter]") {
    TmpDir tmp;
    std::ofstream(tmp.path / "target.txt") << "data";
    fs::create_symlink(tmp.path / "target.txt", tmp.path / "link.txt");
    auto config = make_config(tmp.path);
    PathSandbox paths(*config);
    ReversibleDeleter deleter(*config);

    auto link = paths.resolve_entry("link.txt");
    REQUIRE(link.has_value());

    auto entry = deleter.delete_path(*link);
    REQUIRE(entry.has_value());
    CHECK_FALSE(fs::exists(fs::symlink_status(tmp.path / "link.txt")));
    CHECK(fs::is_symlink(fs::symlink_status(config->recycle_dir() / "link.txt")));
    CHECK(read_file(tmp.path / "target.txt") == "data");
}

TEST_CASE("ReversibleDeleter refuses unsafe targets", "[sandbox][deleter]") {
    TmpDir tmp;
    auto config = make_config(tmp.path);
    PathSandbox paths(*config);
    ReversibleDeleter deleter(*config);

    SECTION("missing path") {
        auto missing = paths.resolve("missing.txt");
        REQUIRE(missing.has_value());
        auto result = deleter.delete_path(*missing);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().reason == "No such file or directory");
        CHECK(result.error().to_error().code() == ErrorCode::DeleteFailed);
    }

    SECTION("the allowed root") {
        auto result = deleter.delete_path(paths.root());
        REQUIRE_FALSE(result.has_value());
        CHECK(fs::is_directory(tmp.path));
    }

    SECTION("an entry already in the recycle directory") {
        std::ofstream(config->recycle_dir() / "a_1.txt") << "old";
        auto inside = paths.resolve(".recycle_bin/a_1.txt");
        REQUIRE(inside.has_value());
        auto result = deleter.delete_path(*inside);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().reason == "already in the recycle directory");
        CHECK(read_file(config->recycle_dir() / "a_1.txt") == "old");
        CHECK_FALSE(fs::exists(config->recycle_dir() / "a_1_1.txt"));
    }

    SECTION("the recycle directory") {
        auto bin = paths.resolve(".recycle_bin");
        REQUIRE(bin.has_value());
        auto result = deleter.delete_path(*bin);
        REQUIRE_FALSE(result.has_value());
        CHECK(fs::is_directory(config->recycle_dir()));
    }
}

TEST_CASE("ReversibleDeleter next_recycle_name", "[sandbox][deleter]") {
    TmpDir tmp;
    auto config = make_config(tmp.path);
    ReversibleDeleter deleter(*config);

    CHECK(deleter.next_recycle_name(tmp.path / "notes.md") == config->recycle_dir() / "notes.md");

    std::ofstream(config->recycle_dir() / "notes.md") << "";
    std::ofstream(config->recycle_dir() / "notes_1.md") << "";
    CHECK(deleter.next_recycle_name(tmp.path / "notes.md") == config->recycle_dir() / "notes_2.md");
}

TEST_CASE("ReversibleDeleter copies across filesystems", "[sandbox][deleter]") {
    TmpDir tmp;
    if (!fs::is_directory("/dev/shm")) {
        SKIP("no /dev/shm on this system");
    }
    TmpDir bin("/dev/shm");
    if (same_device(tmp.path, bin.path)) {
        SKIP("temp directory and /dev/shm share a filesystem");
    }

    Config cfg;
    cfg.allowed_root = tmp.path.string();
    cfg.recycle_bin = (bin.path / "recycle").string();
    auto created = SandboxConfig::create(cfg);
    REQUIRE(created.has_value());
    auto config = std::move(*created);
    PathSandbox paths(*config);
    ReversibleDeleter deleter(*config);

    SECTION("a directory tree is copied and the original removed") {
        fs::create_directories(tmp.path / "sub" / "nested");
        std::ofstream(tmp.path / "sub" / "nested" / "f.txt") << "moved";
        fs::create_symlink("nested/f.txt", tmp.path / "sub" / "link");

        auto target = paths.resolve("sub");
        REQUIRE(target.has_value());
        auto entry = deleter.delete_path(*target);
        REQUIRE(entry.has_value());

        CHECK(entry->recycled_path == config->recycle_dir() / "sub");
        CHECK_FALSE(fs::exists(tmp.path / "sub"));
        CHECK(read_file(config->recycle_dir() / "sub" / "nested" / "f.txt") == "moved");
        CHECK(fs::is_symlink(fs::symlink_status(config->recycle_dir() / "sub" / "link")));
        CHECK_FALSE(fs::exists(config->recycle_dir() / ".sub.partial"));
    }

    SECTION("name collisions still get a suffix") {
        std::ofstream(config->recycle_dir() / "a.txt") << "first";
        std::ofstream(tmp.path / "a.txt") << "second";

        auto target = paths.resolve("a.txt");
        REQUIRE(target.has_value());
        auto entry = deleter.delete_path(*target);
        REQUIRE(entry.has_value());
        CHECK(entry->name() == "a_1.txt");
        CHECK(read_file(config->recycle_dir() / "a_1.txt") == "second");
        CHECK(read_file(config->recycle_dir() / "a.txt") == "first");
    }

    SECTION("a failed copy keeps the source and leaves nothing behind") {
        // Special files cannot be copied, so the tree copy fails part way.
        fs::create_directories(tmp.path / "tree");
        std::ofstream(tmp.path / "tree" / "a.txt") << "keep";
        REQUIRE(::mkfifo((tmp.path / "tree" / "pipe").c_str(), 0600) == 0);

        auto target = paths.resolve("tree");
        REQUIRE(target.has_value());
        auto result = deleter.delete_path(*target);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().reason.starts_with("copy to recycle directory failed"));

        CHECK(read_file(tmp.path / "tree" / "a.txt") == "keep");
        CHECK(fs::is_fifo(tmp.path / "tree" / "pipe"));
        CHECK(fs::is_empty(config->recycle_dir()));
    }
}
