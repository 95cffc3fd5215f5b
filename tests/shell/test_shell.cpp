#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <unistd.h>

#include "safeterm/commands/registry.hpp"
#include "safeterm/core/logger.hpp"
#include "safeterm/shell/shell.hpp"

#include <spdlog/sinks/ostream_sink.h>

namespace fs = std::filesystem;
using namespace safeterm;
using safeterm::commands::Outcome;
using safeterm::shell::Shell;
using safeterm::shell::ShellOptions;

namespace {

struct TmpDir {
    fs::path path;
    TmpDir() {
        static int counter = 0;
        auto base = fs::temp_directory_path() /
                    ("test_shell_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(base);
        fs::create_directories(base);
        path = fs::canonical(base);
    }
    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

/// Captures debug-level output of the shared logger while alive.
struct DebugLogCapture {
    std::ostringstream stream;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink;
    spdlog::level::level_enum saved_level;

    DebugLogCapture()
        : sink(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream, true))
        , saved_level(Logger::get()->level()) {
        sink->set_pattern("%l %v");
        Logger::get()->sinks().push_back(sink);
        Logger::get()->set_level(spdlog::level::debug);
    }
    ~DebugLogCapture() {
        auto& sinks = Logger::get()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
        Logger::get()->set_level(saved_level);
    }

    [[nodiscard]] auto text() const -> std::string { return stream.str(); }
};

struct ShellHarness {
    TmpDir tmp;
    std::unique_ptr<sandbox::SandboxConfig> config;
    std::unique_ptr<exec::CommandExecutor> executor;
    commands::CommandRegistry registry;
    std::ostringstream out;
    std::ostringstream err;
    std::istringstream in;
    std::unique_ptr<Shell> shell;

    explicit ShellHarness(std::string input = "", bool safe_mode = true) : in(std::move(input)) {
        Config cfg;
        cfg.allowed_root = tmp.path.string();
        cfg.safe_mode = safe_mode;
        auto created = sandbox::SandboxConfig::create(cfg);
        REQUIRE(created.has_value());
        config = std::move(*created);
        executor = std::make_unique<exec::CommandExecutor>(*config);
        commands::register_builtin_commands(registry);

        ShellOptions options;
        options.colors_enabled = false;
        shell = std::make_unique<Shell>(*executor, registry, out, err, in, options);
    }
};

} // namespace

TEST_CASE("expand_alias", "[shell]") {
    std::vector<std::string> ll = {"ll", "docs"};
    CHECK(shell::expand_alias(ll));
    CHECK(ll == std::vector<std::string>{"ls", "-l", "docs"});

    std::vector<std::string> la = {"la"};
    CHECK(shell::expand_alias(la));
    CHECK(la == std::vector<std::string>{"ls", "-a"});

    std::vector<std::string> plain = {"ls"};
    CHECK_FALSE(shell::expand_alias(plain));
    CHECK(plain == std::vector<std::string>{"ls"});
}

TEST_CASE("Shell executes single lines", "[shell]") {
    ShellHarness h;

    SECTION("blank line does nothing") {
        CHECK(h.shell->execute_line("   ") == Outcome::Success);
        CHECK(h.out.str().empty());
        CHECK(h.err.str().empty());
    }

    SECTION("quoted operand") {
        CHECK(h.shell->execute_line("mkdir 'my dir'") == Outcome::Success);
        CHECK(fs::is_directory(h.tmp.path / "my dir"));
    }

    SECTION("unknown command") {
        CHECK(h.shell->execute_line("frobnicate now") == Outcome::Failure);
        CHECK(h.err.str().find("Unknown command: frobnicate") != std::string::npos);
        CHECK(h.err.str().find("Type 'help' for available commands.") != std::string::npos);
    }

    SECTION("parse error") {
        CHECK(h.shell->execute_line("ls 'unterminated") == Outcome::Failure);
        CHECK(h.err.str().find("No closing quotation") != std::string::npos);
    }

    SECTION("ll alias lists in long form") {
        fs::create_directories(h.tmp.path / "docs");
        CHECK(h.shell->execute_line("ll") == Outcome::Success);
        CHECK(h.out.str().find("drwx") != std::string::npos);
        CHECK(h.out.str().find("docs/") != std::string::npos);
    }

    SECTION("exit") {
        CHECK(h.shell->execute_line("exit") == Outcome::Exit);
    }
}

TEST_CASE("Shell runs the argument gate before dispatch", "[shell]") {
    SECTION("safe mode rejects without running the command") {
        ShellHarness h;
        fs::create_directories(h.tmp.path / "sub");
        CHECK(h.shell->execute_line("cd sub") == Outcome::Success);

        CHECK(h.shell->execute_line("mkdir ../made_by_gate_test") == Outcome::Failure);
        CHECK(h.err.str().find("Invalid or potentially dangerous arguments") != std::string::npos);
        // ../ from sub is still inside the root, so only the gate stopped it
        CHECK_FALSE(fs::exists(h.tmp.path / "made_by_gate_test"));
    }

    SECTION("without safe mode the sandbox still decides") {
        ShellHarness h("", false);
        fs::create_directories(h.tmp.path / "sub");
        CHECK(h.shell->execute_line("cd sub") == Outcome::Success);

        CHECK(h.shell->execute_line("mkdir ../allowed") == Outcome::Success);
        CHECK(fs::is_directory(h.tmp.path / "allowed"));

        CHECK(h.shell->execute_line("cd ../../") == Outcome::Failure);
        CHECK(h.err.str().find("Access denied") != std::string::npos);
    }

    SECTION("patterns the gate misses are caught by the sandbox") {
        ShellHarness h;
        CHECK(h.shell->execute_line("ls /etc") == Outcome::Failure);
        CHECK(h.err.str().find("Access denied") != std::string::npos);
        CHECK(h.err.str().find("Invalid or potentially dangerous") == std::string::npos);
    }
}

TEST_CASE("Shell failures are logged with their error code", "[shell]") {
    ShellHarness h;
    DebugLogCapture capture;

    SECTION("argument gate") {
        CHECK(h.shell->execute_line("ls ~/") == Outcome::Failure);
        CHECK(h.err.str() == "Invalid or potentially dangerous arguments\n");
        CHECK(capture.text().find("[ARGUMENT_REJECTED] Invalid or potentially dangerous arguments") !=
              std::string::npos);
    }

    SECTION("sandbox violation") {
        CHECK(h.shell->execute_line("cd /") == Outcome::Failure);
        CHECK(h.err.str().starts_with("Access denied: / is outside allowed root"));
        CHECK(capture.text().find("[SANDBOX_VIOLATION]") != std::string::npos);
    }

    SECTION("parse error") {
        CHECK(h.shell->execute_line("ls \"open") == Outcome::Failure);
        CHECK(h.err.str().starts_with("Parse error: "));
        CHECK(capture.text().find("[PARSE_ERROR]") != std::string::npos);
    }
}

TEST_CASE("Shell prompt shows the path relative to the root", "[shell]") {
    ShellHarness h;

    CHECK(h.shell->prompt() == "/ > ");

    fs::create_directories(h.tmp.path / "a" / "b");
    CHECK(h.shell->execute_line("cd a/b") == Outcome::Success);
    CHECK(h.shell->prompt() == "/a/b > ");

    SECTION("long paths are truncated from the left") {
        auto deep = std::string(30, 'x') + "/" + std::string(30, 'y');
        fs::create_directories(h.tmp.path / "a" / "b" / deep);
        CHECK(h.shell->execute_line("cd " + deep) == Outcome::Success);

        auto prompt = h.shell->prompt();
        CHECK(prompt.starts_with("..."));
        CHECK(prompt.size() == 40 + std::string(" > ").size());
        CHECK(prompt.ends_with(std::string(30, 'y') + " > "));
    }
}

TEST_CASE("Shell run loop", "[shell]") {
    SECTION("stops at exit") {
        ShellHarness h("mkdir first\nexit\nmkdir second\n");
        CHECK(h.shell->run() == 0);
        CHECK(fs::is_directory(h.tmp.path / "first"));
        CHECK_FALSE(fs::exists(h.tmp.path / "second"));
        CHECK(h.out.str().find("Goodbye!") != std::string::npos);
    }

    SECTION("stops at end of input and survives failures") {
        ShellHarness h("rm missing\nbogus\nmkdir after_failures\n");
        CHECK(h.shell->run() == 0);
        CHECK(fs::is_directory(h.tmp.path / "after_failures"));
        CHECK(h.err.str().find("File not found: missing") != std::string::npos);
    }

    SECTION("rm confirmation reads from the same input") {
        ShellHarness h("mkdir -p d/e\nrm -r d\nyes\nexit\n");
        CHECK(h.shell->run() == 0);
        CHECK_FALSE(fs::exists(h.tmp.path / "d"));
        CHECK(fs::is_directory(h.config->recycle_dir() / "d" / "e"));
    }
}
