/**
 * @file test_config_loader.cpp
 * @brief Tests for config.py loading through the embedded interpreter, and for the Logger.
 */

#include "core/config.hpp"
#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "core/theme.hpp"
#include "test_harness.hpp"
#include <filesystem>
#include <fstream>
#include <pybind11/embed.h>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
namespace py = pybind11;
using namespace tether::core;

namespace {
    fs::path scratch_dir(const std::string& name) {
        fs::path dir = fs::temp_directory_path() / ("tether_config_" + std::to_string(getpid())) / name;
        fs::create_directories(dir);
        return dir;
    }

    void write_file(const fs::path& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    std::string read_file(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
}

// ============================================================================
// Test Cases: ConfigLoader
// ============================================================================

TEST(test_missing_config_keeps_defaults) {
    Config config;
    ASSERT_FALSE(ConfigLoader::load(config, scratch_dir("empty").string()), "no config.py");
    ASSERT_EQ(config.exit_grace_ms, 2000, "default exit grace");
    ASSERT_EQ(config.query_timeout_ms, 1500, "default query timeout");
    ASSERT_EQ(config.shell_args.size(), 4u, "default shell args");
    ASSERT_TRUE(config.shell_path.empty(), "default shell path");
    PASS("Missing config.py keeps every default");
}

TEST(test_full_config) {
    fs::path dir = scratch_dir("full");
    write_file(dir / "config.py",
        "WORKING_DIRECTORY = '/srv'\n"
        "SHELL_PATH = '/usr/bin/pwsh'\n"
        "SHELL_ARGS = ['-NoProfile', '-NoExit']\n"
        "STOP_TIMEOUTS = {'exit': 100, 'terminate': 200, 'kill': 300, 'join': 400}\n"
        "DIRECTORY_QUERY = {'settle': 50, 'timeout': 600}\n"
        "WRITE_TIMEOUT_MS = 700\n"
        "MAX_QUEUED_LINES = 42\n"
        "SHELL_PROMPTS = ['>', '$']\n"
        "LOG = {'level': 'DEBUG', 'file': 'logs/tether.log'}\n"
        "THEME = {'PROMPT': '\\x1b[95m'}\n");

    Config config;
    std::string saved_prompt = Theme::PROMPT;
    ASSERT_TRUE(ConfigLoader::load(config, dir.string()), "loaded");
    ASSERT_EQ(config.working_directory, std::string("/srv"), "working directory");
    ASSERT_EQ(config.shell_path, std::string("/usr/bin/pwsh"), "shell path");
    ASSERT_TRUE((config.shell_args == std::vector<std::string>{"-NoProfile", "-NoExit"}), "shell args");
    ASSERT_EQ(config.exit_grace_ms, 100, "exit grace");
    ASSERT_EQ(config.terminate_grace_ms, 200, "terminate grace");
    ASSERT_EQ(config.kill_grace_ms, 300, "kill grace");
    ASSERT_EQ(config.reader_join_ms, 400, "join timeout");
    ASSERT_EQ(config.query_settle_ms, 50, "query settle");
    ASSERT_EQ(config.query_timeout_ms, 600, "query timeout");
    ASSERT_EQ(config.write_timeout_ms, 700, "write timeout");
    ASSERT_EQ(config.max_queued_lines, 42u, "queue bound");
    ASSERT_EQ(config.shell_prompts.size(), 2u, "prompts");
    ASSERT_EQ(config.log_level, std::string("DEBUG"), "log level");
    ASSERT_EQ(config.log_file, (fs::absolute(dir) / "logs/tether.log").string(), "log file resolved against config dir");
    ASSERT_EQ(Theme::PROMPT, std::string("\x1b[95m"), "theme override");
    Theme::PROMPT = saved_prompt;
    PASS("Every setting is reflected into Config and Theme");
}

TEST(test_type_mismatch_keeps_default) {
    fs::path dir = scratch_dir("mismatch");
    write_file(dir / "config.py",
        "WRITE_TIMEOUT_MS = 'fast'\n"
        "STOP_TIMEOUTS = [1, 2, 3]\n"
        "DIRECTORY_QUERY = {'settle': 'soon', 'timeout': 900}\n"
        "SHELL_PATH = '/bin/sh'\n");

    Config config;
    ASSERT_TRUE(ConfigLoader::load(config, dir.string()), "loaded");
    ASSERT_EQ(config.write_timeout_ms, 2000, "wrong type ignored");
    ASSERT_EQ(config.exit_grace_ms, 2000, "non-dict section ignored");
    ASSERT_EQ(config.query_settle_ms, 300, "wrong dict item type ignored");
    ASSERT_EQ(config.query_timeout_ms, 900, "valid sibling still loaded");
    ASSERT_EQ(config.shell_path, std::string("/bin/sh"), "unrelated settings loaded");
    PASS("Type mismatches warn and keep the default");
}

TEST(test_reload_other_directory) {
    fs::path first = scratch_dir("first");
    fs::path second = scratch_dir("second");
    write_file(first / "config.py", "MAX_QUEUED_LINES = 11\n");
    write_file(second / "config.py", "MAX_QUEUED_LINES = 22\n");

    Config a;
    ASSERT_TRUE(ConfigLoader::load(a, first.string()), "first loaded");
    Config b;
    ASSERT_TRUE(ConfigLoader::load(b, second.string()), "second loaded");
    ASSERT_EQ(a.max_queued_lines, 11u, "first value");
    ASSERT_EQ(b.max_queued_lines, 22u, "second directory wins, not the cached module");
    PASS("A second load imports the new config.py");
}

TEST(test_broken_config) {
    fs::path dir = scratch_dir("broken");
    write_file(dir / "config.py", "this is not python(\n");
    Config config;
    ASSERT_FALSE(ConfigLoader::load(config, dir.string()), "syntax error reported");
    ASSERT_EQ(config.exit_grace_ms, 2000, "defaults kept");
    PASS("A config.py that fails to import keeps the defaults");
}

// ============================================================================
// Test Cases: Logger
// ============================================================================

TEST(test_log_level_parsing) {
    ASSERT_TRUE(parse_log_level("debug") == LogLevel::Debug, "debug");
    ASSERT_TRUE(parse_log_level("WARN") == LogLevel::Warning, "warn");
    ASSERT_TRUE(parse_log_level("Warning") == LogLevel::Warning, "warning");
    ASSERT_TRUE(parse_log_level("ERROR") == LogLevel::Error, "error");
    ASSERT_TRUE(parse_log_level("nonsense") == LogLevel::Info, "unknown falls back to info");
    ASSERT_EQ(std::string(to_string(LogLevel::Warning)), std::string("WARNING"), "name");
    PASS("Log levels parse by name");
}

TEST(test_level_filter) {
    std::ostringstream sink;
    Logger logger("filter", LogLevel::Warning, sink);
    logger.debug("hidden debug");
    logger.info("hidden info");
    logger.warn("shown warning");
    logger.error("shown error");

    std::string text = sink.str();
    ASSERT_TRUE(text.find("hidden") == std::string::npos, "below level suppressed");
    ASSERT_TRUE(text.find("filter: shown warning") != std::string::npos, "warning emitted with name");
    ASSERT_TRUE(text.find("filter: shown error") != std::string::npos, "error emitted");

    logger.set_level(LogLevel::Debug);
    logger.debug("now visible");
    ASSERT_TRUE(sink.str().find("now visible") != std::string::npos, "level raised at runtime");
    PASS("Messages below the level are filtered");
}

TEST(test_file_sink) {
    fs::path file = scratch_dir("logs") / "nested" / "session.log";
    std::ostringstream sink;
    Logger logger("shell_session", LogLevel::Info, sink);
    ASSERT_TRUE(logger.open_file(file), "file opened, parent created");

    logger.info("started \x1b[32mgreen\x1b[0m shell");
    logger.debug("not written");

    std::string content = read_file(file);
    ASSERT_TRUE(content.find(" - shell_session - INFO - started green shell") != std::string::npos,
                "name, level and stripped message");
    ASSERT_TRUE(content.find('\x1b') == std::string::npos, "no escape sequences in the file");
    ASSERT_TRUE(content.find("not written") == std::string::npos, "level applies to the file too");
    ASSERT_TRUE(content.size() > 19 && content[4] == '-' && content[13] == ':', "timestamp prefix");
    PASS("File sink writes plain 'time - name - level - message' lines");
}

// ============================================================================
// Main
// ============================================================================

int main() {
    print_banner("tether Config & Logging Tests");

    int result = 0;
    {
        py::scoped_interpreter guard{};

        std::cout << "\n[ConfigLoader]" << std::endl;
        test_missing_config_keeps_defaults();
        test_full_config();
        test_type_mismatch_keeps_default();
        test_reload_other_directory();
        test_broken_config();

        std::cout << "\n[Logger]" << std::endl;
        test_log_level_parsing();
        test_level_filter();
        test_file_sink();

        result = print_results();
    }

    std::error_code ec;
    fs::remove_all(fs::temp_directory_path() / ("tether_config_" + std::to_string(getpid())), ec);
    return result;
}
