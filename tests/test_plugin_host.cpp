/**
 * @file test_plugin_host.cpp
 * @brief Tests for Python extension loading and hook dispatch.
 *
 * Each test writes its extensions into a scratch directory. Module names are
 * unique per test because imported modules stay cached in `sys.modules`.
 */

#include "core/logger.hpp"
#include "core/plugin_host.hpp"
#include "test_harness.hpp"
#include <filesystem>
#include <fstream>
#include <pybind11/embed.h>
#include <pybind11/stl.h>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
namespace py = pybind11;
using namespace tether::core;

namespace {
    fs::path scratch_dir(const std::string& name) {
        fs::path dir = fs::temp_directory_path() / ("tether_plugins_" + std::to_string(getpid())) / name;
        fs::create_directories(dir);
        return dir;
    }

    void write_file(const fs::path& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    std::vector<std::string> recorded_calls(const std::string& module_name) {
        return py::module_::import(module_name.c_str()).attr("calls").cast<std::vector<std::string>>();
    }

    /** @brief Captures std::cout for the lifetime of the object. */
    struct CoutCapture {
        std::ostringstream buffer;
        std::streambuf* saved;

        CoutCapture() : saved(std::cout.rdbuf(buffer.rdbuf())) {}
        ~CoutCapture() { std::cout.rdbuf(saved); }
    };
}

// ============================================================================
// Test Cases: Loading
// ============================================================================

TEST(test_invalid_path) {
    std::ostringstream sink;
    PluginHost plugins(std::make_shared<Logger>("plugins", LogLevel::Warning, sink));

    ASSERT_EQ(plugins.load_extensions(""), 0u, "empty path");
    ASSERT_EQ(plugins.load_extensions((scratch_dir("none") / "missing").string()), 0u, "missing directory");
    ASSERT_EQ(plugins.plugin_count(), 0u, "nothing loaded");
    ASSERT_TRUE(sink.str().find("invalid") != std::string::npos, "warning logged");

    plugins.trigger("on_output", {"stdout", "ignored"});
    PASS("An invalid extension directory loads nothing");
}

TEST(test_skips_and_broken_scripts) {
    fs::path dir = scratch_dir("loading");
    write_file(dir / "__init__.py", "raise RuntimeError('package init imported')\n");
    write_file(dir / "config.py", "raise RuntimeError('config imported')\n");
    write_file(dir / "load_good.py", "calls = []\n");
    write_file(dir / "load_broken.py", "def on_output(stream, text)\n");
    write_file(dir / "notes.txt", "not a script\n");

    std::ostringstream sink;
    PluginHost plugins(std::make_shared<Logger>("plugins", LogLevel::Debug, sink));
    size_t loaded = 0;
    {
        CoutCapture capture;
        loaded = plugins.load_extensions(dir.string());
    }

    ASSERT_EQ(loaded, 1u, "only the valid script counted");
    ASSERT_EQ(plugins.plugin_count(), 1u, "one module kept");
    ASSERT_TRUE(sink.str().find("load_broken") != std::string::npos, "broken script reported");
    ASSERT_TRUE(sink.str().find("imported") == std::string::npos, "__init__ and config never imported");

    plugins.clear();
    ASSERT_EQ(plugins.plugin_count(), 0u, "cleared");
    PASS("__init__ and config are skipped, a broken script does not stop the rest");
}

// ============================================================================
// Test Cases: Dispatch
// ============================================================================

TEST(test_raising_plugin_isolated) {
    fs::path dir = scratch_dir("dispatch");
    write_file(dir / "hook_raiser.py",
        "def on_output(stream, text):\n"
        "    raise ValueError('plugin bug')\n");
    write_file(dir / "hook_recorder.py",
        "import tether\n"
        "calls = []\n"
        "def on_output(stream, text):\n"
        "    calls.append('output:' + stream + ':' + text)\n"
        "def on_command(command):\n"
        "    calls.append('command:' + command)\n"
        "    tether.log('saw ' + command)\n");
    write_file(dir / "hook_silent.py", "calls = []\n");

    std::ostringstream sink;
    PluginHost plugins(std::make_shared<Logger>("plugins", LogLevel::Debug, sink));
    {
        CoutCapture capture;
        ASSERT_EQ(plugins.load_extensions(dir.string()), 3u, "three extensions");
    }
    ASSERT_EQ(plugins.plugin_count(), 3u, "three modules kept");

    plugins.trigger("on_output", {"stdout", "hello"});
    auto calls = recorded_calls("hook_recorder");
    ASSERT_EQ(calls.size(), 1u, "recorder called despite the raiser");
    ASSERT_EQ(calls[0], std::string("output:stdout:hello"), "arguments passed as strings");

    std::string log = sink.str();
    ASSERT_TRUE(log.find("error in plugin hook on_output") != std::string::npos, "raiser logged");
    ASSERT_TRUE(log.find("plugin bug") != std::string::npos, "Python message kept");
    ASSERT_EQ(log.find("error in plugin hook"), log.rfind("error in plugin hook"), "only the raiser failed");

    std::string printed;
    {
        CoutCapture capture;
        plugins.trigger("on_command", {"Get-ChildItem"});
        printed = capture.buffer.str();
    }
    calls = recorded_calls("hook_recorder");
    ASSERT_EQ(calls.size(), 2u, "second hook delivered");
    ASSERT_EQ(calls[1], std::string("command:Get-ChildItem"), "command hook");
    ASSERT_TRUE(printed.find("saw Get-ChildItem") != std::string::npos, "tether.log reaches the terminal");

    plugins.trigger("on_directory", {"/tmp"});
    ASSERT_EQ(recorded_calls("hook_recorder").size(), 2u, "undefined hook skipped");
    ASSERT_TRUE(recorded_calls("hook_silent").empty(), "module without hooks never called");
    ASSERT_EQ(sink.str().find("on_directory"), std::string::npos, "missing hooks are not errors");

    plugins.clear();
    PASS("A raising plugin is logged and the others still run");
}

TEST(test_trigger_from_worker_thread) {
    fs::path dir = scratch_dir("threads");
    write_file(dir / "thread_recorder.py",
        "calls = []\n"
        "def on_output(stream, text):\n"
        "    calls.append(text)\n");

    std::ostringstream sink;
    PluginHost plugins(std::make_shared<Logger>("plugins", LogLevel::Debug, sink));
    {
        CoutCapture capture;
        ASSERT_EQ(plugins.load_extensions(dir.string()), 1u, "loaded");
    }

    {
        // Reader threads dispatch while the main thread has released the GIL.
        py::gil_scoped_release release;
        std::thread a([&] { plugins.trigger("on_output", {"stdout", "from a"}); });
        std::thread b([&] { plugins.trigger("on_output", {"stderr", "from b"}); });
        a.join();
        b.join();
    }

    ASSERT_EQ(recorded_calls("thread_recorder").size(), 2u, "both threads delivered");
    plugins.clear();
    PASS("Hooks can be triggered from threads without the GIL");
}

// ============================================================================
// Main
// ============================================================================

int main() {
    print_banner("tether Plugin Host Tests");

    int result = 0;
    {
        py::scoped_interpreter guard{};

        std::cout << "\n[Loading]" << std::endl;
        test_invalid_path();
        test_skips_and_broken_scripts();

        std::cout << "\n[Dispatch]" << std::endl;
        test_raising_plugin_isolated();
        test_trigger_from_worker_thread();

        result = print_results();
    }

    std::error_code ec;
    fs::remove_all(fs::temp_directory_path() / ("tether_plugins_" + std::to_string(getpid())), ec);
    return result;
}
