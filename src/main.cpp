#include "core/config.hpp"
#include "core/config_loader.hpp"
#include "core/directory_probe.hpp"
#include "core/escape_decoder.hpp"
#include "core/logger.hpp"
#include "core/plugin_host.hpp"
#include "core/shell_session.hpp"
#include "core/theme.hpp"
#include <atomic>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>

namespace fs = std::filesystem;
using namespace tether::core;

namespace {

    constexpr const char* HELP_TEXT =
        "  :cd <path>            change the shell's directory\n"
        "  :pwd                  ask the shell where it is\n"
        "  :stage <text>         write text without executing it\n"
        "  :in <dir> <command>   run one command in another directory\n"
        "  :help                 this text\n"
        "  :q, :exit             stop the shell and quit\n"
        "Anything else is sent to the shell as a command.\n";

    /**
     * @brief Prints shell output in color. Runs on the reader threads, one
     * format state per stream so colors carry across lines of the same stream.
     */
    class Renderer {
    public:
        void render(const OutputLine& line) {
            std::string plain = strip_escapes(line.text);

            // Shell furniture the user does not need to see twice.
            if (is_prompt_echo(plain) || is_table_furniture(plain)) return;
            if (suppress_paths && line.stream == StreamKind::Stdout && looks_like_path(plain)) return;

            TextFormat& format = line.stream == StreamKind::Stdout ? stdout_format_ : stderr_format_;
            DecodedChunk decoded = decode_or_plain(line.text, format);
            format = decoded.final_format;

            std::lock_guard<std::mutex> lock(out_mutex_);
            std::string_view base = line.stream == StreamKind::Stderr ? std::string_view(Theme::STDERR)
                                                                      : std::string_view();
            std::cout << to_terminal(decoded.runs, base) << "\n" << std::flush;
        }

        void print_prompt(const std::string& dir) {
            std::lock_guard<std::mutex> lock(out_mutex_);
            std::cout << Theme::PROMPT << "PS " << dir << ">" << Theme::RESET << " " << std::flush;
        }

        void print(const std::string& text) {
            std::lock_guard<std::mutex> lock(out_mutex_);
            std::cout << text << std::flush;
        }

        void notice(const std::string& msg, const std::string& color) {
            std::lock_guard<std::mutex> lock(out_mutex_);
            std::cout << "[" << color << "-" << Theme::RESET << "] " << msg << "\n" << std::flush;
        }

        /// Set while a directory query is in flight: its answer is not user output.
        std::atomic<bool> suppress_paths{false};

    private:
        std::mutex out_mutex_;
        TextFormat stdout_format_;
        TextFormat stderr_format_;
    };

    /** @brief Splits "word rest of line"; `rest` loses its leading spaces. */
    std::string first_word(const std::string& s, std::string& rest) {
        size_t space = s.find(' ');
        if (space == std::string::npos) {
            rest.clear();
            return s;
        }
        size_t next = s.find_first_not_of(' ', space);
        rest = next == std::string::npos ? std::string() : s.substr(next);
        return s.substr(0, space);
    }

}

int main() {
    // 1. Path Setup
    // Get the baked-in absolute path to the project root
#ifdef TETHER_ROOT
    fs::path project_root = TETHER_ROOT;
#else
    fs::path project_root = fs::current_path().parent_path();
#endif
    fs::path scripts_path = project_root / "src" / "py_scripts";
    fs::path config_path = project_root / "config";

    py::scoped_interpreter guard{};

    // 2. Configuration & logging
    Config config;
    ConfigLoader::load(config, config_path.string());

    auto logger = std::make_shared<Logger>("tether", parse_log_level(config.log_level));
    if (!config.log_file.empty() && !logger->open_file(config.log_file)) {
        logger->warn("could not open log file " + config.log_file);
    }

    // 3. Extensions
    PluginHost plugins(logger);
    plugins.load_extensions(scripts_path.string());

    Renderer renderer;
    int exit_code = 0;
    {
        // Reader threads call into Python; the main thread only needs the GIL again at shutdown.
        py::gil_scoped_release release;

        ShellSession session(config, logger);
        session.register_subscriber([&](const OutputLine& line) {
            renderer.render(line);
            plugins.trigger("on_output", {to_string(line.stream), line.text});
        });

        // 4. Launch in the background, like a UI would
        auto launched = session.start_async();
        if (!launched.get()) {
            renderer.notice(std::string("Could not start the shell: ") + to_string(session.last_error()), Theme::ERROR);
            exit_code = 1;
        } else {
            renderer.notice("Shell started. Type :help for commands.", Theme::SUCCESS);

            auto query_directory = [&] {
                renderer.suppress_paths = true;
                std::string dir = session.get_current_directory();
                renderer.suppress_paths = false;
                return dir;
            };

            std::string current_dir = query_directory();
            plugins.trigger("on_directory", {current_dir});
            renderer.print_prompt(current_dir);

            // 5. Command loop
            std::string input;
            while (std::getline(std::cin, input)) {
                std::string rest;
                std::string head = first_word(input, rest);

                if (head == ":q" || head == ":exit") break;

                if (head == ":help") {
                    renderer.print(HELP_TEXT);
                } else if (head == ":pwd") {
                    renderer.print(query_directory() + "\n");
                } else if (head == ":cd") {
                    if (!session.change_directory(rest)) {
                        renderer.notice("No such directory: " + rest, Theme::WARNING);
                    }
                } else if (head == ":stage") {
                    session.send_input(rest, false);
                } else if (head == ":in") {
                    std::string command;
                    std::string dir = first_word(rest, command);
                    if (dir.empty() || command.empty()) {
                        renderer.notice("usage: :in <dir> <command>", Theme::WARNING);
                    } else if (session.execute_command(command, dir)) {
                        plugins.trigger("on_command", {command});
                    }
                } else if (!input.empty()) {
                    if (session.execute_command(input)) plugins.trigger("on_command", {input});
                }

                if (!session.is_alive()) {
                    renderer.notice("The shell has exited.", Theme::WARNING);
                    break;
                }

                std::string dir = query_directory();
                if (dir != current_dir) {
                    current_dir = dir;
                    plugins.trigger("on_directory", {current_dir});
                }
                renderer.print_prompt(current_dir);
            }
        }

        session.stop();
    }

    plugins.clear();
    return exit_code;
}
