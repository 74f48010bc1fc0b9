/**
 * @file child_process.cpp
 * @brief fork/exec with three pipes, liveness probing, signalling and bounded input writes.
 */

#include "core/child_process.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace tether::core {

    namespace {
        /**
         * @brief A write to a pipe whose reader died must fail with EPIPE instead of
         * killing the whole controller, so SIGPIPE is ignored once for the process.
         */
        void ignore_sigpipe_once() {
            static std::once_flag once;
            std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
        }

        bool make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
            int fds[2];
            if (pipe2(fds, O_CLOEXEC) != 0) return false;
            read_end.reset(fds[0]);
            write_end.reset(fds[1]);
            return true;
        }

        bool is_executable_file(const std::filesystem::path& p) {
            std::error_code ec;
            return std::filesystem::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
        }
    }

    std::optional<std::filesystem::path> find_executable(const std::string& program) {
        namespace fs = std::filesystem;
        if (program.empty()) return std::nullopt;

        if (program.find('/') != std::string::npos) {
            std::error_code ec;
            fs::path p = fs::absolute(program, ec);
            if (ec || !is_executable_file(p)) return std::nullopt;
            return p;
        }

        const char* path_env = std::getenv("PATH");
        std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

        std::stringstream ss(search);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (dir.empty()) dir = ".";
            fs::path candidate = fs::path(dir) / program;
            if (is_executable_file(candidate)) {
                std::error_code ec;
                fs::path abs = fs::absolute(candidate, ec);
                return ec ? candidate : abs;
            }
        }
        return std::nullopt;
    }

    std::unique_ptr<ChildProcess> ChildProcess::spawn(const LaunchSpec& spec, std::string& error) {
        ignore_sigpipe_once();

        UniqueFd in_read, in_write, out_read, out_write, err_read, err_write, exec_read, exec_write;
        if (!make_pipe(in_read, in_write) || !make_pipe(out_read, out_write) ||
            !make_pipe(err_read, err_write) || !make_pipe(exec_read, exec_write)) {
            error = std::string("pipe() failed: ") + std::strerror(errno);
            return nullptr;
        }

        // Everything the child touches is prepared before fork(): only
        // async-signal-safe calls are allowed between fork() and exec().
        std::string exe = spec.executable.string();
        std::string cwd = spec.working_directory.string();
        std::vector<std::string> args;
        args.reserve(spec.arguments.size() + 1);
        args.push_back(exe);
        args.insert(args.end(), spec.arguments.begin(), spec.arguments.end());
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        argv.push_back(nullptr);

        pid_t pid = fork();
        if (pid < 0) {
            error = std::string("fork() failed: ") + std::strerror(errno);
            return nullptr;
        }

        if (pid == 0) {
            // --- Child process context ---
            // dup2 clears FD_CLOEXEC on the targets; every original pipe fd is
            // close-on-exec and disappears at exec time.
            int child_err = 0;
            if (dup2(in_read.get(), STDIN_FILENO) < 0 ||
                dup2(out_write.get(), STDOUT_FILENO) < 0 ||
                dup2(err_write.get(), STDERR_FILENO) < 0) {
                child_err = errno;
            } else if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
                child_err = errno;
            } else {
                execv(exe.c_str(), argv.data());
                child_err = errno;
            }
            ssize_t ignored = write(exec_write.get(), &child_err, sizeof(child_err));
            (void)ignored;
            _exit(127);
        }

        // --- Parent process context ---
        // Drop the child's ends so EOF propagates when the child exits.
        in_read.reset();
        out_write.reset();
        err_write.reset();
        exec_write.reset();

        int child_err = 0;
        ssize_t n;
        do {
            n = read(exec_read.get(), &child_err, sizeof(child_err));
        } while (n < 0 && errno == EINTR);

        if (n > 0) {
            int status = 0;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            error = std::string("failed to launch '") + exe + "': " + std::strerror(child_err);
            return nullptr;
        }

        // Input writes are bounded by poll(); the fd must not block.
        int flags = fcntl(in_write.get(), F_GETFL, 0);
        if (flags != -1) fcntl(in_write.get(), F_SETFL, flags | O_NONBLOCK);

        auto child = std::make_unique<ChildProcess>(SpawnKey{});
        child->pid_ = pid;
        child->stdin_ = std::move(in_write);
        child->stdout_ = std::move(out_read);
        child->stderr_ = std::move(err_read);
        return child;
    }

    ChildProcess::~ChildProcess() {
        if (has_exited()) return;

        // Normally stop() has already reaped the child. Kill and reap with a bound:
        // a process stuck in uninterruptible sleep must not hang the destructor.
        send_signal(SIGKILL);
        wait_for(std::chrono::milliseconds(1000));
    }

    bool ChildProcess::has_exited_locked() {
        if (pid_ <= 0 || reaped_) return true;

        int status = 0;
        pid_t r;
        do {
            r = waitpid(pid_, &status, WNOHANG);
        } while (r < 0 && errno == EINTR);

        if (r == 0) return false;
        reaped_ = true;
        if (r == pid_) status_ = status;
        // r < 0 (ECHILD): someone else reaped it; it is gone either way.
        return true;
    }

    bool ChildProcess::has_exited() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return has_exited_locked();
    }

    std::optional<int> ChildProcess::exit_status() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!has_exited_locked()) return std::nullopt;
        return status_;
    }

    bool ChildProcess::wait_for(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (has_exited()) return true;
            if (std::chrono::steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    bool ChildProcess::send_signal(int signal) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (has_exited_locked()) return false;
        return kill(pid_, signal) == 0;
    }

    bool ChildProcess::write_input(std::string_view data, std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> lock(input_mutex_);
        if (!stdin_) return false;

        auto deadline = std::chrono::steady_clock::now() + timeout;
        size_t written = 0;

        while (written < data.size()) {
            ssize_t n = write(stdin_.get(), data.data() + written, data.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) return false;

                struct pollfd pfd{};
                pfd.fd = stdin_.get();
                pfd.events = POLLOUT;
                int ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
                if (ret < 0 && errno == EINTR) continue;
                if (ret <= 0) return false;
                if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return false;
                continue;
            }
            // EPIPE (reader gone) or a real error.
            return false;
        }
        return true;
    }

    bool ChildProcess::input_open() const {
        std::lock_guard<std::mutex> lock(input_mutex_);
        return static_cast<bool>(stdin_);
    }

    void ChildProcess::close_input() {
        std::lock_guard<std::mutex> lock(input_mutex_);
        stdin_.reset();
    }

}
