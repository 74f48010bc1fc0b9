/**
 * @file output_pump.cpp
 * @brief Reader loops, line splitting, fan-out and the pull queue.
 */

#include "core/output_pump.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <format>
#include <poll.h>
#include <unistd.h>

namespace tether::core {

    namespace {
        constexpr size_t BUFFER_SIZE = 4096;
        constexpr int POLL_TICK_MS = 100;
        constexpr auto DRAIN_QUIET_WINDOW = std::chrono::milliseconds(25);

        bool is_blank(const std::string& s) {
            return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        }

        std::string chomp(std::string line) {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
            return line;
        }
    }

    const char* to_string(StreamKind stream) {
        return stream == StreamKind::Stdout ? "stdout" : "stderr";
    }

    // ==================================================================================
    // SHARED STATE
    // ==================================================================================

    void OutputPump::Shared::publish(OutputLine line) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            if (queue.size() >= max_queued_lines) {
                queue.pop_front();
                if (!overflowing) {
                    overflowing = true;
                    logger->warn(std::format("delivery queue full ({} lines), dropping oldest output",
                                             max_queued_lines));
                }
            } else {
                overflowing = false;
            }
            queue.push_back(line);
        }
        queue_cv.notify_all();

        // Snapshot so callbacks run without the lock: a subscriber may call back
        // into the session (or even unregister itself) without deadlocking.
        std::vector<std::pair<SubscriberId, Subscriber>> snapshot;
        {
            std::lock_guard<std::mutex> lock(subscribers_mutex);
            snapshot = subscribers;
        }

        for (const auto& [id, callback] : snapshot) {
            try {
                callback(line);
            } catch (const std::exception& e) {
                logger->error(std::format("subscriber #{} failed: {}", id, e.what()));
            } catch (...) {
                logger->error(std::format("subscriber #{} failed with a non-standard exception", id));
            }
        }
    }

    // ==================================================================================
    // LIFECYCLE
    // ==================================================================================

    OutputPump::OutputPump(std::shared_ptr<Logger> logger, size_t max_queued_lines)
        : shared_(std::make_shared<Shared>()) {
        shared_->logger = std::move(logger);
        shared_->max_queued_lines = std::max<size_t>(1, max_queued_lines);
    }

    OutputPump::~OutputPump() {
        request_stop();
        join(std::chrono::milliseconds(500));
    }

    bool OutputPump::start(UniqueFd stdout_fd, UniqueFd stderr_fd) {
        if (is_running() || stdout_thread_.joinable() || stderr_thread_.joinable()) return false;

        run_ = std::make_shared<Run>();
        run_->active_loops = 2;

        stdout_thread_ = std::thread(&OutputPump::reader_loop, shared_, run_, std::move(stdout_fd), StreamKind::Stdout);
        stderr_thread_ = std::thread(&OutputPump::reader_loop, shared_, run_, std::move(stderr_fd), StreamKind::Stderr);
        return true;
    }

    void OutputPump::request_stop() {
        if (run_) run_->running = false;
    }

    bool OutputPump::join(std::chrono::milliseconds timeout) {
        if (!run_) return true;

        bool exited;
        {
            std::unique_lock<std::mutex> lock(run_->exit_mutex);
            exited = run_->exit_cv.wait_for(lock, timeout, [this] { return run_->active_loops == 0; });
        }

        if (exited) {
            if (stdout_thread_.joinable()) stdout_thread_.join();
            if (stderr_thread_.joinable()) stderr_thread_.join();
        } else {
            // A subscriber is stuck inside a callback. The loop owns its fd and
            // holds shared pointers to its state, so it is safe to let it go.
            shared_->logger->warn("reader loops did not exit in time, detaching");
            if (stdout_thread_.joinable()) stdout_thread_.detach();
            if (stderr_thread_.joinable()) stderr_thread_.detach();
        }
        run_.reset();
        return exited;
    }

    bool OutputPump::is_running() const {
        return run_ && run_->running;
    }

    bool OutputPump::has_active_readers() const {
        if (!run_) return false;
        std::lock_guard<std::mutex> lock(run_->exit_mutex);
        return run_->active_loops > 0;
    }

    // ==================================================================================
    // READER LOOP
    // ==================================================================================

    /**
     * @brief Reads one stream until EOF, error, or the run is cancelled.
     *
     * poll() with a short tick keeps the loop responsive to cancellation even
     * when the child is silent. Lines are split on '\n'; a trailing partial
     * line is carried to the next read and flushed at end of stream.
     */
    void OutputPump::reader_loop(std::shared_ptr<Shared> shared, std::shared_ptr<Run> run,
                                 UniqueFd fd, StreamKind stream) {
        auto& logger = *shared->logger;
        logger.debug(std::format("{} reader started", to_string(stream)));

        std::array<char, BUFFER_SIZE> buffer;
        std::string pending;
        struct pollfd pfd{};
        pfd.fd = fd.get();
        pfd.events = POLLIN;

        auto emit = [&](std::string raw) {
            std::string text = chomp(std::move(raw));
            if (is_blank(text)) return;
            shared->publish(OutputLine{stream, std::move(text)});
        };

        while (run->running && fd) {
            int ret = poll(&pfd, 1, POLL_TICK_MS);

            if (ret < 0) {
                if (errno == EINTR) continue;
                if (run->running) logger.error(std::format("poll on {} failed: {}", to_string(stream), std::strerror(errno)));
                break;
            }
            if (ret == 0) continue;

            // POLLHUP still leaves buffered data readable; read() reports EOF when it is gone.
            if (pfd.revents & (POLLIN | POLLHUP)) {
                ssize_t n = read(fd.get(), buffer.data(), buffer.size());
                if (n == 0) break; // End of stream (child closed its end)
                if (n < 0) {
                    if (errno == EINTR || errno == EAGAIN) continue;
                    if (run->running) {
                        logger.error(std::format("read on {} failed: {}", to_string(stream), std::strerror(errno)));
                    }
                    break;
                }

                pending.append(buffer.data(), static_cast<size_t>(n));
                size_t start = 0;
                size_t nl;
                while ((nl = pending.find('\n', start)) != std::string::npos) {
                    emit(pending.substr(start, nl - start));
                    start = nl + 1;
                }
                pending.erase(0, start);
            } else if (pfd.revents & (POLLERR | POLLNVAL)) {
                if (run->running) logger.error(std::format("{} stream reported an error", to_string(stream)));
                break;
            }
        }

        if (!pending.empty()) emit(std::move(pending));
        fd.reset();

        logger.debug(std::format("{} reader finished", to_string(stream)));
        {
            std::lock_guard<std::mutex> lock(run->exit_mutex);
            --run->active_loops;
        }
        run->exit_cv.notify_all();
    }

    // ==================================================================================
    // SUBSCRIBERS & QUEUE
    // ==================================================================================

    OutputPump::SubscriberId OutputPump::register_subscriber(Subscriber subscriber) {
        std::lock_guard<std::mutex> lock(shared_->subscribers_mutex);
        SubscriberId id = shared_->next_id++;
        shared_->subscribers.emplace_back(id, std::move(subscriber));
        return id;
    }

    bool OutputPump::unregister_subscriber(SubscriberId id) {
        std::lock_guard<std::mutex> lock(shared_->subscribers_mutex);
        auto& subs = shared_->subscribers;
        auto it = std::find_if(subs.begin(), subs.end(), [id](const auto& entry) { return entry.first == id; });
        if (it == subs.end()) return false;
        subs.erase(it);
        return true;
    }

    size_t OutputPump::subscriber_count() const {
        std::lock_guard<std::mutex> lock(shared_->subscribers_mutex);
        return shared_->subscribers.size();
    }

    std::vector<OutputLine> OutputPump::drain(std::chrono::milliseconds timeout) {
        using clock = std::chrono::steady_clock;
        const auto deadline = clock::now() + timeout;

        std::vector<OutputLine> lines;
        std::unique_lock<std::mutex> lock(shared_->queue_mutex);

        auto take_all = [&] {
            while (!shared_->queue.empty()) {
                lines.push_back(std::move(shared_->queue.front()));
                shared_->queue.pop_front();
            }
        };

        if (!shared_->queue_cv.wait_until(lock, deadline, [this] { return !shared_->queue.empty(); })) {
            return lines;
        }
        take_all();

        // Output of one command usually arrives in several reads; give the
        // rest a brief chance to land, bounded by the caller's deadline.
        while (clock::now() < deadline) {
            auto quiet_until = std::min(clock::now() + DRAIN_QUIET_WINDOW, deadline);
            if (!shared_->queue_cv.wait_until(lock, quiet_until, [this] { return !shared_->queue.empty(); })) {
                break;
            }
            take_all();
        }
        return lines;
    }

    size_t OutputPump::queued_lines() const {
        std::lock_guard<std::mutex> lock(shared_->queue_mutex);
        return shared_->queue.size();
    }

}
