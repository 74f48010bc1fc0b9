/**
 * @file output_pump.hpp
 * @brief Drains a child's stdout and stderr on two reader threads.
 *
 * Every non-blank line is tagged with its stream, pushed onto a bounded
 * delivery queue for pull-based consumers (drain()) and fanned out
 * synchronously to every registered subscriber.
 */

#pragma once
#include "core/logger.hpp"
#include "core/unique_fd.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tether::core {

    enum class StreamKind { Stdout, Stderr };

    const char* to_string(StreamKind stream);

    struct OutputLine {
        StreamKind stream = StreamKind::Stdout;
        std::string text; ///< Without the line terminator.
    };

    class OutputPump {
    public:
        using Subscriber = std::function<void(const OutputLine&)>;
        using SubscriberId = std::uint64_t;

        static constexpr size_t DEFAULT_MAX_QUEUED_LINES = 10000;

        explicit OutputPump(std::shared_ptr<Logger> logger,
                            size_t max_queued_lines = DEFAULT_MAX_QUEUED_LINES);
        ~OutputPump();

        OutputPump(const OutputPump&) = delete;
        OutputPump& operator=(const OutputPump&) = delete;

        /**
         * @brief Starts one reader thread per stream. The pump takes ownership of both fds;
         * each is closed by its reader when the loop ends.
         * @return false if the pump is already running.
         */
        bool start(UniqueFd stdout_fd, UniqueFd stderr_fd);

        /** @brief Signals the reader loops to stop at their next poll tick. Does not wait. */
        void request_stop();

        /**
         * @brief Waits up to `timeout` for both loops to finish and joins them.
         * Loops still running after the timeout are detached.
         * @return true if both loops exited in time.
         */
        bool join(std::chrono::milliseconds timeout);

        /** @brief True while the current run has not been asked to stop. */
        bool is_running() const;

        /** @brief True while at least one reader loop of the current run is still active. */
        bool has_active_readers() const;

        SubscriberId register_subscriber(Subscriber subscriber);
        bool unregister_subscriber(SubscriberId id);
        size_t subscriber_count() const;

        /**
         * @brief Pops queued lines.
         *
         * Waits up to `timeout` for the first line, then keeps collecting while
         * more lines arrive within a short quiet window. Never waits past
         * `timeout` measured from the call. A zero timeout returns what is
         * queued right now.
         */
        std::vector<OutputLine> drain(std::chrono::milliseconds timeout);

        size_t queued_lines() const;

    private:
        /** @brief Shared with the reader threads so a detached loop never outlives its state. */
        struct Shared {
            std::shared_ptr<Logger> logger;
            size_t max_queued_lines;

            mutable std::mutex subscribers_mutex;
            std::vector<std::pair<SubscriberId, Subscriber>> subscribers;
            SubscriberId next_id = 1;

            mutable std::mutex queue_mutex;
            std::condition_variable queue_cv;
            std::deque<OutputLine> queue;
            bool overflowing = false;

            void publish(OutputLine line);
        };

        /** @brief Per-run cancellation flag and exit accounting. */
        struct Run {
            std::atomic<bool> running{true};
            std::mutex exit_mutex;
            std::condition_variable exit_cv;
            int active_loops = 0;
        };

        static void reader_loop(std::shared_ptr<Shared> shared, std::shared_ptr<Run> run,
                                UniqueFd fd, StreamKind stream);

        std::shared_ptr<Shared> shared_;
        std::shared_ptr<Run> run_;
        std::thread stdout_thread_;
        std::thread stderr_thread_;
    };

}
