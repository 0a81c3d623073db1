#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/thread_pool.hpp>
#include <procd/core/types.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace procd::daemon {

class RequestDispatcher;
struct DispatchReply;

/**
 * Unix domain socket front end for the supervisor
 *
 * Speaks newline-delimited JSON through Boost.ASIO's local::stream_protocol. Each connection
 * is a coroutine; a `subscribe` request turns the connection into a one-way chunk stream until
 * the client disconnects or the subscription ends.
 */
class ControlServer {
public:
    struct Config {
        std::filesystem::path socketPath;
        size_t workerThreads = 2;
        // Requests run here: stop/restart block for up to grace + kill wait
        size_t dispatchThreads = 4;
        size_t maxRequestBytes = 1024 * 1024;
        // Idle wait between subscription polls while streaming
        std::chrono::milliseconds streamPollInterval{50};
    };

    ControlServer(Config config, RequestDispatcher& dispatcher);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Lifecycle
    Result<void> start();
    Result<void> stop();
    bool isRunning() const { return running_.load(); }

    const std::filesystem::path& socketPath() const { return actualSocketPath_; }

    // Metrics
    size_t activeConnections() const { return activeConnections_.load(); }
    uint64_t totalConnections() const { return totalConnections_.load(); }

private:
    using socket_type = boost::asio::local::stream_protocol::socket;

    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> handle_connection(std::shared_ptr<socket_type> socket);
    boost::asio::awaitable<void> stream_subscription(std::shared_ptr<socket_type> socket,
                                                     DispatchReply& reply);

    // Register active socket for deterministic shutdown
    void register_socket(const std::shared_ptr<socket_type>& socket);

    Config config_;
    RequestDispatcher& dispatcher_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_guard_;
    std::unique_ptr<boost::asio::local::stream_protocol::acceptor> acceptor_;
    std::vector<std::thread> workers_;
    std::unique_ptr<boost::asio::thread_pool> dispatchPool_;

    std::filesystem::path actualSocketPath_;

    // Connection metrics
    std::atomic<size_t> activeConnections_{0};
    std::atomic<uint64_t> totalConnections_{0};

    // Lifecycle state
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::mutex activeSocketsMutex_;
    std::vector<std::weak_ptr<socket_type>> activeSockets_;
};

} // namespace procd::daemon
