#include <procd/daemon/components/ControlServer.h>
#include <procd/daemon/components/RequestDispatcher.h>
#include <procd/supervisor/output_broadcaster.h>

#include <spdlog/spdlog.h>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <future>
#include <string>
#include <system_error>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace {
void set_current_thread_name(const std::string& name) {
#ifdef __linux__
    prctl(PR_SET_NAME, name.c_str(), 0, 0, 0);
#endif
}

// Streaming connections never expect input; readable or hung up means the client went away
bool peer_closed(int fd) {
    pollfd pfd{fd, POLLIN, 0};
    if (::poll(&pfd, 1, 0) <= 0)
        return false;
    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL))
        return true;
    if (pfd.revents & POLLIN) {
        char c;
        return ::recv(fd, &c, 1, MSG_PEEK | MSG_DONTWAIT) == 0;
    }
    return false;
}

constexpr std::size_t kStreamBatchBytes = 64 * 1024;
} // namespace

namespace procd::daemon {

using boost::asio::awaitable;
using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;
using local = boost::asio::local::stream_protocol;

ControlServer::ControlServer(Config config, RequestDispatcher& dispatcher)
    : config_(std::move(config)), dispatcher_(dispatcher) {}

ControlServer::~ControlServer() {
    if (running_.load()) {
        if (auto r = stop(); !r) {
            spdlog::warn("ControlServer: stop during destruction failed: {}", r.error().message);
        }
    }
}

Result<void> ControlServer::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Control server already running"};
    }
    stopping_.store(false, std::memory_order_relaxed);

    try {
        if (config_.workerThreads == 0)
            config_.workerThreads = 1;
        if (config_.dispatchThreads == 0)
            config_.dispatchThreads = 1;

        std::filesystem::path sockPath = config_.socketPath;
        if (!sockPath.is_absolute()) {
            sockPath = std::filesystem::absolute(sockPath);
        }

        {
            std::string sp = sockPath.string();
            if (sp.size() >= sizeof(sockaddr_un::sun_path)) {
                running_ = false;
                return Error{
                    ErrorCode::InvalidArgument,
                    std::string("Socket path too long for AF_UNIX (") + std::to_string(sp.size()) +
                        "/" + std::to_string(sizeof(sockaddr_un::sun_path)) + ") : '" + sp + "'"};
            }
        }

        std::error_code ec;
        std::filesystem::remove(sockPath, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            spdlog::warn("Failed to remove existing socket: {}", ec.message());
        }

        auto parent = sockPath.parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }

        spdlog::info("Starting control server on {}", sockPath.string());

        io_context_.restart();
        work_guard_.emplace(io_context_.get_executor());

        acceptor_ = std::make_unique<local::acceptor>(io_context_);
        local::endpoint endpoint(sockPath.string());
        acceptor_->open(endpoint.protocol());
        acceptor_->bind(endpoint);
        acceptor_->listen(boost::asio::socket_base::max_listen_connections);

        std::filesystem::permissions(sockPath, std::filesystem::perms::owner_read |
                                                   std::filesystem::perms::owner_write);
        actualSocketPath_ = sockPath;

        dispatchPool_ = std::make_unique<boost::asio::thread_pool>(config_.dispatchThreads);

        co_spawn(
            io_context_,
            [this]() -> awaitable<void> {
                co_await accept_loop();
                co_return;
            },
            detached);

        workers_.reserve(config_.workerThreads);
        for (size_t i = 0; i < config_.workerThreads; ++i) {
            workers_.emplace_back([this, i]() {
                set_current_thread_name("procd-ipc-" + std::to_string(i));
                try {
                    io_context_.run();
                } catch (const std::exception& e) {
                    spdlog::error("ControlServer: worker {} exception: {}", i, e.what());
                }
                spdlog::debug("ControlServer: worker {} exiting", i);
            });
        }

        spdlog::info("Control server listening on {}", sockPath.string());
        return {};
    } catch (const std::exception& e) {
        running_ = false;
        work_guard_.reset();
        io_context_.stop();
        for (auto& w : workers_) {
            if (w.joinable())
                w.join();
        }
        workers_.clear();
        spdlog::error("ControlServer::start exception: {}", e.what());
        return Error{ErrorCode::IOError,
                     fmt::format("Failed to start control server: {}", e.what())};
    }
}

Result<void> ControlServer::stop() {
    if (!running_.exchange(false)) {
        return Error{ErrorCode::InvalidState, "Control server not running"};
    }
    spdlog::info("Stopping control server");
    stopping_.store(true, std::memory_order_relaxed);

    // Acceptor and sockets belong to the io_context; close them on its executor
    auto closed = boost::asio::post(io_context_, boost::asio::use_future([this]() {
                                        boost::system::error_code ec;
                                        if (acceptor_ && acceptor_->is_open())
                                            acceptor_->close(ec);

                                        std::vector<std::shared_ptr<socket_type>> sockets;
                                        {
                                            std::lock_guard<std::mutex> lk(activeSocketsMutex_);
                                            for (auto& weak : activeSockets_) {
                                                if (auto s = weak.lock())
                                                    sockets.push_back(std::move(s));
                                            }
                                            activeSockets_.clear();
                                        }
                                        for (auto& s : sockets) {
                                            if (s->is_open())
                                                s->close(ec);
                                        }
                                        return sockets.size();
                                    }));
    if (closed.wait_for(std::chrono::seconds(2)) == std::future_status::ready) {
        spdlog::info("Closed {} active connections", closed.get());
    } else {
        spdlog::warn("ControlServer: timed out closing connections");
    }

    // Workers return once the remaining coroutines have wound down
    work_guard_.reset();
    for (size_t i = 0; i < workers_.size(); ++i) {
        if (workers_[i].joinable())
            workers_[i].join();
    }
    workers_.clear();

    if (dispatchPool_) {
        dispatchPool_->join();
        dispatchPool_.reset();
    }

    if (!actualSocketPath_.empty()) {
        std::error_code ec;
        std::filesystem::remove(actualSocketPath_, ec);
        actualSocketPath_.clear();
    }

    spdlog::info("Control server stopped (total_conn={})",
                 totalConnections_.load(std::memory_order_relaxed));
    stopping_.store(false, std::memory_order_relaxed);
    return {};
}

awaitable<void> ControlServer::accept_loop() {
    spdlog::debug("Accept loop started");

    while (running_ && !stopping_) {
        auto [ec, socket] = co_await acceptor_->async_accept(boost::asio::as_tuple(use_awaitable));
        if (ec) {
            if (!running_ || stopping_ || ec == boost::asio::error::operation_aborted)
                break;
            spdlog::warn("Accept error: {} ({})", ec.message(), ec.value());
            boost::asio::steady_timer timer(io_context_);
            timer.expires_after(std::chrono::milliseconds(100));
            co_await timer.async_wait(boost::asio::as_tuple(use_awaitable));
            continue;
        }

        auto current = activeConnections_.fetch_add(1) + 1;
        totalConnections_.fetch_add(1);
        spdlog::debug("ControlServer: accepted connection, active={} total={}", current,
                      totalConnections_.load());

        auto sock = std::make_shared<socket_type>(std::move(socket));
        register_socket(sock);
        co_spawn(io_context_, handle_connection(std::move(sock)), detached);
    }

    spdlog::debug("Accept loop ended");
}

awaitable<void> ControlServer::handle_connection(std::shared_ptr<socket_type> socket) {
    struct CleanupGuard {
        ControlServer* server;
        ~CleanupGuard() {
            auto current = server->activeConnections_.fetch_sub(1) - 1;
            spdlog::debug("Connection closed, active: {}", current);
        }
    } guard{this};

    std::string buffer;
    try {
        while (running_ && !stopping_) {
            auto [ec, n] = co_await boost::asio::async_read_until(
                *socket, boost::asio::dynamic_buffer(buffer, config_.maxRequestBytes), '\n',
                boost::asio::as_tuple(use_awaitable));
            if (ec) {
                if (ec == boost::asio::error::not_found) {
                    auto line = RequestDispatcher::toWireLine(RequestDispatcher::errorToJson(
                        Error{ErrorCode::InvalidArgument,
                              fmt::format("Request exceeds {} bytes", config_.maxRequestBytes)}));
                    co_await boost::asio::async_write(*socket, boost::asio::buffer(line),
                                                      boost::asio::as_tuple(use_awaitable));
                } else if (ec != boost::asio::error::eof &&
                           ec != boost::asio::error::operation_aborted) {
                    spdlog::debug("ControlServer: read failed: {}", ec.message());
                }
                break;
            }

            std::string request = buffer.substr(0, n - 1);
            buffer.erase(0, n);
            if (!request.empty() && request.back() == '\r')
                request.pop_back();
            if (request.empty())
                continue;

            // Off the I/O threads: lifecycle requests block
            DispatchReply reply = co_await co_spawn(
                *dispatchPool_,
                [this, request = std::move(request)]() -> awaitable<DispatchReply> {
                    co_return dispatcher_.dispatchLine(request);
                },
                use_awaitable);

            auto out = RequestDispatcher::toWireLine(reply.body);
            auto [wec, written] = co_await boost::asio::async_write(
                *socket, boost::asio::buffer(out), boost::asio::as_tuple(use_awaitable));
            if (wec) {
                spdlog::debug("ControlServer: write failed: {}", wec.message());
                break;
            }

            if (reply.subscription) {
                co_await stream_subscription(socket, reply);
                break;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("ControlServer::handle_connection error: {}", e.what());
    }

    boost::system::error_code ec;
    socket->close(ec);
}

awaitable<void> ControlServer::stream_subscription(std::shared_ptr<socket_type> socket,
                                                   DispatchReply& reply) {
    auto& sub = *reply.subscription;
    spdlog::debug("ControlServer: streaming '{}'", sub.processId());

    std::string batch;
    for (const auto& chunk : reply.backlog) {
        batch += RequestDispatcher::toWireLine(RequestDispatcher::chunkToJson(chunk));
    }

    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    while (running_ && !stopping_) {
        std::optional<Error> end;
        while (batch.size() < kStreamBatchBytes) {
            auto next = sub.next(std::chrono::milliseconds(0));
            if (!next) {
                if (next.error().code != ErrorCode::Timeout)
                    end = next.error();
                break;
            }
            if (reply.coveredByBacklog(next.value()))
                continue;
            batch += RequestDispatcher::toWireLine(RequestDispatcher::chunkToJson(next.value()));
        }

        if (!batch.empty()) {
            auto [ec, n] = co_await boost::asio::async_write(
                *socket, boost::asio::buffer(batch), boost::asio::as_tuple(use_awaitable));
            if (ec) {
                spdlog::debug("ControlServer: subscriber of '{}' went away: {}",
                              sub.processId(), ec.message());
                co_return;
            }
            batch.clear();
            if (!end)
                continue;
        }

        if (end) {
            auto line = RequestDispatcher::toWireLine(RequestDispatcher::errorToJson(*end));
            co_await boost::asio::async_write(*socket, boost::asio::buffer(line),
                                              boost::asio::as_tuple(use_awaitable));
            spdlog::info("ControlServer: subscription to '{}' ended: {}", sub.processId(),
                         end->message);
            co_return;
        }

        if (peer_closed(socket->native_handle())) {
            spdlog::debug("ControlServer: subscriber of '{}' disconnected", sub.processId());
            co_return;
        }
        timer.expires_after(config_.streamPollInterval);
        co_await timer.async_wait(boost::asio::as_tuple(use_awaitable));
    }
}

void ControlServer::register_socket(const std::shared_ptr<socket_type>& socket) {
    std::lock_guard<std::mutex> lk(activeSocketsMutex_);
    activeSockets_.erase(std::remove_if(activeSockets_.begin(), activeSockets_.end(),
                                        [](const auto& weak) { return weak.expired(); }),
                         activeSockets_.end());
    activeSockets_.push_back(socket);
}

} // namespace procd::daemon
