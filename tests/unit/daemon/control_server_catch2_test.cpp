// ControlServer: newline-delimited JSON over a Unix domain socket

#include <catch2/catch_test_macros.hpp>

#include <procd/daemon/components/ControlServer.h>
#include <procd/daemon/components/RequestDispatcher.h>
#include <procd/supervisor/process_registry.h>

#include "../../support/temp_dir_scope.hpp"
#include "../../support/wait_until.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <istream>
#include <string>
#include <string_view>

using namespace procd;
using namespace procd::daemon;
using namespace procd::supervisor;
using namespace std::chrono_literals;
using nlohmann::json;
using procd::test_support::TempDirScope;
using procd::test_support::wait_until;

namespace {

using local = boost::asio::local::stream_protocol;

bool isPermissionDenied(const Result<void>& result) {
    if (result)
        return false;
    const std::string_view message{result.error().message};
    return message.find("Operation not permitted") != std::string_view::npos ||
           message.find("Permission denied") != std::string_view::npos;
}

// Blocking client speaking one JSON document per line
class LineClient {
public:
    explicit LineClient(const std::filesystem::path& socketPath) : socket_(io_) {
        socket_.connect(local::endpoint(socketPath.string()));
    }

    void send(const json& request) {
        auto line = request.dump() + "\n";
        boost::asio::write(socket_, boost::asio::buffer(line));
    }

    void sendRaw(const std::string& text) { boost::asio::write(socket_, boost::asio::buffer(text)); }

    json receive() {
        boost::asio::read_until(socket_, buffer_, '\n');
        std::istream in(&buffer_);
        std::string line;
        std::getline(in, line);
        return json::parse(line);
    }

    json call(const json& request) {
        send(request);
        return receive();
    }

    void close() {
        boost::system::error_code ec;
        socket_.close(ec);
    }

private:
    boost::asio::io_context io_;
    local::socket socket_;
    boost::asio::streambuf buffer_;
};

struct ServerFixture {
    TempDirScope dir = TempDirScope::unique_under("procd-srv");
    ProcessRegistry registry{makeConfig()};
    RequestDispatcher dispatcher{registry, ""};
    ControlServer server{makeServerConfig(dir.path()), dispatcher};

    static SupervisorConfig makeConfig() {
        SupervisorConfig c;
        c.pumpPollInterval = 20ms;
        c.defaultGrace = 300ms;
        return c;
    }

    static ControlServer::Config makeServerConfig(const std::filesystem::path& dir) {
        ControlServer::Config c;
        c.socketPath = dir / "ctl.sock";
        c.workerThreads = 1;
        c.dispatchThreads = 2;
        c.maxRequestBytes = 4096;
        c.streamPollInterval = 10ms;
        return c;
    }
};

} // namespace

TEST_CASE("ControlServer answers requests line by line", "[daemon][server]") {
    ServerFixture fx;
    auto started = fx.server.start();
    if (isPermissionDenied(started)) {
        SKIP("UNIX domain sockets are not permitted: " << started.error().message);
    }
    REQUIRE(started);
    CHECK(fx.server.isRunning());
    CHECK(std::filesystem::exists(fx.server.socketPath()));

    LineClient client(fx.server.socketPath());

    auto list = client.call({{"op", "list"}});
    CHECK(list["ok"] == true);
    CHECK(list["processes"].empty());

    auto start = client.call(
        {{"op", "start"}, {"id", "echo1"}, {"command", json::array({"/bin/sh", "-c", "echo hi"})}});
    REQUIRE(start["ok"] == true);

    REQUIRE(wait_until([&] {
        auto info = client.call({{"op", "info"}, {"id", "echo1"}});
        return info["process"]["state"] == "exited";
    }));

    // Two requests in one write are answered in order
    client.sendRaw("{\"op\":\"read\",\"id\":\"echo1\",\"stream\":\"stdout\"}\n"
                   "{\"op\":\"info\",\"id\":\"missing\"}\n");
    auto read = client.receive();
    auto missing = client.receive();
    REQUIRE(read["chunks"].size() == 1);
    CHECK(read["chunks"][0]["data"] == "hi\n");
    CHECK(missing["error"] == "NotFound");

    auto garbage = client.call(json("not an object"));
    CHECK(garbage["error"] == "InvalidArgument");

    client.close();
    REQUIRE(fx.server.stop());
    CHECK_FALSE(std::filesystem::exists(fx.dir.path() / "ctl.sock"));
}

TEST_CASE("ControlServer rejects oversized requests", "[daemon][server]") {
    ServerFixture fx;
    auto started = fx.server.start();
    if (isPermissionDenied(started)) {
        SKIP("UNIX domain sockets are not permitted: " << started.error().message);
    }
    REQUIRE(started);

    LineClient client(fx.server.socketPath());
    client.sendRaw(std::string(8192, 'x'));
    auto reply = client.receive();
    CHECK(reply["ok"] == false);
    CHECK(reply["error"] == "InvalidArgument");
}

TEST_CASE("ControlServer streams a subscription", "[daemon][server][subscribe]") {
    ServerFixture fx;
    auto started = fx.server.start();
    if (isPermissionDenied(started)) {
        SKIP("UNIX domain sockets are not permitted: " << started.error().message);
    }
    REQUIRE(started);

    ProcessRecord feed;
    feed.command = {"/bin/sh", "-c", "echo early; read go; echo late; read done"};
    REQUIRE(fx.registry.start("feed", feed));
    REQUIRE(wait_until([&] {
        auto t = fx.registry.tail("feed", 1, false);
        return t && !t.value().empty();
    }));

    LineClient subscriber(fx.server.socketPath());
    auto ack = subscriber.call({{"op", "subscribe"}, {"id", "feed"}, {"tail", 5}});
    REQUIRE(ack["ok"] == true);
    CHECK(ack["subscribed"] == "feed");

    auto backlog = subscriber.receive();
    CHECK(backlog["data"] == "early\n");
    CHECK(backlog["seq"] == 1);

    REQUIRE(fx.registry.sendInput("feed", std::string_view{"go\n"}));
    auto live = subscriber.receive();
    CHECK(live["data"] == "late\n");
    CHECK(live["seq"] == 2);
    CHECK(live["generation"] == 1);

    SECTION("removing the process ends the stream") {
        REQUIRE(fx.registry.stop("feed"));
        REQUIRE(fx.registry.remove("feed"));
        auto end = subscriber.receive();
        CHECK(end["ok"] == false);
        CHECK(end["error"] == "SubscriptionClosed");
    }

    SECTION("a disconnected subscriber is dropped") {
        subscriber.close();
        CHECK(wait_until([&] { return fx.server.activeConnections() == 0; }));
        CHECK(fx.registry.stop("feed"));
    }

    SECTION("stopping the server closes streaming connections") {
        auto before = std::chrono::steady_clock::now();
        REQUIRE(fx.server.stop());
        CHECK(std::chrono::steady_clock::now() - before < 3s);
        CHECK(fx.server.activeConnections() == 0);
    }
}

TEST_CASE("ControlServer can be restarted", "[daemon][server]") {
    ServerFixture fx;
    auto first = fx.server.start();
    if (isPermissionDenied(first)) {
        SKIP("UNIX domain sockets are not permitted: " << first.error().message);
    }
    REQUIRE(first);
    CHECK_FALSE(fx.server.start());

    REQUIRE(fx.server.stop());
    CHECK_FALSE(fx.server.stop());

    REQUIRE(fx.server.start());
    LineClient client(fx.server.socketPath());
    CHECK(client.call({{"op", "list"}})["ok"] == true);
    client.close();
    REQUIRE(fx.server.stop());
}
