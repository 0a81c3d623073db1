// RequestDispatcher: JSON control requests mapped onto the registry

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <procd/daemon/components/RequestDispatcher.h>
#include <procd/supervisor/process_registry.h>

#include "../../support/wait_until.hpp"

#include <chrono>
#include <string>

using namespace procd;
using namespace procd::daemon;
using namespace procd::supervisor;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;
using nlohmann::json;
using procd::test_support::wait_until;

namespace {

struct DispatcherFixture {
    ProcessRegistry registry{makeConfig()};
    RequestDispatcher dispatcher{registry, ""};

    static SupervisorConfig makeConfig() {
        SupervisorConfig c;
        c.pumpPollInterval = 20ms;
        c.defaultGrace = 500ms;
        return c;
    }

    json call(const json& request) { return dispatcher.dispatch(request).body; }

    std::string stateOf(const std::string& id) {
        auto r = call({{"op", "info"}, {"id", id}});
        return r["process"]["state"].get<std::string>();
    }

    void startShell(const std::string& id, const std::string& script) {
        auto r = call({{"op", "start"},
                       {"id", id},
                       {"command", json::array({"/bin/sh", "-c", script})}});
        REQUIRE(r["ok"] == true);
    }
};

} // namespace

TEST_CASE("Dispatcher rejects malformed requests", "[daemon][dispatcher]") {
    DispatcherFixture fx;

    SECTION("invalid JSON") {
        auto body = fx.dispatcher.dispatchLine("{not json").body;
        CHECK(body["ok"] == false);
        CHECK(body["error"] == "InvalidArgument");
    }

    SECTION("not an object") {
        auto body = fx.dispatcher.dispatchLine("[1,2,3]").body;
        CHECK(body["error"] == "InvalidArgument");
    }

    SECTION("missing op") {
        auto body = fx.call({{"id", "x"}});
        CHECK(body["error"] == "InvalidArgument");
    }

    SECTION("unknown op") {
        auto body = fx.call({{"op", "explode"}});
        CHECK(body["error"] == "InvalidArgument");
        CHECK_THAT(body["message"].get<std::string>(), ContainsSubstring("explode"));
    }

    SECTION("field with the wrong type") {
        auto body = fx.call({{"op", "start"}, {"id", "t"}, {"command", "not-an-array"}});
        CHECK(body["ok"] == false);
        CHECK(body["error"] == "InvalidArgument");
    }

    SECTION("read without a stream") {
        auto body = fx.call({{"op", "read"}, {"id", "x"}});
        CHECK(body["error"] == "InvalidArgument");
    }
}

TEST_CASE("Dispatcher enforces the api key when configured", "[daemon][dispatcher][auth]") {
    ProcessRegistry registry;
    RequestDispatcher dispatcher(registry, "s3cret");

    auto missing = dispatcher.dispatch({{"op", "list"}}).body;
    CHECK(missing["error"] == "Unauthorized");

    auto wrong = dispatcher.dispatch({{"op", "list"}, {"api_key", "guess"}}).body;
    CHECK(wrong["error"] == "Forbidden");

    auto good = dispatcher.dispatch({{"op", "list"}, {"api_key", "s3cret"}}).body;
    CHECK(good["ok"] == true);
    CHECK(good["processes"].is_array());
}

TEST_CASE("Dispatcher start, info, read and tail", "[daemon][dispatcher]") {
    DispatcherFixture fx;
    fx.startShell("echo1", "printf 'hello\\n'; printf 'oops\\n' 1>&2");
    REQUIRE(wait_until([&] { return fx.stateOf("echo1") == "exited"; }));

    auto info = fx.call({{"op", "info"}, {"id", "echo1"}});
    CHECK(info["process"]["exit_code"] == 0);
    CHECK(info["process"]["generation"] == 1);
    CHECK(info["process"]["pid"].is_null());
    CHECK(info["process"]["command"][0] == "/bin/sh");
    CHECK(info["process"]["ended_at"].is_string());

    auto list = fx.call({{"op", "list"}});
    REQUIRE(list["processes"].size() == 1);
    CHECK(list["processes"][0]["id"] == "echo1");

    auto read = fx.call({{"op", "read"}, {"id", "echo1"}, {"stream", "stdout"}, {"since", 0}});
    REQUIRE(read["ok"] == true);
    REQUIRE(read["chunks"].size() == 1);
    CHECK(read["chunks"][0]["data"] == "hello\n");
    CHECK(read["chunks"][0]["seq"] == 1);
    CHECK(read["chunks"][0]["stream"] == "stdout");
    CHECK(read["floor"] == 0);
    CHECK(read["last"] == 1);

    auto tail = fx.call({{"op", "tail"}, {"id", "echo1"}, {"n", 10}});
    CHECK(tail["chunks"].size() == 2);

    auto stdoutOnly =
        fx.call({{"op", "tail"}, {"id", "echo1"}, {"n", 10}, {"include_stderr", false}});
    CHECK(stdoutOnly["chunks"].size() == 1);

    SECTION("tail_text prefixes timestamps by default") {
        auto text = fx.call({{"op", "tail_text"}, {"id", "echo1"}, {"n", 10}});
        REQUIRE(text["lines"].size() == 2);
        CHECK_THAT(text["lines"][0].get<std::string>(), EndsWith(" | hello\n"));
    }

    SECTION("tail_text without prefix") {
        auto text = fx.call({{"op", "tail_text"},
                             {"id", "echo1"},
                             {"n", 1},
                             {"include_stderr", false},
                             {"prefix_timestamp", false}});
        REQUIRE(text["lines"].size() == 1);
        CHECK(text["lines"][0] == "hello\n");
    }
}

TEST_CASE("Dispatcher maps registry errors to wire names", "[daemon][dispatcher]") {
    DispatcherFixture fx;

    auto missing = fx.call({{"op", "info"}, {"id", "ghost"}});
    CHECK(missing["ok"] == false);
    CHECK(missing["error"] == "NotFound");

    auto spawn = fx.call({{"op", "start"},
                          {"id", "bad"},
                          {"command", json::array({"/nonexistent/procd-no-such-binary"})}});
    CHECK(spawn["error"] == "SpawnError");

    fx.startShell("svc", "sleep 30");
    auto running = fx.call({{"op", "remove"}, {"id", "svc"}});
    CHECK(running["error"] == "StillRunning");

    auto again = fx.call({{"op", "start"},
                          {"id", "svc"},
                          {"command", json::array({"/bin/sh", "-c", "sleep 30"})}});
    CHECK(again["error"] == "AlreadyRunning");

    auto stopped = fx.call({{"op", "stop"}, {"id", "svc"}, {"grace_ms", 200}});
    CHECK(stopped["ok"] == true);
    CHECK(stopped["process"]["state"] == "stopped");

    auto removed = fx.call({{"op", "remove"}, {"id", "svc"}});
    CHECK(removed["ok"] == true);
    CHECK(removed["removed"] == "svc");
}

TEST_CASE("Dispatcher restart and start without a command", "[daemon][dispatcher]") {
    DispatcherFixture fx;
    fx.startShell("job", "echo run");
    REQUIRE(wait_until([&] { return fx.stateOf("job") == "exited"; }));

    auto restarted = fx.call({{"op", "start"}, {"id", "job"}});
    REQUIRE(restarted["ok"] == true);
    CHECK(restarted["process"]["generation"] == 2);

    auto viaRestart = fx.call({{"op", "restart"}, {"id", "job"}});
    REQUIRE(viaRestart["ok"] == true);
    CHECK(viaRestart["process"]["generation"] == 3);

    auto unknown = fx.call({{"op", "start"}, {"id", "never-seen"}});
    CHECK(unknown["error"] == "NotFound");
}

TEST_CASE("Dispatcher create registers a process that start launches later",
          "[daemon][dispatcher]") {
    DispatcherFixture fx;
    auto created = fx.call({{"op", "create"},
                            {"id", "later"},
                            {"command", json::array({"/bin/sh", "-c", "echo later"})}});
    REQUIRE(created["ok"] == true);
    CHECK(created["process"]["state"] == "pending");
    CHECK(created["process"]["generation"] == 0);
    CHECK(created["process"]["started_at"].is_null());

    auto duplicate = fx.call({{"op", "create"},
                              {"id", "later"},
                              {"command", json::array({"/bin/sh", "-c", "echo later"})}});
    CHECK(duplicate["error"] == "InvalidArgument");

    auto noCommand = fx.call({{"op", "create"}, {"id", "other"}});
    CHECK(noCommand["error"] == "InvalidArgument");

    auto started = fx.call({{"op", "start"}, {"id", "later"}});
    REQUIRE(started["ok"] == true);
    CHECK(started["process"]["generation"] == 1);
    REQUIRE(wait_until([&] { return fx.stateOf("later") == "exited"; }));
}

TEST_CASE("Dispatcher rejects out-of-range grace_ms", "[daemon][dispatcher]") {
    DispatcherFixture fx;
    fx.startShell("svc", "sleep 30");

    for (const json& bad : {json(-1), json(3600001), json(18446744073709551615ULL), json(1.5),
                            json("100")}) {
        auto r = fx.call({{"op", "stop"}, {"id", "svc"}, {"grace_ms", bad}});
        CHECK(r["ok"] == false);
        CHECK(r["error"] == "InvalidArgument");
    }
    CHECK(fx.stateOf("svc") == "running");

    auto stopped = fx.call({{"op", "stop"}, {"id", "svc"}, {"grace_ms", 0}});
    REQUIRE(stopped["ok"] == true);
    CHECK(stopped["process"]["state"] == "stopped");
}

TEST_CASE("Dispatcher write forwards stdin", "[daemon][dispatcher][stdin]") {
    DispatcherFixture fx;
    auto started = fx.call({{"op", "start"}, {"id", "cat"}, {"command", json::array({"cat"})}});
    REQUIRE(started["ok"] == true);

    auto written = fx.call({{"op", "write"}, {"id", "cat"}, {"data", "ping"}});
    REQUIRE(written["ok"] == true);
    CHECK(written["written"] == 5);

    REQUIRE(wait_until([&] {
        auto r = fx.call({{"op", "read"}, {"id", "cat"}, {"stream", "stdout"}});
        return r["ok"] == true && !r["chunks"].empty() && r["chunks"][0]["data"] == "ping\n";
    }));

    auto raw = fx.call({{"op", "write"}, {"id", "cat"}, {"data", "x"}, {"newline", false}});
    CHECK(raw["written"] == 1);

    REQUIRE(fx.call({{"op", "stop"}, {"id", "cat"}})["ok"] == true);
    auto late = fx.call({{"op", "write"}, {"id", "cat"}, {"data", "late"}});
    CHECK(late["error"] == "NotRunning");
}

TEST_CASE("Dispatcher subscribe returns a backlog and a live subscription",
          "[daemon][dispatcher][subscribe]") {
    DispatcherFixture fx;
    fx.startShell("feed", "echo one; echo two; read go; echo three; sleep 30");
    REQUIRE(wait_until([&] {
        auto r = fx.call({{"op", "read"}, {"id", "feed"}, {"stream", "stdout"}});
        return r["ok"] == true && r["chunks"].size() == 2;
    }));

    auto reply = fx.dispatcher.dispatch({{"op", "subscribe"}, {"id", "feed"}, {"tail", 1}});
    CHECK(reply.body["ok"] == true);
    CHECK(reply.body["subscribed"] == "feed");
    CHECK(reply.body["stream"].is_null());
    REQUIRE(reply.subscription);
    REQUIRE(reply.backlog.size() == 1);
    CHECK(reply.backlog[0].data == "two\n");
    CHECK(reply.coveredByBacklog(reply.backlog[0]));

    REQUIRE(fx.call({{"op", "write"}, {"id", "feed"}, {"data", "go"}})["ok"] == true);
    auto live = reply.subscription->next(5s);
    REQUIRE(live);
    CHECK(live.value().data == "three\n");
    CHECK_FALSE(reply.coveredByBacklog(live.value()));

    REQUIRE(fx.call({{"op", "stop"}, {"id", "feed"}, {"grace_ms", 100}})["ok"] == true);
}

TEST_CASE("Dispatcher subscribe to an unknown id fails", "[daemon][dispatcher][subscribe]") {
    DispatcherFixture fx;
    auto reply = fx.dispatcher.dispatch({{"op", "subscribe"}, {"id", "nobody"}});
    CHECK(reply.body["error"] == "NotFound");
    CHECK_FALSE(reply.subscription);

    auto badStream =
        fx.dispatcher.dispatch({{"op", "subscribe"}, {"id", "nobody"}, {"stream", "stdin"}});
    CHECK(badStream.body["error"] == "InvalidArgument");
}

TEST_CASE("formatTimestamp writes ISO-8601 UTC", "[daemon][dispatcher]") {
    using namespace std::chrono;
    // 2024-01-01T12:00:03Z
    const TimePoint base{seconds{1704110403}};

    CHECK(RequestDispatcher::formatTimestamp(base) == "2024-01-01T12:00:03+00:00");
    CHECK(RequestDispatcher::formatTimestamp(base + milliseconds{250}) ==
          "2024-01-01T12:00:03.250000+00:00");
    CHECK(RequestDispatcher::formatTimestamp(base + microseconds{7}) ==
          "2024-01-01T12:00:03.000007+00:00");
}

TEST_CASE("toWireLine is one line and tolerates invalid UTF-8", "[daemon][dispatcher]") {
    json body{{"ok", true}, {"data", std::string("a\xff" "b\n")}};
    auto line = RequestDispatcher::toWireLine(body);
    REQUIRE_FALSE(line.empty());
    CHECK(line.back() == '\n');
    CHECK(line.find('\n') == line.size() - 1);
    CHECK_NOTHROW(json::parse(line));
}
