// ProcessHandle lifecycle: start, exit detection, stop escalation, restart and stdin

#include <catch2/catch_test_macros.hpp>

#include <procd/supervisor/output_broadcaster.h>
#include <procd/supervisor/process_handle.h>

#include "../../support/wait_until.hpp"

#include <cerrno>
#include <chrono>
#include <string>

#include <signal.h>

using namespace procd;
using namespace procd::supervisor;
using namespace std::chrono_literals;
using procd::test_support::wait_until;

namespace {

struct HandleFixture {
    SupervisorConfig config;
    OutputBroadcaster broadcaster{config.subscriberQueueDepth, config.overflowPolicy};

    HandleFixture() { config.pumpPollInterval = 20ms; }
};

bool stdoutContains(const ProcessHandle& h, const std::string& needle) {
    auto slice = h.readOutput(OutputStream::Stdout, 0);
    if (!slice)
        return false;
    for (const auto& c : slice.value().chunks) {
        if (c.data.find(needle) != std::string::npos)
            return true;
    }
    return false;
}

bool processGone(int64_t pid) {
    return ::kill(static_cast<pid_t>(pid), 0) == -1 && errno == ESRCH;
}

} // namespace

TEST_CASE("ProcessHandle runs then records the exit code", "[supervisor][handle]") {
    HandleFixture fx;
    ProcessRecord rec;
    rec.id = "exit7";
    rec.command = {"/bin/sh", "-c", "sleep 0.2; exit 7"};
    ProcessHandle handle(rec, fx.config, fx.broadcaster);

    CHECK(handle.state() == ProcessState::Pending);
    CHECK(handle.generation() == 0);

    REQUIRE(handle.start());
    auto running = handle.status();
    CHECK(running.state == ProcessState::Running);
    REQUIRE(running.pid.has_value());
    CHECK(*running.pid > 0);
    CHECK_FALSE(running.exitCode.has_value());
    CHECK(running.generation == 1);

    REQUIRE(wait_until([&] { return handle.state() == ProcessState::Exited; }));
    auto done = handle.status();
    CHECK(done.exitCode == 7);
    CHECK_FALSE(done.pid.has_value());
    CHECK(done.endedAt.has_value());
}

TEST_CASE("ProcessHandle start while running is AlreadyRunning", "[supervisor][handle]") {
    HandleFixture fx;
    ProcessRecord rec;
    rec.id = "long";
    rec.command = {"/bin/sh", "-c", "sleep 30"};
    ProcessHandle handle(rec, fx.config, fx.broadcaster);

    REQUIRE(handle.start());
    auto again = handle.start();
    REQUIRE_FALSE(again);
    CHECK(again.error().code == ErrorCode::AlreadyRunning);
    CHECK(handle.generation() == 1);

    REQUIRE(handle.stop(200ms));
}

TEST_CASE("ProcessHandle frames output per line", "[supervisor][handle]") {
    HandleFixture fx;
    ProcessRecord rec;
    rec.id = "lines";
    rec.command = {"/bin/sh", "-c", "printf 'one\\ntwo\\npartial'"};
    ProcessHandle handle(rec, fx.config, fx.broadcaster);

    REQUIRE(handle.start());
    REQUIRE(wait_until([&] { return handle.state() == ProcessState::Exited; }));

    auto slice = handle.readOutput(OutputStream::Stdout, 0);
    REQUIRE(slice);
    const auto& chunks = slice.value().chunks;
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].data == "one\n");
    CHECK(chunks[1].data == "two\n");
    CHECK(chunks[2].data == "partial");
    CHECK(chunks[2].sequence == 3);
}

TEST_CASE("ProcessHandle stop escalates to SIGKILL when SIGTERM is ignored",
          "[supervisor][handle][stop]") {
    HandleFixture fx;
    fx.config.killWait = 2000ms;
    ProcessRecord rec;
    rec.id = "stubborn";
    rec.command = {"/bin/sh", "-c", "trap '' TERM; echo ready; while true; do sleep 0.05; done"};
    ProcessHandle handle(rec, fx.config, fx.broadcaster);

    REQUIRE(handle.start());
    REQUIRE(wait_until([&] { return stdoutContains(handle, "ready"); }));
    const auto pid = *handle.status().pid;

    auto started = std::chrono::steady_clock::now();
    REQUIRE(handle.stop(50ms));
    auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(elapsed < 50ms + fx.config.killWait + 500ms);
    auto st = handle.status();
    CHECK(st.state == ProcessState::Stopped);
    CHECK(st.exitCode == 128 + SIGKILL);
    CHECK(processGone(pid));
}

TEST_CASE("ProcessHandle stop of a cooperative process ends Stopped",
          "[supervisor][handle][stop]") {
    HandleFixture fx;
    ProcessRecord rec;
    rec.id = "polite";
    rec.command = {"/bin/sh", "-c", "sleep 30"};
    ProcessHandle handle(rec, fx.config, fx.broadcaster);

    REQUIRE(handle.start());
    REQUIRE(handle.stop(2000ms));
    CHECK(handle.state() == ProcessState::Stopped);
    CHECK(handle.exitCode() == 128 + SIGTERM);

    SECTION("stop when not running is a no-op") {
        CHECK(handle.stop(10ms));
        CHECK(handle.state() == ProcessState::Stopped);
    }
}

TEST_CASE("ProcessHandle restart starts a new generation with fresh sequences",
          "[supervisor][handle][restart]") {
    HandleFixture fx;
    ProcessRecord rec;
    rec.id = "restartable";
    rec.command = {"/bin/sh", "-c", "echo first; echo second; sleep 30"};
    ProcessHandle handle(rec, fx.config, fx.broadcaster);

    REQUIRE(handle.start());
    REQUIRE(wait_until([&] { return stdoutContains(handle, "second"); }));
    const auto firstPid = *handle.status().pid;

    REQUIRE(handle.restart(500ms));
    CHECK(handle.generation() == 2);
    CHECK(handle.state() == ProcessState::Running);
    CHECK(*handle.status().pid != firstPid);

    REQUIRE(wait_until([&] { return stdoutContains(handle, "first"); }));
    auto slice = handle.readOutput(OutputStream::Stdout, 0);
    REQUIRE(slice);
    REQUIRE_FALSE(slice.value().chunks.empty());
    CHECK(slice.value().chunks.front().sequence == 1);
    CHECK(slice.value().chunks.front().generation == 2);

    REQUIRE(handle.stop(500ms));
}

TEST_CASE("ProcessHandle forwards stdin while running", "[supervisor][handle][stdin]") {
    HandleFixture fx;
    ProcessRecord rec;
    rec.id = "cat";
    rec.command = {"/bin/cat"};
    ProcessHandle handle(rec, fx.config, fx.broadcaster);

    REQUIRE(handle.start());
    REQUIRE(handle.sendInput(std::string_view{"ping\n"}));
    REQUIRE(wait_until([&] { return stdoutContains(handle, "ping"); }));
    REQUIRE(handle.stop(500ms));
}

TEST_CASE("ProcessHandle sendInput to an exited process is NotRunning",
          "[supervisor][handle][stdin]") {
    HandleFixture fx;
    ProcessRecord rec;
    rec.id = "done";
    rec.command = {"/bin/sh", "-c", "exit 0"};
    ProcessHandle handle(rec, fx.config, fx.broadcaster);

    auto before = handle.sendInput(std::string_view{"x\n"});
    REQUIRE_FALSE(before);
    CHECK(before.error().code == ErrorCode::NotRunning);

    REQUIRE(handle.start());
    REQUIRE(wait_until([&] { return handle.state() == ProcessState::Exited; }));

    auto r = handle.sendInput(std::string_view{"x\n"});
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::NotRunning);
}

TEST_CASE("ProcessHandle broken stdin pipe fails the generation and stop still terminates it",
          "[supervisor][handle][stdin]") {
    HandleFixture fx;
    ProcessRecord rec;
    rec.id = "deaf";
    rec.command = {"/bin/sh", "-c", "exec 0<&-; echo ready; sleep 30"};
    ProcessHandle handle(rec, fx.config, fx.broadcaster);

    REQUIRE(handle.start());
    REQUIRE(wait_until([&] { return stdoutContains(handle, "ready"); }));

    auto r = handle.sendInput(std::string_view{"hello\n"});
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::IOError);

    auto failed = handle.status();
    CHECK(failed.state == ProcessState::Failed);
    CHECK(failed.reason.rfind("stdin", 0) == 0);
    // The OS process is still there and is reported as such
    REQUIRE(failed.pid.has_value());
    CHECK_FALSE(processGone(*failed.pid));
    CHECK(handle.hasLiveProcess());

    REQUIRE(handle.stop(500ms));

    auto after = handle.status();
    CHECK(after.state == ProcessState::Failed);
    CHECK(after.reason == failed.reason);
    CHECK(after.exitCode.has_value());
    CHECK_FALSE(after.pid.has_value());
    CHECK_FALSE(handle.hasLiveProcess());
    CHECK(processGone(*failed.pid));

    // Nothing left to stop
    CHECK(handle.stop(50ms));
}

TEST_CASE("ProcessHandle spawn failure leaves the generation Failed",
          "[supervisor][handle][spawn]") {
    HandleFixture fx;
    ProcessRecord rec;
    rec.id = "ghost";
    rec.command = {"/nonexistent/procd-no-such-binary"};
    ProcessHandle handle(rec, fx.config, fx.broadcaster);

    auto r = handle.start();
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::SpawnFailed);

    auto st = handle.status();
    CHECK(st.state == ProcessState::Failed);
    CHECK_FALSE(st.reason.empty());
    CHECK_FALSE(st.pid.has_value());

    // A failed generation is not live, so start may be retried
    auto again = handle.start();
    REQUIRE_FALSE(again);
    CHECK(again.error().code == ErrorCode::SpawnFailed);
    CHECK(handle.generation() == 2);
}

TEST_CASE("ProcessHandle publishes chunks to subscribers", "[supervisor][handle][broadcast]") {
    HandleFixture fx;
    ProcessRecord rec;
    rec.id = "talker";
    rec.command = {"/bin/sh", "-c", "echo a; echo b 1>&2"};
    auto sub = fx.broadcaster.subscribe("talker");
    ProcessHandle handle(rec, fx.config, fx.broadcaster);

    REQUIRE(handle.start());
    int out = 0;
    int err = 0;
    for (int i = 0; i < 2; ++i) {
        auto c = sub->next(5s);
        REQUIRE(c);
        CHECK(c.value().generation == 1);
        (c.value().stream == OutputStream::Stdout ? out : err)++;
    }
    CHECK(out == 1);
    CHECK(err == 1);
}

TEST_CASE("ProcessHandle tail merges both streams", "[supervisor][handle]") {
    HandleFixture fx;
    ProcessRecord rec;
    rec.id = "tail";
    rec.command = {"/bin/sh", "-c", "echo o1; sleep 0.05; echo e1 1>&2; sleep 0.05; echo o2"};
    ProcessHandle handle(rec, fx.config, fx.broadcaster);

    REQUIRE(handle.start());
    REQUIRE(wait_until([&] { return handle.state() == ProcessState::Exited; }));

    auto all = handle.tail(10, true);
    REQUIRE(all.size() == 3);
    CHECK(all[0].data == "o1\n");
    CHECK(all[1].data == "e1\n");
    CHECK(all[2].data == "o2\n");

    auto last = handle.tail(1, true);
    REQUIRE(last.size() == 1);
    CHECK(last[0].data == "o2\n");

    CHECK(handle.tail(10, false).size() == 2);
}
