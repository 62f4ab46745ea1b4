#include "grace/rt/ShutdownSequencer.hpp"
#include "grace/util/Logger.hpp"
#include "support/ManualSignalSource.hpp"
#include "support/TempFile.hpp"
#include <gtest/gtest.h>
#include <boost/asio/error.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace grace;
using namespace grace::rt;
using grace::test::ManualSignalSource;
using grace::test::TempFile;
using namespace std::chrono_literals;

// Drain that either finishes after `delay` or never finishes in time.
class FakeServer : public IDrainable {
public:
    std::chrono::milliseconds delay{0};
    bool hang = false;
    std::atomic<int> calls{0};

    boost::system::error_code shutdown(const Deadline& deadline) override {
        calls++;
        if (hang) {
            std::this_thread::sleep_until(deadline.timePoint());
            return boost::asio::error::timed_out;
        }
        std::this_thread::sleep_for(delay);
        return {};
    }
};

struct FatalRecorder {
    Completion fired;
    std::string reason;
    ShutdownSequencer::FatalHandler handler() {
        return [this](const std::string& r) { reason = r; fired.fire(); };
    }
};

static ShutdownSequencer::Options opts(std::chrono::milliseconds drain, std::chrono::milliseconds cleanup) {
    ShutdownSequencer::Options o;
    o.shutdownTimeout = drain;
    o.cleanupTimeout  = cleanup;
    return o;
}

TEST(ShutdownSequencerTest, StaysRunningWithoutSignal) {
    ManualSignalSource signals;
    FakeServer server;
    ResourceCleaner cleaner;
    ShutdownSequencer seq(signals, server, cleaner, opts(1s, 1s));
    seq.arm();

    EXPECT_FALSE(seq.waitFor(50ms));
    EXPECT_EQ(seq.state(), ShutdownSequencer::State::Running);
    EXPECT_EQ(server.calls.load(), 0);
    EXPECT_EQ(seq.triggeredBy(), 0);
}

TEST(ShutdownSequencerTest, DrainSuccessReachesDone) {
    ManualSignalSource signals;
    FakeServer server;
    ResourceCleaner cleaner;
    std::atomic<int> cleaned{0};
    cleaner.registerWithName("Tracer", [&]{ cleaned++; return Status{}; });

    ShutdownSequencer seq(signals, server, cleaner, opts(1s, 1s));
    seq.arm();
    signals.trigger(SIGTERM);

    ASSERT_TRUE(seq.waitFor(5s));
    EXPECT_EQ(seq.state(), ShutdownSequencer::State::Done);
    EXPECT_EQ(seq.triggeredBy(), SIGTERM);
    EXPECT_EQ(server.calls.load(), 1);
    EXPECT_EQ(cleaned.load(), 1);
}

static std::string lineWith(const std::string& text, const std::string& msg) {
    std::istringstream in(text);
    std::string l;
    while (std::getline(in, l)) {
        if (l.find(" " + msg) != std::string::npos) return l;
    }
    return {};
}

TEST(ShutdownSequencerTest, LogLinesCarryTheirPhase) {
    TempFile f("seq_log");
    auto& log = util::logger();
    const auto prevLevel = log.level();
    log.setLevel(util::LogLevel::Info);
    log.setFormatJson(false);
    ASSERT_TRUE(log.setFile(f.path()));

    ManualSignalSource signals;
    FakeServer server;
    ResourceCleaner cleaner;
    cleaner.registerWithName("B", []{ return Status::failure("disk busy"); });
    {
        ShutdownSequencer seq(signals, server, cleaner, opts(1s, 1s));
        seq.arm();
        signals.trigger(SIGTERM);
        ASSERT_TRUE(seq.waitFor(5s));
    }
    log.setFile("");
    log.setLevel(prevLevel);

    const std::string out = f.read();
    EXPECT_NE(lineWith(out, "shutdown.drain.begin").find("phase=drain"), std::string::npos);
    EXPECT_NE(lineWith(out, "shutdown.drain.end").find("phase=drain"), std::string::npos);
    EXPECT_NE(lineWith(out, "shutdown.cleanup.begin").find("phase=cleanup"), std::string::npos);
    EXPECT_NE(lineWith(out, "shutdown.cleanup.errors").find("phase=cleanup"), std::string::npos);

    const std::string done = lineWith(out, "shutdown.done");
    ASSERT_FALSE(done.empty());
    EXPECT_EQ(done.find("phase="), std::string::npos);
}

TEST(ShutdownSequencerTest, CleanupFailuresDoNotPreventDone) {
    ManualSignalSource signals;
    FakeServer server;
    ResourceCleaner cleaner;
    std::atomic<int> ran{0};
    cleaner.registerWithName("A", [&]{ ran++; return Status{}; });
    cleaner.registerWithName("B", [&]{ ran++; return Status::failure("disk busy"); });
    cleaner.registerWithName("C", [&]{ ran++; return Status{}; });

    ShutdownSequencer seq(signals, server, cleaner, opts(1s, 1s));
    seq.arm();
    signals.trigger(SIGINT);

    ASSERT_TRUE(seq.waitFor(5s));
    EXPECT_EQ(seq.state(), ShutdownSequencer::State::Done);
    EXPECT_EQ(ran.load(), 3);
}

TEST(ShutdownSequencerTest, DrainTimeoutSkipsCleanup) {
    ManualSignalSource signals;
    FakeServer server;
    server.hang = true;
    ResourceCleaner cleaner;
    std::atomic<int> cleaned{0};
    cleaner.registerWithName("Tracer", [&]{ cleaned++; return Status{}; });
    FatalRecorder fatal;

    ShutdownSequencer seq(signals, server, cleaner, opts(50ms, 1s), fatal.handler());
    seq.arm();
    signals.trigger(SIGTERM);

    ASSERT_TRUE(fatal.fired.waitFor(5s));
    EXPECT_NE(fatal.reason.find("50ms"), std::string::npos);
    EXPECT_EQ(seq.state(), ShutdownSequencer::State::Aborted);
    EXPECT_FALSE(seq.waitFor(50ms));
    EXPECT_EQ(cleaned.load(), 0);
    EXPECT_FALSE(cleaner.consumed());
}

TEST(ShutdownSequencerTest, DrainTimeoutCanStillCleanUpWhenConfigured) {
    ManualSignalSource signals;
    FakeServer server;
    server.hang = true;
    ResourceCleaner cleaner;
    std::atomic<int> cleaned{0};
    cleaner.registerWithName("Tracer", [&]{ cleaned++; return Status{}; });
    FatalRecorder fatal;

    auto o = opts(50ms, 1s);
    o.cleanupOnDrainTimeout = true;
    ShutdownSequencer seq(signals, server, cleaner, o, fatal.handler());
    seq.arm();
    signals.trigger(SIGTERM);

    ASSERT_TRUE(fatal.fired.waitFor(5s));
    EXPECT_EQ(cleaned.load(), 1);
    EXPECT_EQ(seq.state(), ShutdownSequencer::State::Aborted);
    EXPECT_FALSE(seq.waitFor(10ms));
}

TEST(ShutdownSequencerTest, SignalBeforeArmIsNotLost) {
    ManualSignalSource signals;
    FakeServer server;
    ResourceCleaner cleaner;
    ShutdownSequencer seq(signals, server, cleaner, opts(1s, 1s));

    signals.trigger(SIGHUP);
    seq.arm();

    ASSERT_TRUE(seq.waitFor(5s));
    EXPECT_EQ(seq.triggeredBy(), SIGHUP);
    EXPECT_EQ(server.calls.load(), 1);
}

TEST(ShutdownSequencerTest, RepeatedSignalsDriveOneSequence) {
    ManualSignalSource signals;
    FakeServer server;
    server.delay = 50ms;
    ResourceCleaner cleaner;
    std::atomic<int> cleaned{0};
    cleaner.registerWithName("Tracer", [&]{ cleaned++; return Status{}; });

    ShutdownSequencer seq(signals, server, cleaner, opts(1s, 1s));
    signals.trigger(SIGINT);   // latched before arm
    seq.arm();

    std::vector<std::thread> senders;
    for (int s : {SIGTERM, SIGHUP, SIGINT, SIGTERM}) {
        senders.emplace_back([&signals, s]{ signals.trigger(s); });
    }
    for (auto& t : senders) t.join();

    ASSERT_TRUE(seq.waitFor(5s));
    EXPECT_EQ(seq.triggeredBy(), SIGINT);
    EXPECT_EQ(server.calls.load(), 1);
    EXPECT_EQ(cleaned.load(), 1);
}

TEST(ShutdownSequencerTest, SlowDrainDoesNotShortenCleanupBudget) {
    ManualSignalSource signals;
    FakeServer server;
    server.delay = 150ms;        // uses most of the drain budget
    ResourceCleaner cleaner;
    std::atomic<bool> lastRan{false};
    cleaner.registerWithName("slow", []{
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        return Status{};
    });
    cleaner.registerWithName("last", [&]{ lastRan = true; return Status{}; });

    ShutdownSequencer seq(signals, server, cleaner, opts(200ms, 400ms));
    seq.arm();
    signals.trigger(SIGTERM);

    ASSERT_TRUE(seq.waitFor(5s));
    EXPECT_EQ(seq.state(), ShutdownSequencer::State::Done);
    EXPECT_TRUE(lastRan.load());
}

TEST(ShutdownSequencerTest, DestroyWithoutSignalDoesNotHang) {
    ManualSignalSource signals;
    FakeServer server;
    ResourceCleaner cleaner;
    {
        ShutdownSequencer seq(signals, server, cleaner, opts(1s, 1s));
        seq.arm();
    }
    EXPECT_EQ(server.calls.load(), 0);
    EXPECT_FALSE(cleaner.consumed());
}

TEST(ShutdownSequencerTest, StateNames) {
    EXPECT_STREQ(stateName(ShutdownSequencer::State::Running), "running");
    EXPECT_STREQ(stateName(ShutdownSequencer::State::CleaningUp), "cleaning_up");
    EXPECT_STREQ(stateName(ShutdownSequencer::State::Aborted), "aborted");
}
