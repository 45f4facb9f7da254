#include <catch2/catch_test_macros.hpp>

#include "session.hpp"

#include <memory>

namespace {

class FakeChildProcess : public ChildProcess {
public:
    explicit FakeChildProcess(int pid) : pid_(pid) {}
    int pid() const override { return pid_; }
    bool request_stop() override { return true; }
    bool terminate() override { return true; }
    bool try_wait() override { return true; }
    std::expected<int, std::string> wait() override { return 0; }
private:
    int pid_;
};

RecordingSession make_session(int pid, const std::string& path) {
    return RecordingSession{.process = std::make_unique<FakeChildProcess>(pid), .path = path};
}

} // namespace

TEST_CASE("SessionSlot", "[session]") {
    SessionSlot slot;

    SECTION("InitialStateIdle") {
        REQUIRE(slot.state() == SessionState::Idle);
        REQUIRE_FALSE(slot.peek().has_value());
    }

    SECTION("AcquireThenRelease") {
        REQUIRE(slot.acquire(make_session(42, "/tmp/a.wav")));
        REQUIRE(slot.state() == SessionState::Active);

        auto session = slot.release();
        REQUIRE(session.has_value());
        REQUIRE(session->process->pid() == 42);
        REQUIRE(session->path == "/tmp/a.wav");
        REQUIRE(slot.state() == SessionState::Idle);
    }

    SECTION("ReleaseWhenIdleReturnsEmpty") {
        REQUIRE_FALSE(slot.release().has_value());
    }

    SECTION("SecondAcquireRejectedAndLeftWithCaller") {
        REQUIRE(slot.acquire(make_session(1, "/tmp/first.wav")));

        auto second = make_session(2, "/tmp/second.wav");
        auto res = slot.acquire(std::move(second));
        REQUIRE_FALSE(res);
        REQUIRE(res.error().code == ErrorCode::SessionAlreadyActive);

        // The rejected session still belongs to the caller.
        REQUIRE(second.process != nullptr);
        REQUIRE(second.process->pid() == 2);

        auto info = slot.peek();
        REQUIRE(info.has_value());
        REQUIRE(info->pid == 1);
        REQUIRE(info->path == "/tmp/first.wav");
    }

    SECTION("PeekDoesNotConsume") {
        REQUIRE(slot.acquire(make_session(7, "/tmp/b.wav")));
        REQUIRE(slot.peek().has_value());
        REQUIRE(slot.peek().has_value());
        REQUIRE(slot.state() == SessionState::Active);
    }
}
