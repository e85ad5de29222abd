#include "fake_backend.hpp"

#include <lldpwatch/session.hpp>

#include <spdlog/sinks/ringbuffer_sink.h>

#include <gtest/gtest.h>

using namespace lldpwatch;
using namespace lldpwatch::test;

namespace
{
struct NullListener : ChangeListener
{
    int calls = 0;
    void onChange(ChangeKind, AtomHandle, AtomHandle) override
    {
        ++calls;
    }
};
} // namespace

TEST(SessionTest, ConnectsAndReleasesOnce)
{
    FakeBackend backend;
    NullListener listener;
    {
        Session session(backend, listener);
        EXPECT_EQ(session.state(), Session::State::connected);
        EXPECT_NE(session.connection(), nullptr);
        EXPECT_EQ(backend.connects, 1);
        EXPECT_EQ(backend.logCallback, &logFromBackend);
    }
    EXPECT_EQ(backend.releases, 1);
    EXPECT_EQ(backend.misuses, 0);
}

TEST(SessionTest, NullConnectionThrows)
{
    FakeBackend backend;
    NullListener listener;
    backend.failConnects = 1;
    try
    {
        Session session(backend, listener);
        FAIL() << "expected ConnectionError";
    }
    catch (const ConnectionError& e)
    {
        EXPECT_EQ(e.code(), make_error_code(Errc::no_connection));
    }
    EXPECT_EQ(backend.connectAttempts, 1);
    EXPECT_EQ(backend.releases, 0);
}

TEST(SessionTest, FailedRegistrationReleasesConnection)
{
    FakeBackend backend;
    NullListener listener;
    backend.failWatchRegistration = true;
    EXPECT_THROW((Session{backend, listener}), ConnectionError);
    EXPECT_EQ(backend.connects, 1);
    EXPECT_EQ(backend.releases, 1);
}

TEST(SessionTest, ReleasedWhenScopeUnwinds)
{
    FakeBackend backend;
    NullListener listener;
    EXPECT_THROW(
        {
            Session session(backend, listener);
            throw std::runtime_error("load failed");
        },
        std::runtime_error);
    EXPECT_EQ(backend.releases, 1);
}

TEST(SessionTest, WaitDeliversChangesAndErrors)
{
    FakeBackend backend;
    NullListener listener;
    auto& iface = backend.addInterface("eth0");
    auto& neighbor = backend.addNeighbor(iface, "sw");
    backend.pushEvent(ChangeKind::updated, iface, neighbor);
    backend.pushError(-501);

    Session session(backend, listener);
    EXPECT_FALSE(session.wait());
    EXPECT_EQ(listener.calls, 1);

    auto ec = session.wait();
    EXPECT_TRUE(ec);
    EXPECT_EQ(ec.value(), -501);
    EXPECT_EQ(ec.message(), "fake error -501");
}

TEST(SessionTest, UnblockEndsWait)
{
    FakeBackend backend;
    NullListener listener;
    Session session(backend, listener);
    session.unblock();
    auto ec = session.wait();
    EXPECT_EQ(ec.value(), UNBLOCKED);
    EXPECT_EQ(listener.calls, 0);
}

TEST(BackendLogTest, SeveritiesMapToLevels)
{
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    sink->set_pattern("%l %v");
    setLogSink(sink);
    setLogLevel(spdlog::level::debug);

    logFromBackend(3, "err");
    logFromBackend(4, "warn");
    logFromBackend(5, "notice");
    logFromBackend(7, "debug");
    logFromBackend(6, nullptr);

    auto lines = sink->last_formatted();
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0].substr(0, lines[0].find_first_of("\r\n")), "error err");
    EXPECT_EQ(lines[1].substr(0, lines[1].find_first_of("\r\n")),
              "warning warn");
    EXPECT_EQ(lines[2].substr(0, lines[2].find_first_of("\r\n")),
              "info notice");
    EXPECT_EQ(lines[3].substr(0, lines[3].find_first_of("\r\n")),
              "debug debug");

    setLogSink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    setLogLevel(spdlog::level::info);
}
