#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "PushListener.h"

using nlohmann::json;
using namespace std::chrono_literals;
using boost::asio::ip::udp;

namespace {

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

class PushListenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway = std::make_shared<GatewaySession>("127.0.0.1", 9898, "34ce00aabbcc", "", "1.1.2", "any", "");
        worker = std::thread([this] { worker_io.run(); });

        PushListenerOptions options;
        options.listen_address = "127.0.0.1";
        options.port = 0;
        options.join_multicast = false;
        listener = std::make_unique<PushListener>("any",
            [this](const std::string& ip) { return ip == "127.0.0.1" ? gateway : nullptr; },
            worker_io, options);
        listener->Start();

        sender.open(udp::v4());
        target = udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), listener->GetLocalPort());
    }

    void TearDown() override {
        listener->Stop();
        work_guard.reset();
        worker_io.stop();
        worker.join();
    }

    void Send(const std::string& text) {
        sender.send_to(boost::asio::buffer(text), target);
    }

    boost::asio::io_context worker_io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard{ worker_io.get_executor() };
    std::thread worker;
    std::shared_ptr<GatewaySession> gateway;
    std::unique_ptr<PushListener> listener;

    boost::asio::io_context sender_io;
    udp::socket sender{ sender_io };
    udp::endpoint target;
};

TEST_F(PushListenerTest, ReportReachesSubscriber) {
    std::atomic<int> calls{ 0 };
    std::atomic<bool> open{ false };
    gateway->Subscribe("158d0001234567", [&](const json& data, const json&) {
        open = data["status"] == "open";
        ++calls;
        });

    Send("{not json");
    Send(json{ {"cmd", "report"}, {"model", "magnet"}, {"sid", "158d0001234567"}, {"data", "{\"status\":\"open\"}"} }.dump());

    ASSERT_TRUE(WaitFor([&] { return calls.load() == 1; }));
    EXPECT_TRUE(open);
    EXPECT_EQ(listener->GetReceivedCount(), 2u);
    EXPECT_GE(listener->GetDroppedCount(), 1u);
}

TEST_F(PushListenerTest, WrongFieldTypesKeepTheLoopAlive) {
    std::atomic<int> calls{ 0 };
    gateway->Subscribe("158d0001234567", [&](const json&, const json&) { ++calls; });

    Send("{\"cmd\":1}");
    Send("{\"cmd\":\"heartbeat\",\"model\":[1,2]}");
    Send(json{ {"cmd", "report"}, {"model", "magnet"}, {"sid", "158d0001234567"}, {"data", "{\"status\":\"close\"}"} }.dump());

    ASSERT_TRUE(WaitFor([&] { return calls.load() == 1; }));
    EXPECT_TRUE(listener->IsRunning());
    EXPECT_EQ(listener->GetReceivedCount(), 3u);
    EXPECT_GE(listener->GetDroppedCount(), 1u);
}

TEST_F(PushListenerTest, GatewayHeartbeatRefreshesToken) {
    Send(json{ {"cmd", "heartbeat"}, {"model", "gateway"}, {"sid", "34ce00aabbcc"}, {"token", "1234567890abcdef"},
        {"data", "{\"ip\":\"127.0.0.1\"}"} }.dump());
    ASSERT_TRUE(WaitFor([&] { return gateway->GetToken() == "1234567890abcdef"; }));
    EXPECT_EQ(gateway->GetState(), SessionState::TOKEN_KNOWN);
}

TEST_F(PushListenerTest, UnknownCommandIsDropped) {
    Send(json{ {"cmd", "iam"}, {"model", "gateway"} }.dump());
    ASSERT_TRUE(WaitFor([&] { return listener->GetDroppedCount() == 1u; }));
}

TEST_F(PushListenerTest, StopIsIdempotent) {
    EXPECT_TRUE(listener->IsRunning());
    listener->Stop();
    listener->Stop();
    EXPECT_FALSE(listener->IsRunning());
}
