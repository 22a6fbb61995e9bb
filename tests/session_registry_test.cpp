#include <gtest/gtest.h>
#include "../src/session/session_registry.hpp"
#include "support/counting_strategy.hpp"
#include "support/fake_transport.hpp"
#include "support/test_clocks.hpp"
#include <thread>
#include <vector>

using namespace trade_gate;
using trade_gate::testing::CountingStrategy;
using trade_gate::testing::FakeTransport;
using trade_gate::testing::ManualClock;
using trade_gate::testing::fast_engine;

namespace {

struct RegistryFixture : public ::testing::Test {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<RateLimiter> limiter = std::make_shared<RateLimiter>(RateLimitConfig{}, clock);
    std::shared_ptr<SessionRegistry> registry =
        std::make_shared<SessionRegistry>(limiter, fast_engine(), clock);

    TradingClientHandle make_handle(const std::shared_ptr<UserSession>& s) {
        return TradingClientHandle(std::make_shared<ExchangeClient>(
            std::make_shared<FakeTransport>(), limiter, s->credentials()));
    }
};

} // namespace

TEST_F(RegistryFixture, ReLoginReplacesAndScrubsPreviousSession) {
    auto first = registry->create_session(42, "alice");
    registry->update_credentials(first, "AK1", "SK1");
    registry->set_client(first, make_handle(first));
    auto strategy = std::make_shared<CountingStrategy>();
    first->engine()->start(strategy);

    auto second = registry->create_session(42, "alice");

    EXPECT_TRUE(first->torn_down());
    EXPECT_TRUE(first->credentials()->empty());
    EXPECT_FALSE(first->client_handle().valid());
    EXPECT_FALSE(first->engine()->is_running());

    EXPECT_EQ(registry->get_session(42), second);
    EXPECT_NE(first, second);
    EXPECT_EQ(registry->active_count(), 1u);
    EXPECT_FALSE(second->torn_down());
}

TEST_F(RegistryFixture, RemovingUnknownUserIsNoop) {
    registry->create_session(1, "bob");
    EXPECT_NO_THROW(registry->remove_session(999));
    EXPECT_EQ(registry->active_count(), 1u);
    EXPECT_NO_THROW(registry->remove_session_async(999).get());
    EXPECT_EQ(registry->get_session(999), nullptr);
}

TEST_F(RegistryFixture, RemoveSessionTearsDown) {
    auto s = registry->create_session(7, "carol");
    registry->update_credentials(s, "AK", "SK");
    registry->set_client(s, make_handle(s));
    registry->update_login_status(s, true, nlohmann::json{{"balance", 1000}});
    auto client = s->client_handle().client();

    registry->remove_session(7);

    EXPECT_EQ(registry->get_session(7), nullptr);
    EXPECT_EQ(registry->active_count(), 0u);
    EXPECT_TRUE(s->credentials()->empty());
    EXPECT_FALSE(s->client_handle().valid());
    EXPECT_TRUE(client->cancelled());
    EXPECT_FALSE(s->login_status().logged_in);
}

TEST_F(RegistryFixture, AsyncRemovalWaitsForEngine) {
    auto s = registry->create_session(8, "dave");
    registry->update_credentials(s, "AK", "SK");
    auto strategy = std::make_shared<CountingStrategy>();
    s->engine()->start(strategy);
    while (strategy->total() == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    auto done = registry->remove_session_async(8);
    // The entry is gone and the engine flagged before the future resolves.
    EXPECT_EQ(registry->get_session(8), nullptr);
    EXPECT_FALSE(s->engine()->is_running());

    done.get();
    EXPECT_TRUE(s->torn_down());
    EXPECT_TRUE(s->credentials()->empty());
    auto after = strategy->total();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(strategy->total(), after);
}

TEST_F(RegistryFixture, SessionsAreIsolated) {
    auto a = registry->create_session(1, "alice");
    auto b = registry->create_session(2, "bob");
    registry->update_credentials(a, "AK-A", "SK-A");
    registry->update_credentials(b, "AK-B", "SK-B");

    EXPECT_NE(a->credentials(), b->credentials());
    EXPECT_NE(a->engine(), b->engine());

    registry->remove_session(1);
    EXPECT_TRUE(a->credentials()->empty());
    EXPECT_EQ(b->credentials()->access_key(), "AK-B");
    EXPECT_EQ(registry->get_session(2), b);
}

TEST_F(RegistryFixture, EvictsOnlyIdleSessions) {
    auto a = registry->create_session(1, "alice");
    auto b = registry->create_session(2, "bob");
    registry->update_credentials(a, "AK", "SK");

    clock->advance(std::chrono::hours(23));
    registry->get_session(2);  // touch
    clock->advance(std::chrono::hours(2));

    EXPECT_EQ(registry->evict_idle(std::chrono::hours(24)), 1u);
    EXPECT_EQ(registry->get_session(1), nullptr);
    EXPECT_TRUE(a->credentials()->empty());
    EXPECT_EQ(registry->get_session(2), b);
    EXPECT_EQ(registry->evict_idle(std::chrono::hours(24)), 0u);
}

TEST_F(RegistryFixture, LoginSnapshotAndSerialization) {
    auto s = registry->create_session(5, "erin");
    registry->update_credentials(s, "AKEY-visible-prefix", "SUPER-SECRET-VALUE");
    registry->update_login_status(s, true, nlohmann::json{{"balance", 150000.0}});

    auto snap = s->login_status();
    EXPECT_TRUE(snap.logged_in);
    EXPECT_EQ(snap.account_info["balance"], 150000.0);
    EXPECT_FALSE(snap.login_time.empty());

    auto dumped = s->to_json().dump();
    EXPECT_EQ(dumped.find("SUPER-SECRET-VALUE"), std::string::npos);
    EXPECT_EQ(dumped.find("AKEY-visible-prefix"), std::string::npos);
    EXPECT_TRUE(s->to_json()["has_credentials"].get<bool>());

    registry->update_login_status(s, false);
    EXPECT_FALSE(s->login_status().logged_in);
    EXPECT_TRUE(s->login_status().account_info.is_null());
}

TEST_F(RegistryFixture, ConcurrentCreateKeepsOneSessionPerUser) {
    std::mutex mu;
    std::vector<std::shared_ptr<UserSession>> created;
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto s = registry->create_session(77, "frank");
            std::lock_guard<std::mutex> lock(mu);
            created.push_back(s);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(registry->active_count(), 1u);
    auto live = registry->get_session(77);
    int alive = 0;
    for (auto& s : created) {
        if (!s->torn_down()) {
            ++alive;
            EXPECT_EQ(s, live);
        }
    }
    EXPECT_EQ(alive, 1);
}

TEST_F(RegistryFixture, DestructionTearsDownEverything) {
    auto a = registry->create_session(1, "alice");
    registry->update_credentials(a, "AK", "SK");
    auto strategy = std::make_shared<CountingStrategy>();
    a->engine()->start(strategy);

    registry.reset();
    EXPECT_TRUE(a->torn_down());
    EXPECT_TRUE(a->credentials()->empty());
    EXPECT_FALSE(a->engine()->is_running());
}

TEST(SessionRegistryTest, RequiresLimiter) {
    EXPECT_THROW({ SessionRegistry reg(nullptr); }, std::invalid_argument);
}

TEST_F(RegistryFixture, AsyncRemovalWaitsForInFlightTick) {
    using trade_gate::testing::SlowTickStrategy;
    auto s = registry->create_session(8, "dave");
    registry->update_credentials(s, "AK", "SK");
    auto strategy = std::make_shared<SlowTickStrategy>(300);
    ASSERT_TRUE(s->engine()->start(strategy));
    while (strategy->started == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    auto t0 = std::chrono::steady_clock::now();
    registry->remove_session_async(8).get();
    auto waited = std::chrono::steady_clock::now() - t0;

    EXPECT_EQ(strategy->completed.load(), strategy->started.load());
    EXPECT_GE(waited, std::chrono::milliseconds(100));
    EXPECT_TRUE(s->credentials()->empty());
}

TEST_F(RegistryFixture, TeardownAndWaitJoinsInFlightTick) {
    using trade_gate::testing::SlowTickStrategy;
    auto s = registry->create_session(9, "gina");
    auto strategy = std::make_shared<SlowTickStrategy>(300);
    ASSERT_TRUE(s->engine()->start(strategy));
    while (strategy->started == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    s->teardown_and_wait();
    EXPECT_EQ(strategy->completed.load(), strategy->started.load());
    EXPECT_FALSE(s->engine()->is_running());
}

TEST_F(RegistryFixture, RegistryDestructionWaitsForInFlightTick) {
    using trade_gate::testing::SlowTickStrategy;
    auto s = registry->create_session(10, "hank");
    auto strategy = std::make_shared<SlowTickStrategy>(300);
    ASSERT_TRUE(s->engine()->start(strategy));
    while (strategy->started == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    registry.reset();
    EXPECT_EQ(strategy->completed.load(), strategy->started.load());
}

TEST_F(RegistryFixture, ReplacedSessionRejectsNewState) {
    auto first = registry->create_session(42, "alice");
    auto second = registry->create_session(42, "alice");
    ASSERT_TRUE(first->torn_down());

    EXPECT_THROW(registry->update_credentials(first, "AK-A", "SK-A"), SessionClosed);
    EXPECT_TRUE(first->credentials()->empty());

    auto client = std::make_shared<ExchangeClient>(std::make_shared<FakeTransport>(), limiter, first->credentials());
    EXPECT_THROW(registry->set_client(first, TradingClientHandle(client)), SessionClosed);
    EXPECT_FALSE(first->client_handle().valid());
    EXPECT_TRUE(client->cancelled());

    EXPECT_THROW(registry->update_login_status(first, true), SessionClosed);
    EXPECT_FALSE(first->login_status().logged_in);

    auto strategy = std::make_shared<CountingStrategy>();
    EXPECT_FALSE(first->engine()->start(strategy));
    EXPECT_FALSE(first->engine()->is_running());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(strategy->total(), 0u);

    // The live session is unaffected.
    EXPECT_NO_THROW(registry->update_credentials(second, "AK-B", "SK-B"));
    EXPECT_TRUE(second->engine()->start(strategy));
    second->engine()->stop();
}
