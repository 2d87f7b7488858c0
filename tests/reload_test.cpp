// Live reload protocol tests: wire format, fan-out and the client state model

#include "test_helpers.hpp"
#include "engine/builder.hpp"
#include "engine/reload.hpp"

#include <chrono>

using namespace verso::engine;
using verso::test::SiteTest;

namespace {

    // Drains every event currently queued on a channel into a client
    void deliver(ReloadChannel& channel, ReloadClient& client) {
        ReloadEvent event;
        while (channel.pop_for(event, std::chrono::milliseconds(0))) {
            client.handle(event);
        }
    }

    struct NoBooks : BookCompiler {
        void compile(const BookRequest&) override {}
    };

}

// ============================================================================
// Wire format
// ============================================================================

TEST(ReloadEventTest, JsonShape) {
    EXPECT_EQ(ReloadEvent::start().to_json(), nlohmann::json({{"type", "start"}}));
    EXPECT_EQ(ReloadEvent::notify("3 rendered", false).to_json(),
              nlohmann::json({{"type", "notify"}, {"message", "3 rendered"}, {"error", false}}));
    EXPECT_EQ(ReloadEvent::reload().to_json(), nlohmann::json({{"type", "reload"}}));
    EXPECT_EQ(ReloadEvent::reload("/docs/").to_json(), nlohmann::json({{"type", "reload"}, {"href", "/docs/"}}));
}

TEST(ReloadEventTest, ParseFromJson) {
    auto e = ReloadEvent::from_json(nlohmann::json::parse(R"({"type":"notify","message":"bad","error":true})"));
    EXPECT_EQ(e.type, ReloadEvent::Type::Notify);
    EXPECT_EQ(e.message, "bad");
    EXPECT_TRUE(e.error);

    auto r = ReloadEvent::from_json(nlohmann::json::parse(R"({"type":"reload","href":"/x/"})"));
    ASSERT_TRUE(r.href.has_value());
    EXPECT_EQ(*r.href, "/x/");
}

TEST(ReloadEventTest, RejectsInvalidEvents) {
    EXPECT_THROW(ReloadEvent::from_json(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(ReloadEvent::from_json(nlohmann::json({{"kind", "start"}})), std::invalid_argument);
    EXPECT_THROW(ReloadEvent::from_json(nlohmann::json({{"type", "explode"}})), std::invalid_argument);
}

// ============================================================================
// Coordinator
// ============================================================================

TEST(ReloadCoordinatorTest, BroadcastReachesEverySubscriber) {
    ReloadCoordinator coordinator;
    auto a = coordinator.subscribe();
    auto b = coordinator.subscribe();
    EXPECT_EQ(coordinator.client_count(), 2u);
    EXPECT_EQ(coordinator.broadcast(ReloadEvent::start()), 2u);
    EXPECT_EQ(a->size(), 1u);
    EXPECT_EQ(b->size(), 1u);
}

TEST(ReloadCoordinatorTest, LateSubscribersSeeNoReplay) {
    ReloadCoordinator coordinator;
    EXPECT_EQ(coordinator.broadcast(ReloadEvent::reload()), 0u);

    auto late = coordinator.subscribe();
    EXPECT_EQ(late->size(), 0u);
}

TEST(ReloadCoordinatorTest, UnsubscribedClientsStopReceiving) {
    ReloadCoordinator coordinator;
    auto a = coordinator.subscribe();
    auto b = coordinator.subscribe();
    coordinator.unsubscribe(a);

    EXPECT_EQ(coordinator.broadcast(ReloadEvent::start()), 1u);
    EXPECT_EQ(a->size(), 0u);
    EXPECT_EQ(b->size(), 1u);
}

TEST(ReloadCoordinatorTest, CloseAllStopsChannels) {
    ReloadCoordinator coordinator;
    auto a = coordinator.subscribe();
    coordinator.close_all();
    EXPECT_TRUE(a->stopped());
    EXPECT_EQ(coordinator.client_count(), 0u);
    EXPECT_EQ(coordinator.broadcast(ReloadEvent::start()), 0u);
}

// ============================================================================
// Client state model
// ============================================================================

TEST(ReloadClientTest, BuildCycle) {
    ReloadClient client("http://localhost:8080/");
    EXPECT_EQ(client.state(), ReloadClient::State::Idle);

    client.handle(ReloadEvent::start());
    EXPECT_EQ(client.state(), ReloadClient::State::Building);
    EXPECT_EQ(client.message(), "Building...");

    client.handle(ReloadEvent::notify("1 rendered", false));
    EXPECT_EQ(client.state(), ReloadClient::State::Idle);

    client.handle(ReloadEvent::reload());
    EXPECT_EQ(client.state(), ReloadClient::State::Reloaded);
    EXPECT_FALSE(client.connected());

    // Disconnected: nothing more is seen
    client.handle(ReloadEvent::reload());
    EXPECT_EQ(client.reloads(), 1);
}

TEST(ReloadClientTest, ErrorNotificationKeepsConnection) {
    ReloadClient client("/");
    client.handle(ReloadEvent::start());
    client.handle(ReloadEvent::notify("1 failed", true));
    EXPECT_EQ(client.state(), ReloadClient::State::IdleWithError);
    EXPECT_TRUE(client.connected());
    EXPECT_EQ(client.reloads(), 0);
    EXPECT_STREQ(to_string(client.state()), "idle-with-error");
}

TEST(ReloadClientTest, ReloadCanNavigate) {
    ReloadClient client("/old/");
    client.handle(ReloadEvent::reload("/new/"));
    EXPECT_EQ(client.location(), "/new/");
}

TEST(ReloadClientTest, HistoryReplayIsNotAnnounced) {
    auto announced = ReloadClient("/a/").announcement();
    ASSERT_TRUE(announced.has_value());
    EXPECT_EQ(*announced, "/a/");
    EXPECT_FALSE(ReloadClient("/a/?history=1").announcement().has_value());
}

TEST(ReloadClientTest, HistoryMarker) {
    EXPECT_EQ(mark_history_replay("/a/"), "/a/?history=1");
    EXPECT_EQ(mark_history_replay("/a/?x=2"), "/a/?x=2&history=1");
    EXPECT_EQ(mark_history_replay("/a/#top"), "/a/?history=1#top");
    EXPECT_EQ(mark_history_replay("/a/?history=1"), "/a/?history=1");

    EXPECT_TRUE(is_history_replay("/a/?x=1&history=1"));
    EXPECT_FALSE(is_history_replay("/a/?histories=1"));
    EXPECT_FALSE(is_history_replay("/a/#?history=1"));
}

TEST(ReloadScriptTest, ScriptTalksToTheEventStream) {
    auto script = livereload_script();
    EXPECT_NE(script.find(kEventsPath), std::string::npos);
    EXPECT_NE(script.find("EventSource"), std::string::npos);
    EXPECT_NE(script.find(kHistoryParam), std::string::npos);
    EXPECT_EQ(livereload_tag(), "<script src=\"/__livereload.js\"></script>");
}

// ============================================================================
// Build passes through the protocol
// ============================================================================

class ReloadBuildTest : public SiteTest {
protected:
    ReloadCoordinator coordinator_;

    void SetUp() override {
        SiteTest::SetUp();
        config_.live.enabled = true;
        write("index.md", "# Home\n");
    }
};

TEST_F(ReloadBuildTest, SuccessfulPassReloadsOnce) {
    auto channel = coordinator_.subscribe();
    ReloadClient client("http://localhost:8080/");

    Builder builder(config_, std::make_unique<NoBooks>());
    auto report = build_and_notify(builder, coordinator_);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(channel->size(), 3u);

    ReloadEvent event;
    ASSERT_TRUE(channel->pop_for(event, std::chrono::milliseconds(0)));
    client.handle(event);
    EXPECT_EQ(client.state(), ReloadClient::State::Building);

    ASSERT_TRUE(channel->pop_for(event, std::chrono::milliseconds(0)));
    client.handle(event);
    EXPECT_EQ(client.state(), ReloadClient::State::Idle);
    EXPECT_EQ(client.message(), report.summary());

    deliver(*channel, client);
    EXPECT_EQ(client.state(), ReloadClient::State::Reloaded);
    EXPECT_EQ(client.reloads(), 1);

    EXPECT_TRUE(output_exists(kScriptFile));
    EXPECT_NE(read_output("index.html").find(livereload_tag()), std::string::npos);
}

TEST_F(ReloadBuildTest, FailedPassDoesNotReload) {
    write("ok.md", "fine");
    write("broken.html", "{{ nowhere }}");
    auto channel = coordinator_.subscribe();
    ReloadClient client("/");

    Builder builder(config_, std::make_unique<NoBooks>());
    auto report = build_and_notify(builder, coordinator_);
    EXPECT_FALSE(report.ok());

    deliver(*channel, client);
    EXPECT_EQ(client.state(), ReloadClient::State::IdleWithError);
    EXPECT_EQ(client.reloads(), 0);
    EXPECT_TRUE(client.connected());
}
