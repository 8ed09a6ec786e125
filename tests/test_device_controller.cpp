#include <gtest/gtest.h>
#include "fakes.hpp"
#include <connection/direct_connection.hpp>
#include <connection/proxy_connection.hpp>
#include <device/device_controller.hpp>
#include <device/device_factory.hpp>
#include <core/constants.hpp>

static DeviceTarget test_target() {
    DeviceTarget t;
    t.host = "192.168.1.50";
    return t;
}

static ControllerOptions test_options() {
    ControllerOptions options;
    options.name = "Living Room";
    options.apps = {{"com.netflix.ninja", "Netflix"}};
    return options;
}

// ── Direct backend ──────────────────────────────────────────

class DirectControllerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeDevice> device = std::make_shared<FakeDevice>();
    LogCapture logs;

    std::unique_ptr<DeviceController> make(bool connect = true,
                                           ControllerOptions options = test_options()) {
        auto conn = std::make_unique<DirectConnection>(test_target(), std::nullopt, fake_factory(device));
        if (connect) conn->connect();
        return std::make_unique<AndroidTvController>(std::move(conn), std::move(options));
    }
};

TEST_F(DirectControllerTest, InitialAvailabilityFollowsManager) {
    EXPECT_TRUE(make(true)->available());
    EXPECT_FALSE(make(false)->available());
}

TEST_F(DirectControllerTest, RefreshReportsState) {
    device->result = ShellResult::Output("playing com.netflix.ninja 7 0\n");
    auto ctl = make();

    auto status = ctl->refresh();
    EXPECT_EQ(status.state, DeviceState::PLAYING);
    EXPECT_EQ(status.current_app, "com.netflix.ninja");
    EXPECT_EQ(status.app_name, "Netflix");
    EXPECT_EQ(status.volume, 7);
    EXPECT_EQ(status.is_volume_muted, false);
    EXPECT_EQ(ctl->state(), DeviceState::PLAYING);
    EXPECT_EQ(device->last_command(), CMD_UPDATE);
}

TEST_F(DirectControllerTest, FiveFailedRefreshes) {
    auto ctl = make();
    ASSERT_TRUE(ctl->available());
    logs.clear();

    device->result = ShellResult::Err(TransportError::BROKEN_PIPE, "broken pipe");
    device->open_ok = false;

    for (int i = 0; i < 5; i++) {
        auto status = ctl->refresh();
        EXPECT_FALSE(status.state.has_value());
        EXPECT_FALSE(ctl->available());
        EXPECT_FALSE(ctl->state().has_value());
    }

    auto levels = logs.problem_levels();
    ASSERT_EQ(levels.size(), 2u);
    EXPECT_EQ(levels[0], LogLevel::ERROR);
    EXPECT_EQ(levels[1], LogLevel::WARNING);
}

TEST_F(DirectControllerTest, RecoveryTakesOneCycleToReconnect) {
    auto ctl = make();
    device->result = ShellResult::Err(TransportError::TIMEOUT, "timed out");
    ctl->refresh();
    ASSERT_FALSE(ctl->available());
    logs.clear();

    device->result = ShellResult::Output("paused com.netflix.ninja 4 0");
    int executes = device->executes.load();

    // Reconnects only
    auto first = ctl->refresh();
    EXPECT_TRUE(ctl->available());
    EXPECT_FALSE(first.state.has_value());
    EXPECT_EQ(device->executes.load(), executes);
    EXPECT_EQ(logs.containing("successfully established"), 1);

    auto second = ctl->refresh();
    EXPECT_EQ(second.state, DeviceState::PAUSED);
    EXPECT_EQ(logs.containing("successfully established"), 1);
    EXPECT_EQ(logs.problems(), 0);
}

TEST_F(DirectControllerTest, UnrecognizedStateMakesUnavailable) {
    device->result = ShellResult::Output("1 com.app.foo 3");
    auto ctl = make();

    auto status = ctl->refresh();
    EXPECT_FALSE(status.state.has_value());
    EXPECT_FALSE(ctl->available());
    EXPECT_FALSE(ctl->state().has_value());
    EXPECT_EQ(logs.count(LogLevel::WARNING), 1);
}

TEST_F(DirectControllerTest, NoOutputMakesUnavailable) {
    device->result = ShellResult::None();
    auto ctl = make();

    EXPECT_FALSE(ctl->refresh().state.has_value());
    EXPECT_FALSE(ctl->available());
}

TEST_F(DirectControllerTest, UnexpectedErrorKindThrows) {
    // Resets are reported as BROKEN_PIPE by direct transports
    device->result = ShellResult::Err(TransportError::CONNECTION_RESET, "reset");
    auto ctl = make();

    try {
        ctl->refresh();
        FAIL() << "expected TransportFault";
    } catch (const TransportFault& e) {
        EXPECT_EQ(e.backend(), Backend::DIRECT);
        EXPECT_EQ(e.error(), TransportError::CONNECTION_RESET);
    }
}

TEST_F(DirectControllerTest, CollaboratorExceptionsPropagate) {
    device->handler = [](const std::string&) -> ShellResult {
        throw std::runtime_error("bug");
    };
    auto ctl = make();
    EXPECT_THROW(ctl->command("ls"), std::runtime_error);
}

TEST_F(DirectControllerTest, KeyCommand) {
    auto ctl = make();
    EXPECT_FALSE(ctl->command("HOME").has_value());
    EXPECT_EQ(device->last_command(), "input keyevent 3");
}

TEST_F(DirectControllerTest, KeyCommandClearsLastResponse) {
    device->result = ShellResult::Output("hello\n");
    auto ctl = make();
    ASSERT_EQ(ctl->command("echo hello"), "hello");

    ctl->command("HOME");
    EXPECT_FALSE(ctl->last_response().has_value());
}

TEST_F(DirectControllerTest, RawCommandReturnsStrippedOutput) {
    device->result = ShellResult::Output("  hello world \n");
    auto ctl = make();

    EXPECT_EQ(ctl->command("echo hello world"), "hello world");
    EXPECT_EQ(ctl->last_response(), "hello world");
    EXPECT_EQ(device->last_command(), "echo hello world");
}

TEST_F(DirectControllerTest, RawCommandEmptyOutput) {
    device->result = ShellResult::Output(" \n");
    auto ctl = make();
    EXPECT_FALSE(ctl->command("true").has_value());
    EXPECT_FALSE(ctl->last_response().has_value());
}

TEST_F(DirectControllerTest, GetPropertiesFormatsStatus) {
    device->result = ShellResult::Output("idle com.netflix.ninja 2 1");
    auto ctl = make();

    auto text = ctl->command("GET_PROPERTIES");
    ASSERT_TRUE(text.has_value());
    EXPECT_NE(text->find("state: idle"), std::string::npos);
    EXPECT_NE(text->find("Netflix"), std::string::npos);
    EXPECT_NE(text->find("muted: yes"), std::string::npos);
}

TEST_F(DirectControllerTest, CommandsAreNoOpsWhileUnavailable) {
    auto ctl = make(false);
    EXPECT_FALSE(ctl->command("ls").has_value());
    ctl->media_play();
    ctl->turn_on();
    EXPECT_EQ(device->executes.load(), 0);
    EXPECT_EQ(logs.problems(), 0);
}

TEST_F(DirectControllerTest, RecoverableCommandErrorClosesConnection) {
    auto ctl = make();
    device->result = ShellResult::Err(TransportError::INVALID_RESPONSE, "bad packet");

    EXPECT_FALSE(ctl->command("ls").has_value());
    EXPECT_FALSE(ctl->available());
    EXPECT_FALSE(ctl->manager().connected());
    EXPECT_EQ(logs.count(LogLevel::ERROR), 1);
    EXPECT_EQ(logs.containing("Connection re-establishing attempt in the next update"), 1);

    // Next command is a no-op until refresh() reconnects
    EXPECT_FALSE(ctl->command("ls").has_value());
    EXPECT_EQ(logs.count(LogLevel::ERROR), 1);
}

TEST_F(DirectControllerTest, PowerCommands) {
    auto ctl = make();
    ctl->turn_on();
    EXPECT_EQ(device->last_command(), "input keyevent 224");
    ctl->turn_off();
    EXPECT_EQ(device->last_command(), "input keyevent 223");

    auto options = test_options();
    options.turn_on_command = "input keyevent 26";
    options.turn_off_command = "input keyevent 26 && input keyevent 223";
    auto custom = make(true, options);
    custom->turn_on();
    EXPECT_EQ(device->last_command(), "input keyevent 26");
    custom->turn_off();
    EXPECT_EQ(device->last_command(), "input keyevent 26 && input keyevent 223");
}

TEST_F(DirectControllerTest, MediaCommands) {
    auto ctl = make();
    ctl->media_play();
    EXPECT_EQ(device->last_command(), "input keyevent 126");
    ctl->media_pause();
    EXPECT_EQ(device->last_command(), "input keyevent 127");
    ctl->media_play_pause();
    EXPECT_EQ(device->last_command(), "input keyevent 85");
    ctl->media_stop();
    EXPECT_EQ(device->last_command(), "input keyevent 86");
    ctl->media_next_track();
    EXPECT_EQ(device->last_command(), "input keyevent 87");
    ctl->media_previous_track();
    EXPECT_EQ(device->last_command(), "input keyevent 88");
    ctl->volume_up();
    EXPECT_EQ(device->last_command(), "input keyevent 24");
    ctl->volume_down();
    EXPECT_EQ(device->last_command(), "input keyevent 25");
    ctl->mute_volume();
    EXPECT_EQ(device->last_command(), "input keyevent 164");
}

TEST_F(DirectControllerTest, SelectSource) {
    auto ctl = make();
    ctl->select_source("Netflix");
    EXPECT_EQ(device->last_command(),
              "monkey -p 'com.netflix.ninja' -c android.intent.category.LAUNCHER 1");

    ctl->select_source("com.example.app");
    EXPECT_EQ(device->last_command(),
              "monkey -p 'com.example.app' -c android.intent.category.LAUNCHER 1");

    ctl->select_source("!Netflix");
    EXPECT_EQ(device->last_command(), "am force-stop 'com.netflix.ninja'");

    EXPECT_THROW(ctl->select_source("!"), std::invalid_argument);
}

TEST_F(DirectControllerTest, FetchProperties) {
    device->result = ShellResult::Output("SERIAL123\nGoogle\nChromecast\n12\n00:11:22:33:44:55\n");
    auto ctl = make();

    EXPECT_FALSE(ctl->unique_id().has_value());
    auto props = ctl->fetch_properties();
    EXPECT_EQ(props["model"], "Chromecast");
    EXPECT_EQ(ctl->unique_id(), "SERIAL123");
    EXPECT_EQ(device->last_command(), CMD_DEVICE_PROPERTIES);
}

TEST_F(DirectControllerTest, StartReadsPropertiesAfterConnect) {
    device->result = ShellResult::Output("SERIAL123\nGoogle\nChromecast\n12\n00:11:22:33:44:55\n");
    auto config = Config::parse("device:\n  host: 192.168.1.50\n");
    ASSERT_TRUE(config.is_ok()) << config.error;

    auto conn = std::make_unique<DirectConnection>(test_target(), std::nullopt, fake_factory(device));
    auto ctl = start_controller(config.value, std::move(conn));

    EXPECT_TRUE(ctl->available());
    EXPECT_EQ(ctl->unique_id(), "SERIAL123");
    EXPECT_EQ(device->last_command(), CMD_DEVICE_PROPERTIES);
}

TEST_F(DirectControllerTest, StartWithoutConnectionSkipsProperties) {
    device->open_ok = false;
    auto config = Config::parse("device:\n  host: 192.168.1.50\n");
    ASSERT_TRUE(config.is_ok()) << config.error;

    auto conn = std::make_unique<DirectConnection>(test_target(), std::nullopt, fake_factory(device));
    auto ctl = start_controller(config.value, std::move(conn));

    EXPECT_FALSE(ctl->available());
    EXPECT_FALSE(ctl->unique_id().has_value());
    EXPECT_EQ(device->executes.load(), 0);
}

// ── Fire TV ─────────────────────────────────────────────────

TEST_F(DirectControllerTest, FireTvReportsRunningApps) {
    device->result = ShellResult::Output("playing com.amazon.tv 5 0\ncom.amazon.tv\ncom.netflix.ninja\n");
    auto conn = std::make_unique<DirectConnection>(test_target(), std::nullopt, fake_factory(device));
    conn->connect();
    FireTvController ctl(std::move(conn), test_options());

    auto status = ctl.refresh();
    EXPECT_EQ(ctl.device_class(), DeviceClass::FIRE_TV);
    EXPECT_EQ(status.state, DeviceState::PLAYING);
    ASSERT_EQ(status.running_apps.size(), 2u);
    EXPECT_FALSE(status.volume.has_value());
    EXPECT_EQ(device->last_command(), std::string(CMD_UPDATE) + CMD_RUNNING_APPS);
}

TEST_F(DirectControllerTest, FireTvWithoutSources) {
    device->result = ShellResult::Output("idle - - 0\ncom.amazon.tv\n");
    auto options = test_options();
    options.get_sources = false;
    auto conn = std::make_unique<DirectConnection>(test_target(), std::nullopt, fake_factory(device));
    conn->connect();
    FireTvController ctl(std::move(conn), options);

    auto status = ctl.refresh();
    EXPECT_EQ(status.state, DeviceState::IDLE);
    EXPECT_TRUE(status.running_apps.empty());
    EXPECT_EQ(device->last_command(), CMD_UPDATE);
}

// ── Proxy backend ───────────────────────────────────────────

class ProxyControllerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeProxyServer> server = std::make_shared<FakeProxyServer>();
    LogCapture logs;

    void SetUp() override {
        server->serials = {"192.168.1.50:5555"};
    }

    std::unique_ptr<DeviceController> make(bool connect = true) {
        auto conn = std::make_unique<ProxyConnection>(test_target(),
                                                      std::make_unique<FakeProxyClient>(server));
        if (connect) conn->connect();
        return std::make_unique<AndroidTvController>(std::move(conn), test_options());
    }
};

TEST_F(ProxyControllerTest, InitialAvailabilityIsProbedLive) {
    EXPECT_TRUE(make(true)->available());

    // The proxy server already holds the device
    EXPECT_TRUE(make(false)->available());

    server->serials.clear();
    EXPECT_FALSE(make(false)->available());
}

TEST_F(ProxyControllerTest, FiveFailedRefreshes) {
    auto ctl = make();
    ASSERT_TRUE(ctl->available());
    logs.clear();

    server->device->result = ShellResult::Err(TransportError::CONNECTION_RESET, "reset");
    server->devices_fail = true;

    for (int i = 0; i < 5; i++) {
        EXPECT_FALSE(ctl->refresh().state.has_value());
        EXPECT_FALSE(ctl->available());
    }

    auto levels = logs.problem_levels();
    ASSERT_EQ(levels.size(), 2u);
    EXPECT_EQ(levels[0], LogLevel::ERROR);
    EXPECT_EQ(levels[1], LogLevel::WARNING);
}

TEST_F(ProxyControllerTest, RecoveryReportsStateImmediately) {
    auto ctl = make();
    server->device->result = ShellResult::Err(TransportError::RPC_FAILURE, "device offline");
    ctl->refresh();
    ASSERT_FALSE(ctl->available());
    logs.clear();

    server->device->result = ShellResult::Output("playing com.netflix.ninja 3 0");
    auto status = ctl->refresh();
    EXPECT_TRUE(ctl->available());
    EXPECT_EQ(status.state, DeviceState::PLAYING);
    EXPECT_EQ(logs.containing("successfully established"), 1);
    EXPECT_EQ(logs.problems(), 0);
}

TEST_F(ProxyControllerTest, UnrecognizedStateMakesUnavailable) {
    server->device->result = ShellResult::Output("1 com.app.foo 3");
    auto ctl = make();
    EXPECT_FALSE(ctl->refresh().state.has_value());
    EXPECT_FALSE(ctl->available());
}

TEST_F(ProxyControllerTest, DirectOnlyErrorKindThrows) {
    server->device->result = ShellResult::Err(TransportError::TIMEOUT, "timeout");
    auto ctl = make();
    EXPECT_THROW(ctl->command("ls"), TransportFault);
}
