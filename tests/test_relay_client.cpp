#include <gtest/gtest.h>
#include "fakes.hpp"
#include <transport/ssh_relay_client.hpp>

TEST(AdbDevicesTest, Parse) {
    auto serials = parse_adb_devices(
        "* daemon not running; starting now at tcp:5037\n"
        "* daemon started successfully\n"
        "List of devices attached\n"
        "192.168.1.50:5555\tdevice\n"
        "192.168.1.51:5555\toffline\n"
        "emulator-5554\tdevice product:sdk model:sdk\n"
        "10.0.0.9:5555\tunauthorized\n"
        "\n");
    ASSERT_EQ(serials.size(), 2u);
    EXPECT_EQ(serials[0], "192.168.1.50:5555");
    EXPECT_EQ(serials[1], "emulator-5554");
}

TEST(AdbDevicesTest, Empty) {
    EXPECT_TRUE(parse_adb_devices("List of devices attached\n\n").empty());
    EXPECT_TRUE(parse_adb_devices("").empty());
}

class RelayClientTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeDevice> relay = std::make_shared<FakeDevice>();
    LogCapture logs;

    std::unique_ptr<SshRelayClient> make() {
        ProxyConfig config;
        config.host = "relay.local";
        config.user = "pi";
        return std::make_unique<SshRelayClient>(config, std::nullopt,
                                                std::make_unique<FakeTransport>(relay));
    }
};

TEST_F(RelayClientTest, Server) {
    EXPECT_EQ(make()->server(), "relay.local:22");
}

TEST_F(RelayClientTest, OpensLazilyOnce) {
    relay->result = ShellResult::Output("List of devices attached\n");
    auto client = make();
    EXPECT_EQ(relay->opens.load(), 0);

    ASSERT_TRUE(client->devices().is_ok());
    ASSERT_TRUE(client->devices().is_ok());
    EXPECT_EQ(relay->opens.load(), 1);
}

TEST_F(RelayClientTest, RemoteConnect) {
    relay->result = ShellResult::Output("connected to 192.168.1.50:5555\n");
    auto client = make();
    EXPECT_TRUE(client->remote_connect("192.168.1.50", 5555).is_ok());
    EXPECT_EQ(relay->last_command(), "adb connect '192.168.1.50:5555'");

    relay->result = ShellResult::Output("already connected to 192.168.1.50:5555\n");
    EXPECT_TRUE(client->remote_connect("192.168.1.50", 5555).is_ok());

    relay->result = ShellResult::Output("failed to connect to '192.168.1.50:5555': Connection refused\n");
    EXPECT_TRUE(client->remote_connect("192.168.1.50", 5555).is_err());
}

TEST_F(RelayClientTest, DevicesAndShell) {
    relay->handler = [](const std::string& cmd) {
        if (cmd == "adb devices") {
            return ShellResult::Output("List of devices attached\n192.168.1.50:5555\tdevice\n");
        }
        return ShellResult::Output("hello\n");
    };
    auto client = make();

    auto list = client->devices();
    ASSERT_TRUE(list.is_ok());
    ASSERT_EQ(list.value.size(), 1u);

    auto serial = list.value[0]->serial_no();
    ASSERT_TRUE(serial.is_ok());
    EXPECT_EQ(serial.value, "192.168.1.50:5555");

    auto r = list.value[0]->shell("echo 'hi'");
    EXPECT_EQ(r.output, "hello\n");
    EXPECT_EQ(relay->last_command(), "adb -s '192.168.1.50:5555' shell 'echo '\\''hi'\\'''");
}

TEST_F(RelayClientTest, AdbErrorIsRpcFailure) {
    relay->handler = [](const std::string& cmd) {
        if (cmd == "adb devices") {
            return ShellResult::Output("List of devices attached\n192.168.1.50:5555\tdevice\n");
        }
        ShellResult r = ShellResult::None();
        r.stderr_data = "error: device offline\n";
        r.exit_status = 1;
        return r;
    };
    auto client = make();
    auto list = client->devices();
    ASSERT_TRUE(list.is_ok());

    auto r = list.value[0]->shell("ls");
    EXPECT_EQ(r.error, TransportError::RPC_FAILURE);
}

TEST_F(RelayClientTest, DeviceCommandExitStatusIsNotAnError) {
    relay->handler = [](const std::string& cmd) {
        if (cmd == "adb devices") {
            return ShellResult::Output("List of devices attached\n192.168.1.50:5555\tdevice\n");
        }
        ShellResult r = ShellResult::None();
        r.stderr_data = "ls: /nope: No such file or directory\n";
        r.exit_status = 1;
        return r;
    };
    auto client = make();
    auto list = client->devices();
    ASSERT_TRUE(list.is_ok());
    EXPECT_TRUE(list.value[0]->shell("ls /nope").ok());
}

TEST_F(RelayClientTest, LostSessionIsConnectionReset) {
    relay->result = ShellResult::Err(TransportError::BROKEN_PIPE, "socket closed");
    auto client = make();

    auto r = client->run("adb devices");
    EXPECT_EQ(r.error, TransportError::CONNECTION_RESET);
    EXPECT_EQ(relay->closes.load(), 1);

    // The next call reopens the session
    relay->result = ShellResult::Output("List of devices attached\n");
    EXPECT_TRUE(client->devices().is_ok());
    EXPECT_EQ(relay->opens.load(), 2);
}

TEST_F(RelayClientTest, UnreachableRelay) {
    relay->open_ok = false;
    auto client = make();
    auto list = client->devices();
    EXPECT_TRUE(list.is_err());
    EXPECT_EQ(relay->executes.load(), 0);
}

TEST_F(RelayClientTest, DevicesExitStatus) {
    ShellResult r = ShellResult::None();
    r.exit_status = 127;
    r.stderr_data = "adb: not found";
    relay->result = r;
    auto client = make();
    auto list = client->devices();
    ASSERT_TRUE(list.is_err());
    EXPECT_NE(list.error.find("adb: not found"), std::string::npos);
}
