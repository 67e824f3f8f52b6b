#include <gtest/gtest.h>
#include <cli/sshbatch_cli.hpp>
#include <core/log.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include "fake_transport.hpp"

namespace fs = std::filesystem;

class CliTest : public ::testing::Test {
protected:
    fs::path test_dir;
    FakeTransport transport;
    std::ostringstream out;
    std::ostringstream log_sink;
    LogLevel saved_level = LogLevel::INFO;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sshbatch_cli_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        saved_level = logging::level();
        logging::set_console(&log_sink);
    }

    void TearDown() override {
        logging::set_console(nullptr);
        logging::set_level(saved_level);
        fs::remove_all(test_dir);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        std::ofstream(path) << content;
        return path.string();
    }

    int run(const std::vector<std::string>& args) {
        SshBatchCLI cli(transport, out);
        cli.set_password_prompt([](const std::string&) { return std::string(); });
        return cli.run(args);
    }

    bool printed(const std::string& text) const {
        return out.str().find(text) != std::string::npos;
    }
};

TEST_F(CliTest, NoArgumentsPrintsUsage) {
    EXPECT_EQ(run({}), 1);
    EXPECT_TRUE(printed("Usage"));
    EXPECT_EQ(transport.connect_count, 0);
}

TEST_F(CliTest, HelpExitsCleanly) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_TRUE(printed("--create-example"));
}

TEST_F(CliTest, BadArgumentsFail) {
    EXPECT_EQ(run({"host", "user"}), 1);
    EXPECT_TRUE(printed("Usage"));
}

TEST_F(CliTest, MissingCommandsFileNeverConnects) {
    EXPECT_EQ(run({"host", "user", (test_dir / "absent.txt").string(), "pw"}), 1);
    EXPECT_TRUE(printed("Commands file not found"));
    EXPECT_EQ(transport.connect_count, 0);
}

TEST_F(CliTest, EmptyCommandsFileNeverConnects) {
    auto cmds = write_file("empty.txt", "# nothing here\n\n");
    EXPECT_EQ(run({"host", "user", cmds, "pw"}), 1);
    EXPECT_TRUE(printed("No commands to execute"));
    EXPECT_EQ(transport.connect_count, 0);
}

TEST_F(CliTest, MissingCredentialsNeverConnect) {
    auto cmds = write_file("cmds.txt", "uptime\n");
    EXPECT_EQ(run({"host", "user", cmds}), 1);
    EXPECT_TRUE(printed("No authentication method provided"));
    EXPECT_EQ(transport.connect_count, 0);
}

TEST_F(CliTest, SuccessfulRun) {
    auto cmds = write_file("cmds.txt", "uptime\n");
    EXPECT_EQ(run({"10.0.0.5", "deploy", cmds, "pw", "", "2222"}), 0);

    EXPECT_EQ(transport.last_params.port, 2222);
    EXPECT_EQ(transport.last_params.auth, AuthMethod::PASSWORD);
    EXPECT_TRUE(printed("STDOUT:\nuptime ok\n"));
    EXPECT_TRUE(printed("Execution complete: 1/1 commands successful"));
    EXPECT_TRUE(printed("All commands executed successfully"));
}

TEST_F(CliTest, ConnectFailureReported) {
    auto cmds = write_file("cmds.txt", "uptime\n");
    transport.fail_with = ConnectFailure::NETWORK;
    transport.fail_message = "Connection refused";

    EXPECT_EQ(run({"host", "user", cmds, "pw"}), 1);
    EXPECT_TRUE(printed("Failed to establish SSH connection"));
    EXPECT_TRUE(printed("Connection refused"));
    EXPECT_FALSE(printed("Execution complete"));
}

TEST_F(CliTest, ConfigModeRunsBatch) {
    auto cmds = write_file("cmds.txt", "echo one\nfalse\necho three\n");
    auto config = write_file("config.yaml",
        "hostname: 10.0.0.5\n"
        "username: deploy\n"
        "password: secret\n"
        "commands_file: " + cmds + "\n"
        "command_delay_ms: 0\n");
    transport.outcomes = {
        FakeTransport::exit_with(0, "one\n"),
        FakeTransport::exit_with(1),
        FakeTransport::exit_with(0, "three\n"),
    };

    EXPECT_EQ(run({"--config", config}), 1);
    EXPECT_EQ(transport.attempted.size(), 3u);
    EXPECT_EQ(transport.last_params.host, "10.0.0.5");
    EXPECT_TRUE(printed("Execution complete: 2/3 commands successful"));
    EXPECT_TRUE(printed("Some commands failed to execute"));
}

TEST_F(CliTest, ConfigModeMissingFileWritesTemplate) {
    auto config = test_dir / "config.json";
    EXPECT_EQ(run({"--config", config.string()}), 1);
    EXPECT_TRUE(fs::exists(config));
    EXPECT_EQ(transport.connect_count, 0);
}

TEST_F(CliTest, ConnectionLossReported) {
    auto cmds = write_file("cmds.txt", "echo one\necho two\n");
    auto config = write_file("config.yaml",
        "hostname: h\nusername: u\npassword: p\ncommands_file: " + cmds + "\ncommand_delay_ms: 0\n");
    transport.outcomes = {CommandOutcome::connection_lost("socket closed by peer")};

    EXPECT_EQ(run({"--config", config}), 1);
    EXPECT_TRUE(printed("Execution complete: 0/2 commands successful"));
    EXPECT_TRUE(printed("socket closed by peer"));
    EXPECT_EQ(transport.close_count, 1);
}

TEST_F(CliTest, CreateExample) {
    auto path = test_dir / "example.txt";
    EXPECT_EQ(run({"--create-example", path.string()}), 0);
    ASSERT_TRUE(fs::exists(path));

    std::ifstream in(path);
    std::string first;
    std::getline(in, first);
    EXPECT_EQ(first[0], '#');
}

static CharSource scripted(const std::string& keys, int tail) {
    auto pos = std::make_shared<size_t>(0);
    return [keys, tail, pos](char& c) {
        if (*pos >= keys.size()) return tail;
        c = keys[(*pos)++];
        return 1;
    };
}

TEST(PasswordInput, EnterEndsAndBackspaceErases) {
    EXPECT_EQ(collect_password(scripted("hunx\x7fter2\n", 0)), "hunter2");
    EXPECT_EQ(collect_password(scripted("abc", 0)), "abc");
}

TEST(PasswordInput, TimeoutDiscardsPartialInput) {
    EXPECT_EQ(collect_password(scripted("hunt", -1)), "");
}
