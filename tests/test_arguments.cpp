#include <gtest/gtest.h>
#include <cli/arguments.hpp>

TEST(Arguments, MinimalPositional) {
    auto result = parse_arguments({"192.168.1.100", "user", "commands.txt"});
    ASSERT_TRUE(result.is_ok()) << result.error;

    const CliOptions& o = result.value;
    EXPECT_EQ(o.mode, CliMode::RUN);
    EXPECT_EQ(o.host, "192.168.1.100");
    EXPECT_EQ(o.username, "user");
    EXPECT_EQ(o.commands_file, "commands.txt");
    EXPECT_TRUE(o.password.empty());
    EXPECT_TRUE(o.key_path.empty());
    EXPECT_EQ(o.port, 22);
    EXPECT_FALSE(o.verbose);
}

TEST(Arguments, AllPositional) {
    auto result = parse_arguments({"host", "user", "cmds.txt", "pw", "/keys/id_rsa", "2222"});
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.password, "pw");
    EXPECT_EQ(result.value.key_path, "/keys/id_rsa");
    EXPECT_EQ(result.value.port, 2222);
}

TEST(Arguments, EmptyPasswordWithKey) {
    auto result = parse_arguments({"host", "user", "cmds.txt", "", "~/.ssh/id_rsa"});
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_TRUE(result.value.password.empty());
    EXPECT_EQ(result.value.key_path, "~/.ssh/id_rsa");
}

TEST(Arguments, RejectsBadPort) {
    EXPECT_TRUE(parse_arguments({"h", "u", "c", "", "", "ssh"}).is_err());
    EXPECT_TRUE(parse_arguments({"h", "u", "c", "", "", "0"}).is_err());
    EXPECT_TRUE(parse_arguments({"h", "u", "c", "", "", "65536"}).is_err());
    EXPECT_TRUE(parse_arguments({"h", "u", "c", "", "", "22x"}).is_err());
}

TEST(Arguments, RejectsWrongArity) {
    EXPECT_TRUE(parse_arguments({"host", "user"}).is_err());
    EXPECT_TRUE(parse_arguments({"h", "u", "c", "p", "k", "22", "extra"}).is_err());
}

TEST(Arguments, ConfigMode) {
    auto plain = parse_arguments({"--config"});
    ASSERT_TRUE(plain.is_ok());
    EXPECT_EQ(plain.value.mode, CliMode::CONFIG);
    EXPECT_EQ(plain.value.config_path, "config.json");

    auto custom = parse_arguments({"--config", "prod.yaml"});
    ASSERT_TRUE(custom.is_ok());
    EXPECT_EQ(custom.value.config_path, "prod.yaml");
}

TEST(Arguments, CreateExampleMode) {
    auto result = parse_arguments({"--create-example"});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.mode, CliMode::CREATE_EXAMPLE);
    EXPECT_EQ(result.value.example_path, "test_commands.txt");
}

TEST(Arguments, VerboseAnywhere) {
    auto result = parse_arguments({"host", "-v", "user", "cmds.txt"});
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_TRUE(result.value.verbose);
    EXPECT_EQ(result.value.username, "user");
}

TEST(Arguments, HelpAndVersion) {
    EXPECT_EQ(parse_arguments({"--help"}).value.mode, CliMode::HELP);
    EXPECT_EQ(parse_arguments({"--version"}).value.mode, CliMode::VERSION);
}

TEST(Arguments, RejectsUnknownAndConflictingOptions) {
    EXPECT_TRUE(parse_arguments({"--frobnicate"}).is_err());
    EXPECT_TRUE(parse_arguments({"--config", "--create-example"}).is_err());
}
