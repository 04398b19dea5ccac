#include <gtest/gtest.h>
#include "chunkvault/core/cli.hpp"
#include "chunkvault/core/errors.hpp"
#include <sstream>

using namespace chunkvault::core;

TEST(CommandLineTest, NoArgumentsUsesDefaults) {
    auto invocation = CommandLine::parse(std::vector<std::string>{});
    
    EXPECT_EQ(invocation.config_path, "chunkvault.conf");
    EXPECT_FALSE(invocation.data_dir.has_value());
    EXPECT_FALSE(invocation.verbose);
    EXPECT_FALSE(invocation.show_help);
    EXPECT_TRUE(invocation.command.empty());
    EXPECT_TRUE(invocation.args.empty());
}

TEST(CommandLineTest, GlobalOptionsBeforeCommand) {
    auto invocation = CommandLine::parse({"-c", "/etc/cv.conf", "--data-dir=/srv/vault", "--verbose",
                                          "status", "f-1"});
    
    EXPECT_EQ(invocation.config_path, "/etc/cv.conf");
    ASSERT_TRUE(invocation.data_dir.has_value());
    EXPECT_EQ(*invocation.data_dir, "/srv/vault");
    EXPECT_TRUE(invocation.verbose);
    EXPECT_EQ(invocation.command, "status");
    EXPECT_EQ(invocation.args, (std::vector<std::string>{"status", "f-1"}));
}

TEST(CommandLineTest, ArgumentsAfterCommandPassThrough) {
    auto invocation = CommandLine::parse({"ingest", "./big.iso", "media", "alice", "--verbose"});
    
    EXPECT_FALSE(invocation.verbose);
    EXPECT_EQ(invocation.command, "ingest");
    ASSERT_EQ(invocation.args.size(), 5u);
    EXPECT_EQ(invocation.args.back(), "--verbose");
}

TEST(CommandLineTest, SetOverridesKeepOrder) {
    auto invocation = CommandLine::parse({"-s", "upload.io_threads=2", "--set", " upload.session_backend = memory",
                                          "--set=upload.io_threads=6", "sessions"});
    
    ASSERT_EQ(invocation.overrides.size(), 3u);
    EXPECT_EQ(invocation.overrides[0], std::make_pair(std::string("upload.io_threads"), std::string("2")));
    EXPECT_EQ(invocation.overrides[1], std::make_pair(std::string("upload.session_backend"), std::string("memory")));
    EXPECT_EQ(invocation.overrides[2], std::make_pair(std::string("upload.io_threads"), std::string("6")));
    EXPECT_EQ(invocation.command, "sessions");
}

TEST(CommandLineTest, HelpAndVersionFlags) {
    EXPECT_TRUE(CommandLine::parse({"-h"}).show_help);
    EXPECT_TRUE(CommandLine::parse({"--help"}).show_help);
    EXPECT_TRUE(CommandLine::parse({"-V"}).show_version);
    EXPECT_TRUE(CommandLine::parse({"--version"}).show_version);
}

TEST(CommandLineTest, RejectsBadOptions) {
    EXPECT_THROW(CommandLine::parse({"--force", "sweep"}), ValidationError);
    EXPECT_THROW(CommandLine::parse({"-x"}), ValidationError);
    EXPECT_THROW(CommandLine::parse({"--data-dir"}), ValidationError);
    EXPECT_THROW(CommandLine::parse({"--verbose=yes"}), ValidationError);
    EXPECT_THROW(CommandLine::parse({"--set", "upload.io_threads"}), ValidationError);
    EXPECT_THROW(CommandLine::parse({"--set", "=4"}), ValidationError);
}

TEST(CommandLineTest, UsageListsEveryOption) {
    std::ostringstream out;
    CommandLine::print_usage(out);
    
    auto text = out.str();
    for (const char* flag : {"--config", "--data-dir", "--set", "--verbose", "--help", "--version"}) {
        EXPECT_NE(text.find(flag), std::string::npos) << flag;
    }
}
