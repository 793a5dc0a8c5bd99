#include <gtest/gtest.h>
#include "ginseng/core/cli.hpp"
#include "ginseng/core/command_registry.hpp"
#include "ginseng/core/progress_display.hpp"
#include <sstream>

using namespace ginseng::core;
using namespace ginseng::transfer;

class CommandLineParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "ginseng");
        storage_ = std::move(args);
        argv_.clear();
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
        return parser_.parse(static_cast<int>(argv_.size()), argv_.data());
    }
    
    CommandLineParser parser_{"ginseng"};
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

TEST_F(CommandLineParserTest, CommandAndPositionals) {
    ASSERT_TRUE(parse({"share", "a.txt", "docs"}));
    
    const auto& positional = parser_.get_positional_args();
    ASSERT_EQ(positional.size(), 3u);
    EXPECT_EQ(positional[0], "share");
    EXPECT_EQ(positional[2], "docs");
}

TEST_F(CommandLineParserTest, OutputOption) {
    ASSERT_TRUE(parse({"download", "ticket", "-o", "/tmp/out"}));
    EXPECT_EQ(parser_.get_option("output"), "/tmp/out");
    EXPECT_EQ(parser_.get_option("o"), "/tmp/out");
    
    ASSERT_TRUE(parse({"--output=/srv/in", "download", "ticket"}));
    EXPECT_EQ(parser_.get_option("output"), "/srv/in");
    EXPECT_EQ(parser_.get_positional_args().size(), 2u);
}

TEST_F(CommandLineParserTest, Flags) {
    ASSERT_TRUE(parse({"--json", "--verbose", "info"}));
    EXPECT_TRUE(parser_.get_bool_option("json"));
    EXPECT_TRUE(parser_.get_bool_option("verbose"));
    EXPECT_FALSE(parser_.has_option("help"));
    
    ASSERT_TRUE(parse({"-hv"}));
    EXPECT_TRUE(parser_.has_option("help"));
    EXPECT_TRUE(parser_.has_option("version"));
}

TEST_F(CommandLineParserTest, ConfigDefault) {
    ASSERT_TRUE(parse({"info"}));
    EXPECT_FALSE(parser_.has_option("config"));
    EXPECT_EQ(parser_.get_option("config"), "~/.ginseng/ginseng.conf");
}

TEST_F(CommandLineParserTest, DoubleDashEndsOptions) {
    ASSERT_TRUE(parse({"share", "--", "--json"}));
    EXPECT_FALSE(parser_.has_option("json"));
    ASSERT_EQ(parser_.get_positional_args().size(), 2u);
    EXPECT_EQ(parser_.get_positional_args()[1], "--json");
}

TEST_F(CommandLineParserTest, Errors) {
    EXPECT_FALSE(parse({"--bogus"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: --bogus");
    
    EXPECT_FALSE(parse({"download", "-o"}));
    EXPECT_EQ(parser_.get_error(), "Option -o requires a value");
    
    EXPECT_FALSE(parse({"-x"}));
}

TEST_F(CommandLineParserTest, IntOption) {
    parser_.add_option("j", "jobs", "Worker count", true);
    ASSERT_TRUE(parse({"--jobs", "4"}));
    EXPECT_EQ(parser_.get_int_option("jobs"), 4);
    
    ASSERT_TRUE(parse({"--jobs", "four"}));
    EXPECT_EQ(parser_.get_int_option("jobs", 2), 2);
}

TEST(CommandResultTest, Factories) {
    auto ok = CommandResult::ok("done");
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.exit_code, 0);
    EXPECT_EQ(ok.message, "done");
    
    auto partial = CommandResult::error("1 file(s) could not be downloaded", 2);
    EXPECT_FALSE(partial.success);
    EXPECT_EQ(partial.exit_code, 2);
    EXPECT_EQ(CommandResult::error("boom").exit_code, 1);
}

TEST(CommandRegistryTest, KnownCommands) {
    CommandRegistry registry;
    EXPECT_TRUE(registry.has_command("share"));
    EXPECT_TRUE(registry.has_command("download"));
    EXPECT_TRUE(registry.has_command("info"));
    EXPECT_FALSE(registry.has_command("send"));
    
    auto result = registry.execute_command("send", {"send"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Unknown command: send");
}

TEST(CommandRegistryTest, UsageErrors) {
    CommandRegistry registry;
    
    auto share = registry.execute_command("share", {"share"});
    EXPECT_FALSE(share.success);
    EXPECT_EQ(share.message, "Usage: ginseng share <path> [path...]");
    
    auto download = registry.execute_command("download", {"download"});
    EXPECT_FALSE(download.success);
    EXPECT_EQ(download.exit_code, 1);
}

class ProgressDisplayTest : public ::testing::Test {
protected:
    void SetUp() override {
        FileEntry entry;
        entry.file_id = "f1";
        entry.name = "b.txt";
        entry.relative_path = "docs/b.txt";
        entry.total_bytes = 2048;
        entry.transferred_bytes = 2048;
        entry.status = FileStatus::COMPLETED;
        entry_ = entry;
        
        session_.transfer_id = "t1";
        session_.transfer_type = TransferType::UPLOAD;
        session_.total_files = 2;
        session_.total_bytes = 4096;
        session_.transferred_bytes = 1024;
        session_.files.push_back(entry);
    }
    
    FileEntry entry_;
    Session session_;
};

TEST_F(ProgressDisplayTest, DescribeLifecycle) {
    EXPECT_EQ(ProgressDisplay::describe(TransferStartedEvent{session_}), "Sharing 2 files (4.00 KB)");
    
    session_.transfer_type = TransferType::DOWNLOAD;
    session_.total_files = 1;
    EXPECT_EQ(ProgressDisplay::describe(TransferStartedEvent{session_}), "Downloading 1 file (4.00 KB)");
    
    EXPECT_EQ(ProgressDisplay::describe(StageChangedEvent{"t1", TransferStage::FINALIZING, "Writing files"}),
              "Stage: finalizing (Writing files)");
    EXPECT_EQ(ProgressDisplay::describe(TransferFailedEvent{session_, "TransportError: peer unreachable"}),
              "Failed: TransportError: peer unreachable");
    EXPECT_EQ(ProgressDisplay::describe(TransferProgressEvent{session_}), "");
}

TEST_F(ProgressDisplayTest, DescribeFileOutcomes) {
    EXPECT_EQ(ProgressDisplay::describe(FileProgressEvent{"t1", entry_}), "  done     docs/b.txt");
    
    entry_.status = FileStatus::SKIPPED;
    EXPECT_EQ(ProgressDisplay::describe(FileProgressEvent{"t1", entry_}), "  present  docs/b.txt");
    
    entry_.status = FileStatus::FAILED;
    entry_.error = "IoError: disk full";
    EXPECT_EQ(ProgressDisplay::describe(FileProgressEvent{"t1", entry_}),
              "  failed   docs/b.txt: IoError: disk full");
    
    entry_.status = FileStatus::TRANSFERRING;
    EXPECT_EQ(ProgressDisplay::describe(FileProgressEvent{"t1", entry_}), "");
}

TEST_F(ProgressDisplayTest, ProgressLine) {
    EXPECT_EQ(ProgressDisplay::progress_line(session_), "[ 25%] 1.00 KB / 4.00 KB");
    
    session_.transfer_rate = 1024;
    session_.eta_seconds = 3;
    EXPECT_EQ(ProgressDisplay::progress_line(session_), "[ 25%] 1.00 KB / 4.00 KB  1.00 KB/s  ETA 3s");
    
    session_.total_bytes = 0;
    session_.transferred_bytes = 0;
    EXPECT_EQ(ProgressDisplay::progress_line(session_).substr(0, 7), "[100%] ");
}

TEST_F(ProgressDisplayTest, JsonLinesUntilTerminalEvent) {
    EventChannel channel;
    std::ostringstream out;
    
    channel.send(TransferStartedEvent{session_});
    channel.send(FileProgressEvent{"t1", entry_});
    channel.send(TransferCompletedEvent{session_});
    
    ProgressDisplay display(channel, true, out);
    display.start();
    display.finish();
    
    std::istringstream lines(out.str());
    std::vector<std::string> events;
    std::string line;
    while (std::getline(lines, line)) {
        events.push_back(nlohmann::json::parse(line).at("event").get<std::string>());
    }
    
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0], "transferStarted");
    EXPECT_EQ(events[1], "fileProgress");
    EXPECT_EQ(events[2], "transferCompleted");
}

TEST_F(ProgressDisplayTest, TextViewPrintsOutcomes) {
    EventChannel channel;
    std::ostringstream out;
    
    channel.send(TransferStartedEvent{session_});
    channel.send(TransferProgressEvent{session_});
    channel.send(FileProgressEvent{"t1", entry_});
    channel.send(TransferFailedEvent{session_, "IoError: disk full"});
    
    ProgressDisplay display(channel, false, out);
    display.start();
    display.finish();
    
    auto text = out.str();
    EXPECT_NE(text.find("Sharing 2 files"), std::string::npos);
    EXPECT_NE(text.find("\r[ 25%]"), std::string::npos);
    EXPECT_NE(text.find("  done     docs/b.txt\n"), std::string::npos);
    EXPECT_NE(text.find("Failed: IoError: disk full\n"), std::string::npos);
}
