#include <gtest/gtest.h>
#include "ginseng/transfer/progress_event.hpp"

using namespace ginseng::transfer;

class ProgressEventTest : public ::testing::Test {
protected:
    void SetUp() override {
        entry_.file_id = "file-1";
        entry_.name = "notes.txt";
        entry_.relative_path = "docs/notes.txt";
        entry_.total_bytes = 2048;
        entry_.transferred_bytes = 1024;
        entry_.status = FileStatus::TRANSFERRING;
        
        session_.transfer_id = "transfer-1";
        session_.transfer_type = TransferType::DOWNLOAD;
        session_.stage = TransferStage::TRANSFERRING;
        session_.total_files = 1;
        session_.total_bytes = 2048;
        session_.transferred_bytes = 1024;
        session_.start_time = 1700000000;
        session_.files.push_back(entry_);
    }
    
    FileEntry entry_;
    Session session_;
};

TEST_F(ProgressEventTest, EventNames) {
    EXPECT_STREQ(event_name(TransferStartedEvent{session_}), "transferStarted");
    EXPECT_STREQ(event_name(TransferProgressEvent{session_}), "transferProgress");
    EXPECT_STREQ(event_name(FileProgressEvent{"transfer-1", entry_}), "fileProgress");
    EXPECT_STREQ(event_name(StageChangedEvent{"transfer-1", TransferStage::FINALIZING, std::nullopt}),
                 "stageChanged");
    EXPECT_STREQ(event_name(TransferCompletedEvent{session_}), "transferCompleted");
    EXPECT_STREQ(event_name(TransferFailedEvent{session_, "boom"}), "transferFailed");
}

TEST_F(ProgressEventTest, TerminalEvents) {
    EXPECT_TRUE(is_terminal_event(TransferCompletedEvent{session_}));
    EXPECT_TRUE(is_terminal_event(TransferFailedEvent{session_, "boom"}));
    EXPECT_FALSE(is_terminal_event(TransferProgressEvent{session_}));
    EXPECT_FALSE(is_terminal_event(FileProgressEvent{"transfer-1", entry_}));
}

TEST_F(ProgressEventTest, FileEntryFieldsAreCamelCase) {
    nlohmann::json j = entry_;
    
    EXPECT_EQ(j["fileId"], "file-1");
    EXPECT_EQ(j["relativePath"], "docs/notes.txt");
    EXPECT_EQ(j["totalBytes"], 2048);
    EXPECT_EQ(j["transferredBytes"], 1024);
    EXPECT_EQ(j["status"], "transferring");
    EXPECT_FALSE(j.contains("transferRate"));
    EXPECT_FALSE(j.contains("error"));
    EXPECT_FALSE(j.contains("file_id"));
}

TEST_F(ProgressEventTest, OptionalFieldsAppearWhenSet) {
    entry_.transfer_rate = 512;
    entry_.status = FileStatus::FAILED;
    entry_.error = "stream severed";
    
    nlohmann::json j = entry_;
    EXPECT_EQ(j["transferRate"], 512);
    EXPECT_EQ(j["status"], "failed");
    EXPECT_EQ(j["error"], "stream severed");
}

TEST_F(ProgressEventTest, SessionShape) {
    nlohmann::json j = session_;
    
    EXPECT_EQ(j["transferId"], "transfer-1");
    EXPECT_EQ(j["transferType"], "download");
    EXPECT_EQ(j["stage"], "transferring");
    EXPECT_EQ(j["totalFiles"], 1);
    EXPECT_EQ(j["completedFiles"], 0);
    EXPECT_EQ(j["failedFiles"], 0);
    EXPECT_EQ(j["startTime"], 1700000000);
    ASSERT_TRUE(j["files"].is_array());
    EXPECT_EQ(j["files"][0]["fileId"], "file-1");
    EXPECT_FALSE(j.contains("etaSeconds"));
    EXPECT_FALSE(j.contains("transferRate"));
    EXPECT_FALSE(j.contains("error"));
}

TEST_F(ProgressEventTest, EnvelopeShape) {
    auto j = to_json(ProgressEvent{TransferStartedEvent{session_}});
    
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j["event"], "transferStarted");
    EXPECT_EQ(j["data"]["transfer"]["transferId"], "transfer-1");
}

TEST_F(ProgressEventTest, FileProgressEnvelope) {
    auto j = to_json(ProgressEvent{FileProgressEvent{"transfer-1", entry_}});
    
    EXPECT_EQ(j["event"], "fileProgress");
    EXPECT_EQ(j["data"]["transferId"], "transfer-1");
    EXPECT_EQ(j["data"]["file"]["name"], "notes.txt");
}

TEST_F(ProgressEventTest, StageChangedMessageIsOptional) {
    auto without = to_json(ProgressEvent{StageChangedEvent{"transfer-1", TransferStage::FINALIZING, std::nullopt}});
    EXPECT_EQ(without["data"]["stage"], "finalizing");
    EXPECT_FALSE(without["data"].contains("message"));
    
    auto with = to_json(ProgressEvent{StageChangedEvent{"transfer-1", TransferStage::FINALIZING, "Writing files"}});
    EXPECT_EQ(with["data"]["message"], "Writing files");
}

TEST_F(ProgressEventTest, FailedEnvelopeCarriesError) {
    session_.stage = TransferStage::FAILED;
    session_.error = "TransportError: peer unreachable";
    
    auto j = to_json(ProgressEvent{TransferFailedEvent{session_, "TransportError: peer unreachable"}});
    EXPECT_EQ(j["event"], "transferFailed");
    EXPECT_EQ(j["data"]["error"], "TransportError: peer unreachable");
    EXPECT_EQ(j["data"]["transfer"]["stage"], "failed");
    EXPECT_EQ(j["data"]["transfer"]["error"], "TransportError: peer unreachable");
}

TEST(ProgressTypesTest, LowercaseNames) {
    EXPECT_STREQ(to_string(TransferType::UPLOAD), "upload");
    EXPECT_STREQ(to_string(TransferStage::CANCELLED), "cancelled");
    EXPECT_STREQ(to_string(FileStatus::SKIPPED), "skipped");
    EXPECT_EQ(transfer_stage_from_string("connecting"), TransferStage::CONNECTING);
    EXPECT_EQ(file_status_from_string("pending"), FileStatus::PENDING);
    EXPECT_FALSE(transfer_type_from_string("UPLOAD").has_value());
}

TEST(ProgressTypesTest, TransitionRules) {
    EXPECT_TRUE(can_transition(FileStatus::PENDING, FileStatus::TRANSFERRING));
    EXPECT_TRUE(can_transition(FileStatus::TRANSFERRING, FileStatus::TRANSFERRING));
    EXPECT_TRUE(can_transition(FileStatus::PENDING, FileStatus::FAILED));
    EXPECT_FALSE(can_transition(FileStatus::TRANSFERRING, FileStatus::PENDING));
    EXPECT_FALSE(can_transition(FileStatus::COMPLETED, FileStatus::FAILED));
    EXPECT_FALSE(can_transition(FileStatus::SKIPPED, FileStatus::SKIPPED));
    
    EXPECT_TRUE(is_terminal(TransferStage::FAILED));
    EXPECT_FALSE(is_terminal(TransferStage::FINALIZING));
}
