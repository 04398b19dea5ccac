#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "chunkvault/commit/commit_orchestrator.hpp"
#include "chunkvault/commit/sqlite_record_store.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/storage/assembly_engine.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace chunkvault::commit;
using namespace chunkvault::storage;
using namespace chunkvault::upload;
using namespace chunkvault::core;
using ::testing::_;
using ::testing::ByMove;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class MockRecordStore : public RecordStore {
public:
    MOCK_METHOD(std::unique_ptr<RecordTransaction>, begin, (), (override));
    MOCK_METHOD(void, finalize_path, (const std::string&, const std::string&), (override));
    MOCK_METHOD(std::optional<PersistedRecord>, get_record, (const std::string&), (override));
    MOCK_METHOD(std::vector<PersistedRecord>, list_pending_finalize, (), (override));
    MOCK_METHOD(std::vector<PersistedRecord>, list_records, (const std::string&), (override));
    
    // Forwards every call to `real` unless a test sets an expectation.
    void delegate_to(RecordStore& real) {
        ON_CALL(*this, begin()).WillByDefault([&real]() { return real.begin(); });
        ON_CALL(*this, finalize_path(_, _)).WillByDefault([&real](const std::string& id, const std::string& path) {
            real.finalize_path(id, path);
        });
        ON_CALL(*this, get_record(_)).WillByDefault([&real](const std::string& id) { return real.get_record(id); });
        ON_CALL(*this, list_pending_finalize()).WillByDefault([&real]() { return real.list_pending_finalize(); });
        ON_CALL(*this, list_records(_)).WillByDefault([&real](const std::string& module) {
            return real.list_records(module);
        });
    }
};

class MockRecordTransaction : public RecordTransaction {
public:
    MOCK_METHOD(void, create_record, (const PersistedRecord&), (override));
    MOCK_METHOD(void, attach_associations, (const std::string&, const Associations&), (override));
    MOCK_METHOD(void, commit, (), (override));
    MOCK_METHOD(void, rollback, (), (override));
};

class MockArtifactGenerator : public ArtifactGenerator {
public:
    MOCK_METHOD(void, generate, (const PersistedRecord&, const std::filesystem::path&), (override));
};

class CommitOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "chunkvault_commit_test";
        std::filesystem::remove_all(test_dir_);
        
        config_ = StorageConfig(test_dir_);
        ASSERT_TRUE(config_.create_directories());
        
        sessions_ = std::make_shared<InMemorySessionStore>();
        chunks_ = std::make_shared<ChunkStore>(config_, sessions_);
        assembler_ = std::make_unique<AssemblyEngine>(config_, sessions_, chunks_);
        
        real_records_ = std::make_unique<SqliteRecordStore>(config_.database_path);
        ASSERT_TRUE(real_records_->initialize());
        
        records_ = std::make_shared<NiceMock<MockRecordStore>>();
        records_->delegate_to(*real_records_);
        
        artifacts_ = std::make_shared<NiceMock<MockArtifactGenerator>>();
        modules_ = std::make_shared<const ModuleRegistry>(ModuleRegistry::with_default_modules());
        orchestrator_ = std::make_unique<CommitOrchestrator>(config_, sessions_, chunks_, records_, modules_,
                                                             artifacts_);
    }
    
    void TearDown() override {
        orchestrator_.reset();
        records_.reset();
        real_records_.reset();
        std::filesystem::remove_all(test_dir_);
    }
    
    std::vector<std::uint8_t> content(size_t size) {
        std::vector<std::uint8_t> data(size);
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<std::uint8_t>((i * 7) % 251);
        }
        return data;
    }
    
    // Uploads data in two chunks; assembles unless only the first is sent.
    void upload(const std::string& file_id, const std::vector<std::uint8_t>& data,
                const std::string& filename = "report.pdf", bool complete = true) {
        ChunkUpload request;
        request.file_id = file_id;
        request.filename = filename;
        request.total_chunks = 2;
        request.total_size = static_cast<std::int64_t>(data.size());
        request.owner = "alice";
        
        size_t half = data.size() / 2;
        std::span<const std::uint8_t> bytes(data);
        
        request.chunk_index = 0;
        chunks_->save(request, bytes.subspan(0, half));
        if (!complete) {
            return;
        }
        
        request.chunk_index = 1;
        chunks_->save(request, bytes.subspan(half));
        assembler_->assemble(file_id);
    }
    
    std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    
    // Regular files below the storage directory.
    size_t stored_file_count() {
        size_t count = 0;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(config_.file_storage_directory)) {
            if (entry.is_regular_file()) {
                ++count;
            }
        }
        return count;
    }
    
    std::filesystem::path test_dir_;
    StorageConfig config_;
    std::shared_ptr<InMemorySessionStore> sessions_;
    std::shared_ptr<ChunkStore> chunks_;
    std::unique_ptr<AssemblyEngine> assembler_;
    std::unique_ptr<SqliteRecordStore> real_records_;
    std::shared_ptr<NiceMock<MockRecordStore>> records_;
    std::shared_ptr<NiceMock<MockArtifactGenerator>> artifacts_;
    std::shared_ptr<const ModuleRegistry> modules_;
    std::unique_ptr<CommitOrchestrator> orchestrator_;
};

TEST_F(CommitOrchestratorTest, CommitsCompletedUpload) {
    auto data = content(5000);
    upload("f1", data);
    
    CommitMetadata metadata;
    metadata.title = "Q3 Report";
    metadata.tags = {"finance"};
    metadata.project_ids = {"p-1"};
    
    auto record = orchestrator_->commit("f1", "documents", "alice", metadata);
    
    EXPECT_EQ(record.finalize_state, FinalizeState::FINALIZED);
    EXPECT_EQ(record.file_path, record.target_path);
    EXPECT_EQ(record.file_size, 5000u);
    EXPECT_EQ(record.title, "Q3 Report");
    EXPECT_EQ(record.mime_type, "application/pdf");
    EXPECT_EQ(record.owner, "alice");
    EXPECT_EQ(record.content_hash,
              chunkvault::crypto::hash_utils::hash_to_hex(chunkvault::crypto::ContentHasher::hash(data)));
    EXPECT_EQ(read_file(config_.file_storage_directory / record.file_path), data);
    
    auto stored = real_records_->get_record(record.uuid);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->finalize_state, FinalizeState::FINALIZED);
    EXPECT_EQ(stored->file_path, record.target_path);
    EXPECT_EQ(stored->tags, (std::vector<std::string>{"finance"}));
    EXPECT_EQ(stored->project_ids, (std::vector<std::string>{"p-1"}));
    
    EXPECT_FALSE(sessions_->get("f1").has_value());
    EXPECT_FALSE(std::filesystem::exists(config_.get_assembled_path("f1", "report.pdf")));
    EXPECT_FALSE(std::filesystem::exists(config_.get_chunk_directory("f1")));
    EXPECT_EQ(stored_file_count(), 1u);
}

TEST_F(CommitOrchestratorTest, UnknownUpload) {
    EXPECT_THROW(orchestrator_->commit("missing", "documents", "alice", CommitMetadata{}), ResourceNotFound);
}

TEST_F(CommitOrchestratorTest, ForeignOwnerLeavesUploadUntouched) {
    upload("f1", content(1000));
    
    EXPECT_THROW(orchestrator_->commit("f1", "documents", "mallory", CommitMetadata{}), OwnershipError);
    
    EXPECT_TRUE(sessions_->get("f1").has_value());
    EXPECT_TRUE(std::filesystem::exists(config_.get_assembled_path("f1", "report.pdf")));
    EXPECT_TRUE(real_records_->list_records().empty());
}

TEST_F(CommitOrchestratorTest, IncompleteUploadRejected) {
    upload("f1", content(1000), "report.pdf", false);
    
    EXPECT_THROW(orchestrator_->commit("f1", "documents", "alice", CommitMetadata{}), InvalidStateError);
    
    auto session = sessions_->get("f1");
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->status, UploadStatus::UPLOADING);
    EXPECT_TRUE(real_records_->list_records().empty());
}

TEST_F(CommitOrchestratorTest, UnsupportedModuleDiscardsAssembledFile) {
    upload("f1", content(1000));
    
    EXPECT_THROW(orchestrator_->commit("f1", "photos", "alice", CommitMetadata{}), ValidationError);
    
    EXPECT_TRUE(real_records_->list_records().empty());
    EXPECT_FALSE(std::filesystem::exists(config_.get_assembled_path("f1", "report.pdf")));
    EXPECT_EQ(stored_file_count(), 0u);
}

TEST_F(CommitOrchestratorTest, AssociationFailureRollsBack) {
    upload("f1", content(3000));
    
    auto transaction = std::make_unique<NiceMock<MockRecordTransaction>>();
    EXPECT_CALL(*transaction, create_record(_)).Times(1);
    EXPECT_CALL(*transaction, attach_associations(_, _)).WillOnce(Throw(TransientIOError("disk full")));
    EXPECT_CALL(*transaction, commit()).Times(0);
    EXPECT_CALL(*transaction, rollback()).Times(1);
    EXPECT_CALL(*records_, begin()).WillOnce(Return(ByMove(std::move(transaction))));
    
    EXPECT_THROW(orchestrator_->commit("f1", "documents", "alice", CommitMetadata{}), TransientIOError);
    
    EXPECT_TRUE(real_records_->list_records().empty());
    EXPECT_EQ(stored_file_count(), 0u);
    EXPECT_FALSE(std::filesystem::exists(config_.get_assembled_path("f1", "report.pdf")));
}

TEST_F(CommitOrchestratorTest, NonUploadErrorsBecomeTransient) {
    upload("f1", content(3000));
    
    EXPECT_CALL(*records_, begin()).WillOnce(Throw(std::runtime_error("connection lost")));
    
    EXPECT_THROW(orchestrator_->commit("f1", "documents", "alice", CommitMetadata{}), TransientIOError);
    EXPECT_EQ(stored_file_count(), 0u);
}

TEST_F(CommitOrchestratorTest, FinalizeFailureLeavesRecordPending) {
    auto data = content(4000);
    upload("f1", data);
    
    EXPECT_CALL(*records_, finalize_path(_, _)).WillOnce(Throw(TransientIOError("database is locked")));
    
    std::string record_id;
    try {
        orchestrator_->commit("f1", "documents", "alice", CommitMetadata{});
        FAIL() << "Expected PartialCommitInconsistency";
    } catch (const PartialCommitInconsistency& e) {
        record_id = e.record_id();
        EXPECT_TRUE(e.retryable());
    }
    
    auto pending = real_records_->get_record(record_id);
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(pending->finalize_state, FinalizeState::PENDING_FINALIZE);
    EXPECT_NE(pending->file_path, pending->target_path);
    
    // The rename happened before the failing update.
    EXPECT_TRUE(std::filesystem::exists(config_.file_storage_directory / pending->target_path));
    EXPECT_FALSE(sessions_->get("f1").has_value());
    
    ::testing::Mock::VerifyAndClearExpectations(records_.get());
    records_->delegate_to(*real_records_);
    
    auto finalized = orchestrator_->retry_finalize(record_id);
    EXPECT_EQ(finalized.finalize_state, FinalizeState::FINALIZED);
    EXPECT_EQ(finalized.file_path, pending->target_path);
    EXPECT_EQ(read_file(config_.file_storage_directory / finalized.file_path), data);
    
    EXPECT_EQ(real_records_->get_record(record_id)->finalize_state, FinalizeState::FINALIZED);
}

TEST_F(CommitOrchestratorTest, RetryFinalizeUnknownRecord) {
    EXPECT_THROW(orchestrator_->retry_finalize("missing"), ResourceNotFound);
}

TEST_F(CommitOrchestratorTest, RetryFinalizeIsIdempotent) {
    upload("f1", content(1000));
    auto record = orchestrator_->commit("f1", "notes", "alice", CommitMetadata{});
    
    auto again = orchestrator_->retry_finalize(record.uuid);
    EXPECT_EQ(again.finalize_state, FinalizeState::FINALIZED);
    EXPECT_EQ(again.file_path, record.file_path);
}

TEST_F(CommitOrchestratorTest, ReconcileFinishesPendingRecords) {
    upload("f1", content(1000), "a.txt");
    upload("f2", content(2000), "b.txt");
    
    EXPECT_CALL(*records_, finalize_path(_, _)).Times(2).WillRepeatedly(Throw(TransientIOError("busy")));
    EXPECT_THROW(orchestrator_->commit("f1", "documents", "alice", CommitMetadata{}), PartialCommitInconsistency);
    EXPECT_THROW(orchestrator_->commit("f2", "documents", "alice", CommitMetadata{}), PartialCommitInconsistency);
    
    ::testing::Mock::VerifyAndClearExpectations(records_.get());
    records_->delegate_to(*real_records_);
    ASSERT_EQ(real_records_->list_pending_finalize().size(), 2u);
    
    auto report = orchestrator_->reconcile();
    EXPECT_EQ(report.finalized, 2u);
    EXPECT_EQ(report.failed, 0u);
    EXPECT_TRUE(real_records_->list_pending_finalize().empty());
    
    auto nothing = orchestrator_->reconcile();
    EXPECT_EQ(nothing.finalized, 0u);
}

TEST_F(CommitOrchestratorTest, ReconcileCountsMissingFiles) {
    upload("f1", content(1000));
    
    EXPECT_CALL(*records_, finalize_path(_, _)).WillOnce(Throw(TransientIOError("busy")));
    EXPECT_THROW(orchestrator_->commit("f1", "documents", "alice", CommitMetadata{}), PartialCommitInconsistency);
    
    ::testing::Mock::VerifyAndClearExpectations(records_.get());
    records_->delegate_to(*real_records_);
    
    auto pending = real_records_->list_pending_finalize();
    ASSERT_EQ(pending.size(), 1u);
    std::filesystem::remove(config_.file_storage_directory / pending[0].target_path);
    
    auto report = orchestrator_->reconcile();
    EXPECT_EQ(report.finalized, 0u);
    EXPECT_EQ(report.failed, 1u);
}

TEST_F(CommitOrchestratorTest, ArtifactsGeneratedForFinalFile) {
    upload("f1", content(1000), "photo.png");
    
    std::filesystem::path generated_for;
    EXPECT_CALL(*artifacts_, generate(_, _))
        .WillOnce([&generated_for](const PersistedRecord&, const std::filesystem::path& path) {
            generated_for = path;
        });
    
    auto record = orchestrator_->commit("f1", "notes", "alice", CommitMetadata{});
    EXPECT_EQ(generated_for, config_.file_storage_directory / record.file_path);
}

TEST_F(CommitOrchestratorTest, ArtifactFailureDoesNotFailCommit) {
    upload("f1", content(1000));
    
    EXPECT_CALL(*artifacts_, generate(_, _)).WillOnce(Throw(std::runtime_error("no decoder")));
    
    auto record = orchestrator_->commit("f1", "documents", "alice", CommitMetadata{});
    EXPECT_EQ(record.finalize_state, FinalizeState::FINALIZED);
}
