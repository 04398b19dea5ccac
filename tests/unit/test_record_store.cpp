#include <gtest/gtest.h>
#include "chunkvault/commit/sqlite_record_store.hpp"
#include "chunkvault/core/errors.hpp"
#include "chunkvault/core/utils.hpp"
#include <filesystem>

using namespace chunkvault::commit;
using chunkvault::core::utils::TimeUtils;

class RecordStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "chunkvault_record_store_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        
        store_ = std::make_unique<SqliteRecordStore>(test_dir_ / "records.db");
        ASSERT_TRUE(store_->initialize());
    }
    
    void TearDown() override {
        store_.reset();
        std::filesystem::remove_all(test_dir_);
    }
    
    PersistedRecord make_record(const std::string& uuid, const std::string& module = "documents") {
        PersistedRecord record;
        record.uuid = uuid;
        record.module = module;
        record.title = "Report " + uuid;
        record.original_name = "report.pdf";
        record.stored_filename = "report_" + uuid + ".pdf";
        record.target_path = "assets/documents/" + record.stored_filename;
        record.file_path = "assets/documents/temp_" + record.stored_filename;
        record.file_size = 2048;
        record.content_hash = std::string(64, 'a');
        record.mime_type = "application/pdf";
        record.owner = "alice";
        record.created_at = TimeUtils::now();
        record.updated_at = record.created_at;
        return record;
    }
    
    void commit_record(const PersistedRecord& record, const Associations& associations = {}) {
        auto tx = store_->begin();
        tx->create_record(record);
        tx->attach_associations(record.uuid, associations);
        tx->commit();
    }
    
    std::filesystem::path test_dir_;
    std::unique_ptr<SqliteRecordStore> store_;
};

TEST_F(RecordStoreTest, CommittedRecordIsReadable) {
    auto record = make_record("r1");
    record.description = "Q3 numbers";
    
    Associations associations;
    associations.tags = {"finance", "board"};
    associations.links = {{"project", "p-9"}, {"note", "n-1"}};
    commit_record(record, associations);
    
    auto loaded = store_->get_record("r1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->module, "documents");
    EXPECT_EQ(loaded->title, "Report r1");
    EXPECT_EQ(loaded->file_path, record.file_path);
    EXPECT_EQ(loaded->target_path, record.target_path);
    EXPECT_EQ(loaded->file_size, 2048u);
    EXPECT_EQ(loaded->content_hash, record.content_hash);
    EXPECT_EQ(loaded->description, "Q3 numbers");
    EXPECT_EQ(loaded->owner, "alice");
    EXPECT_TRUE(loaded->parent_id.empty());
    EXPECT_EQ(loaded->finalize_state, FinalizeState::PENDING_FINALIZE);
    EXPECT_EQ(loaded->tags, (std::vector<std::string>{"board", "finance"}));
    EXPECT_EQ(loaded->project_ids, (std::vector<std::string>{"p-9"}));
    
    EXPECT_EQ(store_->get_record_count(), 1u);
    EXPECT_EQ(store_->get_total_size(), 2048u);
}

TEST_F(RecordStoreTest, UnknownRecord) {
    EXPECT_FALSE(store_->get_record("missing").has_value());
}

TEST_F(RecordStoreTest, DroppedTransactionRollsBack) {
    {
        auto tx = store_->begin();
        tx->create_record(make_record("r1"));
        tx->attach_associations("r1", Associations{{"tag"}, {}});
    }
    
    EXPECT_FALSE(store_->get_record("r1").has_value());
    EXPECT_EQ(store_->get_record_count(), 0u);
}

TEST_F(RecordStoreTest, ExplicitRollback) {
    auto tx = store_->begin();
    tx->create_record(make_record("r1"));
    tx->rollback();
    
    EXPECT_THROW(tx->commit(), chunkvault::core::InvalidStateError);
    tx.reset();
    
    EXPECT_FALSE(store_->get_record("r1").has_value());
}

TEST_F(RecordStoreTest, DuplicateUuidFailsWholeTransaction) {
    commit_record(make_record("r1"));
    
    auto tx = store_->begin();
    tx->create_record(make_record("r2"));
    EXPECT_THROW(tx->create_record(make_record("r1")), chunkvault::core::TransientIOError);
    tx.reset();
    
    EXPECT_FALSE(store_->get_record("r2").has_value());
    EXPECT_EQ(store_->get_record_count(), 1u);
}

TEST_F(RecordStoreTest, FinalizePath) {
    auto record = make_record("r1");
    commit_record(record);
    
    store_->finalize_path("r1", record.target_path);
    
    auto loaded = store_->get_record("r1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->file_path, record.target_path);
    EXPECT_EQ(loaded->finalize_state, FinalizeState::FINALIZED);
}

TEST_F(RecordStoreTest, FinalizeUnknownRecordThrows) {
    EXPECT_THROW(store_->finalize_path("missing", "x"), chunkvault::core::ResourceNotFound);
}

TEST_F(RecordStoreTest, ListPendingFinalize) {
    commit_record(make_record("r1"));
    commit_record(make_record("r2"));
    commit_record(make_record("r3"));
    store_->finalize_path("r2", "assets/documents/r2.pdf");
    
    auto pending = store_->list_pending_finalize();
    ASSERT_EQ(pending.size(), 2u);
    for (const auto& record : pending) {
        EXPECT_NE(record.uuid, "r2");
        EXPECT_EQ(record.finalize_state, FinalizeState::PENDING_FINALIZE);
    }
}

TEST_F(RecordStoreTest, ListByModule) {
    commit_record(make_record("d1", "documents"));
    commit_record(make_record("n1", "notes"));
    commit_record(make_record("n2", "notes"));
    
    EXPECT_EQ(store_->list_records().size(), 3u);
    EXPECT_EQ(store_->list_records("notes").size(), 2u);
    EXPECT_EQ(store_->list_records("diary").size(), 0u);
}

TEST_F(RecordStoreTest, ParentIdRoundTrips) {
    auto record = make_record("r1", "notes");
    record.parent_id = "note-7";
    commit_record(record, Associations{{}, {{"note", "note-7"}}});
    
    auto loaded = store_->get_record("r1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->parent_id, "note-7");
    EXPECT_TRUE(loaded->project_ids.empty());
}

TEST_F(RecordStoreTest, SurvivesReopen) {
    commit_record(make_record("r1"));
    store_.reset();
    
    store_ = std::make_unique<SqliteRecordStore>(test_dir_ / "records.db");
    ASSERT_TRUE(store_->initialize());
    EXPECT_TRUE(store_->get_record("r1").has_value());
}
