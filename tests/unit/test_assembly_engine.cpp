#include <gtest/gtest.h>
#include "chunkvault/core/errors.hpp"
#include "chunkvault/storage/assembly_engine.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>

using namespace chunkvault::storage;
using namespace chunkvault::upload;
using namespace chunkvault::core;

class AssemblyEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "chunkvault_assembly_test";
        std::filesystem::remove_all(test_dir_);
        
        config_ = StorageConfig(test_dir_);
        config_.max_chunk_size = 4096;
        config_.max_file_size = 64 * 1024;
        config_.max_concurrent_assemblies = 2;
        config_.create_directories();
        
        rebuild();
    }
    
    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }
    
    void rebuild() {
        sessions_ = std::make_shared<InMemorySessionStore>();
        chunks_ = std::make_shared<ChunkStore>(config_, sessions_);
        engine_ = std::make_unique<AssemblyEngine>(config_, sessions_, chunks_);
    }
    
    static std::vector<std::uint8_t> content(size_t size) {
        std::vector<std::uint8_t> data(size);
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<std::uint8_t>((i * 131) ^ (i >> 8));
        }
        return data;
    }
    
    // Uploads `data` split into chunk_size pieces, in the given index order.
    void upload(const std::string& file_id, const std::vector<std::uint8_t>& data, size_t chunk_size,
                const std::vector<int64_t>& order, int64_t declared_size = -1) {
        auto total_chunks = static_cast<int64_t>((data.size() + chunk_size - 1) / chunk_size);
        
        for (auto index : order) {
            ChunkUpload request;
            request.file_id = file_id;
            request.chunk_index = index;
            request.filename = "data.bin";
            request.total_chunks = total_chunks;
            request.total_size = declared_size >= 0 ? declared_size : static_cast<int64_t>(data.size());
            request.owner = "alice";
            
            auto begin = static_cast<size_t>(index) * chunk_size;
            auto end = std::min(begin + chunk_size, data.size());
            chunks_->save(request, std::span<const std::uint8_t>(data.data() + begin, end - begin));
        }
    }
    
    static std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }
    
    std::filesystem::path test_dir_;
    StorageConfig config_;
    std::shared_ptr<InMemorySessionStore> sessions_;
    std::shared_ptr<ChunkStore> chunks_;
    std::unique_ptr<AssemblyEngine> engine_;
};

TEST_F(AssemblyEngineTest, AssemblesInIndexOrder) {
    auto data = content(10000);
    upload("f1", data, 4096, {2, 0, 1});
    
    auto path = engine_->assemble("f1");
    
    EXPECT_EQ(path, test_dir_ / "temp_uploads" / "complete_f1_data.bin");
    EXPECT_EQ(read_file(path), data);
    EXPECT_EQ(sessions_->get("f1")->status, UploadStatus::COMPLETED);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "temp_uploads" / "f1"));
}

TEST_F(AssemblyEngineTest, DeliveryOrderDoesNotMatter) {
    auto data = content(9000);
    std::vector<int64_t> order = {0, 1, 2};
    std::vector<std::uint8_t> reference;
    
    do {
        rebuild();
        std::filesystem::remove_all(config_.temp_upload_directory);
        upload("perm", data, 4096, order);
        
        auto assembled = read_file(engine_->assemble("perm"));
        if (reference.empty()) {
            reference = assembled;
        }
        EXPECT_EQ(assembled, reference);
    } while (std::next_permutation(order.begin(), order.end()));
    
    EXPECT_EQ(reference, data);
}

TEST_F(AssemblyEngineTest, FlippedByteFailsIntegrity) {
    auto data = content(8192);
    upload("f1", data, 4096, {0, 1});
    
    auto chunk_path = config_.get_chunk_path("f1", 1);
    {
        std::fstream file(chunk_path, std::ios::binary | std::ios::in | std::ios::out);
        file.seekp(100);
        file.put(static_cast<char>(data[4096 + 100] ^ 0xFF));
    }
    
    EXPECT_THROW(engine_->assemble("f1"), IntegrityError);
    
    EXPECT_FALSE(std::filesystem::exists(config_.get_assembled_path("f1", "data.bin")));
    auto session = sessions_->get("f1");
    EXPECT_EQ(session->status, UploadStatus::ERROR);
    EXPECT_FALSE(session->error_message.empty());
}

TEST_F(AssemblyEngineTest, MissingChunkFileIsNotFound) {
    upload("f1", content(8192), 4096, {0, 1});
    std::filesystem::remove(config_.get_chunk_path("f1", 0));
    
    EXPECT_THROW(engine_->assemble("f1"), ResourceNotFound);
    EXPECT_EQ(sessions_->get("f1")->status, UploadStatus::ERROR);
    EXPECT_FALSE(std::filesystem::exists(config_.get_assembled_path("f1", "data.bin")));
}

TEST_F(AssemblyEngineTest, DeclaredSizeMustMatch) {
    upload("f1", content(5000), 4096, {0, 1}, 6000);
    
    EXPECT_THROW(engine_->assemble("f1"), IntegrityError);
    EXPECT_EQ(sessions_->get("f1")->status, UploadStatus::ERROR);
}

TEST_F(AssemblyEngineTest, OversizedUploadRejectedBeforeTouchingDisk) {
    config_.max_file_size = 1000;
    rebuild();
    upload("big", content(5000), 4096, {0, 1});
    
    EXPECT_THROW(engine_->assemble("big"), ValidationError);
    EXPECT_EQ(sessions_->get("big")->status, UploadStatus::ERROR);
    EXPECT_FALSE(std::filesystem::exists(config_.get_assembled_path("big", "data.bin")));
    EXPECT_TRUE(std::filesystem::exists(config_.get_chunk_path("big", 0)));
}

TEST_F(AssemblyEngineTest, UnknownUpload) {
    EXPECT_THROW(engine_->assemble("nope"), ResourceNotFound);
    EXPECT_EQ(chunks_->tracked_locks(), 0u);
}

TEST_F(AssemblyEngineTest, RepeatedUnknownIdsLeaveNoLockEntries) {
    for (int i = 0; i < 100; ++i) {
        EXPECT_THROW(engine_->assemble("ghost-" + std::to_string(i)), ResourceNotFound);
    }
    EXPECT_EQ(chunks_->tracked_locks(), 0u);
}

TEST_F(AssemblyEngineTest, IncompleteUploadIsInvalidState) {
    upload("f1", content(8192), 4096, {1});
    
    EXPECT_THROW(engine_->assemble("f1"), InvalidStateError);
    
    auto session = sessions_->get("f1");
    EXPECT_EQ(session->status, UploadStatus::UPLOADING);
    EXPECT_TRUE(session->error_message.empty());
}

TEST_F(AssemblyEngineTest, SecondAssembleIsInvalidState) {
    upload("f1", content(100), 4096, {0});
    engine_->assemble("f1");
    
    EXPECT_THROW(engine_->assemble("f1"), InvalidStateError);
    EXPECT_EQ(sessions_->get("f1")->status, UploadStatus::COMPLETED);
}

TEST_F(AssemblyEngineTest, ConcurrentAssembliesOfDistinctUploads) {
    constexpr int upload_count = 6;
    for (int i = 0; i < upload_count; ++i) {
        upload("u" + std::to_string(i), content(13000 + static_cast<size_t>(i)), 4096, {3, 1, 0, 2});
    }
    
    std::vector<std::thread> workers;
    std::atomic<int> succeeded{0};
    for (int i = 0; i < upload_count; ++i) {
        workers.emplace_back([this, i, &succeeded]() {
            engine_->assemble("u" + std::to_string(i));
            ++succeeded;
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    
    EXPECT_EQ(succeeded.load(), upload_count);
    for (int i = 0; i < upload_count; ++i) {
        auto path = config_.get_assembled_path("u" + std::to_string(i), "data.bin");
        EXPECT_EQ(read_file(path), content(13000 + static_cast<size_t>(i)));
    }
}
