#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include "../include/errors.hpp"
#include "../include/metadata_store.hpp"
#include "../include/storage.hpp"
#include "../include/util.hpp"
#include "../include/vector_index.hpp"
#include "test_helpers.hpp"

static constexpr std::size_t kDim = 4;

static StorageKind other_kind(StorageKind kind) {
    return kind == StorageKind::Index ? StorageKind::Database : StorageKind::Index;
}

class StorageContractTest : public ::testing::TestWithParam<StorageKind> {
protected:
    std::unique_ptr<StorageBackend> open(std::size_t dim = kDim) {
        return make_storage(storage_config(dir_, GetParam(), dim));
    }
    std::unique_ptr<StorageBackend> open_other() {
        return make_storage(storage_config(dir_, other_kind(GetParam()), kDim));
    }

    TempDir dir_;
};

TEST_P(StorageContractTest, StoresNewRecord) {
    auto s = open();
    EXPECT_EQ(s->count(), 0);
    auto out = s->store(make_record("m1", axis(kDim, 0)));
    EXPECT_EQ(out.status, StoreOutcome::Status::Inserted);
    EXPECT_EQ(s->count(), 1);
    EXPECT_EQ(s->name(), to_string(GetParam()));
    EXPECT_EQ(s->dimension(), kDim);
}

TEST_P(StorageContractTest, SecondStoreOfSameIdIsNoOp) {
    auto s = open();
    ASSERT_EQ(s->store(make_record("m1", axis(kDim, 0))).status, StoreOutcome::Status::Inserted);
    auto again = make_record("m1", axis(kDim, 1));
    again.summary = "changed";
    EXPECT_EQ(s->store(again).status, StoreOutcome::Status::AlreadyExists);
    EXPECT_EQ(s->count(), 1);
    EXPECT_TRUE(s->audit().clean());
    EXPECT_EQ(s->audit().vectors, 1);

    auto hits = s->search(axis(kDim, 1), 5);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0], "summary of m1");
}

TEST_P(StorageContractTest, WrongDimensionFailsWithoutMutation) {
    auto s = open();
    auto out = s->store(make_record("m1", std::vector<float>(kDim + 1, 0.5f)));
    EXPECT_EQ(out.status, StoreOutcome::Status::Failed);
    EXPECT_NE(out.reason.find("dimension"), std::string::npos);
    EXPECT_EQ(s->count(), 0);
    EXPECT_EQ(s->audit().vectors, 0);

    // the id is still free afterwards
    EXPECT_EQ(s->store(make_record("m1", axis(kDim, 0))).status, StoreOutcome::Status::Inserted);
}

TEST_P(StorageContractTest, EmptyStoreSearchReturnsSentinel) {
    auto s = open();
    auto hits = s->search(axis(kDim, 0), 5);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0], kNoResults);
}

TEST_P(StorageContractTest, SearchIsNeverEmpty) {
    auto s = open();
    s->store(make_record("m1", axis(kDim, 0)));
    EXPECT_EQ(s->search(axis(kDim, 0), 0), std::vector<std::string>{kNoResults});
    EXPECT_EQ(s->search(std::vector<float>(kDim + 2, 1.0f), 3), std::vector<std::string>{kNoResults});
}

TEST_P(StorageContractTest, SearchRanksNearestFirst) {
    auto s = open();
    s->store(make_record("a", axis(kDim, 0)));
    s->store(make_record("b", axis(kDim, 1)));
    s->store(make_record("c", axis(kDim, 1, 2.0f)));
    s->store(make_record("d", axis(kDim, 3)));

    auto hits = s->search(axis(kDim, 1), 2);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0], "summary of b");
    EXPECT_EQ(hits[1], "summary of c");

    EXPECT_EQ(s->search(axis(kDim, 1), 50).size(), 4u);
}

TEST_P(StorageContractTest, EqualDistancesKeepInsertionOrder) {
    auto s = open();
    s->store(make_record("first", axis(kDim, 2)));
    s->store(make_record("second", axis(kDim, 2)));
    s->store(make_record("third", axis(kDim, 2)));

    auto hits = s->search(axis(kDim, 2), 3);
    EXPECT_EQ(hits, (std::vector<std::string>{"summary of first", "summary of second", "summary of third"}));
}

TEST_P(StorageContractTest, CheckpointDefaultsToEpochAndRoundTrips) {
    {
        auto s = open();
        EXPECT_EQ(s->get_checkpoint(), epoch());
        s->set_checkpoint(at(1700000000));
        EXPECT_EQ(s->get_checkpoint(), at(1700000000));
    }
    auto reopened = open();
    EXPECT_EQ(reopened->get_checkpoint(), at(1700000000));
}

TEST_P(StorageContractTest, RecordsSurviveReopen) {
    {
        auto s = open();
        s->store(make_record("a", axis(kDim, 0)));
        s->store(make_record("b", axis(kDim, 1)));
    }
    auto s = open();
    EXPECT_EQ(s->count(), 2);
    EXPECT_TRUE(s->audit().clean());
    EXPECT_EQ(s->store(make_record("a", axis(kDim, 0))).status, StoreOutcome::Status::AlreadyExists);
    EXPECT_EQ(s->store(make_record("c", axis(kDim, 2))).status, StoreOutcome::Status::Inserted);
    EXPECT_EQ(s->search(axis(kDim, 2), 1), std::vector<std::string>{"summary of c"});
}

TEST_P(StorageContractTest, ReopenWithOtherDimensionIsRejected) {
    {
        auto s = open(kDim);
        s->store(make_record("a", axis(kDim, 0)));
    }
    EXPECT_THROW(open(kDim * 2), DimensionMismatch);
}

TEST_P(StorageContractTest, ConcurrentStoresOfSameIdInsertOnce) {
    auto s = open();
    std::atomic<int> inserted {0};
    std::atomic<int> existing {0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 10; ++i) {
                auto out = s->store(make_record("m" + std::to_string(i), axis(kDim, (size_t)t % kDim)));
                if (out.status == StoreOutcome::Status::Inserted) ++inserted;
                else if (out.status == StoreOutcome::Status::AlreadyExists) ++existing;
            }
        });
    }
    for (auto& w : workers) w.join();
    EXPECT_EQ(inserted.load(), 10);
    EXPECT_EQ(existing.load(), 30);
    EXPECT_EQ(s->count(), 10);
    EXPECT_TRUE(s->audit().clean());
}

TEST_P(StorageContractTest, SwitchingBackendsKeepsAllRecordsSearchable) {
    {
        auto s = open();
        ASSERT_EQ(s->store(make_record("A", axis(kDim, 0))).status, StoreOutcome::Status::Inserted);
        ASSERT_EQ(s->store(make_record("B", axis(kDim, 1))).status, StoreOutcome::Status::Inserted);
    }
    {
        auto s = open_other();
        EXPECT_EQ(s->store(make_record("A", axis(kDim, 0))).status, StoreOutcome::Status::AlreadyExists);
        EXPECT_EQ(s->store(make_record("C", axis(kDim, 2))).status, StoreOutcome::Status::Inserted);
        EXPECT_EQ(s->store(make_record("D", axis(kDim, 3))).status, StoreOutcome::Status::Inserted);
        EXPECT_EQ(s->count(), 4);
        EXPECT_EQ(s->search(axis(kDim, 0), 1), std::vector<std::string>{"summary of A"});
        EXPECT_EQ(s->search(axis(kDim, 2), 1), std::vector<std::string>{"summary of C"});
        EXPECT_TRUE(s->audit().clean());
    }
    {
        auto s = open();
        EXPECT_EQ(s->store(make_record("E", axis(kDim, 0, 5.0f))).status, StoreOutcome::Status::Inserted);
        EXPECT_EQ(s->count(), 5);
        EXPECT_EQ(s->search(axis(kDim, 1), 1), std::vector<std::string>{"summary of B"});
        EXPECT_EQ(s->search(axis(kDim, 3), 1), std::vector<std::string>{"summary of D"});
        EXPECT_EQ(s->search(axis(kDim, 0, 5.0f), 1), std::vector<std::string>{"summary of E"});
        EXPECT_EQ(s->search(axis(kDim, 2), 10).size(), 5u);
        EXPECT_TRUE(s->audit().clean());
    }
    IndexedStorage indexed(storage_config(dir_, StorageKind::Index, kDim));
    auto report = indexed.audit();
    EXPECT_TRUE(report.clean());
    EXPECT_EQ(report.records, 5);
    EXPECT_EQ(report.vectors, 5);
}

TEST_P(StorageContractTest, CheckpointIsSharedAcrossBackends) {
    {
        auto s = open();
        s->set_checkpoint(at(1700000000));
    }
    {
        auto s = open_other();
        EXPECT_EQ(s->get_checkpoint(), at(1700000000));
        s->set_checkpoint(at(1800000000));
    }
    auto s = open();
    EXPECT_EQ(s->get_checkpoint(), at(1800000000));
}

INSTANTIATE_TEST_SUITE_P(Backends, StorageContractTest,
                         ::testing::Values(StorageKind::Index, StorageKind::Database),
                         [](const ::testing::TestParamInfo<StorageKind>& info) {
                             return to_string(info.param);
                         });

// ----------------------------------------------------------- index backend only

class IndexedStorageTest : public ::testing::Test {
protected:
    TempDir dir_;
    StorageConfig cfg_ {storage_config(dir_, StorageKind::Index, kDim)};
};

TEST_F(IndexedStorageTest, OrphanVectorsAreSkippedInSearch) {
    // a vector whose metadata row never made it, as after a crash between the two writes
    {
        FlatVectorIndex idx(cfg_.index_path, kDim);
        idx.add("ghost", axis(kDim, 0));
    }
    IndexedStorage s(cfg_);
    auto report = s.audit();
    EXPECT_EQ(report.vectors, 1);
    EXPECT_EQ(report.records, 0);
    EXPECT_EQ(report.orphan_vectors, 1);
    EXPECT_EQ(s.search(axis(kDim, 0), 5), std::vector<std::string>{kNoResults});

    ASSERT_EQ(s.store(make_record("real", axis(kDim, 1))).status, StoreOutcome::Status::Inserted);
    EXPECT_EQ(s.count(), 1);
    // the orphan is nearer to the query but must not surface or shift results
    EXPECT_EQ(s.search(axis(kDim, 0), 1), std::vector<std::string>{"summary of real"});
}

TEST_F(IndexedStorageTest, RetriedIdAfterOrphanResolvesToNewVectorOnly) {
    {
        FlatVectorIndex idx(cfg_.index_path, kDim);
        idx.add("m1", axis(kDim, 0));
    }
    IndexedStorage s(cfg_);
    ASSERT_EQ(s.store(make_record("m1", axis(kDim, 3))).status, StoreOutcome::Status::Inserted);
    EXPECT_EQ(s.search(axis(kDim, 0), 5), std::vector<std::string>{"summary of m1"});
    auto report = s.audit();
    EXPECT_EQ(report.orphan_vectors, 1);
    EXPECT_EQ(report.missing_vectors, 0);
}

TEST_F(IndexedStorageTest, MetadataWriteFailureLeavesSkippedOrphan) {
    cfg_.busy_timeout_ms = 0;
    IndexedStorage s(cfg_);
    ASSERT_EQ(s.store(make_record("a", axis(kDim, 0))).status, StoreOutcome::Status::Inserted);
    {
        // a second writer holds the database, so the row insert cannot start
        MetadataStore writer(cfg_.db_path, 0);
        MetadataStore::Transaction held(writer);
        auto out = s.store(make_record("b", axis(kDim, 1)));
        EXPECT_EQ(out.status, StoreOutcome::Status::Failed);
        EXPECT_NE(out.reason.find("orphan vector at handle 2"), std::string::npos);
    }
    auto report = s.audit();
    EXPECT_EQ(report.records, 1);
    EXPECT_EQ(report.vectors, 2);
    EXPECT_EQ(report.orphan_vectors, 1);
    EXPECT_EQ(report.missing_vectors, 0);
    EXPECT_EQ(s.count(), 1);
    EXPECT_EQ(s.search(axis(kDim, 1), 5), std::vector<std::string>{"summary of a"});

    ASSERT_EQ(s.store(make_record("b", axis(kDim, 1))).status, StoreOutcome::Status::Inserted);
    EXPECT_EQ(s.count(), 2);
    EXPECT_EQ(s.search(axis(kDim, 1), 1), std::vector<std::string>{"summary of b"});
    report = s.audit();
    EXPECT_EQ(report.orphan_vectors, 1);
    EXPECT_EQ(report.missing_vectors, 0);
}

TEST_F(IndexedStorageTest, RowsWithoutVectorsAreIndexedOnOpen) {
    // rows whose index file was lost
    {
        IndexedStorage s(cfg_);
        s.store(make_record("a", axis(kDim, 0)));
        s.store(make_record("b", axis(kDim, 1)));
    }
    std::filesystem::remove(cfg_.index_path);
    IndexedStorage s(cfg_);
    auto report = s.audit();
    EXPECT_TRUE(report.clean());
    EXPECT_EQ(report.vectors, 2);
    EXPECT_EQ(s.search(axis(kDim, 1), 1), std::vector<std::string>{"summary of b"});
    EXPECT_EQ(s.store(make_record("c", axis(kDim, 2))).status, StoreOutcome::Status::Inserted);
    EXPECT_EQ(s.search(axis(kDim, 2), 1), std::vector<std::string>{"summary of c"});
}

TEST_F(IndexedStorageTest, CheckpointIsMirroredIntoDatabase) {
    {
        IndexedStorage s(cfg_);
        s.set_checkpoint(at(1700000000));
    }
    MetadataStore meta(cfg_.db_path);
    EXPECT_EQ(meta.get_meta("last_email_check").value_or(""), "2023-11-14T22:13:20Z");
}

TEST_F(IndexedStorageTest, CheckpointFileIsIso8601) {
    IndexedStorage s(cfg_);
    s.set_checkpoint(at(1700000000));
    std::ifstream f(cfg_.checkpoint_path);
    std::string line;
    std::getline(f, line);
    EXPECT_EQ(line, "2023-11-14T22:13:20Z");
}

TEST_F(IndexedStorageTest, UnreadableCheckpointFallsBackToEpoch) {
    {
        std::ofstream f(cfg_.checkpoint_path);
        f << "not a date";
    }
    IndexedStorage s(cfg_);
    EXPECT_EQ(s.get_checkpoint(), epoch());
}

// -------------------------------------------------------- database backend only

TEST(DatabaseStorageTest, SearchOnlyScansRecentWindow) {
    TempDir dir;
    auto cfg = storage_config(dir, StorageKind::Database, kDim);
    cfg.search_window = 2;
    DatabaseStorage s(cfg);
    s.store(make_record("old", axis(kDim, 0)));
    s.store(make_record("newer", axis(kDim, 1)));
    s.store(make_record("newest", axis(kDim, 2)));

    auto hits = s.search(axis(kDim, 0), 5);
    EXPECT_EQ(hits.size(), 2u);
    EXPECT_EQ(std::set<std::string>(hits.begin(), hits.end()),
              (std::set<std::string>{"summary of newer", "summary of newest"}));
    EXPECT_EQ(s.count(), 3);
}

TEST(DatabaseStorageTest, DimensionIsRecordedOnFirstOpen) {
    TempDir dir;
    auto cfg = storage_config(dir, StorageKind::Database, kDim);
    { DatabaseStorage s(cfg); }
    MetadataStore meta(cfg.db_path);
    EXPECT_EQ(meta.get_meta("embedding_dim").value_or(""), std::to_string(kDim));
}
