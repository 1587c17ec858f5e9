#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "test_utils.hpp"

using namespace Skuld;
using namespace Skuld::Testing;

namespace {
    std::shared_ptr<const Model::PredictorModel> trained_model()
    {
        auto model = std::make_shared<Model::PredictorModel>(small_network());
        static_cast<void>(model->fit(training_examples(candidate_plans(12)), quick_fit(3)));
        return model;
    }

    Store::ArtifactKey tiny_key()
    {
        return Store::make_key(Plan::Benchmark::DenseTransformer, tiny_mesh());
    }

    void expect_same_predictions(const Model::PredictorModel& left, const Model::PredictorModel& right)
    {
        for (const auto& plan : eight_plans()) {
            const auto graph = encode(plan);
            const auto expected = left.predict(graph);
            EXPECT_NEAR(right.predict(graph), expected, 1e-9 * std::max(1.0, expected)) << plan.signature();
        }
    }
}

TEST(ArtifactKey, NamesTheStorageDirectory)
{
    const auto key = tiny_key();
    EXPECT_EQ(key.benchmark, "gpt");
    EXPECT_EQ(key.hardware_signature, "a100-1x4");
    EXPECT_EQ(key.schema_version, std::string(Encoding::kSchemaVersion));
    EXPECT_EQ(key.relative_path(), "gpt/a100-1x4/" + key.schema_version);

    auto bad = key;
    bad.hardware_signature = "../escape";
    EXPECT_THROW(Store::validate(bad), std::invalid_argument);
}

TEST(ArtifactStore, RoundTripsThroughTheFilesystem)
{
    const TemporaryDirectory directory;
    const auto key = tiny_key();
    const auto model = trained_model();
    {
        Store::ArtifactStore store(directory.path());
        EXPECT_FALSE(store.contains(key));
        EXPECT_FALSE(store.load(key).has_value());
        store.save(key, model);
        EXPECT_TRUE(store.contains(key));
    }

    const auto record = directory.path() / key.relative_path();
    EXPECT_TRUE(std::filesystem::exists(record / Store::kMetadataFile));
    EXPECT_TRUE(std::filesystem::exists(record / Store::kParametersFile));

    Store::ArtifactStore reopened(directory.path());
    const auto loaded = reopened.load(key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ((*loaded)->freshness(), Model::Freshness::Loaded);
    EXPECT_EQ((*loaded)->example_count(), model->example_count());
    expect_same_predictions(*model, **loaded);

    // Memoized: the same instance is handed out again.
    EXPECT_EQ(reopened.load(key)->get(), loaded->get());
    ASSERT_EQ(reopened.keys().size(), 1U);
    EXPECT_EQ(reopened.keys().front(), key);
}

TEST(ArtifactStore, CreateRefusesToOverwrite)
{
    Store::ArtifactStore store(std::make_shared<Store::MemoryBackend>());
    const auto key = tiny_key();
    const auto model = trained_model();
    store.save(key, model);
    EXPECT_THROW(store.save(key, model, Store::SaveMode::Create), Error::DestinationConflict);
    EXPECT_NO_THROW(store.save(key, model, Store::SaveMode::Replace));
}

TEST(ArtifactStore, OlderSchemaRecordRaisesSchemaMismatch)
{
    const TemporaryDirectory directory;
    const auto key = tiny_key();
    {
        Store::ArtifactStore store(directory.path());
        store.save(key, trained_model());
    }

    const auto metadata_path = directory.path() / key.relative_path() / Store::kMetadataFile;
    auto metadata = Common::SaveLoad::read_json_file(metadata_path);
    metadata.put("schema_version", "v1");
    Common::SaveLoad::write_json_file(metadata_path, metadata);

    Store::ArtifactStore store(directory.path());
    try {
        static_cast<void>(store.load(key));
        FAIL() << "expected SchemaMismatch";
    } catch (const Error::SchemaMismatch& error) {
        EXPECT_EQ(error.expected(), std::string(Encoding::kSchemaVersion));
        EXPECT_EQ(error.actual(), "v1");
    }
}

TEST(ArtifactStore, KeyOfAnotherSchemaRaisesSchemaMismatchWhenPresent)
{
    auto backend = std::make_shared<Store::MemoryBackend>();
    Store::ArtifactStore store(backend);
    auto old_key = tiny_key();
    old_key.schema_version = "v1";
    EXPECT_FALSE(store.load(old_key).has_value());

    backend->write(old_key.relative_path() + "/" + Store::kMetadataFile, "{}");
    backend->write(old_key.relative_path() + "/" + Store::kParametersFile, "");
    EXPECT_THROW(static_cast<void>(store.load(old_key)), Error::SchemaMismatch);
}

TEST(ArtifactStore, DamagedRecordsRaiseArtifactCorrupted)
{
    auto backend = std::make_shared<Store::MemoryBackend>();
    Store::ArtifactStore store(backend);
    const auto key = tiny_key();
    store.save(key, trained_model());

    backend->write(key.relative_path() + "/" + Store::kParametersFile, "truncated");
    store.forget(key);
    EXPECT_THROW(static_cast<void>(store.load(key)), Error::ArtifactCorrupted);

    EXPECT_TRUE(backend->remove(key.relative_path() + "/" + Store::kParametersFile));
    EXPECT_THROW(static_cast<void>(store.load(key)), Error::ArtifactCorrupted);
}

TEST(ArtifactStore, RemoveDeletesTheRecord)
{
    Store::ArtifactStore store(std::make_shared<Store::MemoryBackend>());
    const auto key = tiny_key();
    store.save(key, trained_model());
    EXPECT_TRUE(store.remove(key));
    EXPECT_FALSE(store.contains(key));
    EXPECT_FALSE(store.load(key).has_value());
    EXPECT_FALSE(store.remove(key));
}

TEST(ArtifactStore, AttachmentsLiveBesideTheRecord)
{
    Store::ArtifactStore store(std::make_shared<Store::MemoryBackend>());
    const auto key = tiny_key();
    EXPECT_FALSE(store.read_attachment(key, "notes.json").has_value());
    store.write_attachment(key, "notes.json", "{\"a\": 1}");
    EXPECT_EQ(store.read_attachment(key, "notes.json").value(), "{\"a\": 1}");
    EXPECT_FALSE(store.contains(key));
    EXPECT_TRUE(store.remove_attachment(key, "notes.json"));
    EXPECT_FALSE(store.read_attachment(key, "notes.json").has_value());
}

TEST(FilesystemBackend, KeyLockSerializesWriters)
{
    const TemporaryDirectory directory;
    Store::ArtifactStore store(directory.path());
    const auto key = tiny_key();

    std::vector<std::string> order;
    std::mutex order_mutex;
    auto first_lock = store.lock(key);
    std::thread second([&] {
        const auto guard = store.lock(key);
        std::lock_guard<std::mutex> hold(order_mutex);
        order.push_back("second");
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    {
        std::lock_guard<std::mutex> hold(order_mutex);
        order.push_back("first");
    }
    first_lock.reset();
    second.join();
    EXPECT_EQ(order, (std::vector<std::string>{"first", "second"}));
}
