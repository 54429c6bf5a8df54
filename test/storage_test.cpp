#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include <gtest/gtest.h>

#include "relaysync/storage/persistence.hpp"
#include "relaysync/storage/watermark_store.hpp"
#include "test_helpers.hpp"

using namespace relaysync::storage;
using namespace relaysync_test;
using namespace std;
using namespace ::testing;

namespace fs = std::filesystem;

namespace relaysync_test
{
class SlowReadPersistence : public InMemoryPersistence
{
public:
    optional<string> get(const string& key) override
    {
        this_thread::sleep_for(chrono::milliseconds(2));
        return InMemoryPersistence::get(key);
    };
};

class JsonFilePersistenceTest : public testing::Test
{
protected:
    fs::path directory;
    fs::path path;

    void SetUp() override
    {
        const auto* testInfo = UnitTest::GetInstance()->current_test_info();
        directory = fs::temp_directory_path() / (string("relaysync_") + testInfo->name());
        fs::remove_all(directory);
        path = directory / "nested" / "store.json";
    };

    void TearDown() override
    {
        fs::remove_all(directory);
    };
};

TEST(InMemoryPersistenceTest, Get_ReturnsStoredValue)
{
    InMemoryPersistence persistence;

    ASSERT_FALSE(persistence.get("key").has_value());

    persistence.set("key", "value");
    persistence.set("key", "updated");

    ASSERT_EQ(persistence.get("key").value_or(""), "updated");
};

TEST_F(JsonFilePersistenceTest, Set_PersistsValues_AcrossInstances)
{
    {
        JsonFilePersistence persistence(path);
        persistence.set("watermark:messages", "1700000000");
        persistence.set("follower-baseline:owner", "{\"version\":1}");
    }

    JsonFilePersistence reloaded(path);

    ASSERT_EQ(reloaded.get("watermark:messages").value_or(""), "1700000000");
    ASSERT_EQ(reloaded.get("follower-baseline:owner").value_or(""), "{\"version\":1}");
    ASSERT_FALSE(reloaded.get("missing").has_value());
    ASSERT_FALSE(fs::exists(path.string() + ".tmp"));
};

TEST_F(JsonFilePersistenceTest, Constructor_StartsEmpty_WhenFileIsCorrupt)
{
    fs::create_directories(path.parent_path());
    {
        ofstream file(path);
        file << "{ this is not json";
    }

    JsonFilePersistence persistence(path);

    ASSERT_FALSE(persistence.get("anything").has_value());

    persistence.set("key", "value");
    ASSERT_EQ(JsonFilePersistence(path).get("key").value_or(""), "value");
};

TEST(WatermarkStoreTest, Constructor_Throws_WithoutPersistence)
{
    ASSERT_THROW(WatermarkStore(nullptr), invalid_argument);
};

TEST(WatermarkStoreTest, Advance_OnlyMovesForward)
{
    WatermarkStore watermarks(make_shared<InMemoryPersistence>());

    ASSERT_EQ(watermarks.get(WatermarkStore::NOTIFICATIONS), 0);
    ASSERT_TRUE(watermarks.advance(WatermarkStore::NOTIFICATIONS, 200));
    ASSERT_FALSE(watermarks.advance(WatermarkStore::NOTIFICATIONS, 100));
    ASSERT_FALSE(watermarks.advance(WatermarkStore::NOTIFICATIONS, 200));

    ASSERT_EQ(watermarks.get(WatermarkStore::NOTIFICATIONS), 200);
};

TEST(WatermarkStoreTest, Advance_NeverMovesBackward_UnderConcurrentCallers)
{
    WatermarkStore watermarks(make_shared<SlowReadPersistence>());

    vector<thread> writers;
    for (time_t timestamp = 1; timestamp <= 16; timestamp++)
    {
        writers.emplace_back([&watermarks, timestamp]() { watermarks.advance(WatermarkStore::MESSAGES, timestamp); });
    }
    for (auto& writer : writers)
    {
        writer.join();
    }

    ASSERT_EQ(watermarks.get(WatermarkStore::MESSAGES), 16);
};

TEST(WatermarkStoreTest, Watermarks_AreIndependentPerName)
{
    auto persistence = make_shared<InMemoryPersistence>();
    WatermarkStore watermarks(persistence);

    watermarks.advance(WatermarkStore::peerKey(BOB), 300);

    ASSERT_EQ(watermarks.get(WatermarkStore::peerKey(BOB)), 300);
    ASSERT_EQ(watermarks.get(WatermarkStore::peerKey(CAROL)), 0);
    ASSERT_EQ(watermarks.get(WatermarkStore::MESSAGES), 0);
    ASSERT_EQ(persistence->get("watermark:messages:" + BOB).value_or(""), "300");
};

TEST(WatermarkStoreTest, Get_IgnoresUnreadableValues)
{
    auto persistence = make_shared<InMemoryPersistence>();
    persistence->set("watermark:" + WatermarkStore::MESSAGES, "yesterday");

    WatermarkStore watermarks(persistence);

    ASSERT_EQ(watermarks.get(WatermarkStore::MESSAGES), 0);
    ASSERT_TRUE(watermarks.advance(WatermarkStore::MESSAGES, 10));
};
} // namespace relaysync_test
