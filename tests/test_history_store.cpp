#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "history_store.hpp"
#include "sqlite_backend.hpp"
#include "storage_backend.hpp"

using namespace std::chrono_literals;

// ============================================================================
// Every test runs on both backends
// ============================================================================

class HistoryStoreTest : public ::testing::TestWithParam<std::string>
{
protected:
    timestamp_t now = from_unix_ms(1700000000000);

    std::unique_ptr<StorageBackend> MakeBackend()
    {
        if (GetParam() == "sqlite")
        {
            auto res = SqliteBackend::Open(":memory:");
            EXPECT_TRUE(res.ok()) << res.error();
            if (res.ok())
                return std::move(res.get());
        }
        return std::make_unique<MemoryBackend>();
    }

    std::unique_ptr<HistoryStore> MakeStore(size_t max_entries, std::chrono::hours max_age = 0h)
    {
        return std::make_unique<HistoryStore>(MakeBackend(), max_entries, max_age, [this] { return now; });
    }

    EntryId AddText(HistoryStore& store, const std::string& text)
    {
        now += 1s;
        const Result<EntryId>& res = store.Add(text, EntryKind::Text);
        EXPECT_TRUE(res.ok()) << res.error();
        return res.ok() ? res.get() : 0;
    }

    static std::vector<std::string> Contents(const HistoryStore& store, const std::string& filter = "")
    {
        std::vector<std::string> ret;
        const auto&              list = store.List(filter);
        EXPECT_TRUE(list.ok()) << list.error();
        if (list.ok())
            for (const entry_t& e : list.get())
                ret.push_back(e.is_text() ? e.content : "<image>");
        return ret;
    }

    static size_t CountOf(const HistoryStore& store)
    {
        const Result<size_t>& res = store.Count();
        EXPECT_TRUE(res.ok()) << res.error();
        return res.ok() ? res.get() : 0;
    }
};

INSTANTIATE_TEST_SUITE_P(Backends, HistoryStoreTest, ::testing::Values("memory", "sqlite"));

// ============================================================================
// Consecutive dedup
// ============================================================================

TEST_P(HistoryStoreTest, SameTextTwiceIsOneEntry)
{
    auto store = MakeStore(500);

    const EntryId     first      = AddText(*store, "hello");
    const timestamp_t first_time = now;
    const EntryId     second     = AddText(*store, "hello");

    EXPECT_EQ(first, second);
    EXPECT_EQ(CountOf(*store), 1u);

    const auto& entry = store->Get(first);
    ASSERT_TRUE(entry.ok());
    ASSERT_TRUE(entry.get().has_value());
    EXPECT_EQ(entry.get()->created_at, first_time);
    EXPECT_EQ(entry.get()->last_used_at, now);
}

TEST_P(HistoryStoreTest, AThenBThenAKeepsTwoRowsForA)
{
    auto store = MakeStore(500);

    const EntryId a1 = AddText(*store, "A");
    AddText(*store, "B");
    const EntryId a2 = AddText(*store, "A");

    EXPECT_NE(a1, a2);
    EXPECT_EQ(CountOf(*store), 3u);
    EXPECT_EQ(Contents(*store), (std::vector<std::string>{ "A", "B", "A" }));
}

TEST_P(HistoryStoreTest, DedupIsCaseSensitive)
{
    auto store = MakeStore(500);

    AddText(*store, "hello");
    AddText(*store, "Hello");

    EXPECT_EQ(CountOf(*store), 2u);
}

TEST_P(HistoryStoreTest, SameImageTwiceIsOneEntry)
{
    auto store = MakeStore(500);

    const std::string png("\x89PNG\r\n\x1a\n-image-bytes", 20);
    const auto&       first  = store->Add(png, EntryKind::Image);
    const auto&       second = store->Add(png, EntryKind::Image);

    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(CountOf(*store), 1u);
}

TEST_P(HistoryStoreTest, SameBytesAsTextAndImageAreDifferent)
{
    auto store = MakeStore(500);

    ASSERT_TRUE(store->Add("payload", EntryKind::Text).ok());
    ASSERT_TRUE(store->Add("payload", EntryKind::Image).ok());

    EXPECT_EQ(CountOf(*store), 2u);
}

// ============================================================================
// Capacity and pins
// ============================================================================

TEST_P(HistoryStoreTest, EvictsOldestUnpinned)
{
    auto store = MakeStore(3);

    AddText(*store, "a");
    AddText(*store, "b");
    AddText(*store, "c");
    AddText(*store, "d");

    EXPECT_EQ(CountOf(*store), 3u);
    EXPECT_EQ(Contents(*store), (std::vector<std::string>{ "d", "c", "b" }));
}

TEST_P(HistoryStoreTest, PinnedEntryIsNeverTheVictim)
{
    auto store = MakeStore(3);

    const EntryId a = AddText(*store, "a");
    AddText(*store, "b");
    AddText(*store, "c");
    ASSERT_TRUE(store->SetPinned(a, true).ok());

    AddText(*store, "d");
    AddText(*store, "e");

    EXPECT_EQ(CountOf(*store), 3u);
    EXPECT_EQ(Contents(*store), (std::vector<std::string>{ "a", "e", "d" }));
}

TEST_P(HistoryStoreTest, AllPinnedOverflowsByTheMinimum)
{
    auto store = MakeStore(2);

    const EntryId a = AddText(*store, "a");
    const EntryId b = AddText(*store, "b");
    ASSERT_TRUE(store->SetPinned(a, true).ok());
    ASSERT_TRUE(store->SetPinned(b, true).ok());

    // nothing to evict, the capture still goes in
    const EntryId c = AddText(*store, "c");
    EXPECT_NE(c, 0);
    EXPECT_EQ(CountOf(*store), 3u);

    // c is unpinned now, so it makes room for d
    AddText(*store, "d");
    EXPECT_EQ(CountOf(*store), 3u);
    EXPECT_EQ(Contents(*store), (std::vector<std::string>{ "b", "a", "d" }));
}

TEST_P(HistoryStoreTest, NewestIsNeverEvicted)
{
    auto store = MakeStore(1);

    const EntryId a = AddText(*store, "a");
    ASSERT_TRUE(store->SetPinned(a, true).ok());

    const EntryId b = AddText(*store, "b");

    const auto& entry = store->Get(b);
    ASSERT_TRUE(entry.ok());
    EXPECT_TRUE(entry.get().has_value());
}

TEST_P(HistoryStoreTest, CountNeverExceedsLimitWithoutPins)
{
    auto store = MakeStore(10);

    for (int i = 0; i < 100; ++i)
    {
        AddText(*store, "entry " + std::to_string(i));
        ASSERT_LE(CountOf(*store), 10u);
    }
}

// ============================================================================
// Listing
// ============================================================================

TEST_P(HistoryStoreTest, PinnedFirstThenNewestFirst)
{
    auto store = MakeStore(500);

    AddText(*store, "a");
    const EntryId b = AddText(*store, "b");
    AddText(*store, "c");
    const EntryId d = AddText(*store, "d");
    AddText(*store, "e");

    ASSERT_TRUE(store->SetPinned(b, true).ok());
    ASSERT_TRUE(store->SetPinned(d, true).ok());

    EXPECT_EQ(Contents(*store), (std::vector<std::string>{ "d", "b", "e", "c", "a" }));
}

TEST_P(HistoryStoreTest, RefreshedDuplicateMovesUp)
{
    auto store = MakeStore(500);

    AddText(*store, "a");
    AddText(*store, "b");
    AddText(*store, "b");

    EXPECT_EQ(Contents(*store), (std::vector<std::string>{ "b", "a" }));
}

TEST_P(HistoryStoreTest, FilterIsCaseInsensitiveAndSkipsImages)
{
    auto store = MakeStore(500);

    AddText(*store, "Hello World");
    AddText(*store, "goodbye");
    ASSERT_TRUE(store->Add("\x89PNG hello", EntryKind::Image).ok());
    AddText(*store, "say HELLO");

    EXPECT_EQ(Contents(*store, "hello"), (std::vector<std::string>{ "say HELLO", "Hello World" }));
    EXPECT_EQ(Contents(*store, "nothing like this"), std::vector<std::string>{});
    EXPECT_EQ(Contents(*store).size(), 4u);
}

TEST_P(HistoryStoreTest, ListLimit)
{
    auto store = MakeStore(500);

    for (int i = 0; i < 10; ++i)
        AddText(*store, "item " + std::to_string(i));

    const auto& list = store->List("", 3);
    ASSERT_TRUE(list.ok());
    ASSERT_EQ(list.get().size(), 3u);
    EXPECT_EQ(list.get()[0].content, "item 9");

    const auto& filtered = store->List("item", 2);
    ASSERT_TRUE(filtered.ok());
    EXPECT_EQ(filtered.get().size(), 2u);
}

TEST_P(HistoryStoreTest, ListLeavesImageBytesToGet)
{
    auto store = MakeStore(500);

    const std::string png(4096, '\x42');
    const auto&       id = store->Add(png, EntryKind::Image);
    ASSERT_TRUE(id.ok());

    const auto& list = store->List();
    ASSERT_TRUE(list.ok());
    ASSERT_EQ(list.get().size(), 1u);
    EXPECT_TRUE(list.get()[0].is_image());
    EXPECT_TRUE(list.get()[0].content.empty());
    EXPECT_EQ(list.get()[0].size, png.size());
    EXPECT_EQ(list.get()[0].preview(), "Image (4 KB)");

    const auto& entry = store->Get(id.get());
    ASSERT_TRUE(entry.ok());
    ASSERT_TRUE(entry.get().has_value());
    EXPECT_EQ(entry.get()->content, png);
}

// ============================================================================
// Mutations by id
// ============================================================================

TEST_P(HistoryStoreTest, StaleIdIsNoOp)
{
    auto store = MakeStore(500);

    const EntryId a = AddText(*store, "a");
    ASSERT_TRUE(store->Delete(a).ok());

    EXPECT_TRUE(store->Delete(a).ok());
    EXPECT_TRUE(store->SetPinned(a, true).ok());
    EXPECT_TRUE(store->SetPinned(12345, false).ok());

    const auto& entry = store->Get(a);
    ASSERT_TRUE(entry.ok());
    EXPECT_FALSE(entry.get().has_value());
}

TEST_P(HistoryStoreTest, UnpinMakesEntryEvictableAgain)
{
    auto store = MakeStore(2);

    const EntryId a = AddText(*store, "a");
    ASSERT_TRUE(store->SetPinned(a, true).ok());
    AddText(*store, "b");
    ASSERT_TRUE(store->SetPinned(a, false).ok());

    AddText(*store, "c");

    EXPECT_EQ(Contents(*store), (std::vector<std::string>{ "c", "b" }));
}

TEST_P(HistoryStoreTest, ClearKeepsPinned)
{
    auto store = MakeStore(500);

    const EntryId a = AddText(*store, "a");
    AddText(*store, "b");
    AddText(*store, "c");
    ASSERT_TRUE(store->SetPinned(a, true).ok());

    const Result<size_t>& cleared = store->Clear();
    ASSERT_TRUE(cleared.ok());
    EXPECT_EQ(cleared.get(), 2u);
    EXPECT_EQ(Contents(*store), (std::vector<std::string>{ "a" }));
}

TEST_P(HistoryStoreTest, ExpireDropsOldUnpinned)
{
    auto store = MakeStore(500, 24h);

    const EntryId old_pinned = AddText(*store, "old pinned");
    AddText(*store, "old");
    ASSERT_TRUE(store->SetPinned(old_pinned, true).ok());

    now += 48h;
    AddText(*store, "fresh");

    const Result<size_t>& expired = store->Expire();
    ASSERT_TRUE(expired.ok());
    EXPECT_EQ(Contents(*store), (std::vector<std::string>{ "old pinned", "fresh" }));
}

TEST_P(HistoryStoreTest, ClosedStoreReportsStorageUnavailable)
{
    auto store = MakeStore(500);
    AddText(*store, "a");

    store->Close();
    EXPECT_TRUE(store->IsClosed());

    const Result<EntryId>& res = store->Add("b", EntryKind::Text);
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.kind(), ErrorKind::StorageUnavailable);
    EXPECT_EQ(store->List().kind(), ErrorKind::StorageUnavailable);

    // twice is fine
    store->Close();
}

// ============================================================================
// Watcher thread adds while the UI thread pins and deletes
// ============================================================================

TEST_P(HistoryStoreTest, ConcurrentAddPinDeleteStress)
{
    constexpr size_t limit = 50;
    auto             store = std::make_unique<HistoryStore>(MakeBackend(), limit);

    std::atomic<bool> done{ false };
    std::set<EntryId> deleted;

    // failures stop the loops, never skip the join
    std::atomic<bool> failed{ false };

    std::thread watcher([&] {
        for (int i = 0; i < 1500 && !failed.load(); ++i)
        {
            // every third capture repeats the previous one
            const std::string text = "capture " + std::to_string(i % 3 == 0 ? i - 1 : i);
            const bool        ok   = store->Add(text, EntryKind::Text).ok();
            EXPECT_TRUE(ok) << text;
            if (!ok)
                failed.store(true);
        }
        done.store(true);
    });

    std::mt19937 rng(42);
    size_t       pinned = 0;
    while (!done.load() && !failed.load())
    {
        const auto& snapshot = store->List();
        EXPECT_TRUE(snapshot.ok());
        if (!snapshot.ok())
        {
            failed.store(true);
            break;
        }

        std::set<EntryId> ids;
        for (const entry_t& e : snapshot.get())
            EXPECT_TRUE(ids.insert(e.id).second) << "duplicate id " << e.id;

        if (snapshot.get().empty())
            continue;

        const entry_t& victim = snapshot.get()[rng() % snapshot.get().size()];
        if (rng() % 2 == 0 && pinned < 10 && !victim.pinned)
        {
            EXPECT_TRUE(store->SetPinned(victim.id, true).ok());
            ++pinned;
        }
        else if (!victim.pinned)
        {
            EXPECT_TRUE(store->Delete(victim.id).ok());
            deleted.insert(victim.id);
        }
    }
    watcher.join();
    ASSERT_FALSE(failed.load());

    const auto& list = store->List();
    ASSERT_TRUE(list.ok());
    EXPECT_LE(list.get().size(), limit);

    std::set<EntryId> ids;
    size_t            pinned_left = 0;
    for (const entry_t& e : list.get())
    {
        EXPECT_TRUE(ids.insert(e.id).second);
        EXPECT_EQ(deleted.count(e.id), 0u) << "deleted id " << e.id << " came back";
        if (e.pinned)
            ++pinned_left;
    }

    // pins are never evicted
    EXPECT_EQ(pinned_left, pinned);
}
