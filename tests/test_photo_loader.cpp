#include <gtest/gtest.h>

#include "core/loader/photo_loader.h"
#include "core/loader/request_tracker.h"
#include "io/photo/contact_photo_store.h"
#include "io/photo/stb_image_decoder.h"
#include "test_helpers.h"

#include <any>
#include <fstream>
#include <map>
#include <string>
#include <vector>

using namespace cphoto;
using namespace cphoto_test;

namespace
{
struct Delivery
{
    int token = 0;
    std::string cookie;
    ImageHandle image;
};

class AsyncPhotoLoaderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        provider.Add("content://contacts/1/photo", "face-one");
        provider.Add("content://contacts/2/photo", "face-two!");
        cfg.worker_count = 1;
        loader = std::make_unique<AsyncPhotoLoader>(cfg, provider, decoder, registry, delivery);
        loader->Start();
    }

    LoadCompleteListener Recorder()
    {
        return [this](int token, const std::any& cookie, const ImageHandle& image)
        {
            Delivery d;
            d.token = token;
            d.cookie = std::any_cast<std::string>(cookie);
            d.image = image;
            delivered.push_back(d);
        };
    }

    TargetHandle Caller(std::int64_t id)
    {
        CallerInfo info;
        info.person_id = id;
        return registry.Create(info);
    }

    bool WaitFor(size_t n)
    {
        return PumpUntil(delivery, [&]() { return delivered.size() >= n; });
    }

    FakeProvider provider;
    FakeDecoder decoder;
    TargetRegistry registry;
    DeliveryQueue delivery;
    LoaderConfig cfg;
    std::unique_ptr<AsyncPhotoLoader> loader;
    std::vector<Delivery> delivered;
};
} // namespace

TEST_F(AsyncPhotoLoaderTest, ValidLocatorDeliversImage)
{
    const TargetHandle a = Caller(1);
    loader->RequestLoad(a, 1, registry.PhotoLocatorFor(a), std::string("c1"), Recorder());

    ASSERT_TRUE(WaitFor(1));
    EXPECT_EQ(delivered[0].token, 1);
    EXPECT_EQ(delivered[0].cookie, "c1");
    ASSERT_NE(delivered[0].image, nullptr);
    EXPECT_EQ(delivered[0].image->width, 8);
    EXPECT_EQ(registry.Find(a)->cached_photo, delivered[0].image);
    EXPECT_TRUE(registry.Find(a)->is_cached_photo_current);
}

TEST_F(AsyncPhotoLoaderTest, SameIdentityIsGatedButStillIsolatedIfDispatched)
{
    const TargetHandle a = Caller(1);
    RequestTracker slot;

    ASSERT_TRUE(slot.ShouldLoad(a));
    slot.SetIdentity(a);
    loader->RequestLoad(a, 1, registry.PhotoLocatorFor(a), std::string("first"), Recorder());

    EXPECT_FALSE(slot.ShouldLoad(a));
    // Dispatched anyway with a different locator: its own result, nothing mixed in.
    loader->RequestLoad(a, 2, "content://contacts/2/photo", std::string("second"), Recorder());

    ASSERT_TRUE(WaitFor(2));
    EXPECT_EQ(delivered[1].token, 2);
    EXPECT_EQ(delivered[1].cookie, "second");
    ASSERT_NE(delivered[1].image, nullptr);
    EXPECT_EQ(delivered[1].image->source_hint, "content://contacts/2/photo");
}

TEST_F(AsyncPhotoLoaderTest, UnopenableLocatorDeliversAbsent)
{
    const TargetHandle a = Caller(3);
    loader->RequestLoad(a, 3, registry.PhotoLocatorFor(a), std::string("c3"), Recorder());

    ASSERT_TRUE(WaitFor(1));
    EXPECT_EQ(delivered[0].token, 3);
    EXPECT_EQ(delivered[0].cookie, "c3");
    EXPECT_TRUE(IsAbsent(delivered[0].image));
    EXPECT_EQ(registry.Find(a)->cached_photo, nullptr);
    EXPECT_TRUE(registry.Find(a)->is_cached_photo_current);
}

TEST_F(AsyncPhotoLoaderTest, EmptyLocatorIsRejectedWithoutCallback)
{
    loader->RequestLoad(Caller(1), 4, "", std::string("c4"), Recorder());
    loader->RequestLoad(Caller(1), 5, "content://contacts/1/photo", std::string("c5"), Recorder());

    ASSERT_TRUE(WaitFor(1));
    loader->Stop();
    delivery.RunPending();
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].token, 5);
    EXPECT_EQ(provider.opened.load(), 1);
}

TEST_F(AsyncPhotoLoaderTest, SlotsNeverCrossDeliver)
{
    const TargetHandle a = Caller(1);
    const TargetHandle b = Caller(2);
    RequestTracker left;
    RequestTracker right;
    std::map<std::string, std::vector<int>> per_slot;

    auto listener = [&](int token, const std::any& cookie, const ImageHandle& image)
    {
        const std::string slot = std::any_cast<std::string>(cookie);
        per_slot[slot].push_back(token);
        ASSERT_NE(image, nullptr);
        EXPECT_EQ(image->source_hint, slot == "left" ? "content://contacts/1/photo" : "content://contacts/2/photo");
    };

    for (int round = 0; round < 5; ++round)
    {
        left.SetIdentity(a);
        right.SetIdentity(b);
        loader->RequestLoad(a, 100 + round, registry.PhotoLocatorFor(a), std::string("left"), listener);
        loader->RequestLoad(b, 200 + round, registry.PhotoLocatorFor(b), std::string("right"), listener);
    }

    ASSERT_TRUE(PumpUntil(delivery, [&]() { return loader->DeliveredCount() == 10; }));
    EXPECT_EQ(per_slot["left"], (std::vector<int>{100, 101, 102, 103, 104}));
    EXPECT_EQ(per_slot["right"], (std::vector<int>{200, 201, 202, 203, 204}));
}

// No cancellation: a slot that moved on still receives the older result.
TEST_F(AsyncPhotoLoaderTest, InFlightRequestStillDeliversAfterSlotMovesOn)
{
    const TargetHandle a = Caller(1);
    const TargetHandle b = Caller(2);
    RequestTracker slot;

    slot.SetIdentity(a);
    loader->RequestLoad(a, 1, registry.PhotoLocatorFor(a), std::string("slot"), Recorder());
    ASSERT_TRUE(slot.ShouldLoad(b));
    slot.SetIdentity(b);
    loader->RequestLoad(b, 2, registry.PhotoLocatorFor(b), std::string("slot"), Recorder());

    ASSERT_TRUE(WaitFor(2));
    EXPECT_EQ(delivered[0].token, 1);
    EXPECT_EQ(delivered[1].token, 2);
    // Only token 2 matches what the slot wants now; filtering is the listener's call.
    EXPECT_EQ(slot.CurrentIdentity(), b);
}

TEST_F(AsyncPhotoLoaderTest, ManyRequestsManyResults)
{
    const TargetHandle a = Caller(1);
    for (int i = 0; i < 100; ++i)
    {
        const std::string loc = (i % 2 == 0) ? "content://contacts/1/photo" : "content://contacts/404/photo";
        loader->RequestLoad(a, i, loc, std::string("c") + std::to_string(i), Recorder());
    }

    ASSERT_TRUE(WaitFor(100));
    loader->Stop();
    delivery.RunPending();
    ASSERT_EQ(delivered.size(), 100u);
    for (int i = 0; i < 100; ++i)
    {
        EXPECT_EQ(delivered[(size_t)i].token, i);
        EXPECT_EQ(delivered[(size_t)i].cookie, "c" + std::to_string(i));
        EXPECT_EQ(delivered[(size_t)i].image != nullptr, i % 2 == 0);
    }
    EXPECT_EQ(loader->PendingCount(), 0u);
}

TEST(AsyncPhotoLoaderEndToEnd, LoadsContactPhotoFromDirectory)
{
    ScratchDir dir("cphoto_e2e");
    {
        std::ofstream f(dir.Path() / "21.ppm", std::ios::binary);
        f << MakePpm(5, 4, 200, 100, 50);
    }

    LoaderConfig cfg;
    cfg.photo_dir = dir.Path().string();
    ContactPhotoStore store(cfg.photo_dir, cfg.prefer_high_res);
    StbImageDecoder decoder;
    TargetRegistry registry;
    DeliveryQueue delivery;
    AsyncPhotoLoader loader(cfg, store, decoder, registry, delivery);
    loader.Start();

    CallerInfo known;
    known.person_id = 21;
    CallerInfo unknown;
    unknown.person_id = 22;
    const TargetHandle a = registry.Create(known);
    const TargetHandle b = registry.Create(unknown);

    std::map<int, ImageHandle> got;
    auto listener = [&](int token, const std::any&, const ImageHandle& image) { got[token] = image; };
    loader.RequestLoad(a, 1, registry.PhotoLocatorFor(a), {}, listener);
    loader.RequestLoad(b, 2, registry.PhotoLocatorFor(b), {}, listener);

    ASSERT_TRUE(PumpUntil(delivery, [&]() { return got.size() == 2; }));
    ASSERT_NE(got[1], nullptr);
    EXPECT_EQ(got[1]->width, 5);
    EXPECT_EQ(got[1]->height, 4);
    EXPECT_EQ(got[1]->pixels[0], 200);
    EXPECT_EQ(got[2], nullptr);
    EXPECT_EQ(registry.Find(a)->cached_photo, got[1]);
    EXPECT_TRUE(registry.Find(b)->is_cached_photo_current);
}

TEST(AsyncPhotoLoaderLifetime, ResultsQueuedPastLoaderLifetimeAreDropped)
{
    FakeProvider provider;
    FakeDecoder decoder;
    TargetRegistry registry;
    DeliveryQueue delivery;
    provider.Add("content://contacts/1/photo", "face");

    CallerInfo info;
    info.person_id = 1;
    const TargetHandle a = registry.Create(info);
    int calls = 0;
    {
        LoaderConfig cfg;
        AsyncPhotoLoader loader(cfg, provider, decoder, registry, delivery);
        loader.Start();
        loader.RequestLoad(a, 1, registry.PhotoLocatorFor(a), {}, [&](int, const std::any&, const ImageHandle&) { ++calls; });
        loader.Stop();
        EXPECT_EQ(delivery.PendingCount(), 1u);
    }

    EXPECT_EQ(delivery.RunPending(), 1u);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(registry.Find(a)->cached_photo, nullptr);
}
