#include <gtest/gtest.h>

#include <random>

#include "VolumeAddress.hpp"

using svf::planSegments;
using svf::Segment;
using svf::SegmentPlan;

namespace {

void checkPlanCovers(const SegmentPlan& plan, uint64_t offset, uint64_t length, uint64_t capacity)
{
    uint64_t pos = offset;
    uint64_t total = 0;
    for(size_t i = 0; i < plan.size(); ++i)
    {
        auto& seg = plan[i];
        ASSERT_GT(seg.length, 0u);
        ASSERT_LT(seg.offset, capacity);
        ASSERT_LE(seg.offset + seg.length, capacity);
        ASSERT_EQ(seg.volumeIndex * capacity + seg.offset, pos) << "segment " << i;
        if(i)
        {
            ASSERT_EQ(seg.volumeIndex, plan[i - 1].volumeIndex + 1);
            ASSERT_EQ(seg.offset, 0u);
        }
        pos += seg.length;
        total += seg.length;
    }
    ASSERT_EQ(total, length);
}

}

TEST(VolumeAddress, UnboundedCapacity)
{
    auto plan = planSegments(12345, 100, 0);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0], (Segment{0, 12345, 100}));
}

TEST(VolumeAddress, EmptyRequest)
{
    EXPECT_TRUE(planSegments(0, 0, 10).empty());
    EXPECT_TRUE(planSegments(25, 0, 10).empty());
    EXPECT_TRUE(planSegments(25, 0, 0).empty());
}

TEST(VolumeAddress, BoundaryCrossing)
{
    auto plan = planSegments(0, 15, 10);
    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan[0], (Segment{0, 0, 10}));
    EXPECT_EQ(plan[1], (Segment{1, 0, 5}));

    plan = planSegments(7, 25, 10);
    ASSERT_EQ(plan.size(), 4u);
    EXPECT_EQ(plan[0], (Segment{0, 7, 3}));
    EXPECT_EQ(plan[1], (Segment{1, 0, 10}));
    EXPECT_EQ(plan[2], (Segment{2, 0, 10}));
    EXPECT_EQ(plan[3], (Segment{3, 0, 2}));
}

TEST(VolumeAddress, StartAtBoundary)
{
    auto plan = planSegments(20, 10, 10);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0], (Segment{2, 0, 10}));
}

TEST(VolumeAddress, RandomPlansCoverRange)
{
    std::mt19937_64 rng(12345);
    std::uniform_int_distribution<uint64_t> capDist(1, 1000);
    std::uniform_int_distribution<uint64_t> offDist(0, 100000);
    std::uniform_int_distribution<uint64_t> lenDist(0, 5000);
    for(int i = 0; i < 2000; ++i)
    {
        auto capacity = capDist(rng);
        auto offset = offDist(rng);
        auto length = lenDist(rng);
        auto plan = planSegments(offset, length, capacity);
        checkPlanCovers(plan, offset, length, capacity);
        if(HasFatalFailure())
        {
            FAIL() << "offset=" << offset << " length=" << length << " capacity=" << capacity;
        }
    }
}

TEST(VolumeAddress, RegularLimitsMatchPlainPlan)
{
    std::vector<uint64_t> limits{10, 10, 10};
    for(uint64_t offset = 0; offset < 50; ++offset)
    {
        for(uint64_t length = 0; length < 30; ++length)
        {
            EXPECT_EQ(planSegments(offset, length, limits, 10), planSegments(offset, length, 10))
                    << "offset=" << offset << " length=" << length;
        }
    }
}

TEST(VolumeAddress, SealedPartialVolume)
{
    //volume 0 sealed at 7 bytes, following volumes have capacity 10
    std::vector<uint64_t> limits{7};
    auto plan = planSegments(7, 5, limits, 10);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0], (Segment{1, 0, 5}));

    plan = planSegments(5, 14, limits, 10);
    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(plan[0], (Segment{0, 5, 2}));
    EXPECT_EQ(plan[1], (Segment{1, 0, 10}));
    EXPECT_EQ(plan[2], (Segment{2, 0, 2}));
}

TEST(VolumeAddress, IrregularExistingVolumes)
{
    std::vector<uint64_t> limits{20, 20, 10};
    auto plan = planSegments(15, 40, limits, 10);
    ASSERT_EQ(plan.size(), 4u);
    EXPECT_EQ(plan[0], (Segment{0, 15, 5}));
    EXPECT_EQ(plan[1], (Segment{1, 0, 20}));
    EXPECT_EQ(plan[2], (Segment{2, 0, 10}));
    EXPECT_EQ(plan[3], (Segment{3, 0, 5}));
}

TEST(VolumeAddress, UnboundedLastVolume)
{
    std::vector<uint64_t> limits{5, 5};
    auto plan = planSegments(3, 100, limits, 0);
    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan[0], (Segment{0, 3, 2}));
    EXPECT_EQ(plan[1], (Segment{1, 0, 98}));
}

TEST(VolumeAddress, EmptyVolumeIsSkipped)
{
    std::vector<uint64_t> limits{4, 0, 4};
    auto plan = planSegments(2, 4, limits, 4);
    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan[0], (Segment{0, 2, 2}));
    EXPECT_EQ(plan[1], (Segment{2, 0, 2}));
}

TEST(VolumeAddress, Naming)
{
    EXPECT_EQ(svf::volumeSuffix(0), "");
    EXPECT_EQ(svf::volumeSuffix(1), ".2");
    EXPECT_EQ(svf::volumeSuffix(2), ".3");
    EXPECT_EQ(svf::volumeSuffix(10), ".11");

    boost::filesystem::path base = "dir/archive.tar";
    EXPECT_EQ(svf::volumePath(base, 0), base);
    EXPECT_EQ(svf::volumePath(base, 1), boost::filesystem::path("dir/archive.tar.2"));
    EXPECT_EQ(svf::volumePath(base, 4), boost::filesystem::path("dir/archive.tar.5"));
}
