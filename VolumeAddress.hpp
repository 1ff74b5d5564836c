#pragma once

#include <vector>
#include <limits>
#include <string>
#include <stdint.h>

#include <boost/filesystem/path.hpp>

namespace svf {

using OffsetType = uint64_t;
using VolumeIndex = size_t;

//Capacity of the volume that may grow without limit
constexpr OffsetType k_unboundedVolume = std::numeric_limits<OffsetType>::max();

struct Segment {
    VolumeIndex volumeIndex;
    OffsetType offset;
    OffsetType length;

    friend bool operator==(const Segment& left, const Segment& right)
    {
        return left.volumeIndex == right.volumeIndex && left.offset == right.offset &&
               left.length == right.length;
    }
    friend bool operator!=(const Segment& left, const Segment& right)
    {
        return !(left == right);
    }
};

using SegmentPlan = std::vector<Segment>;

//Split logical range [offset, offset + length) into per volume segments,
//each volume holding exactly capacity bytes. Zero capacity means single unbounded volume.
SegmentPlan planSegments(OffsetType offset, OffsetType length, OffsetType capacity);

//Same as above, but first limits.size() volumes have extents given by limits,
//following volumes have capacity extent. With zero capacity last of limits is unbounded.
SegmentPlan planSegments(OffsetType offset, OffsetType length,
                         const std::vector<OffsetType>& limits, OffsetType capacity);

//"" for volume 0, ".2" for volume 1, ".3" for volume 2 and so on
std::string volumeSuffix(VolumeIndex index);

boost::filesystem::path volumePath(const boost::filesystem::path& basePath, VolumeIndex index);

}
