#include "VolumeAddress.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace svf {

SegmentPlan planSegments(OffsetType offset, OffsetType length, OffsetType capacity)
{
    SegmentPlan rv;
    if(!length)
    {
        return rv;
    }
    if(!capacity)
    {
        rv.push_back({0, offset, length});
        return rv;
    }
    VolumeIndex index = static_cast<VolumeIndex>(offset / capacity);
    OffsetType intraOffset = offset % capacity;
    rv.reserve(static_cast<size_t>((intraOffset + length - 1) / capacity + 1));
    while(length)
    {
        OffsetType toTake = std::min(length, capacity - intraOffset);
        rv.push_back({index, intraOffset, toTake});
        length -= toTake;
        ++index;
        intraOffset = 0;
    }
    return rv;
}

SegmentPlan planSegments(OffsetType offset, OffsetType length,
                         const std::vector<OffsetType>& limits, OffsetType capacity)
{
    SegmentPlan rv;
    if(!length)
    {
        return rv;
    }
    //offset >= start holds on every iteration
    OffsetType start = 0;
    for(VolumeIndex idx = 0; idx < limits.size(); ++idx)
    {
        OffsetType limit = limits[idx];
        if(!capacity && idx + 1 == limits.size())
        {
            limit = k_unboundedVolume;
        }
        OffsetType intraOffset = offset - start;
        if(intraOffset < limit)
        {
            OffsetType toTake = std::min(length, limit - intraOffset);
            rv.push_back({idx, intraOffset, toTake});
            offset += toTake;
            length -= toTake;
            if(!length)
            {
                return rv;
            }
        }
        start += limit;
    }

    auto tail = planSegments(offset - start, length, capacity);
    for(auto& seg : tail)
    {
        seg.volumeIndex += limits.size();
        rv.push_back(seg);
    }
    return rv;
}

std::string volumeSuffix(VolumeIndex index)
{
    if(!index)
    {
        return {};
    }
    return fmt::format(".{}", index + 1);
}

boost::filesystem::path volumePath(const boost::filesystem::path& basePath, VolumeIndex index)
{
    auto rv = basePath;
    rv += volumeSuffix(index);
    return rv;
}

}
