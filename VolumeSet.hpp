#pragma once

#include <deque>
#include <vector>

#include <boost/intrusive/list_hook.hpp>

#include "FileSystem.hpp"
#include "VolumeAddress.hpp"
#include "LRUCachePool.hpp"
#include "Logging.hpp"

namespace svf {

//Sequence of physical volumes backing one logical file.
//Volume handles are opened lazily and owned exclusively by the set.
class VolumeSet {
public:

    using UniquePtr = std::unique_ptr<VolumeSet>;

    struct Options {
        //Maximum bytes per volume, 0 disables splitting
        OffsetType volumeCapacity{0};
        //Continue filling partially filled last volume on append
        bool appendToPartial{true};
        //Maximum number of simultaneously open volume handles, 0 is unlimited
        size_t maxOpenVolumes{16};
        bool readOnly{false};
    };

    //Probe basePath, basePath.2, basePath.3... until first missing volume.
    //If basePath doesn't exist, it's created unless readOnly is set.
    static UniquePtr open(const boost::filesystem::path& basePath, const Options& options);
    //Delete existing volumes and start with single empty volume.
    static UniquePtr create(const boost::filesystem::path& basePath, const Options& options);

    SegmentPlan plan(OffsetType offset, OffsetType length)const;

    IRandomAccessFile& handleFor(VolumeIndex index, bool forWrite);

    void syncSize(VolumeIndex index, OffsetType newSize);

    void truncateTo(OffsetType logicalLength);

    void flush();
    void close();

    OffsetType logicalLength()const
    {
        return m_logicalLength;
    }

    size_t volumeCount()const
    {
        return m_volumes.size();
    }

    OffsetType volumeSize(VolumeIndex index)const;

    const boost::filesystem::path& getVolumePath(VolumeIndex index)const;

    size_t openHandlesCount()const
    {
        return m_openHandles.size();
    }

    ~VolumeSet();

private:

    struct Volume {
        boost::filesystem::path path;
        VolumeIndex index = 0;
        OffsetType size = 0;
        //maximum size volume may reach before next volume is started
        OffsetType limit = 0;
        FileSystem::UniqueFilePtr file;
        bool dirty = false;
        boost::intrusive::list_member_hook<> lruHook;
    };

    using OpenHandlesPool = LRUCachePool<Volume, &Volume::lruHook>;

    struct PrivateKey{};

public:
    //actually private ctor
    VolumeSet(PrivateKey, const boost::filesystem::path& basePath, const Options& options);

private:

    void discoverImpl();
    void createImpl();

    Volume& addVolume(OffsetType size, OffsetType limit);
    void openVolumeFile(Volume& volume);
    void createVolumeFile(Volume& volume);
    [[noreturn]] void throwOpenError(const Volume& volume, const char* action)const;
    void removeLastVolume();
    void evict(Volume* volume);
    OffsetType newVolumeLimit()const;
    LoggerPtr& getLogger();

    boost::filesystem::path m_basePath;
    Options m_options;
    std::deque<Volume> m_volumes;
    OffsetType m_logicalLength = 0;
    OpenHandlesPool m_openHandles;
    LoggerPtr m_log;
};

}
