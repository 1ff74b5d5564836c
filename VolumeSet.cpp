#include "VolumeSet.hpp"

#include <algorithm>
#include <errno.h>

#include <fmt/format.h>

#include "Errors.hpp"

namespace svf {

VolumeSet::VolumeSet(PrivateKey, const boost::filesystem::path& basePath, const Options& options) :
        m_basePath(basePath),
        m_options(options),
        m_openHandles(options.maxOpenVolumes, [this](Volume* volume) { evict(volume); })
{
}

VolumeSet::~VolumeSet()
{
    m_openHandles.clear();
}

VolumeSet::UniquePtr VolumeSet::open(const boost::filesystem::path& basePath, const Options& options)
{
    auto rv = std::make_unique<VolumeSet>(PrivateKey{}, basePath, options);
    rv->discoverImpl();
    return rv;
}

VolumeSet::UniquePtr VolumeSet::create(const boost::filesystem::path& basePath, const Options& options)
{
    if(options.readOnly)
    {
        throw InvalidArgument(fmt::format("VolumeSet::create: {} cannot be created read only", basePath.string()));
    }
    auto rv = std::make_unique<VolumeSet>(PrivateKey{}, basePath, options);
    rv->createImpl();
    return rv;
}

LoggerPtr& VolumeSet::getLogger()
{
    return svf::getLogger(m_log);
}

OffsetType VolumeSet::newVolumeLimit()const
{
    return m_options.volumeCapacity ? m_options.volumeCapacity : k_unboundedVolume;
}

VolumeSet::Volume& VolumeSet::addVolume(OffsetType size, OffsetType limit)
{
    m_volumes.emplace_back();
    auto& rv = m_volumes.back();
    rv.index = m_volumes.size() - 1;
    rv.path = volumePath(m_basePath, rv.index);
    rv.size = size;
    rv.limit = limit;
    m_logicalLength += size;
    return rv;
}

void VolumeSet::throwOpenError(const Volume& volume, const char* action)const
{
    int err = FileSystem::getLastError();
    auto msg = fmt::format("VolumeSet: failed to {} volume {} ({})", action, volume.index, volume.path.string());
    if(FileSystem::isNotFoundError(err))
    {
        throw NotFoundError(err, msg);
    }
    if(FileSystem::isPermissionError(err))
    {
        throw PermissionError(err, msg);
    }
    throw OpenError(err, msg);
}

void VolumeSet::openVolumeFile(Volume& volume)
{
    auto access = m_options.readOnly ? FileSystem::Access::readOnly : FileSystem::Access::readWrite;
    auto file = FileSystem::openFileUnique(volume.path, access);
    if(!file)
    {
        throwOpenError(volume, "open");
    }
    m_openHandles.insert(&volume);
    volume.file = std::move(file);
}

void VolumeSet::createVolumeFile(Volume& volume)
{
    auto file = FileSystem::createFileUnique(volume.path);
    if(!file)
    {
        throwOpenError(volume, "create");
    }
    m_openHandles.insert(&volume);
    volume.file = std::move(file);
}

void VolumeSet::evict(Volume* volume)
{
    getLogger()->debug("closing handle of volume {} to stay within {} open handles",
            volume->path.string(), m_options.maxOpenVolumes);
    auto file = std::move(volume->file);
    if(volume->dirty)
    {
        volume->dirty = false;
        file->flush();
    }
}

void VolumeSet::discoverImpl()
{
    for(VolumeIndex idx = 0;; ++idx)
    {
        auto path = volumePath(m_basePath, idx);
        boost::system::error_code ec;
        if(!boost::filesystem::exists(path, ec))
        {
            break;
        }
        addVolume(boost::filesystem::file_size(path), 0);
    }

    if(m_volumes.empty())
    {
        if(m_options.readOnly)
        {
            throw NotFoundError(ENOENT, fmt::format("VolumeSet::open: volume {} not found", m_basePath.string()));
        }
        createImpl();
        return;
    }

    if(!m_options.volumeCapacity && m_volumes.size() > 1 && !m_options.readOnly)
    {
        throw InvalidArgument(
                fmt::format("VolumeSet::open: {} consists of {} volumes, but volume size is 0",
                        m_basePath.string(), m_volumes.size()));
    }

    auto capacity = m_options.volumeCapacity;
    bool irregular = false;
    for(auto& volume : m_volumes)
    {
        //existing volumes keep their actual extent
        volume.limit = volume.size;
        if(capacity && (volume.size > capacity || (volume.size != capacity && volume.index + 1 != m_volumes.size())))
        {
            irregular = true;
        }
    }
    auto& last = m_volumes.back();
    if(!capacity)
    {
        last.limit = k_unboundedVolume;
    }
    else if(last.size < capacity)
    {
        if(m_options.appendToPartial || !last.size)
        {
            last.limit = capacity;
        }
        else
        {
            getLogger()->debug("partially filled volume {} is sealed at size {}", last.path.string(), last.size);
        }
    }
    if(irregular)
    {
        getLogger()->warn("volume sizes of {} don't match volume size {}, volumes are addressed by actual sizes",
                m_basePath.string(), capacity);
    }

    getLogger()->debug("discovered {} volume(s) of {}, total size {}",
            m_volumes.size(), m_basePath.string(), m_logicalLength);

    openVolumeFile(m_volumes.front());
}

void VolumeSet::createImpl()
{
    std::vector<boost::filesystem::path> existing;
    for(VolumeIndex idx = 1;; ++idx)
    {
        auto path = volumePath(m_basePath, idx);
        boost::system::error_code ec;
        if(!boost::filesystem::exists(path, ec))
        {
            break;
        }
        existing.push_back(std::move(path));
    }

    m_volumes.clear();
    m_logicalLength = 0;
    auto& first = addVolume(0, newVolumeLimit());
    createVolumeFile(first);

    for(auto& path : existing)
    {
        getLogger()->debug("removing stale volume {}", path.string());
        boost::filesystem::remove(path);
    }
    getLogger()->debug("created volume {}", first.path.string());
}

SegmentPlan VolumeSet::plan(OffsetType offset, OffsetType length)const
{
    std::vector<OffsetType> limits;
    limits.reserve(m_volumes.size());
    for(auto& volume : m_volumes)
    {
        limits.push_back(volume.limit);
    }
    return planSegments(offset, length, limits, m_options.volumeCapacity);
}

IRandomAccessFile& VolumeSet::handleFor(VolumeIndex index, bool forWrite)
{
    if(forWrite && m_options.readOnly)
    {
        throw UnsupportedOperation(
                fmt::format("VolumeSet: volumes of {} are opened read only", m_basePath.string()));
    }
    if(index < m_volumes.size())
    {
        auto& volume = m_volumes[index];
        if(volume.file)
        {
            m_openHandles.touch(&volume);
        }
        else
        {
            openVolumeFile(volume);
        }
        return *volume.file;
    }
    if(!forWrite || index > m_volumes.size())
    {
        throw InternalError(
                fmt::format("VolumeSet: volume index {} requested for {}, but {} has {} volumes",
                        index, forWrite ? "write" : "read", m_basePath.string(), m_volumes.size()));
    }
    auto& volume = addVolume(0, newVolumeLimit());
    try
    {
        createVolumeFile(volume);
    }
    catch(...)
    {
        m_volumes.pop_back();
        throw;
    }
    getLogger()->debug("created volume {}", volume.path.string());
    return *volume.file;
}

void VolumeSet::syncSize(VolumeIndex index, OffsetType newSize)
{
    if(index >= m_volumes.size())
    {
        throw InternalError(fmt::format("VolumeSet::syncSize: invalid volume index {}", index));
    }
    auto& volume = m_volumes[index];
    m_logicalLength = m_logicalLength - volume.size + newSize;
    volume.size = newSize;
    volume.dirty = true;
}

void VolumeSet::removeLastVolume()
{
    auto& volume = m_volumes.back();
    m_openHandles.remove(&volume);
    volume.file.reset();
    getLogger()->debug("removing volume {}", volume.path.string());
    //descriptor stays if removal fails, so it matches what is left on disk
    boost::filesystem::remove(volume.path);
    m_logicalLength -= volume.size;
    m_volumes.pop_back();
}

void VolumeSet::truncateTo(OffsetType logicalLength)
{
    if(logicalLength > m_logicalLength)
    {
        throw InternalError(
                fmt::format("VolumeSet::truncateTo: {} is beyond logical length {}", logicalLength, m_logicalLength));
    }
    VolumeIndex lastIndex = 0;
    OffsetType lastSize = 0;
    if(logicalLength)
    {
        auto lastByte = plan(logicalLength - 1, 1);
        lastIndex = lastByte.front().volumeIndex;
        lastSize = lastByte.front().offset + 1;
    }

    auto& file = handleFor(lastIndex, true);
    file.truncate(lastSize);
    syncSize(lastIndex, lastSize);

    while(m_volumes.size() > lastIndex + 1)
    {
        removeLastVolume();
    }
}

void VolumeSet::flush()
{
    for(auto& volume : m_volumes)
    {
        if(volume.dirty && volume.file)
        {
            volume.file->flush();
        }
        volume.dirty = false;
    }
}

void VolumeSet::close()
{
    //handles are released even if flush of one of them fails
    std::vector<std::pair<FileSystem::UniqueFilePtr, bool>> files;
    m_openHandles.clear();
    for(auto& volume : m_volumes)
    {
        if(volume.file)
        {
            files.emplace_back(std::move(volume.file), volume.dirty);
        }
        volume.dirty = false;
    }
    for(auto& p : files)
    {
        if(p.second)
        {
            p.first->flush();
        }
    }
}

OffsetType VolumeSet::volumeSize(VolumeIndex index)const
{
    return m_volumes.at(index).size;
}

const boost::filesystem::path& VolumeSet::getVolumePath(VolumeIndex index)const
{
    return m_volumes.at(index).path;
}

}
