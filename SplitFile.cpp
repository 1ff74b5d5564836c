#include "SplitFile.hpp"

#include <algorithm>
#include <array>
#include <errno.h>
#include <limits>

#include <fmt/format.h>

#include "Errors.hpp"
#include "Logging.hpp"
#include "VolumeSet.hpp"

namespace svf {

namespace {

const size_t k_blockSize = 64 * 1024;
const SplitFile::OffsetType k_maxPosition = static_cast<SplitFile::OffsetType>(std::numeric_limits<int64_t>::max());
const size_t k_lineBlockSize = 8 * 1024;

bool isReadableMode(OpenMode mode)
{
    return mode != OpenMode::write && mode != OpenMode::append;
}

bool isWritableMode(OpenMode mode)
{
    return mode != OpenMode::read;
}

class SplitFileImpl : public SplitFile {
public:
    SplitFileImpl(const boost::filesystem::path& path, const Options& options);

    size_t read(boost::asio::mutable_buffer buf) override;
    size_t write(boost::asio::const_buffer buf) override;
    OffsetType truncate(int64_t newLength) override;
    void flush() override;

    OffsetType seek(int64_t offset, Whence whence) override;
    OffsetType tell() const override;

    OffsetType size() const override;
    void close() override;

    bool isClosed() const override
    {
        return m_closed;
    }

    bool readable() const override;
    bool writable() const override;
    bool seekable() const override;

    size_t volumeCount() const override;

    const boost::filesystem::path& getFilename() const override
    {
        return m_path;
    }

    OpenMode getMode() const override
    {
        return m_options.mode;
    }

    void openImpl();

private:

    void throwIfClosed(const char* funcName) const;
    void throwIfNotReadable(const char* funcName) const;
    void throwIfNotWritable(const char* funcName) const;

    //Write at offset which must not be beyond the end of file
    size_t writeAt(OffsetType offset, boost::asio::const_buffer buf);
    void fillWithZeros(OffsetType from, OffsetType to);

    LoggerPtr& getLogger()
    {
        return svf::getLogger(m_log);
    }

    boost::filesystem::path m_path;
    Options m_options;
    VolumeSet::UniquePtr m_volumes;
    OffsetType m_position = 0;
    bool m_closed = false;
    LoggerPtr m_log;
};

SplitFileImpl::SplitFileImpl(const boost::filesystem::path& path, const Options& options) :
        m_path(path), m_options(options)
{
}

void SplitFileImpl::openImpl()
{
    VolumeSet::Options volumeOptions;
    volumeOptions.volumeCapacity = m_options.volumeSize;
    volumeOptions.appendToPartial = m_options.appendToPartial;
    volumeOptions.maxOpenVolumes = m_options.maxOpenVolumes;
    volumeOptions.readOnly = !isWritableMode(m_options.mode);

    auto mode = m_options.mode;
    if(mode == OpenMode::write || mode == OpenMode::writeRead)
    {
        m_volumes = VolumeSet::create(m_path, volumeOptions);
    }
    else if(mode == OpenMode::read || mode == OpenMode::readWrite)
    {
        //rb+ requires existing file, like rb
        if(!boost::filesystem::exists(m_path))
        {
            throw NotFoundError(ENOENT, fmt::format("SplitFile::open: file {} not found", m_path.string()));
        }
        m_volumes = VolumeSet::open(m_path, volumeOptions);
    }
    else
    {
        m_volumes = VolumeSet::open(m_path, volumeOptions);
        m_position = m_volumes->logicalLength();
    }

    getLogger()->debug("opened {} in mode {}, volume size {}, {} volume(s), size {}",
            m_path.string(), toString(mode), m_options.volumeSize,
            m_volumes->volumeCount(), m_volumes->logicalLength());
}

void SplitFileImpl::throwIfClosed(const char* funcName) const
{
    if(m_closed)
    {
        throw ClosedError(fmt::format("SplitFile::{}: I/O operation on closed file {}", funcName, m_path.string()));
    }
}

void SplitFileImpl::throwIfNotReadable(const char* funcName) const
{
    throwIfClosed(funcName);
    if(!isReadableMode(m_options.mode))
    {
        throw UnsupportedOperation(fmt::format("SplitFile::{}: file {} is opened in mode {}",
                funcName, m_path.string(), toString(m_options.mode)));
    }
}

void SplitFileImpl::throwIfNotWritable(const char* funcName) const
{
    throwIfClosed(funcName);
    if(!isWritableMode(m_options.mode))
    {
        throw UnsupportedOperation(fmt::format("SplitFile::{}: file {} is opened in mode {}",
                funcName, m_path.string(), toString(m_options.mode)));
    }
}

size_t SplitFileImpl::read(boost::asio::mutable_buffer buf)
{
    throwIfNotReadable("read");
    auto length = m_volumes->logicalLength();
    if(m_position >= length)
    {
        return 0;
    }
    auto toRead = std::min<OffsetType>(buf.size(), length - m_position);
    auto ptr = static_cast<uint8_t*>(buf.data());
    size_t done = 0;
    for(auto& seg : m_volumes->plan(m_position, toRead))
    {
        auto& file = m_volumes->handleFor(seg.volumeIndex, false);
        file.seek(seg.offset);
        auto segLength = static_cast<size_t>(seg.length);
        auto actuallyRead = file.read(boost::asio::buffer(ptr + done, segLength));
        if(actuallyRead != segLength)
        {
            throw std::runtime_error(
                    fmt::format("SplitFile::read: volume {} is shorter than expected, requested {} bytes at {}, read {}",
                            file.getFilename().string(), segLength, seg.offset, actuallyRead));
        }
        done += actuallyRead;
        m_position += actuallyRead;
    }
    return done;
}

size_t SplitFileImpl::writeAt(OffsetType offset, boost::asio::const_buffer buf)
{
    auto ptr = static_cast<const uint8_t*>(buf.data());
    size_t done = 0;
    for(auto& seg : m_volumes->plan(offset, buf.size()))
    {
        auto& file = m_volumes->handleFor(seg.volumeIndex, true);
        file.seek(seg.offset);
        auto segLength = static_cast<size_t>(seg.length);
        file.write(boost::asio::buffer(ptr + done, segLength));
        auto volumeSize = std::max(m_volumes->volumeSize(seg.volumeIndex), seg.offset + seg.length);
        m_volumes->syncSize(seg.volumeIndex, volumeSize);
        done += segLength;
    }
    return done;
}

void SplitFileImpl::fillWithZeros(OffsetType from, OffsetType to)
{
    std::array<uint8_t, k_blockSize> zeros{};
    while(from < to)
    {
        auto chunk = static_cast<size_t>(std::min<OffsetType>(zeros.size(), to - from));
        from += writeAt(from, boost::asio::buffer(zeros.data(), chunk));
    }
}

size_t SplitFileImpl::write(boost::asio::const_buffer buf)
{
    throwIfNotWritable("write");
    if(!buf.size())
    {
        return 0;
    }
    auto length = m_volumes->logicalLength();
    if(m_position > length)
    {
        getLogger()->debug("filling gap {}..{} of {} with zeros", length, m_position, m_path.string());
        fillWithZeros(length, m_position);
    }
    auto written = writeAt(m_position, buf);
    m_position += written;
    return written;
}

SplitFile::OffsetType SplitFileImpl::truncate(int64_t newLength)
{
    throwIfNotWritable("truncate");
    if(newLength < 0)
    {
        throw InvalidArgument(fmt::format("SplitFile::truncate: negative size {}", newLength));
    }
    auto target = static_cast<OffsetType>(newLength);
    auto length = m_volumes->logicalLength();
    if(target < length)
    {
        m_volumes->truncateTo(target);
    }
    else if(target > length)
    {
        fillWithZeros(length, target);
    }
    if(m_position > target)
    {
        m_position = target;
    }
    return target;
}

void SplitFileImpl::flush()
{
    throwIfClosed("flush");
    m_volumes->flush();
}

SplitFile::OffsetType SplitFileImpl::seek(int64_t offset, Whence whence)
{
    throwIfClosed("seek");
    OffsetType base = 0;
    switch(whence)
    {
        case Whence::begin:
            break;
        case Whence::current:
            base = m_position;
            break;
        case Whence::end:
            base = m_volumes->logicalLength();
            break;
    }
    OffsetType position = 0;
    if(offset < 0)
    {
        auto back = static_cast<OffsetType>(-(offset + 1)) + 1;
        if(back > base)
        {
            throw InvalidSeekError(fmt::format("SplitFile::seek: negative seek position, {} from {}", offset, base));
        }
        position = base - back;
    }
    else
    {
        auto forward = static_cast<OffsetType>(offset);
        if(base > k_maxPosition || forward > k_maxPosition - base)
        {
            throw InvalidSeekError(fmt::format("SplitFile::seek: seek position {} from {} is out of range", offset, base));
        }
        position = base + forward;
    }
    if(position > m_volumes->logicalLength() && !isWritableMode(m_options.mode))
    {
        throw InvalidSeekError(fmt::format("SplitFile::seek: position {} is beyond the end of read only file {} of size {}",
                position, m_path.string(), m_volumes->logicalLength()));
    }
    m_position = position;
    return m_position;
}

SplitFile::OffsetType SplitFileImpl::tell() const
{
    throwIfClosed("tell");
    return m_position;
}

SplitFile::OffsetType SplitFileImpl::size() const
{
    throwIfClosed("size");
    return m_volumes->logicalLength();
}

void SplitFileImpl::close()
{
    if(m_closed)
    {
        return;
    }
    m_closed = true;
    getLogger()->debug("closing {}, size {}", m_path.string(), m_volumes->logicalLength());
    m_volumes->close();
}

bool SplitFileImpl::readable() const
{
    throwIfClosed("readable");
    return isReadableMode(m_options.mode);
}

bool SplitFileImpl::writable() const
{
    throwIfClosed("writable");
    return isWritableMode(m_options.mode);
}

bool SplitFileImpl::seekable() const
{
    throwIfClosed("seekable");
    return true;
}

size_t SplitFileImpl::volumeCount() const
{
    throwIfClosed("volumeCount");
    return m_volumes->volumeCount();
}

}

OpenMode parseOpenMode(boost::string_view mode)
{
    static const std::array<std::pair<const char*, OpenMode>, 12> modes{{
        {"r", OpenMode::read}, {"rb", OpenMode::read},
        {"w", OpenMode::write}, {"wb", OpenMode::write},
        {"a", OpenMode::append}, {"ab", OpenMode::append},
        {"r+", OpenMode::readWrite}, {"rb+", OpenMode::readWrite},
        {"w+", OpenMode::writeRead}, {"wb+", OpenMode::writeRead},
        {"a+", OpenMode::appendRead}, {"ab+", OpenMode::appendRead}
    }};
    for(auto& p : modes)
    {
        if(mode == p.first)
        {
            return p.second;
        }
    }
    throw InvalidArgument(fmt::format("Unsupported open mode '{}', expected one of rb, wb, ab, rb+, wb+, ab+",
            std::string(mode.data(), mode.length())));
}

const char* toString(OpenMode mode)
{
    switch(mode)
    {
        case OpenMode::read:
            return "rb";
        case OpenMode::write:
            return "wb";
        case OpenMode::append:
            return "ab";
        case OpenMode::readWrite:
            return "rb+";
        case OpenMode::writeRead:
            return "wb+";
        case OpenMode::appendRead:
            return "ab+";
    }
    return "unknown";
}

SplitFile::UniquePtr SplitFile::open(const boost::filesystem::path& path, const Options& options)
{
    auto rv = std::make_unique<SplitFileImpl>(path, options);

    rv->openImpl();

    return rv;
}

void SplitFile::initFileLogger(const boost::filesystem::path& filePath, size_t maxSize, size_t maxFiles)
{
    svf::initFileLogger(filePath, maxSize, maxFiles);
}

void SplitFile::initStdoutLogger()
{
    svf::initStdoutLogger();
}

std::vector<uint8_t> SplitFile::read(size_t maxLength)
{
    std::vector<uint8_t> rv;
    if(!readable())
    {
        throw UnsupportedOperation(fmt::format("SplitFile::read: file {} is not readable", getFilename().string()));
    }
    auto available = size() > tell() ? size() - tell() : 0;
    rv.resize(static_cast<size_t>(std::min<OffsetType>(maxLength, available)));
    rv.resize(read(boost::asio::buffer(rv)));
    return rv;
}

std::vector<uint8_t> SplitFile::readAll()
{
    return read(static_cast<size_t>(-1));
}

std::string SplitFile::readLine(size_t maxLength)
{
    std::string rv;
    while(rv.size() < maxLength)
    {
        auto start = rv.size();
        auto want = std::min(k_lineBlockSize, maxLength - start);
        rv.resize(start + want);
        auto actuallyRead = read(boost::asio::buffer(&rv[start], want));
        rv.resize(start + actuallyRead);
        if(!actuallyRead)
        {
            break;
        }
        auto nl = rv.find('\n', start);
        if(nl != std::string::npos)
        {
            auto extra = rv.size() - (nl + 1);
            rv.resize(nl + 1);
            seek(-static_cast<int64_t>(extra), Whence::current);
            break;
        }
    }
    return rv;
}

std::vector<std::string> SplitFile::readLines()
{
    std::vector<std::string> rv;
    for(;;)
    {
        auto line = readLine();
        if(line.empty())
        {
            break;
        }
        rv.push_back(std::move(line));
    }
    return rv;
}

void SplitFile::writeLines(const std::vector<std::string>& lines)
{
    for(auto& line : lines)
    {
        write(boost::asio::buffer(line));
    }
}

SplitFile::OffsetType SplitFile::truncate()
{
    return truncate(static_cast<int64_t>(tell()));
}

}
