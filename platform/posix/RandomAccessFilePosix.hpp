#pragma once

#include "IRandomAccessFile.hpp"
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <errno.h>
#include <unistd.h>

#include <boost/filesystem.hpp>
#include <fmt/format.h>

namespace svf{

class RandomAccessFile : public IRandomAccessFile {
    friend class FileSystem;

    static_assert(sizeof(OffsetType) == sizeof(off_t), "Expecting 64-bit file offset type");

    struct Handle {
        int m_handle;

        static const int invalidValue = -1;

        Handle(int handle) : m_handle(handle)
        {
        }

        Handle(const Handle&) = delete;

        Handle(Handle&& other) noexcept : m_handle(other.m_handle)
        {
            other.m_handle = invalidValue;
        }

        Handle& operator=(const Handle& other) = delete;

        Handle& operator=(Handle&& other)
        {
            if(this == &other)
            {
                return *this;
            }
            close();
            m_handle = other.m_handle;
            other.m_handle = invalidValue;
            return *this;
        }

        int get()
        {
            return m_handle;
        }

        explicit operator bool() const
        {
            return m_handle != invalidValue;
        }

        void close()
        {
            if(m_handle != invalidValue)
            {
                ::close(m_handle);
                m_handle = invalidValue;
            }
        }

        ~Handle()
        {
            close();
        }
    };

public:

    RandomAccessFile(boost::filesystem::path filename, Handle&& handle) :
      m_filename(std::move(filename)), m_handle(std::move(handle))
    {
    }

    ~RandomAccessFile() override = default;

    size_t read(boost::asio::mutable_buffer buf) override
    {
        auto ptr = static_cast<char*>(buf.data());
        size_t total = 0;
        while(total < buf.size())
        {
            ssize_t ret = ::read(m_handle.get(), ptr + total, buf.size() - total);
            if(ret == -1)
            {
                int err = errno;
                if(err == EINTR)
                {
                    continue;
                }
                throw fmt::system_error(err, "[{}]read error", m_filename.string());
            }
            if(ret == 0)
            {
                break;
            }
            total += static_cast<size_t>(ret);
        }
        return total;
    }

    void write(boost::asio::const_buffer buf) override
    {
        auto ptr = static_cast<const char*>(buf.data());
        size_t total = 0;
        while(total < buf.size())
        {
            ssize_t ret = ::write(m_handle.get(), ptr + total, buf.size() - total);
            if(ret == -1)
            {
                int err = errno;
                if(err == EINTR)
                {
                    continue;
                }
                throw fmt::system_error(err, "[{}]write error", m_filename.string());
            }
            if(ret == 0)
            {
                throw std::runtime_error(
                    fmt::format("[{}]write requested {} bytes, but actually written {}",
                        m_filename.string(), buf.size(), total));
            }
            total += static_cast<size_t>(ret);
        }
    }

    OffsetType seekEnd() override
    {
        off_t ret = lseek(m_handle.get(), 0, SEEK_END);

        if(ret < 0 )
        {
            int err = errno;
            throw fmt::system_error(err, "[{}]seekEnd error", m_filename.string());
        }
        return static_cast<OffsetType>(ret);
    }

    void seek(OffsetType offset) override
    {
        auto fileSize = seekEnd();
        if(offset > fileSize)
        {
            throw std::runtime_error(
                fmt::format("[{}]seek attempt to set file position to {}, beyond file size {}",
                            m_filename.string(), offset, fileSize));
        }

        auto ret = lseek(m_handle.get(), static_cast<off_t>(offset), SEEK_SET);
        if(ret == static_cast<off_t>(-1))
        {
            int err = errno;
            throw fmt::system_error(err, "[{}]seek error", m_filename.string());
        }
    }

    void truncate(OffsetType length) override
    {
        if(::ftruncate(m_handle.get(), static_cast<off_t>(length)) == -1)
        {
            int err = errno;
            throw fmt::system_error(err, "[{}]truncate to {} error", m_filename.string(), length);
        }
    }

    void flush() override
    {
        if(::fsync(m_handle.get()) == -1)
        {
            int err = errno;
            throw fmt::system_error(err, "[{}]flush error", m_filename.string());
        }
    }

    const boost::filesystem::path& getFilename()const override
    {
        return m_filename;
    }

private:

    static Handle open(const boost::filesystem::path& path, bool readOnly)
    {
        return {::open(path.native().c_str(), readOnly ? O_RDONLY : O_RDWR)};
    }

    static Handle create(const boost::filesystem::path& path)
    {
        return {::open(path.native().c_str(), O_CREAT|O_TRUNC|O_RDWR, S_IRUSR|S_IWUSR|S_IRGRP|S_IROTH)};
    }

    boost::filesystem::path m_filename;
    Handle m_handle;
};

}
