#pragma once

#include <stdint.h>
#include <boost/asio/buffer.hpp>
#include <boost/filesystem/path.hpp>

namespace svf{

class IRandomAccessFile{
public:
    using OffsetType = uint64_t;
    virtual ~IRandomAccessFile() = default;
    //Read up to buf.size() bytes at current position, return number of bytes actually read.
    //Result is less than buf.size() only at the end of file.
    virtual size_t read(boost::asio::mutable_buffer buf) = 0;
    virtual void write(boost::asio::const_buffer buf) = 0;
    //Seek to specified absolute offset
    virtual void seek(OffsetType offset) = 0;
    //Seek to the end of the file and return file size
    virtual OffsetType seekEnd() = 0;
    //Set file size to length, position is undefined afterwards
    virtual void truncate(OffsetType length) = 0;
    virtual void flush() = 0;

    virtual const boost::filesystem::path& getFilename()const = 0;
};

}
