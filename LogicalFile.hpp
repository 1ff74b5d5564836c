#pragma once

#include <stdint.h>

#include <boost/asio/buffer.hpp>

namespace svf {

class Readable {
public:
    //Read up to buf.size() bytes, fewer only at the end of file
    virtual size_t read(boost::asio::mutable_buffer buf) = 0;
    virtual bool readable() const = 0;

    virtual ~Readable() = default;
};

class Writable {
public:
    virtual size_t write(boost::asio::const_buffer buf) = 0;
    //Shrink or zero extend file, return new size
    virtual uint64_t truncate(int64_t newLength) = 0;
    virtual void flush() = 0;
    virtual bool writable() const = 0;

    virtual ~Writable() = default;
};

class Seekable {
public:
    enum class Whence {
        begin,
        current,
        end
    };

    virtual uint64_t seek(int64_t offset, Whence whence = Whence::begin) = 0;
    virtual uint64_t tell() const = 0;
    virtual bool seekable() const = 0;

    virtual ~Seekable() = default;
};

class LogicalFile : public Readable, public Writable, public Seekable {
public:
    virtual uint64_t size() const = 0;
    virtual void close() = 0;
    virtual bool isClosed() const = 0;
};

}
