#pragma once

#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <boost/utility/string_view.hpp>

#include "LogicalFile.hpp"

namespace svf {

enum class OpenMode {
    read,       //rb
    write,      //wb, existing volumes are deleted
    append,     //ab
    readWrite,  //rb+
    writeRead,  //wb+
    appendRead  //ab+
};

OpenMode parseOpenMode(boost::string_view mode);
const char* toString(OpenMode mode);

//Logical file stored in volumes path, path.2, path.3, ...
//of at most volumeSize bytes each.
class SplitFile : public LogicalFile {
public:

    using UniquePtr = std::unique_ptr<SplitFile>;
    using OffsetType = uint64_t;

    struct Options {
        OpenMode mode{OpenMode::read};
        //0 disables splitting
        OffsetType volumeSize{0};
        bool appendToPartial{true};
        //0 is unlimited
        size_t maxOpenVolumes{16};
    };

    static UniquePtr open(const boost::filesystem::path& path, const Options& options);

    static void initFileLogger(const boost::filesystem::path& filePath, size_t maxSize, size_t maxFiles);
    static void initStdoutLogger();

    using Readable::read;
    std::vector<uint8_t> read(size_t maxLength);
    std::vector<uint8_t> readAll();
    //Read up to and including next '\n'
    std::string readLine(size_t maxLength = static_cast<size_t>(-1));
    std::vector<std::string> readLines();

    void writeLines(const std::vector<std::string>& lines);

    using Writable::truncate;
    //Truncate at current position
    OffsetType truncate();

    virtual size_t volumeCount() const = 0;
    virtual const boost::filesystem::path& getFilename() const = 0;
    virtual OpenMode getMode() const = 0;
};

}
