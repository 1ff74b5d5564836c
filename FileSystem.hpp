#pragma once

#include <memory>

#include <boost/filesystem.hpp>

#include "IRandomAccessFile.hpp"

namespace svf{

class FileSystem{
public:
    using UniqueFilePtr = std::unique_ptr<IRandomAccessFile>;

    enum class Access {
        readOnly,
        readWrite
    };

    //Create new or truncate existing file, opened for read and write.
    //Return empty pointer on failure, error code is available via getLastError.
    static UniqueFilePtr createFileUnique(boost::filesystem::path filename);
    static UniqueFilePtr openFileUnique(boost::filesystem::path filename, Access access = Access::readWrite);

    //Platform error code of the last failed create/open in the calling thread
    static int getLastError();
    static bool isNotFoundError(int error);
    static bool isPermissionError(int error);
};

}
