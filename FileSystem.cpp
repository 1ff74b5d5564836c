#include "FileSystem.hpp"

#ifdef _WIN32
#include "platform/win32/RandomAccessFileWin32.hpp"
#else
#include "platform/posix/RandomAccessFilePosix.hpp"
#endif

namespace svf{

FileSystem::UniqueFilePtr FileSystem::createFileUnique(boost::filesystem::path filename)
{
    auto handle = RandomAccessFile::create(filename);
    if(!handle)
    {
        return {};
    }
    return std::make_unique<RandomAccessFile>(filename, std::move(handle));
}

FileSystem::UniqueFilePtr FileSystem::openFileUnique(boost::filesystem::path filename, Access access)
{
    auto handle = RandomAccessFile::open(filename, access == Access::readOnly);
    if(!handle)
    {
        return {};
    }
    return std::make_unique<RandomAccessFile>(filename, std::move(handle));
}

#ifdef _WIN32

int FileSystem::getLastError()
{
    return static_cast<int>(GetLastError());
}

bool FileSystem::isNotFoundError(int error)
{
    return error == ERROR_FILE_NOT_FOUND || error == ERROR_PATH_NOT_FOUND;
}

bool FileSystem::isPermissionError(int error)
{
    return error == ERROR_ACCESS_DENIED || error == ERROR_SHARING_VIOLATION;
}

#else

int FileSystem::getLastError()
{
    return errno;
}

bool FileSystem::isNotFoundError(int error)
{
    return error == ENOENT || error == ENOTDIR;
}

bool FileSystem::isPermissionError(int error)
{
    return error == EACCES || error == EPERM || error == EROFS;
}

#endif

}
