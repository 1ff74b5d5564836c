#include <gtest/gtest.h>

#include "FilesCleanupFixture.hpp"

#include "FileSystem.hpp"

#include <boost/filesystem.hpp>

#include <errno.h>

class Files : public FilesCleanupFixture{
public:
};

TEST_F(Files, CreateReadWrite)
{
    boost::filesystem::path fileName = "test.bin";
    auto file = svf::FileSystem::createFileUnique(fileName);
    ASSERT_TRUE(file) << "Failed to create file " << fileName;

    addToCleanup(fileName);

    std::vector<uint8_t> data = {1, 2, 3, 4, 5, 6, 7, 8};
    file->write(boost::asio::buffer(data));
    file->seek(0);
    std::vector<uint8_t> dataRead(data.size());
    EXPECT_EQ(file->read(boost::asio::buffer(dataRead)), data.size());
    EXPECT_EQ(data, dataRead);

    EXPECT_THROW(file->seek(128), std::runtime_error);
    //at the end of file
    EXPECT_EQ(file->read(boost::asio::buffer(dataRead)), 0u);
}

TEST_F(Files, ShortReadAtEnd)
{
    boost::filesystem::path fileName = "test.bin";
    auto file = svf::FileSystem::createFileUnique(fileName);
    ASSERT_TRUE(file);
    addToCleanup(fileName);

    std::vector<uint8_t> data = {1, 2, 3, 4, 5};
    file->write(boost::asio::buffer(data));
    file->seek(3);
    std::vector<uint8_t> dataRead(10, 0xff);
    ASSERT_EQ(file->read(boost::asio::buffer(dataRead)), 2u);
    EXPECT_EQ(dataRead[0], 4);
    EXPECT_EQ(dataRead[1], 5);
}

TEST_F(Files, TruncateAndSize)
{
    boost::filesystem::path fileName = "test.bin";
    auto file = svf::FileSystem::createFileUnique(fileName);
    ASSERT_TRUE(file);
    addToCleanup(fileName);

    std::vector<uint8_t> data(100, 7);
    file->write(boost::asio::buffer(data));
    EXPECT_EQ(file->seekEnd(), 100u);
    file->truncate(40);
    EXPECT_EQ(file->seekEnd(), 40u);
    file->flush();
    EXPECT_EQ(boost::filesystem::file_size(fileName), 40u);
}

TEST_F(Files, CreateTruncatesExisting)
{
    boost::filesystem::path fileName = "test.bin";
    {
        auto file = svf::FileSystem::createFileUnique(fileName);
        ASSERT_TRUE(file);
        addToCleanup(fileName);
        std::vector<uint8_t> data(10, 1);
        file->write(boost::asio::buffer(data));
    }
    auto file = svf::FileSystem::createFileUnique(fileName);
    ASSERT_TRUE(file);
    EXPECT_EQ(file->seekEnd(), 0u);
}

TEST_F(Files, OpenRead)
{
    boost::filesystem::path fileName = "test.bin";
    std::vector<uint8_t> data = {1, 2, 3, 4, 5, 6, 7, 8};
    {
        auto file = svf::FileSystem::createFileUnique(fileName);
        ASSERT_TRUE(file) << "Failed to create file " << fileName;

        addToCleanup(fileName);

        file->write(boost::asio::buffer(data));
    }
    {
        auto file = svf::FileSystem::openFileUnique(fileName, svf::FileSystem::Access::readOnly);

        ASSERT_TRUE(file) << "Failed to open file " << fileName;

        std::vector<uint8_t> dataRead(data.size());
        file->read(boost::asio::buffer(dataRead));
        EXPECT_EQ(data, dataRead);

        EXPECT_THROW(file->write(boost::asio::buffer(data)), std::system_error);
    }
}

TEST_F(Files, OpenMissing)
{
    boost::filesystem::path fileName = "missing.bin";
    boost::system::error_code ec;
    boost::filesystem::remove(fileName, ec);
    auto file = svf::FileSystem::openFileUnique(fileName);
    ASSERT_FALSE(file);
    EXPECT_TRUE(svf::FileSystem::isNotFoundError(svf::FileSystem::getLastError()));
}

#ifndef _WIN32
TEST(FileSystemErrors, Classification)
{
    EXPECT_TRUE(svf::FileSystem::isPermissionError(EACCES));
    EXPECT_TRUE(svf::FileSystem::isPermissionError(EPERM));
    EXPECT_TRUE(svf::FileSystem::isPermissionError(EROFS));
    EXPECT_FALSE(svf::FileSystem::isPermissionError(ENOENT));
    EXPECT_TRUE(svf::FileSystem::isNotFoundError(ENOENT));
    EXPECT_TRUE(svf::FileSystem::isNotFoundError(ENOTDIR));
    EXPECT_FALSE(svf::FileSystem::isNotFoundError(EACCES));
    EXPECT_FALSE(svf::FileSystem::isNotFoundError(EIO));
}
#endif
