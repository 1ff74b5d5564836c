#include <chrono>
#include <functional>
#include <random>

#include <SplitFile.hpp>
#include <VolumeAddress.hpp>

#include <boost/filesystem.hpp>
#include <fmt/printf.h>

using svf::SplitFile;

void executeBenchmark(const std::string& benchName, const std::function<void()>& benchFunc)
{
    fmt::print("===============================\n");
    fmt::print("Starting benchmark '{}'\n", benchName);
    auto start = std::chrono::high_resolution_clock::now();
    benchFunc();
    auto duration = std::chrono::high_resolution_clock::now() - start;
    fmt::print("Benchmark '{}' executed in {} ms\n", benchName,
            std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
}

void removeVolumes(const boost::filesystem::path& path)
{
    for(size_t idx = 0;; ++idx)
    {
        auto volume = svf::volumePath(path, idx);
        if(!boost::filesystem::exists(volume))
        {
            break;
        }
        boost::filesystem::remove(volume);
    }
}

int main()
{
    try
    {
        const boost::filesystem::path path = "svfile_benchmark.bin";
        const size_t totalSize = 256 * 1024 * 1024;
        const size_t blockSize = 64 * 1024;
        const size_t randomReads = 100000;

        std::vector<uint8_t> block(blockSize);
        std::mt19937 rng(42);
        for(auto& v : block)
        {
            v = static_cast<uint8_t>(rng());
        }

        for(uint64_t volumeSize : {uint64_t(0), uint64_t(100 * 1000 * 1000), uint64_t(1000 * 1000), uint64_t(65537)})
        {
            removeVolumes(path);
            SplitFile::Options opt;
            opt.volumeSize = volumeSize;

            executeBenchmark(fmt::format("sequential write of {} MiB, volume size {}", totalSize >> 20, volumeSize),
                    [&]() {
                        opt.mode = svf::OpenMode::write;
                        auto file = SplitFile::open(path, opt);
                        for(size_t written = 0; written < totalSize; written += blockSize)
                        {
                            file->write(boost::asio::buffer(block));
                        }
                        file->close();
                    });

            executeBenchmark(fmt::format("sequential read of {} MiB, volume size {}", totalSize >> 20, volumeSize),
                    [&]() {
                        opt.mode = svf::OpenMode::read;
                        auto file = SplitFile::open(path, opt);
                        std::vector<uint8_t> readBlock(blockSize);
                        while(file->read(boost::asio::buffer(readBlock)))
                        {
                        }
                        file->close();
                    });

            executeBenchmark(fmt::format("{} random reads of 4 KiB, volume size {}", randomReads, volumeSize),
                    [&]() {
                        opt.mode = svf::OpenMode::read;
                        auto file = SplitFile::open(path, opt);
                        std::vector<uint8_t> readBlock(4096);
                        std::uniform_int_distribution<int64_t> dist(0, totalSize - readBlock.size());
                        for(size_t i = 0; i < randomReads; ++i)
                        {
                            file->seek(dist(rng));
                            if(file->read(boost::asio::buffer(readBlock)) != readBlock.size())
                            {
                                throw std::runtime_error("short read inside of file");
                            }
                        }
                        file->close();
                    });
        }
        removeVolumes(path);
    }
    catch(std::exception& e)
    {
        fmt::print("Exception during benchmark:{}\n", e.what());
    }
}
