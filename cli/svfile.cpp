#include <iostream>
#include <system_error>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <fmt/format.h>

#include "SplitFile.hpp"
#include "FileSystem.hpp"
#include "VolumeAddress.hpp"

namespace {

const size_t k_copyBlockSize = 1024 * 1024;

class svfile_app {
public:
    enum {
        version_major = 0,
        version_minor = 1,
    };

    bool init(int argc, const char* const argv[])
    {
        namespace po = boost::program_options;
        po::options_description options("Options");
        options.add_options()
                ("help", "This help page")
                ("volume_size,s", po::value<uint64_t>(&m_options.volumeSize)->default_value(0),
                        "Maximum size of volume in bytes, 0 disables splitting")
                ("no_append_to_partial", "Start new volume instead of filling partially filled last volume")
                ("max_open_volumes", po::value<size_t>(&m_options.maxOpenVolumes)->default_value(16),
                        "Maximum number of simultaneously open volumes, 0 is unlimited")
                ("append,a", "split: append to existing volume set instead of overwriting it")
                ("verbose,v", "Enable debug output")
                ("log_file,l", po::value<boost::filesystem::path>(&m_logFile), "Write debug output to file");

        po::options_description hidden;
        hidden.add_options()
                ("command", po::value<std::string>(&m_command))
                ("args", po::value<std::vector<std::string>>(&m_args));

        po::positional_options_description positional;
        positional.add("command", 1).add("args", -1);

        po::options_description all;
        all.add(options).add(hidden);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);

        if(vm.count("help") || m_command.empty())
        {
            std::cout << fmt::format("svfile v{}.{}\n", version_major, version_minor);
            std::cout << "Usage:\n"
                         "  svfile split <input> <output> [-s volume_size] [-a]\n"
                         "  svfile join <input> <output>\n"
                         "  svfile info <input>\n";
            std::cout << options << std::endl;
            return false;
        }

        m_options.appendToPartial = vm.count("no_append_to_partial") == 0;
        m_append = vm.count("append") != 0;

        if(vm.count("log_file"))
        {
            svf::SplitFile::initFileLogger(m_logFile, 10 * 1024 * 1024, 3);
        }
        else if(vm.count("verbose"))
        {
            svf::SplitFile::initStdoutLogger();
        }
        return true;
    }

    int run()
    {
        if(m_command == "split" && m_args.size() == 2)
        {
            split(m_args[0], m_args[1]);
        }
        else if(m_command == "join" && m_args.size() == 2)
        {
            join(m_args[0], m_args[1]);
        }
        else if(m_command == "info" && m_args.size() == 1)
        {
            info(m_args[0]);
        }
        else
        {
            std::cerr << fmt::format("Invalid command '{}' or number of arguments {}, see --help\n",
                    m_command, m_args.size());
            return 1;
        }
        return 0;
    }

private:

    void split(const boost::filesystem::path& input, const boost::filesystem::path& output)
    {
        auto in = svf::FileSystem::openFileUnique(input, svf::FileSystem::Access::readOnly);
        if(!in)
        {
            throw std::system_error(svf::FileSystem::getLastError(), std::system_category(),
                    fmt::format("Failed to open {}", input.string()));
        }
        auto options = m_options;
        options.mode = m_append ? svf::OpenMode::append : svf::OpenMode::write;
        auto out = svf::SplitFile::open(output, options);
        std::vector<uint8_t> block(k_copyBlockSize);
        uint64_t total = 0;
        for(;;)
        {
            auto actuallyRead = in->read(boost::asio::buffer(block));
            if(!actuallyRead)
            {
                break;
            }
            out->write(boost::asio::buffer(block.data(), actuallyRead));
            total += actuallyRead;
        }
        auto volumes = out->volumeCount();
        out->close();
        fmt::print("{} bytes written to {} volume(s) of {}\n", total, volumes, output.string());
    }

    void join(const boost::filesystem::path& input, const boost::filesystem::path& output)
    {
        auto options = m_options;
        options.mode = svf::OpenMode::read;
        auto in = svf::SplitFile::open(input, options);
        auto out = svf::FileSystem::createFileUnique(output);
        if(!out)
        {
            throw std::system_error(svf::FileSystem::getLastError(), std::system_category(),
                    fmt::format("Failed to create {}", output.string()));
        }
        std::vector<uint8_t> block(k_copyBlockSize);
        uint64_t total = 0;
        for(;;)
        {
            auto actuallyRead = in->read(boost::asio::buffer(block));
            if(!actuallyRead)
            {
                break;
            }
            out->write(boost::asio::buffer(block.data(), actuallyRead));
            total += actuallyRead;
        }
        out->flush();
        in->close();
        fmt::print("{} bytes written to {}\n", total, output.string());
    }

    void info(const boost::filesystem::path& input)
    {
        auto options = m_options;
        options.mode = svf::OpenMode::read;
        auto file = svf::SplitFile::open(input, options);
        for(size_t idx = 0; idx < file->volumeCount(); ++idx)
        {
            auto path = svf::volumePath(input, idx);
            fmt::print("{:>6} {:>16} {}\n", idx, boost::filesystem::file_size(path), path.string());
        }
        fmt::print("total {} bytes in {} volume(s)\n", file->size(), file->volumeCount());
        file->close();
    }

    svf::SplitFile::Options m_options;
    bool m_append = false;
    boost::filesystem::path m_logFile;
    std::string m_command;
    std::vector<std::string> m_args;
};

}

int main(int argc, char* argv[])
{
    try
    {
        svfile_app app;
        if(!app.init(argc, argv))
        {
            return 0;
        }
        return app.run();
    }
    catch(std::exception& e)
    {
        std::cerr << fmt::format("svfile: {}\n", e.what());
        return 1;
    }
}
