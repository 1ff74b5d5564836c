#include "Logging.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace svf {

const char* s_loggingCategory = "SplitFile";

namespace {

//null logger is registered by library code when nothing was installed before first use
void dropNullLogger()
{
    auto existing = spdlog::get(s_loggingCategory);
    if(!existing)
    {
        return;
    }
    auto& sinks = existing->sinks();
    if(sinks.size() == 1 && std::dynamic_pointer_cast<spdlog::sinks::null_sink_mt>(sinks.front()))
    {
        spdlog::drop(s_loggingCategory);
    }
}

}

LoggerPtr& getLogger(LoggerPtr& cached)
{
    if(cached)
    {
        return cached;
    }
    cached = spdlog::get(s_loggingCategory);
    if(!cached)
    {
        cached = spdlog::default_factory::create<spdlog::sinks::null_sink_mt>(s_loggingCategory);
    }
    return cached;
}

void initFileLogger(const boost::filesystem::path& filePath, size_t maxSize, size_t maxFiles)
{
    dropNullLogger();
    if(!spdlog::get(s_loggingCategory))
    {
        auto log = spdlog::default_factory::create<spdlog::sinks::rotating_file_sink_mt>(s_loggingCategory,
                filePath.string(),
                maxSize, maxFiles);
        log->set_level(spdlog::level::debug);
    }
}

void initStdoutLogger()
{
    dropNullLogger();
    if(!spdlog::get(s_loggingCategory))
    {
        auto log = spdlog::stdout_color_mt(s_loggingCategory);
        log->set_level(spdlog::level::debug);
    }
}

}
