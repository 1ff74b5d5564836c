#pragma once

#include <memory>

#include <boost/filesystem/path.hpp>
#include <spdlog/spdlog.h>

namespace svf {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

extern const char* s_loggingCategory;

//Fill cached with registered logger of svf category,
//or with null logger if host application didn't install one.
LoggerPtr& getLogger(LoggerPtr& cached);

void initFileLogger(const boost::filesystem::path& filePath, size_t maxSize, size_t maxFiles);
void initStdoutLogger();

}
