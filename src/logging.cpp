#include "logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace modtui {

void init_logging(const std::filesystem::path &log_file, spdlog::level::level_enum level) {
    spdlog::drop("modtui");
    auto log = spdlog::basic_logger_mt("modtui", log_file.string(), true);
    spdlog::set_default_logger(log);
    spdlog::set_level(level);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

}
