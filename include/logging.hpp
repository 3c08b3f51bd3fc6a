#pragma once

#include <filesystem>

#include <spdlog/common.h>

namespace modtui {

void init_logging(const std::filesystem::path &log_file, spdlog::level::level_enum level);
void shutdown_logging();

}
