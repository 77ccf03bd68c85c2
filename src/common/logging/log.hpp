#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sid::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Install the process logger from the --log_* flags. Idempotent.
void init();

void shutdown();

/// Structured event line: "<event> key=value ...", keys sorted.
void info(std::string_view event, std::unordered_map<std::string, std::string> fields);

}  // namespace sid::log
