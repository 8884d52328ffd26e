#pragma once

#include <memory>
#include <spdlog/logger.h>


namespace gman
{

const char* const CONSOLE_LOGGER = "console";

/** The logger "console" (stdout); created on first use. */
const std::shared_ptr<spdlog::logger>& console();

}

#define L_DEBUG(...) gman::console()->debug(__VA_ARGS__)  // NOLINT(bugprone-macro-parentheses)
#define L_INF(...)   gman::console()->info(__VA_ARGS__)   // NOLINT(bugprone-macro-parentheses)
#define L_WARN(...)  gman::console()->warn(__VA_ARGS__)   // NOLINT(bugprone-macro-parentheses)
