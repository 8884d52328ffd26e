#include "logger.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>


namespace gman
{

/* Ensures that logger "console" exists. */
class LoggerInitializer
{
public:
    const std::shared_ptr<spdlog::logger> logger;

    LoggerInitializer() : logger(get_or_create())
    {
        logger->set_pattern("%H:%M:%S %v ");
    }

private:
    static std::shared_ptr<spdlog::logger> get_or_create()
    {
        auto existing = spdlog::get(CONSOLE_LOGGER);
        return existing? existing: spdlog::stdout_logger_mt(CONSOLE_LOGGER);
    }
};

const std::shared_ptr<spdlog::logger>& console()
{
    static const LoggerInitializer loggerInitializer;
    return loggerInitializer.logger;
}

}
