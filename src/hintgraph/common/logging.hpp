/**
 * @file logging.hpp
 * @brief Library logger and logging macros.
 */
#pragma once
#include "hintgraph/common/graph_exceptions.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace hintgraph
{

/**
 * @brief The library logger, registered with spdlog as "hintgraph".
 *
 * @details
 * Created on first use with a colored stderr sink and level `warn`, so a
 * library user sees constraint failures but not evaluation chatter. If the
 * application registered a logger named "hintgraph" beforehand, that one is
 * used instead.
 */
inline spdlog::logger& hintgraph_logger()
{
    // thread-safe since C++11 for function-local statics
    static spdlog::logger& ref = []() -> spdlog::logger& {
        auto lg = spdlog::get("hintgraph");
        if (!lg)
        {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            lg = std::make_shared<spdlog::logger>("hintgraph", sink);
            lg->set_level(spdlog::level::warn);
            lg->set_pattern("[%^%-5l%$ hintgraph] %v");
            spdlog::register_logger(lg);
        }
        return *lg;
    }();
    return ref;
}

/**
 * @brief Change the level of the library logger.
 */
inline void set_log_level(spdlog::level::level_enum level)
{
    hintgraph_logger().set_level(level);
}

#define HINTGRAPH_TRACE(...) ::hintgraph::hintgraph_logger().trace(__VA_ARGS__)
#define HINTGRAPH_DEBUG(...) ::hintgraph::hintgraph_logger().debug(__VA_ARGS__)
#define HINTGRAPH_INFO(...) ::hintgraph::hintgraph_logger().info(__VA_ARGS__)
#define HINTGRAPH_WARN(...) ::hintgraph::hintgraph_logger().warn(__VA_ARGS__)
#define HINTGRAPH_ERROR(...) ::hintgraph::hintgraph_logger().error(__VA_ARGS__)

/**
 * @brief Log a graph error and throw it.
 *
 * @details
 * Constraint violations are logged at `error` level. Structural misuse and
 * overflow are logged at `debug` level, since the exception already reaches
 * the caller that made the mistake.
 */
template <typename E>
[[noreturn]] void log_and_throw(E error)
{
    static_assert(std::is_base_of_v<GraphError, E>, "log_and_throw expects a GraphError");
    if (error.category() == ErrorCategory::Constraint)
    {
        HINTGRAPH_ERROR("{}", error.what());
    }
    else
    {
        HINTGRAPH_DEBUG("{}", error.what());
    }
    throw error;
}

} // namespace hintgraph
