/**
 * @file log_handler.hpp
 * @brief Interface implemented by logging backends
 * @author rlog contributors
 * @copyright Copyright (c) 2026 rlog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "log_types.hpp"
#include "log_record.hpp"

namespace rlog
{

/**
 * @brief Backend that decides which levels are active and delivers records
 *
 * The embedding application implements this interface (console writer, file
 * appender, network exporter, test spy) and installs it once at startup.
 * Both methods run synchronously on the thread that logs, possibly on several
 * threads at once. Implementations do their own locking.
 *
 * @code
 * struct stderr_handler final : rlog::log_handler
 * {
 *     bool enabled(rlog::log_level level) const override { return level >= rlog::log_level::info; }
 *     void handle(const rlog::log_record &record) override
 *     {
 *         fmt::print(stderr, "[{}] {}\n", record.level, record.message);
 *     }
 * };
 * @endcode
 */
class log_handler
{
  public:
    virtual ~log_handler() = default;

    /**
     * @brief Whether records of this level should be built at all
     */
    virtual bool enabled(log_level level) const = 0;

    /**
     * @brief Deliver one record
     *
     * Delivery failures are the handler's business; the facade does not look
     * at the outcome.
     */
    virtual void handle(const log_record &record) = 0;
};

/**
 * @brief Thrown when a logger is requested before a handler was installed
 *
 * Logging is expected to be set up before any other subsystem starts, so a
 * missing handler is a programming error and not something to recover from.
 */
class handler_not_set : public std::logic_error
{
  public:
    explicit handler_not_set(std::string_view module)
        : std::logic_error("handler not set: no log handler available for module '" + std::string(module) + "'")
    {
    }
};

} // namespace rlog
