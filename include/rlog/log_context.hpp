/**
 * @file log_context.hpp
 * @brief Holder of the default log handler and source of module loggers
 * @author rlog contributors
 * @copyright Copyright (c) 2026 rlog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

#include "log_types.hpp"
#include "log_handler.hpp"
#include "logger.hpp"

namespace rlog
{

/**
 * @brief Slot for the handler shared by all loggers of an application
 *
 * One handler serves every extension compiled into the executable. Since the
 * extensions cannot be told apart by their call stacks, each one asks for its
 * own logger by name and the name is attached to its records as the "module"
 * attribute.
 *
 * The handler must be set before the first logger is requested, normally in
 * main() before the application starts its subsystems. Asking for a logger
 * earlier throws handler_not_set. Loggers capture the handler when they are
 * created, so replacing the handler later only affects loggers requested
 * afterwards.
 *
 * The process-wide slot is log_context::instance(), also reachable through
 * the free functions in log.hpp. Subsystems that prefer explicit wiring can
 * be handed their own log_context instead.
 *
 * @code
 * int main()
 * {
 *     rlog::set_default_handler(std::make_shared<console_handler>());
 *     start_extensions();
 * }
 *
 * // inside an extension
 * auto log = rlog::get_logger("ext_storage");
 * log.info("opened", "path", path);   // ... module=ext_storage
 * @endcode
 */
class log_context
{
    std::shared_ptr<log_handler> handler_;
    mutable std::shared_mutex mutex_;

  public:
    log_context() = default;
    explicit log_context(std::shared_ptr<log_handler> handler) : handler_(std::move(handler)) {}

    log_context(const log_context &)            = delete;
    log_context &operator=(const log_context &) = delete;

    static log_context &instance()
    {
        static log_context inst;
        return inst;
    }

    /**
     * @brief Install the default handler, replacing any previous one
     * @param handler New handler, nullptr to clear the slot
     */
    void set_default_handler(std::shared_ptr<log_handler> handler)
    {
        std::unique_lock lock(mutex_);
        handler_ = std::move(handler);
    }

    std::shared_ptr<log_handler> default_handler() const
    {
        std::shared_lock lock(mutex_);
        return handler_;
    }

    bool has_default_handler() const
    {
        std::shared_lock lock(mutex_);
        return handler_ != nullptr;
    }

    /**
     * @brief Logger for a module, bound to the current default handler
     * @param module Name attached to every record as the "module" attribute
     * @throws handler_not_set if no default handler is installed
     */
    logger get_logger(std::string_view module) const
    {
        auto handler = default_handler();
        if (!handler) { throw handler_not_set(module); }
        return logger(std::string(module), std::move(handler));
    }

    /**
     * @brief Logger tagged with DEFAULT_MODULE_NAME
     * @throws handler_not_set if no default handler is installed
     */
    logger get_default_logger() const { return get_logger(DEFAULT_MODULE_NAME); }
};

} // namespace rlog
