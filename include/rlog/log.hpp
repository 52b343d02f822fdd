/**
 * @file log.hpp
 * @brief Structured logging facade shared by an application and its extensions
 * @author rlog contributors
 * @copyright Copyright (c) 2026 rlog contributors. Licensed under MIT License, see LICENSE for details.
 *
 * rlog only defines the interface for logging. The embedding application
 * provides the backend by implementing log_handler and installing it once,
 * before anything else runs, so that every extension compiled into the
 * executable logs through the same implementation.
 *
 * This facade provides:
 * - Four levels: debug < info < warn < error
 * - Key/value attributes with arbitrary fmt-formattable values
 * - A per-logger module tag appended to every record
 * - Level short-circuit: nothing is built for disabled levels
 * - Synchronous delivery on the calling thread, no buffering
 *
 * Setup in main():
 * @code
 * rlog::set_default_handler(std::make_shared<my_handler>());
 * @endcode
 *
 * Logging from application code and extensions:
 * @code
 * auto log = rlog::get_default_logger();
 * log.info("started", "port", 8080);
 * // record: msg="started" level=info attrs={port=8080, module=default}
 *
 * auto ext = rlog::get_logger("ext_video");
 * ext.warn("frame dropped", {{"pts", pts}, {"queue", depth}});
 * // record: msg="frame dropped" level=warn attrs={pts=..., queue=..., module=ext_video}
 * @endcode
 *
 * Named handlers:
 * @code
 * rlog::register_handler("audit", std::make_shared<audit_handler>());  // false if taken
 * rlog::get_registered_logger("audit").info("login", "user", name);
 * @endcode
 */
#pragma once

#include <memory>
#include <string_view>
#include <utility>

#include "log_version.hpp"
#include "log_types.hpp"
#include "log_value.hpp"
#include "log_record.hpp"
#include "log_handler.hpp"
#include "logger.hpp"
#include "log_context.hpp"
#include "log_handler_registry.hpp"

namespace rlog
{

/**
 * @brief Install the process-wide default handler
 *
 * Must be called before get_default_logger() or get_logger(), in general in
 * main() before the application starts. A later call replaces the handler for
 * loggers requested afterwards.
 */
inline void set_default_handler(std::shared_ptr<log_handler> handler)
{
    log_context::instance().set_default_handler(std::move(handler));
}

/**
 * @brief Logger tagged with the "default" module
 * @throws handler_not_set if set_default_handler() has not been called
 */
inline logger get_default_logger() { return log_context::instance().get_default_logger(); }

/**
 * @brief Logger for an extension or subsystem
 *
 * Extensions call this with their own name; the name is added to each record
 * as the "module" attribute.
 *
 * @throws handler_not_set if set_default_handler() has not been called
 */
inline logger get_logger(std::string_view module) { return log_context::instance().get_logger(module); }

/**
 * @brief Register a handler under a name in the process-wide registry
 * @return false if the name is already taken
 */
inline bool register_handler(std::string_view name, std::shared_ptr<log_handler> handler)
{
    return log_handler_registry::instance().register_handler(name, std::move(handler));
}

/**
 * @brief Logger bound to a handler from the process-wide registry
 * @throws handler_not_set if no handler is registered under name
 */
inline logger get_registered_logger(std::string_view name)
{
    return log_handler_registry::instance().get_logger(name);
}

} // namespace rlog
