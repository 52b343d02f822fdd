/**
 * @file log_handler_registry.hpp
 * @brief Registry of handlers by name
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
#include <vector>

#include "robin_hood.h"
#include "log_types.hpp"
#include "log_handler.hpp"
#include "logger.hpp"

namespace rlog
{

/**
 * @brief Registry for handlers that are addressed by name
 *
 * For applications where a component needs its own backend (an audit trail
 * next to the regular application log, say) the handler is registered under
 * a name and the component asks for a logger by that name. The name doubles
 * as the module attribute of the records.
 *
 * Features:
 * - First registration of a name wins, later ones are refused and leave the
 *   stored handler untouched
 * - Thread-safe registration and lookup, concurrent registrations of the same
 *   name have exactly one winner
 * - Handlers are never removed
 *
 * Unlike log_context this registry is independent of the default handler: a
 * name without a registered handler is an error even if a default handler is
 * installed.
 *
 * @code
 * auto &registry = rlog::log_handler_registry::instance();
 * registry.register_handler("audit", std::make_shared<audit_file_handler>());
 *
 * auto audit = registry.get_logger("audit");
 * audit.info("user deleted", "user_id", id);
 * @endcode
 */
class log_handler_registry
{
    robin_hood::unordered_map<std::string, std::shared_ptr<log_handler>> handlers_;
    mutable std::shared_mutex mutex_; // Allow concurrent reads

  public:
    log_handler_registry() = default;

    log_handler_registry(const log_handler_registry &)            = delete;
    log_handler_registry &operator=(const log_handler_registry &) = delete;

    static log_handler_registry &instance()
    {
        static log_handler_registry inst;
        return inst;
    }

    /**
     * @brief Associate a handler with a name unless the name is taken
     * @param name Registration name
     * @param handler Handler to store
     * @return true if the handler was stored, false if the name already has a
     *         handler or handler is null
     */
    bool register_handler(std::string_view name, std::shared_ptr<log_handler> handler)
    {
        if (!handler) return false;

        std::unique_lock lock(mutex_);
        return handlers_.emplace(std::string(name), std::move(handler)).second;
    }

    /**
     * @brief Handler registered under a name
     * @return The handler, or nullptr if nothing is registered under name
     */
    std::shared_ptr<log_handler> find_handler(std::string_view name) const
    {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::string(name));
        return it != handlers_.end() ? it->second : nullptr;
    }

    bool contains(std::string_view name) const { return find_handler(name) != nullptr; }

    size_t size() const
    {
        std::shared_lock lock(mutex_);
        return handlers_.size();
    }

    std::vector<std::string> names() const
    {
        std::shared_lock lock(mutex_);
        std::vector<std::string> result;
        result.reserve(handlers_.size());

        for (const auto &[name, handler] : handlers_) { result.push_back(name); }
        return result;
    }

    /**
     * @brief Logger bound to the handler registered under name
     * @param name Registration name, also used as the module attribute
     * @throws handler_not_set if nothing is registered under name
     */
    logger get_logger(std::string_view name) const
    {
        auto handler = find_handler(name);
        if (!handler) { throw handler_not_set(name); }
        return logger(std::string(name), std::move(handler));
    }
};

} // namespace rlog
