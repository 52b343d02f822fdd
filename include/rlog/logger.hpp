/**
 * @file logger.hpp
 * @brief Leveled front object that builds records and forwards them to a handler
 * @author rlog contributors
 * @copyright Copyright (c) 2026 rlog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_handler.hpp"

namespace rlog
{

/**
 * @brief Logger bound to one handler and tagged with a module name
 *
 * Loggers are obtained from a log_context or a log_handler_registry and are
 * cheap to copy. They hold no state besides the module name and the handler
 * they were bound to; changing the context's handler later does not affect
 * loggers that already exist.
 *
 * Every record gets the caller's attributes in call order followed by one
 * trailing {"module", <module name>} attribute, which is how records from
 * extensions linked into the same executable are told apart.
 *
 * Attributes are given either as alternating keys and values, checked at
 * compile time, or as a braced list:
 * @code
 * auto log = rlog::get_logger("http");
 * log.info("started", "port", 8080, "tls", true);
 * log.warn("slow request", {{"path", path}, {"ms", elapsed}});
 * @endcode
 */
class logger
{
    std::string module_;
    std::shared_ptr<log_handler> handler_;

    template <typename Key> static std::string_view key_view(const Key &key)
    {
        if constexpr (std::is_pointer_v<Key>)
        {
            if (!key) return {};
        }
        return std::string_view(key);
    }

    template <typename Key, typename Value, typename... Rest>
    static void append_pairs(std::vector<log_attr> &attrs, Key &&key, Value &&value, Rest &&...rest)
    {
        static_assert(std::is_convertible_v<Key, std::string_view> && !std::is_null_pointer_v<std::remove_cvref_t<Key>>,
                      "attribute keys must be strings");
        static_assert(loggable<log_value_storage_t<Value>>, "attribute value cannot be formatted by fmt");

        attrs.emplace_back(key_view(key), std::forward<Value>(value));
        if constexpr (sizeof...(Rest) > 0) { append_pairs(attrs, std::forward<Rest>(rest)...); }
    }

    void emit(log_level level, std::string_view msg, std::vector<log_attr> attrs) const
    {
        attrs.emplace_back(ATTR_KEY_MODULE, module_);

        log_record record;
        record.message = std::string(msg);
        record.level   = level;
        record.attrs   = std::move(attrs);

        handler_->handle(record);
    }

  public:
    /**
     * @brief Bind a logger to a handler
     * @throws handler_not_set if handler is null
     */
    logger(std::string module, std::shared_ptr<log_handler> handler)
        : module_(std::move(module)), handler_(std::move(handler))
    {
        if (!handler_) { throw handler_not_set(module_); }
    }

    const std::string &module() const { return module_; }
    const std::shared_ptr<log_handler> &handler() const { return handler_; }

    /**
     * @brief Ask the bound handler whether a level is active
     *
     * Useful to skip expensive preparation of attribute values.
     */
    bool enabled(log_level level) const { return handler_->enabled(level); }

    /**
     * @brief Emit a record at the given level
     * @param level Severity of the record
     * @param msg Message text
     * @param args Alternating keys and values, key first
     *
     * Nothing is built when the handler reports the level as disabled.
     */
    template <typename... Args> void log(log_level level, std::string_view msg, Args &&...args) const
    {
        static_assert(sizeof...(Args) % 2 == 0, "attributes must be passed as key/value pairs");

        if (!handler_->enabled(level)) return;

        std::vector<log_attr> attrs;
        attrs.reserve(sizeof...(Args) / 2 + 1);
        if constexpr (sizeof...(Args) > 0) { append_pairs(attrs, std::forward<Args>(args)...); }

        emit(level, msg, std::move(attrs));
    }

    /**
     * @brief Emit a record with a braced attribute list
     *
     * The list only refers to the caller's keys and values; they are copied
     * into the record after the level check.
     */
    void log(log_level level, std::string_view msg, std::initializer_list<log_attr_ref> attrs) const
    {
        if (!handler_->enabled(level)) return;

        std::vector<log_attr> built;
        built.reserve(attrs.size() + 1);
        for (const auto &attr : attrs) { attr.append_to(built); }

        emit(level, msg, std::move(built));
    }

    template <typename... Args> void debug(std::string_view msg, Args &&...args) const
    {
        log(log_level::debug, msg, std::forward<Args>(args)...);
    }
    void debug(std::string_view msg, std::initializer_list<log_attr_ref> attrs) const
    {
        log(log_level::debug, msg, attrs);
    }

    template <typename... Args> void info(std::string_view msg, Args &&...args) const
    {
        log(log_level::info, msg, std::forward<Args>(args)...);
    }
    void info(std::string_view msg, std::initializer_list<log_attr_ref> attrs) const
    {
        log(log_level::info, msg, attrs);
    }

    template <typename... Args> void warn(std::string_view msg, Args &&...args) const
    {
        log(log_level::warn, msg, std::forward<Args>(args)...);
    }
    void warn(std::string_view msg, std::initializer_list<log_attr_ref> attrs) const
    {
        log(log_level::warn, msg, attrs);
    }

    template <typename... Args> void error(std::string_view msg, Args &&...args) const
    {
        log(log_level::error, msg, std::forward<Args>(args)...);
    }
    void error(std::string_view msg, std::initializer_list<log_attr_ref> attrs) const
    {
        log(log_level::error, msg, attrs);
    }
};

} // namespace rlog
