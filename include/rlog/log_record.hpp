/**
 * @file log_record.hpp
 * @brief Structured log record passed from loggers to handlers
 * @author rlog contributors
 * @copyright Copyright (c) 2026 rlog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "log_types.hpp"
#include "log_value.hpp"

namespace rlog
{

/**
 * @brief A single key/value pair attached to a record
 *
 * Owns its key and value, so a handler may keep a copy after the call.
 */
struct log_attr
{
    std::string key;
    log_value value;

    log_attr() = default;

    template <typename T>
        requires loggable<log_value_storage_t<T>>
    log_attr(std::string_view k, T &&v) : key(k), value(std::forward<T>(v))
    {
    }
};

/**
 * @brief Borrowed key/value pair used by the braced attribute form of logger
 *
 * Holds only a view of the key and a pointer to the value, both owned by the
 * caller's full expression. The log_attr is built from it after the level
 * check, so disabled calls copy nothing. Never store one beyond the call.
 *
 * @code
 * log.info("request done", {{"status", 200}, {"path", "/index.html"}});
 * @endcode
 */
class log_attr_ref
{
    using append_fn = void (*)(std::vector<log_attr> &, std::string_view, const void *);

    std::string_view key_;
    const void *value_;
    append_fn append_;

    template <typename T> static void append_value(std::vector<log_attr> &attrs, std::string_view key, const void *value)
    {
        attrs.emplace_back(key, *static_cast<const T *>(value));
    }

  public:
    template <typename T>
        requires loggable<log_value_storage_t<const T &>>
    log_attr_ref(std::string_view key, const T &value) : key_(key), value_(&value), append_(&append_value<T>)
    {
    }

    std::string_view key() const { return key_; }

    void append_to(std::vector<log_attr> &attrs) const { append_(attrs, key_, value_); }
};

/**
 * @brief Message, level and attributes of one logging call
 *
 * A record is built once per enabled call and handed to the handler by const
 * reference. The facade keeps nothing after the handler returns; a handler
 * that needs the record later must copy it.
 */
struct log_record
{
    std::string message;
    log_level level = log_level::info;
    std::vector<log_attr> attrs; ///< Caller attributes in call order, then the module attribute

    /**
     * @brief First attribute with the given key
     * @return Pointer into attrs, or nullptr if no attribute has this key
     */
    const log_attr *find(std::string_view key) const
    {
        for (const auto &attr : attrs)
        {
            if (attr.key == key) return &attr;
        }
        return nullptr;
    }
};

} // namespace rlog
