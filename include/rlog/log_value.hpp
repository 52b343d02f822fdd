/**
 * @file log_value.hpp
 * @brief Type-erased attribute value with small buffer optimization
 * @author rlog contributors
 * @copyright Copyright (c) 2026 rlog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstddef>
#include <iterator>
#include <new>
#include <string>
#include <string_view>
#include <typeinfo>
#include <type_traits>
#include <utility>

#include "log_types.hpp"

namespace rlog
{

/**
 * @brief Storage type used for a value of type T
 *
 * Anything string-like is copied into an owned std::string so that a record
 * never points into the caller's stack frame. A null C string or nullptr is
 * stored as NULL_STRING_VALUE.
 */
template <typename T>
using log_value_storage_t =
    std::conditional_t<std::is_convertible_v<T, std::string_view> || std::is_null_pointer_v<std::remove_cvref_t<T>>,
                       std::string, std::remove_cvref_t<T>>;

namespace detail
{

// Converts a caller's value to its storage type; only string-like values change
template <typename T> decltype(auto) to_storage(T &&value)
{
    using raw = std::remove_cvref_t<T>;

    if constexpr (std::is_null_pointer_v<raw>) { return std::string(NULL_STRING_VALUE); }
    else if constexpr (std::is_same_v<log_value_storage_t<T>, std::string> && std::is_pointer_v<raw>)
    {
        return value ? std::string(value) : std::string(NULL_STRING_VALUE);
    }
    else { return std::forward<T>(value); }
}

/**
 * @brief Interface for a stored attribute value
 *
 * Besides value access it carries the operations log_value needs to copy and
 * move a model without knowing its concrete type.
 */
struct value_concept
{
    virtual ~value_concept() = default;

    virtual const std::type_info &type() const noexcept = 0;
    virtual const void *data() const noexcept           = 0;
    virtual void format_to(std::string &out) const      = 0;

    virtual value_concept *clone_in_place(void *buffer) const   = 0;
    virtual value_concept *move_in_place(void *buffer) noexcept = 0;
    virtual value_concept *heap_clone() const                   = 0;
};

template <typename T> struct value_model final : value_concept
{
    T value_;

    template <typename U> explicit value_model(U &&value) : value_(std::forward<U>(value)) {}

    const std::type_info &type() const noexcept override { return typeid(T); }
    const void *data() const noexcept override { return &value_; }
    void format_to(std::string &out) const override { fmt::format_to(std::back_inserter(out), "{}", value_); }

    value_concept *clone_in_place(void *buffer) const override { return new (buffer) value_model(value_); }
    value_concept *move_in_place(void *buffer) noexcept override
    {
        return new (buffer) value_model(std::move(value_));
    }
    value_concept *heap_clone() const override { return new value_model(value_); }
};

} // namespace detail

/**
 * @brief Opaque value of a log attribute
 *
 * The facade never looks inside a value; handlers either ask for a concrete
 * type with get_if<T>() or render it with to_string(). Values up to
 * INLINE_SIZE bytes (ints, doubles, bools, std::string) live inline, larger
 * ones are allocated on the heap.
 *
 * @code
 * log_value port{8080};
 * if (const int *p = port.get_if<int>()) { use(*p); }
 *
 * log_value host{"localhost"};      // stored as std::string
 * host.to_string();                 // "localhost"
 * @endcode
 */
class log_value
{
  public:
    static constexpr size_t INLINE_SIZE = 48;

  private:
    template <typename Model>
    static constexpr bool fits_inline = sizeof(Model) <= INLINE_SIZE && alignof(Model) <= alignof(std::max_align_t) &&
                                        std::is_nothrow_move_constructible_v<Model>;

    alignas(std::max_align_t) unsigned char storage_[INLINE_SIZE];
    detail::value_concept *ptr_ = nullptr;
    bool is_inline_             = false;

    void destroy() noexcept
    {
        if (ptr_)
        {
            is_inline_ ? ptr_->~value_concept() : delete ptr_;
            ptr_ = nullptr;
        }
    }

    // Takes over other's model, leaving other empty
    void steal(log_value &other) noexcept
    {
        is_inline_ = other.is_inline_;
        if (!other.ptr_) return;

        if (is_inline_)
        {
            ptr_ = other.ptr_->move_in_place(storage_);
            other.destroy();
        }
        else
        {
            ptr_       = other.ptr_;
            other.ptr_ = nullptr;
        }
    }

  public:
    log_value() = default;

    template <typename T>
        requires(!std::is_same_v<std::remove_cvref_t<T>, log_value> && loggable<log_value_storage_t<T>>)
    log_value(T &&value)
    {
        using model = detail::value_model<log_value_storage_t<T>>;

        if constexpr (fits_inline<model>)
        {
            ptr_       = new (storage_) model(detail::to_storage(std::forward<T>(value)));
            is_inline_ = true;
        }
        else { ptr_ = new model(detail::to_storage(std::forward<T>(value))); }
    }

    log_value(const log_value &other) : is_inline_(other.is_inline_)
    {
        if (other.ptr_) { ptr_ = is_inline_ ? other.ptr_->clone_in_place(storage_) : other.ptr_->heap_clone(); }
    }

    log_value(log_value &&other) noexcept { steal(other); }

    // Copy-and-swap for strong exception safety
    log_value &operator=(const log_value &other)
    {
        if (this != &other)
        {
            log_value temp(other);
            destroy();
            steal(temp);
        }
        return *this;
    }

    log_value &operator=(log_value &&other) noexcept
    {
        if (this != &other)
        {
            destroy();
            steal(other);
        }
        return *this;
    }

    ~log_value() { destroy(); }

    bool empty() const { return ptr_ == nullptr; }
    explicit operator bool() const { return ptr_ != nullptr; }

    /**
     * @brief Type of the stored value, typeid(void) when empty
     */
    const std::type_info &type() const noexcept { return ptr_ ? ptr_->type() : typeid(void); }

    template <typename T> bool holds() const noexcept { return ptr_ && ptr_->type() == typeid(T); }

    /**
     * @brief Typed access to the stored value
     * @return Pointer to the value, or nullptr if the value is empty or holds another type
     *
     * String-like values are stored as std::string, ask for that type.
     */
    template <typename T> const T *get_if() const noexcept
    {
        return holds<T>() ? static_cast<const T *>(ptr_->data()) : nullptr;
    }

    /**
     * @brief Render the value with fmt's default formatting ("" when empty)
     */
    std::string to_string() const
    {
        std::string out;
        if (ptr_) { ptr_->format_to(out); }
        return out;
    }
};

} // namespace rlog

template <> struct fmt::formatter<rlog::log_value> : fmt::formatter<fmt::string_view>
{
    auto format(const rlog::log_value &value, fmt::format_context &ctx) const
    {
        return fmt::formatter<fmt::string_view>::format(value.to_string(), ctx);
    }
};
