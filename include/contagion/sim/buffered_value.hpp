#pragma once
#include <concepts>
#include <type_traits>

namespace contagion::sim
{
template <typename T>
concept Scalar = std::is_arithmetic_v<T> && not std::same_as<T, bool>;

// A scalar bound to its own write buffer.
// Values that depend on each other can all write their new state into the buffer while reading
// the committed one, and then commit together. Reading the committed value never shows a pending
// write; set() writes through and drops whatever was staged.
template <Scalar T>
class BufferedValue
{
public:
    BufferedValue() = default;

    explicit BufferedValue(T value) noexcept
        : value_{value}
        , buffer_{value}
    {
    }

    [[nodiscard]] T get() const noexcept
    {
        return value_;
    }

    [[nodiscard]] T buffered() const noexcept
    {
        return buffer_;
    }

    void set(T value) noexcept
    {
        value_  = value;
        buffer_ = value;
        dirty_  = false;
    }

    void setBuffered(T value) noexcept
    {
        buffer_ = value;
        dirty_  = true;
    }

    void addBuffered(T delta) noexcept
    {
        buffer_ += delta;
        dirty_ = true;
    }

    [[nodiscard]] bool needsCommit() const noexcept
    {
        return dirty_;
    }

    void commit() noexcept
    {
        value_ = buffer_;
        dirty_ = false;
    }

private:
    T value_{};
    T buffer_{};
    bool dirty_{false};
};
} // namespace contagion::sim
