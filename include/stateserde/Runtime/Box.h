//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Owning indirection used by schema `box<T>` fields.
///
//===----------------------------------------------------------------------===//
#ifndef STATESERDE_RUNTIME_BOX_H
#define STATESERDE_RUNTIME_BOX_H

#include <memory>
#include <utility>

namespace stateserde
{

/// @brief Heap-allocated value with value semantics.
///
/// Copies are deep and comparison compares the pointees, so a record holding a `Box` still behaves like a plain
/// aggregate. A default-constructed box holds a value-initialized `T`. A moved-from box may only be assigned to or
/// destroyed.
template <typename T>
class Box final
{
public:
    Box()
        : value_(std::make_unique<T>())
    {
    }

    // Implicit so that aggregates holding boxes can be brace-initialized from plain values.
    Box(T value)  // NOLINT(google-explicit-constructor)
        : value_(std::make_unique<T>(std::move(value)))
    {
    }

    Box(const Box& other)
        : value_(std::make_unique<T>(*other.value_))
    {
    }

    Box(Box&& other) noexcept = default;

    Box& operator=(const Box& other)
    {
        if (this != &other)
        {
            value_ = std::make_unique<T>(*other.value_);
        }
        return *this;
    }

    Box& operator=(Box&& other) noexcept = default;

    ~Box() = default;

    T& operator*()
    {
        return *value_;
    }

    const T& operator*() const
    {
        return *value_;
    }

    T* operator->()
    {
        return value_.get();
    }

    const T* operator->() const
    {
        return value_.get();
    }

    friend bool operator==(const Box& lhs, const Box& rhs)
    {
        return *lhs.value_ == *rhs.value_;
    }

private:
    std::unique_ptr<T> value_;
};

}  // namespace stateserde

#endif  // STATESERDE_RUNTIME_BOX_H
