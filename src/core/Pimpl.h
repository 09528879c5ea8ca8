#pragma once

#include <memory>
#include <utility>

namespace BouncePit {

/**
 * Generic Pimpl (pointer to implementation) wrapper.
 *
 * Keeps calculator and bookkeeping types out of public headers such as
 * World.h. The owning class declares its destructor and move operations in
 * the header and defaults them in the .cpp where T is complete.
 *
 * Usage:
 *   // World.h
 *   struct Impl;
 *   Pimpl<Impl> pImpl;
 *
 *   // World.cpp
 *   struct World::Impl { ... };
 *   World::~World() = default;
 */
template <typename T>
class Pimpl {
public:
    template <typename... Args>
    Pimpl(Args&&... args) : impl_(std::make_unique<T>(std::forward<Args>(args)...))
    {}

    ~Pimpl() = default;

    // Move-only.
    Pimpl(Pimpl&&) noexcept = default;
    Pimpl& operator=(Pimpl&&) noexcept = default;
    Pimpl(const Pimpl&) = delete;
    Pimpl& operator=(const Pimpl&) = delete;

    T* operator->() { return impl_.get(); }
    const T* operator->() const { return impl_.get(); }

    T& operator*() { return *impl_; }
    const T& operator*() const { return *impl_; }

private:
    std::unique_ptr<T> impl_;
};

} // namespace BouncePit
