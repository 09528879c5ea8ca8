#ifndef BOUNCE_PIT_RESULT_H
#define BOUNCE_PIT_RESULT_H

#include <expected>
#include <utility>

namespace BouncePit {

/**
 * Result<T, E>: Thin wrapper around C++23 std::expected.
 *
 * Used at the sandbox boundary where caller input is validated. Composition
 * keeps the static factories (okay/error) apart from the instance accessors.
 */
template <typename successT, typename failureT>
class Result {
private:
    std::expected<successT, failureT> inner_;

public:
    // A default-constructed Result is an error holding a default failureT.
    Result() : inner_(std::unexpected(failureT())) {}

    Result(successT value) : inner_(std::move(value)) {}
    Result(failureT err) : inner_(std::unexpected(std::move(err))) {}
    Result(std::unexpected<failureT> err) : inner_(std::move(err)) {}

    static Result<successT, failureT> okay() { return Result<successT, failureT>(successT()); }

    // Suppress false positive -Wmaybe-uninitialized with GCC + -O3 + variants.
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
    static Result<successT, failureT> okay(successT value)
    {
        return Result<successT, failureT>(std::move(value));
    }
#pragma GCC diagnostic pop

    static Result<successT, failureT> error(failureT err)
    {
        return Result<successT, failureT>(std::unexpected(std::move(err)));
    }

    bool isValue() const { return inner_.has_value(); }
    bool isError() const { return !inner_.has_value(); }

    successT value() const& { return inner_.value(); }
    successT value() && { return std::move(inner_).value(); }

    // Falls back to @p fallback when this holds an error.
    successT valueOr(successT fallback) const& { return inner_.value_or(std::move(fallback)); }

    // Named errorValue() so it does not collide with the static error() factory.
    const failureT& errorValue() const& { return inner_.error(); }
    failureT errorValue() && { return std::move(inner_).error(); }
};

} // namespace BouncePit

#endif // BOUNCE_PIT_RESULT_H
