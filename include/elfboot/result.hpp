//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/result.hpp
// Purpose: Result<T, E> type for explicit error handling without exceptions.
// Key invariants: Exactly one of value/error is live, selected by is_ok().
// Ownership/Lifetime: Value type; T and E must be trivially copyable.
// Links: include/elfboot/error.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type for the loader core.
 *
 * @details
 * Nothing in elfboot throws: the firmware is built with `-fno-exceptions` and
 * the fault path cannot unwind. Operations that can reject their input return
 * a Result carrying either the success value or an error code. Deciding what
 * a failure means (report, halt) is left to the caller.
 *
 * @code
 * Result<u64, LoadError> entry = loader::load_kernel(payload_base, console);
 * if (entry.is_err())
 *     arch::halt();
 * return entry.unwrap();
 * @endcode
 *
 * Both alternatives share storage, so T and E must be trivially copyable.
 * Every payload in the loader (addresses, counters, enum codes) is.
 */

#include "types.hpp"

namespace elfboot
{

/**
 * @brief Success value of type T or an error of type E.
 */
template <typename T, typename E> class Result
{
  public:
    static Result Ok(T value)
    {
        Result r(true);
        r.value_ = value;
        return r;
    }

    static Result Err(E error)
    {
        Result r(false);
        r.error_ = error;
        return r;
    }

    [[nodiscard]] bool is_ok() const
    {
        return ok_;
    }

    [[nodiscard]] bool is_err() const
    {
        return !ok_;
    }

    /// Success value. Only meaningful after is_ok().
    [[nodiscard]] T unwrap() const
    {
        return value_;
    }

    /// Error code. Only meaningful after is_err().
    [[nodiscard]] E error() const
    {
        return error_;
    }

  private:
    explicit Result(bool ok) : ok_(ok) {}

    union
    {
        T value_;
        E error_;
    };

    bool ok_;
};

/**
 * @brief Outcome of a check or configuration step: success or an error code.
 */
template <typename E> class Result<void, E>
{
  public:
    static Result Ok()
    {
        return Result(true, E{});
    }

    static Result Err(E error)
    {
        return Result(false, error);
    }

    [[nodiscard]] bool is_ok() const
    {
        return ok_;
    }

    [[nodiscard]] bool is_err() const
    {
        return !ok_;
    }

    /// Error code. Only meaningful after is_err().
    [[nodiscard]] E error() const
    {
        return error_;
    }

  private:
    Result(bool ok, E error) : error_(error), ok_(ok) {}

    E error_;
    bool ok_;
};

/// Shorthand for operations that only report success or an error
template <typename E> using Status = Result<void, E>;

} // namespace elfboot
