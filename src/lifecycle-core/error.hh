#pragma once

#include <lifecycle-core/fwd.hh>
#include <lifecycle-core/source_location.hh>

#include <exception>
#include <memory>
#include <string>
#include <vector>

// =========================================================================================================
// Failure model of lifecycle-core
// =========================================================================================================
//
// Setup, teardown and usage failures are exceptions. The library never logs or swallows them.
// When two failures meet (a setup failure whose compensating teardown also fails, a usage failure
// followed by a failing teardown), the first one stays primary and the second is attached to it
// as a "suppressed" failure. Two teardown failures of the same unwind are aggregated into a
// lc::teardown_double_error instead, which nests for longer chains.
//
// Attaching works in place for anything deriving from lc::error, so user code that throws
// lc::error (or its own subclasses) keeps its dynamic type. Any other primary failure is wrapped
// into an lc::error whose cause() is the original.
//

/// Base of all failures raised or aggregated by lifecycle-core
/// Carries a message, the site it was raised at, an optional cause and a list of suppressed failures
/// Copies share their payload, so suppressed failures added to a caught reference are
/// visible on every copy that is rethrown later
struct lc::error : std::exception
{
public:
    explicit error(std::string message, lc::source_location site = lc::source_location::current());
    error(std::exception_ptr cause, std::string message, lc::source_location site = lc::source_location::current());

    [[nodiscard]] char const* what() const noexcept override;

    [[nodiscard]] std::string const& message() const;
    [[nodiscard]] lc::source_location site() const;

    /// the failure this error wraps, nullptr if none
    [[nodiscard]] std::exception_ptr const& cause() const;
    [[nodiscard]] bool has_cause() const;

    /// secondary failures that occurred while this one was propagating, in the order they occurred
    [[nodiscard]] std::vector<std::exception_ptr> const& suppressed() const;
    void add_suppressed(std::exception_ptr failure);

    /// multi-line report with site, cause and suppressed failures (recursively)
    [[nodiscard]] std::string to_string() const;

private:
    struct payload;
    std::shared_ptr<payload> _payload;
};

/// Two teardown failures from the same unwind of a composite resource
/// outer is the failure of the link torn down first (the downstream one), inner the failure of its upstream
/// Either may itself be a teardown_double_error, so any number of failures can be represented
struct lc::teardown_double_error : lc::error
{
public:
    teardown_double_error(std::exception_ptr outer,
                          std::exception_ptr inner,
                          lc::source_location site = lc::source_location::current());

    [[nodiscard]] std::exception_ptr const& outer() const { return _outer; }
    [[nodiscard]] std::exception_ptr const& inner() const { return _inner; }

private:
    std::exception_ptr _outer;
    std::exception_ptr _inner;
};

namespace lc
{
/// Human readable one-line description of an arbitrary failure
///   std::exception          -> what()
///   anything else           -> "<demangled type name>"
///   nullptr                 -> "<no exception>"
[[nodiscard]] std::string describe(std::exception_ptr const& failure);

/// Attaches secondary as a suppressed failure of primary and returns the failure to propagate
/// Returns primary itself if it derives from lc::error, otherwise a new lc::error wrapping it
/// Precondition: primary and secondary are non-null
[[nodiscard]] std::exception_ptr with_suppressed(std::exception_ptr primary,
                                                 std::exception_ptr secondary,
                                                 lc::source_location site = lc::source_location::current());

/// Suppressed failures of a failure, empty if it is not an lc::error
[[nodiscard]] std::vector<std::exception_ptr> suppressed_of(std::exception_ptr const& failure);
} // namespace lc
