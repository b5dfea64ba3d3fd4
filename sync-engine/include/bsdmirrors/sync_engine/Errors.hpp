/**
 * @file Errors.hpp
 * @brief Exception types reported by the sync engine
 */

#pragma once

// Standard Library Includes
#include <stdexcept>

namespace bsdmirrors::sync_engine
{
// A setting, target update or request failed validation. Nothing was changed.
struct validation_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// The target's lock is already held by a running job.
struct target_busy : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct target_disabled : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct target_not_found : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct job_not_found : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct database_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct config_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// The transfer tool could not be started at all (missing binary, EACCES, ...)
struct spawn_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Programming error: an operation was attempted without holding what it requires
// (e.g. releasing a lock that is not held, rewriting a terminal job).
struct precondition_violation : std::logic_error
{
    using std::logic_error::logic_error;
};
} // namespace bsdmirrors::sync_engine
