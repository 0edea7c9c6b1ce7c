/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: errors.h

    Description:
        Exception types for the hard-failure half of the error taxonomy.

        Routine outcomes are NOT exceptions anywhere in fleetwatch:
        - Lock contention, token mismatch, acquisition timeout: false/nullopt
        - Missing worker, lock or checkpoint: no-op or nullopt

        Hard failures ARE exceptions:
        - InvalidArgumentError: rejected input, raised before any store I/O
        - UnavailableError:     shared store unreachable; never retried here
        - PersistenceError:     checkpoint / signal history files unusable
        - ProtocolError:        malformed store wire frame
        - ConflictError:        an optimistic update lost every retry
*******************************************************************************/

#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

namespace fleetwatch {

class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& message)
        : std::invalid_argument(message) {}
};

class UnavailableError : public std::runtime_error {
public:
    explicit UnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message)
        : std::runtime_error(message) {}
};

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConflictError : public std::runtime_error {
public:
    explicit ConflictError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Throws InvalidArgumentError when value is empty or whitespace only.
 * @param what  Name used in the error message ("Resource name", "Session id")
 */
void require_non_blank(const std::string& value, const std::string& what);

} // namespace fleetwatch

#endif // ERRORS_H
