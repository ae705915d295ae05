#pragma once

#include <stdexcept>
#include <string>

namespace Methodical {

/**
 * @brief Row counts of two paired tables disagree. Fatal to the call.
 */
class DimensionMismatchError : public std::runtime_error {
public:
    explicit DimensionMismatchError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Unrecognised correlation or p-value adjustment method name.
 */
class InvalidMethodError : public std::runtime_error {
public:
    explicit InvalidMethodError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Base class for failures that only affect one anchor.
 *
 * Batch callers catch this type, record the outcome and move on.
 */
class AnchorError : public std::runtime_error {
public:
    explicit AnchorError(const std::string& msg) : std::runtime_error(msg) {}
};

class NoSitesInWindowError : public AnchorError {
public:
    explicit NoSitesInWindowError(const std::string& msg) : AnchorError(msg) {}
};

class InsufficientSamplesError : public AnchorError {
public:
    explicit InsufficientSamplesError(const std::string& msg) : AnchorError(msg) {}
};

} // namespace Methodical
