#pragma once

#include <stdexcept>
#include <string>

namespace focuslens {

// Rejected caller input: bad date ranges, unknown section types, malformed
// report configs.
class ValidationError : public std::invalid_argument
{
public:
    explicit ValidationError(const std::string &message)
        : std::invalid_argument(message)
    {
    }
};

class NotFoundError : public std::runtime_error
{
public:
    explicit NotFoundError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// Raised by AnalyticsStore. Callers treat persistence as best effort and log it.
class PersistenceError : public std::runtime_error
{
public:
    explicit PersistenceError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

} // namespace focuslens
