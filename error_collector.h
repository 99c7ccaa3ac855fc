#ifndef ERROR_COLLECTOR_H
#define ERROR_COLLECTOR_H

#include <iosfwd>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "location.h"

struct diagnostic {
    location loc;
    std::string message;
};

std::ostream& operator<<(std::ostream& os, const diagnostic& d);

// Append-only sink for user facing errors
class error_collector {
public:
    void add(const location& loc, const std::string& message);

    bool empty() const
    {
        return errors_.empty();
    }

    size_t size() const
    {
        return errors_.size();
    }

    const std::vector<diagnostic>& errors() const
    {
        return errors_;
    }

private:
    std::vector<diagnostic> errors_;
};

// Recoverable error caused by the input. Converted to a diagnostic by whoever catches it.
class assembler_error : public std::runtime_error {
public:
    explicit assembler_error(const std::string& message, const location& loc = location::invalid())
        : std::runtime_error { message }
        , loc_ { loc }
    {
    }

    const location& where() const
    {
        return loc_;
    }

private:
    location loc_;
};

#define ASSEMBLER_ERROR(...)                      \
    do {                                          \
        std::ostringstream oss;                   \
        oss << __VA_ARGS__;                       \
        throw assembler_error { oss.str() };      \
    } while (0)

#define ASSEMBLER_ERROR_AT(loc, ...)              \
    do {                                          \
        std::ostringstream oss;                   \
        oss << __VA_ARGS__;                       \
        throw assembler_error { oss.str(), loc }; \
    } while (0)

// Broken invariant in the static tables or the encoder. Never reported as a diagnostic.
#define INTERNAL_ERROR(...)                                                                                      \
    do {                                                                                                         \
        std::ostringstream oss;                                                                                  \
        oss << "Internal error: " << __VA_ARGS__ << " in function " << __func__ << " line " << __LINE__;          \
        throw std::logic_error { oss.str() };                                                                    \
    } while (0)

#endif
