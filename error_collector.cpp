#include "error_collector.h"
#include <ostream>

std::ostream& operator<<(std::ostream& os, const location& loc)
{
    if (loc.is_invalid())
        return os << "?:?";
    return os << loc.line << ":" << loc.column;
}

std::ostream& operator<<(std::ostream& os, const diagnostic& d)
{
    return os << d.loc << ": error: " << d.message;
}

void error_collector::add(const location& loc, const std::string& message)
{
    errors_.push_back(diagnostic { loc, message });
}
