#ifndef LOCATION_H
#define LOCATION_H

#include <compare>
#include <functional>
#include <iosfwd>
#include <stddef.h>

// Position in the source text. Lines and columns start at 1.
struct location {
    int line;
    int column;

    // Sentinel for nodes that don't come from the source text
    static constexpr location invalid()
    {
        return location { -1, -1 };
    }

    constexpr bool is_invalid() const
    {
        return line < 0 || column < 0;
    }

    friend constexpr auto operator<=>(const location&, const location&) = default;
};

std::ostream& operator<<(std::ostream& os, const location& loc);

template <>
struct std::hash<location> {
    size_t operator()(const location& loc) const noexcept
    {
        return std::hash<int> {}(loc.line) * 31 + std::hash<int> {}(loc.column);
    }
};

#endif
