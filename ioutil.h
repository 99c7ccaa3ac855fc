#ifndef IOUTIL_H
#define IOUTIL_H

#include <iosfwd>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

class num_formatter {
public:
    explicit num_formatter(uint64_t num, int base, int width) : num_{num}, base_{base}, width_{width} {}
    friend std::ostream& operator<<(std::ostream& os, const num_formatter& hf);
private:
    uint64_t num_;
    int base_;
    int width_;
};


template <typename T>
num_formatter hexfmt(T n, int w = static_cast<int>(sizeof(T) * 2))
{
    return num_formatter { static_cast<uint64_t>(n), 16, w };
}

template <typename T>
num_formatter binfmt(T n, int w = static_cast<int>(sizeof(T) * 8))
{
    return num_formatter { static_cast<uint64_t>(n), 2, w };
}

namespace detail {
std::string do_format(const num_formatter& nf);
}

template <typename T>
std::string hexstring(T n, int w = static_cast<int>(sizeof(T) * 2))
{
    return detail::do_format(hexfmt(n, w));
}

template <typename T>
std::string binstring(T n, int w = static_cast<int>(sizeof(T) * 8))
{
    return detail::do_format(binfmt(n, w));
}

std::vector<uint8_t> read_file(const std::string& path);

std::string trim(const std::string& line);
std::string toupper_str(const std::string& s);

// Parses all of s as an unsigned number in the given base. Fails on empty input, invalid digits or values above 32 bits.
std::pair<bool, uint32_t> number_from_string(const char* s, uint8_t base);
std::pair<bool, uint32_t> from_hex(const std::string& s);

constexpr uint16_t get_u16(const uint8_t* d)
{
    return static_cast<uint16_t>(d[0] << 8 | d[1]);
}

constexpr void put_u16(uint8_t* d, uint16_t val)
{
    d[0] = static_cast<uint8_t>(val >> 8);
    d[1] = static_cast<uint8_t>(val);
}

#endif
