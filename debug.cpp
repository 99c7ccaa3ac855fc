#include "debug.h"
#include <iostream>
#include <stdexcept>

uint32_t debug_flags;
std::ostream* debug_stream = &std::clog;

uint32_t debug_flags_from_string(const std::string& s)
{
    uint32_t flags = 0;
    size_t pos = 0;
    for (;;) {
        const auto end = s.find(',', pos);
        const auto name = s.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        if (name == "tokens")
            flags |= debug_flag_tokens;
        else if (name == "parse")
            flags |= debug_flag_parse;
        else if (name == "encode")
            flags |= debug_flag_encode;
        else if (name == "all")
            flags |= debug_flag_tokens | debug_flag_parse | debug_flag_encode;
        else
            throw std::runtime_error { "Unknown debug flag \"" + name + "\"" };
        if (end == std::string::npos)
            break;
        pos = end + 1;
    }
    return flags;
}
