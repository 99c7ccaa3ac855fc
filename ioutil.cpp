#include "ioutil.h"
#include <ostream>
#include <cassert>
#include <sstream>
#include <fstream>
#include <stdexcept>

std::ostream& operator<<(std::ostream& os, const num_formatter& nf)
{
    assert(nf.base_ == 2 || nf.base_ == 16);
    assert(nf.width_ > 0);

    const uint8_t mask = static_cast<uint8_t>(nf.base_-1);
    const uint8_t shift = nf.base_ == 16 ? 4 : 1;

    for (int w = nf.width_; w--;) {
        os << ("0123456789abcdef"[(nf.num_ >> (w*shift)) & mask]);
    }
    return os;
}

std::string detail::do_format(const num_formatter& nf)
{
    std::ostringstream os;
    os << nf;
    return os.str();
}

std::vector<uint8_t> read_file(const std::string& path)
{
    std::ifstream in { path, std::ifstream::binary };
    if (!in) {
        throw std::runtime_error { "Error opening " + path };
    }

    in.seekg(0, std::ifstream::end);
    const auto len = static_cast<unsigned>(in.tellg());
    in.seekg(0, std::ifstream::beg);

    std::vector<uint8_t> buf(len);
    if (len) {
        in.read(reinterpret_cast<char*>(&buf[0]), len);
    }
    if (!in) {
        throw std::runtime_error { "Error reading from " + path };
    }
    return buf;
}

std::string trim(const std::string& line)
{
    const size_t l = line.length();
    size_t s, e;
    for (s = 0; s < l && isspace(static_cast<unsigned char>(line[s])); ++s)
        ;
    for (e = l; e-- && isspace(static_cast<unsigned char>(line[e]));)
        ;
    return line.substr(s, e + 1 - s);
}

static uint8_t digitval(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    else if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    else if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    else
        return 0xff;
}

std::pair<bool, uint32_t> number_from_string(const char* s, uint8_t base)
{
    assert(base >= 2 && base <= 16);
    if (!*s)
        return { false, 0 };
    uint64_t val = 0;
    char c;
    while ((c = *s++) != '\0') {
        uint8_t d = digitval(c);
        if (d >= base)
            return { false, 0 };
        val = val * base + d;
        if (val > 0xffffffff)
            return { false, 0 };
    }
    return { true, static_cast<uint32_t>(val) };
}

std::pair<bool, uint32_t> from_hex(const std::string& s)
{
    if (!s.empty() && s[0] == '$')
        return number_from_string(s.c_str() + 1, 16);
    return number_from_string(s.c_str(), 16);
}

std::string toupper_str(const std::string& s)
{
    auto res = s;
    for (auto& c : res) {
        if (c >= 'a' && c <= 'z')
            c -= 'a' - 'A';
    }
    return res;
}
