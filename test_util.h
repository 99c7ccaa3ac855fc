#ifndef TEST_UTIL_H
#define TEST_UTIL_H

#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include "ioutil.h"

#define CHECK_BIN(lhs, op, rhs)                                                                                                            \
    do {                                                                                                                                   \
        const auto l = (lhs);                                                                                                              \
        const auto r = (rhs);                                                                                                              \
        if (!(l op r)) {                                                                                                                   \
            std::ostringstream oss;                                                                                                        \
            oss << "Check failed " << #lhs << " (" << test_format { l } << ") " << #op << " " << #rhs << " (" << test_format { r } << ")"; \
            test_failed(oss.str(), __func__, __FILE__, __LINE__);                                                                          \
        }                                                                                                                                  \
    } while (0)

#define CHECK_EQ(lhs, rhs) CHECK_BIN(lhs, ==, rhs)

inline void test_failed(const std::string& msg, const char* function, const char* file, int line)
{
    std::ostringstream oss;
    oss << "Test failed in " << function << " " << file << ":" << line << ": " << msg;
    throw std::runtime_error { oss.str() };
}

template<typename T>
class test_format {
public:
    explicit test_format(const T& val)
        : val_ { val }
    {
    }

    friend std::ostream& operator<<(std::ostream& os, const test_format& tf)
    {
        if constexpr (std::is_same_v<T, bool>)
            return os << (tf.val_ ? "true" : "false");
        else if constexpr (std::is_integral_v<T>)
            return os << "$" << hexfmt(tf.val_);
        else if constexpr (std::is_enum_v<T>)
            return os << static_cast<int>(tf.val_);
        else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, const char*>)
            return os << '"' << tf.val_ << '"';
        else
            return os << tf.val_;
    }

private:
    const T& val_;
};

#endif
