#ifndef DEBUG_H
#define DEBUG_H

#include <stdint.h>
#include <ostream>
#include <string>

extern uint32_t debug_flags;
extern std::ostream* debug_stream;

constexpr uint32_t debug_flag_tokens = 1 << 0;
constexpr uint32_t debug_flag_parse  = 1 << 1;
constexpr uint32_t debug_flag_encode = 1 << 2;

#define DEBUG_TOKENS (debug_flags & debug_flag_tokens)
#define DEBUG_PARSE  (debug_flags & debug_flag_parse)
#define DEBUG_ENCODE (debug_flags & debug_flag_encode)

// Parses a comma separated list like "tokens,encode". Throws std::runtime_error for unknown names.
uint32_t debug_flags_from_string(const std::string& s);

#endif
