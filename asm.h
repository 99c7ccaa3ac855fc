#ifndef ASM_H
#define ASM_H

#include <stdint.h>
#include <iosfwd>
#include <utility>
#include <vector>
#include "statement.h"

class error_collector;

struct assembly {
    std::vector<uint8_t> code;
    // Byte offset into code of each statement (comments take no space)
    std::vector<uint32_t> statement_offsets;
};

// Encodes every operation of prog as big-endian words. Statements that fail to encode are reported and left out.
assembly assemble(const program& prog, error_collector& errors);

// Lexes, parses and encodes text. Returns an empty vector if any error was reported.
std::vector<uint8_t> assemble_text(const char* text, error_collector& errors);

// Address of every label, in source order, with code starting at org
std::vector<std::pair<label_statement, uint32_t>> label_addresses(const program& prog, const assembly& as, uint32_t org);

void write_listing(std::ostream& os, const program& prog, const assembly& as, uint32_t org);

#endif
