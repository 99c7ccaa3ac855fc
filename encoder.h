#ifndef ENCODER_H
#define ENCODER_H

#include <stdint.h>
#include <string>
#include <vector>
#include "statement.h"

// Sequence of up to 32 bits, most significant first
class bit_string {
public:
    bit_string(uint32_t value, uint8_t width);

    uint8_t width() const
    {
        return width_;
    }

    uint32_t value() const
    {
        return value_;
    }

    // Concatenation, this followed by rhs
    bit_string operator+(const bit_string& rhs) const;

    // The value as an instruction word. Raises std::logic_error unless exactly 16 bits wide.
    uint16_t word() const;

    std::string to_string() const;

private:
    uint32_t value_;
    uint8_t width_;
};

// Size field encodings used by the different instruction families
bit_string size_bits_zero_based(opsize size); // b=00 w=01 l=10
bit_string size_bits_one_based(opsize size);  // b=01 w=10 l=11
bit_string size_bits_single(opsize size);     // w=0 l=1
bit_string size_bits_move(opsize size);       // b=01 w=11 l=10

// Effective address mode and register fields (3 bits each)
bit_string mode_bits(const operand& op);
bit_string register_bits(const operand& op);

// Opcode word followed by extension words. Values that don't fit their field throw assembler_error.
std::vector<uint16_t> encode(const operation_statement& s);

#endif
