#ifndef PARSER_H
#define PARSER_H

#include <vector>
#include "statement.h"
#include "token.h"

class error_collector;

// Builds a program from the tokens of a whole file. Errors are reported to errors and the
// offending line is skipped. Only std::logic_error (broken tables) escapes.
program parse(const std::vector<token>& tokens, error_collector& errors);

// Parses exactly one operand. Throws assembler_error if the tokens don't form one.
operand parse_operand(const std::vector<token>& tokens);

#endif
