#ifndef LEXER_H
#define LEXER_H

#include <vector>
#include "token.h"

class error_collector;

// Splits text into located tokens. Invalid characters are reported to errors and skipped.
std::vector<token> tokenize(const char* text, error_collector& errors);

#endif
