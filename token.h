#ifndef TOKEN_H
#define TOKEN_H

#include <string>
#include "location.h"

enum class token_type {
    identifier,
    number,
    comment,
    // Punctuation uses the character value
    hash = '#',
    lparen = '(',
    rparen = ')',
    plus = '+',
    comma = ',',
    minus = '-',
    dot = '.',
    colon = ':',
};

struct token {
    token_type type;
    std::string lexeme; // Verbatim text. For comments the text after ';' without surrounding whitespace.
    location loc;
};

std::string token_type_string(token_type tt);

#endif
