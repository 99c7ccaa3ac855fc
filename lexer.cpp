#include "lexer.h"
#include "error_collector.h"
#include "ioutil.h"
#include "debug.h"
#include <cctype>
#include <string>

std::string token_type_string(token_type tt)
{
    switch (tt) {
    case token_type::identifier:
        return "IDENTIFIER";
    case token_type::number:
        return "NUMBER";
    case token_type::comment:
        return "COMMENT";
    default:
        return "OPERATOR \"" + std::string(1, static_cast<char>(tt)) + "\"";
    }
}

namespace {

bool is_ident_char(char c)
{
    return isalnum(static_cast<unsigned char>(c)) || c == '_';
}

class lexer {
public:
    explicit lexer(const char* text, error_collector& errors)
        : input_ { text }
        , errors_ { errors }
    {
    }

    std::vector<token> process()
    {
        while (*input_) {
            const char c = *input_;
            const location loc { line_, col_ };

            if (c == '\n') {
                ++input_;
                ++line_;
                col_ = 1;
                continue;
            }

            if (isspace(static_cast<unsigned char>(c))) {
                advance();
                continue;
            }

            switch (c) {
            case ';': {
                advance();
                std::string text;
                while (*input_ && *input_ != '\n') {
                    text += *input_;
                    advance();
                }
                add(token_type::comment, trim(text), loc);
                continue;
            }
            case '#':
            case '(':
            case ')':
            case '+':
            case ',':
            case '-':
            case '.':
            case ':':
                advance();
                add(static_cast<token_type>(c), std::string(1, c), loc);
                continue;
            case '$':
            case '%': {
                advance();
                if (!is_ident_char(*input_)) {
                    errors_.add(loc, "No digits in number");
                    continue;
                }
                add(token_type::number, std::string(1, c) + read_word(), loc);
                continue;
            }
            }

            if (isdigit(static_cast<unsigned char>(c))) {
                add(token_type::number, read_word(), loc);
                continue;
            }

            if (isalpha(static_cast<unsigned char>(c)) || c == '_') {
                add(token_type::identifier, read_word(), loc);
                continue;
            }

            errors_.add(loc, std::string { "Invalid character: '" } + c + "'");
            advance();
        }
        return std::move(tokens_);
    }

private:
    const char* input_;
    error_collector& errors_;
    std::vector<token> tokens_;
    int line_ = 1;
    int col_ = 1;

    void advance()
    {
        if (*input_ == '\t')
            col_ += 8 - (col_ - 1) % 8;
        else
            ++col_;
        ++input_;
    }

    // Identifiers and numbers share the same character set. Numbers are validated by the parser.
    std::string read_word()
    {
        std::string word;
        while (is_ident_char(*input_)) {
            word += *input_;
            advance();
        }
        return word;
    }

    void add(token_type type, std::string lexeme, const location& loc)
    {
        if (DEBUG_TOKENS)
            *debug_stream << loc << ": " << token_type_string(type) << " \"" << lexeme << "\"\n";
        tokens_.push_back(token { type, std::move(lexeme), loc });
    }
};

}

std::vector<token> tokenize(const char* text, error_collector& errors)
{
    return lexer { text, errors }.process();
}
