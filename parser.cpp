#include "parser.h"
#include "error_collector.h"
#include "operation.h"
#include "ioutil.h"
#include "debug.h"
#include <optional>

namespace {

// Tokens of one source line and the current position within them
class line_cursor {
public:
    explicit line_cursor(std::vector<token> tokens, error_collector& errors)
        : tokens_ { std::move(tokens) }
        , errors_ { errors }
    {
    }

    bool at_end() const
    {
        return current_ >= tokens_.size();
    }

    size_t position() const
    {
        return current_;
    }

    const token* peek(size_t ahead = 0) const
    {
        return current_ + ahead < tokens_.size() ? &tokens_[current_ + ahead] : nullptr;
    }

    bool next_is(token_type type, size_t ahead = 0) const
    {
        const auto* t = peek(ahead);
        return t && t->type == type;
    }

    const token& advance()
    {
        if (at_end())
            ASSEMBLER_ERROR_AT(error_location(), "Unexpected end of line.");
        return tokens_[current_++];
    }

    const token& expect(token_type type, const char* expected)
    {
        if (!next_is(type))
            ASSEMBLER_ERROR_AT(error_location(), "Expected " << expected << ", but found " << found_string() << " instead.");
        return tokens_[current_++];
    }

    // Description of the current token for error messages
    std::string found_string() const
    {
        if (at_end())
            return "end of line";
        return "'" + tokens_[current_].lexeme + "'";
    }

    // Location of the current token, or of the last one if the cursor ran past the end of the line
    location error_location() const
    {
        if (!at_end())
            return tokens_[current_].loc;
        if (!tokens_.empty())
            return tokens_.back().loc;
        return location::invalid();
    }

    // Runs f and reports an assembler_error it throws. Returns false if it threw.
    template <typename F>
    bool try_or_register(F&& f)
    {
        try {
            f();
            return true;
        } catch (const assembler_error& e) {
            errors_.add(e.where().is_invalid() ? error_location() : e.where(), e.what());
            return false;
        }
    }

    // Moves past the next comma outside parentheses counting from start. Returns false if the line ended first.
    bool skip_operand(size_t start)
    {
        int depth = 0;
        for (size_t i = start; i < tokens_.size(); ++i) {
            switch (tokens_[i].type) {
            case token_type::lparen:
                ++depth;
                break;
            case token_type::rparen:
                if (depth)
                    --depth;
                break;
            case token_type::comma:
                if (!depth) {
                    current_ = i + 1;
                    return true;
                }
                break;
            default:
                break;
            }
        }
        current_ = tokens_.size();
        return false;
    }

private:
    std::vector<token> tokens_;
    error_collector& errors_;
    size_t current_ = 0;
};

int64_t number_value(const token& t)
{
    const auto& s = t.lexeme;
    std::pair<bool, uint32_t> res;
    if (!s.empty() && s[0] == '$')
        res = number_from_string(s.c_str() + 1, 16);
    else if (!s.empty() && s[0] == '%')
        res = number_from_string(s.c_str() + 1, 2);
    else
        res = number_from_string(s.c_str(), 10);
    if (!res.first)
        ASSEMBLER_ERROR_AT(t.loc, "Invalid number " << s);
    return res.second;
}

// [-]number
int64_t read_value(line_cursor& cursor)
{
    const bool neg = cursor.next_is(token_type::minus);
    if (neg)
        cursor.advance();
    const auto v = number_value(cursor.expect(token_type::number, "number"));
    return neg ? -v : v;
}

cpu_register read_register(line_cursor& cursor)
{
    if (!cursor.next_is(token_type::identifier))
        ASSEMBLER_ERROR_AT(cursor.error_location(), "Expected register, but found " << cursor.found_string() << ".");
    const auto& t = cursor.advance();
    const auto name = toupper_str(t.lexeme);
    if (name == "PC")
        return pc_register {};
    if (name == "SP")
        return address_register { 7 };
    if (name.size() >= 2 && (name[0] == 'A' || name[0] == 'D')) {
        const auto [valid, index] = number_from_string(name.c_str() + 1, 10);
        if (valid) {
            if (index > 7)
                ASSEMBLER_ERROR_AT(t.loc, "Register index " << index << " of " << t.lexeme << " is out of range (0-7).");
            if (name[0] == 'A')
                return address_register { static_cast<uint8_t>(index) };
            return data_register { static_cast<uint8_t>(index) };
        }
    }
    ASSEMBLER_ERROR_AT(t.loc, "Expected register, but found '" << t.lexeme << "'.");
}

address_register read_address_register(line_cursor& cursor)
{
    const auto loc = cursor.error_location();
    const auto reg = read_register(cursor);
    if (const auto* a = std::get_if<address_register>(&reg))
        return *a;
    ASSEMBLER_ERROR_AT(loc, "Expected address register, but found " << register_string(reg) << ".");
}

opsize read_size(line_cursor& cursor)
{
    if (cursor.at_end())
        ASSEMBLER_ERROR_AT(cursor.error_location(), "A size was expected. That's either B for byte, W for word or L for long word. But nothing was given.");
    const auto& t = cursor.advance();
    if (t.type == token_type::identifier) {
        const auto s = toupper_str(t.lexeme);
        if (s == "B")
            return opsize::b;
        else if (s == "W")
            return opsize::w;
        else if (s == "L")
            return opsize::l;
    }
    ASSEMBLER_ERROR_AT(t.loc, "A size was expected. That's either B for byte, W for word or L for long word. But " << t.lexeme << " was given. That's not a valid size.");
}

// After "d(" or "(d,": base register, optionally an index register and its size, then ')'
operand parse_base_and_index(line_cursor& cursor, const location& loc, int64_t displacement)
{
    const auto base_loc = cursor.error_location();
    const auto base = read_register(cursor);
    if (std::holds_alternative<data_register>(base))
        ASSEMBLER_ERROR_AT(base_loc, "Data register cannot be displaced.");
    const bool is_pc = std::holds_alternative<pc_register>(base);

    if (cursor.next_is(token_type::rparen)) {
        cursor.advance();
        if (is_pc)
            return pc_disp_operand { .loc = loc, .displacement = displacement };
        return an_ind_disp_operand { .loc = loc, .reg = std::get<address_register>(base), .displacement = displacement };
    }

    cursor.expect(token_type::comma, "',' or ')'");
    const auto index_loc = cursor.error_location();
    if (!cursor.next_is(token_type::identifier))
        ASSEMBLER_ERROR_AT(index_loc, "Expected index register, but found " << cursor.found_string() << ".");
    const auto index_reg = read_register(cursor);
    index_register index;
    if (const auto* d = std::get_if<data_register>(&index_reg))
        index = *d;
    else if (const auto* a = std::get_if<address_register>(&index_reg))
        index = *a;
    else
        ASSEMBLER_ERROR_AT(index_loc, "Expected index register, but found " << register_string(index_reg) << ".");

    cursor.expect(token_type::dot, "'.'");
    const auto size_loc = cursor.error_location();
    const auto index_size = read_size(cursor);
    if (index_size != opsize::w && index_size != opsize::l)
        ASSEMBLER_ERROR_AT(size_loc, "Only word (W) or long word (L) index sizes are permitted.");
    cursor.expect(token_type::rparen, "')'");

    if (is_pc)
        return pc_index_operand { .loc = loc, .displacement = displacement, .index = index, .index_size = index_size };
    return an_ind_index_operand { .loc = loc, .reg = std::get<address_register>(base), .displacement = displacement, .index = index, .index_size = index_size };
}

// Absolute size after "(xxx)." or "xxx."
operand read_absolute(line_cursor& cursor, const location& loc, int64_t value)
{
    const auto size_loc = cursor.error_location();
    const auto size = read_size(cursor);
    if (size == opsize::w)
        return abs_word_operand { loc, value };
    if (size == opsize::l)
        return abs_long_operand { loc, value };
    ASSEMBLER_ERROR_AT(size_loc, "Only word (W) or long word (L) sizes are permitted after (xxx).s operand.");
}

// A value outside parentheses: d(An), d(PC), d(An,Xn.s), d(PC,Xn.s), xxx.W, xxx.L or xxx
operand parse_displaced_or_absolute(line_cursor& cursor, const location& loc, int64_t value)
{
    if (cursor.next_is(token_type::lparen)) {
        cursor.advance();
        return parse_base_and_index(cursor, loc, value);
    }
    if (cursor.next_is(token_type::dot)) {
        cursor.advance();
        return read_absolute(cursor, loc, value);
    }
    return abs_long_operand { loc, value };
}

operand read_operand(line_cursor& cursor)
{
    const auto* first = cursor.peek();
    if (!first)
        ASSEMBLER_ERROR_AT(cursor.error_location(), "Expected operand, but found end of line.");
    const auto loc = first->loc;

    switch (first->type) {
    case token_type::identifier: {
        const auto name = toupper_str(first->lexeme);
        if (name == "CCR") {
            cursor.advance();
            return ccr_operand { loc };
        } else if (name == "SR") {
            cursor.advance();
            return sr_operand { loc };
        } else if (name == "USP") {
            cursor.advance();
            return usp_operand { loc };
        }
        const auto reg = read_register(cursor);
        if (const auto* a = std::get_if<address_register>(&reg))
            return an_operand { loc, *a };
        if (const auto* d = std::get_if<data_register>(&reg))
            return dn_operand { loc, *d };
        ASSEMBLER_ERROR_AT(loc, "Unexpected identifier " << first->lexeme << ".");
    }
    case token_type::hash: {
        cursor.advance();
        const bool neg = cursor.next_is(token_type::minus);
        if (neg)
            cursor.advance();
        if (!cursor.next_is(token_type::number))
            ASSEMBLER_ERROR_AT(cursor.error_location(), "Immediate data was expected, but found " << cursor.found_string() << ".");
        const auto v = number_value(cursor.advance());
        return immediate_operand { loc, neg ? -v : v };
    }
    case token_type::minus:
        if (cursor.next_is(token_type::lparen, 1)) {
            cursor.advance();
            cursor.advance();
            const auto reg = read_address_register(cursor);
            cursor.expect(token_type::rparen, "')'");
            return an_ind_pre_dec_operand { loc, reg };
        }
        return parse_displaced_or_absolute(cursor, loc, read_value(cursor));
    case token_type::number:
        return parse_displaced_or_absolute(cursor, loc, read_value(cursor));
    case token_type::lparen: {
        cursor.advance();
        if (cursor.next_is(token_type::identifier)) {
            const auto reg = read_address_register(cursor);
            cursor.expect(token_type::rparen, "')'");
            if (cursor.next_is(token_type::plus)) {
                cursor.advance();
                return an_ind_post_inc_operand { loc, reg };
            }
            return an_ind_operand { loc, reg };
        }
        if (!cursor.next_is(token_type::number) && !cursor.next_is(token_type::minus))
            ASSEMBLER_ERROR_AT(cursor.error_location(), "Expected address register or number, but found " << cursor.found_string() << ".");
        const auto value = read_value(cursor);
        if (cursor.next_is(token_type::rparen)) {
            cursor.advance();
            cursor.expect(token_type::dot, "'.'");
            return read_absolute(cursor, loc, value);
        }
        cursor.expect(token_type::comma, "',' or ')'");
        return parse_base_and_index(cursor, loc, value);
    }
    default:
        ASSEMBLER_ERROR_AT(loc, "Expected operand, but found '" << first->lexeme << "'.");
    }
}

// mnemonic[.size] [operand[, operand]...]
// Returns nothing if an error was reported for the line.
std::optional<operation_statement> parse_operation(line_cursor& cursor)
{
    const auto& mnemonic = cursor.expect(token_type::identifier, "operation");
    opsize size = opsize::none;
    bool explicit_size = false;
    bool failed = false;

    if (cursor.next_is(token_type::dot)) {
        failed |= !cursor.try_or_register([&] {
            cursor.advance();
            size = read_size(cursor);
            explicit_size = true;
        });
    }

    std::vector<operand> operands;
    bool more = !cursor.at_end();
    while (more) {
        const auto start = cursor.position();
        if (!cursor.try_or_register([&] { operands.push_back(read_operand(cursor)); })) {
            failed = true;
            more = cursor.skip_operand(start);
            continue;
        }
        if (cursor.at_end())
            break;
        if (!cursor.try_or_register([&] { cursor.expect(token_type::comma, "','"); })) {
            failed = true;
            more = cursor.skip_operand(cursor.position());
        }
    }

    const auto* info = find_operation(toupper_str(mnemonic.lexeme));
    if (!info)
        ASSEMBLER_ERROR_AT(mnemonic.loc, "Unknown operation " << mnemonic.lexeme);
    if (failed)
        return {};

    if (!explicit_size)
        size = implied_size(*info, operands);

    try {
        ensure_matching_configuration(*info, size, operands);
    } catch (const assembler_error& e) {
        throw assembler_error { e.what(), mnemonic.loc };
    }

    return operation_statement { mnemonic.loc, info, size, explicit_size, std::move(operands) };
}

std::vector<std::vector<token>> split_lines(const std::vector<token>& tokens)
{
    std::vector<std::vector<token>> lines;
    for (const auto& t : tokens) {
        if (lines.empty() || lines.back().back().loc.line != t.loc.line)
            lines.emplace_back();
        lines.back().push_back(t);
    }
    return lines;
}

}

program parse(const std::vector<token>& tokens, error_collector& errors)
{
    program prog;
    std::vector<label_statement> pending_labels;

    for (const auto& line : split_lines(tokens)) {
        auto first = line.begin();
        auto last = line.end();

        if (line.size() >= 2 && line[0].type == token_type::identifier && line[1].type == token_type::colon) {
            pending_labels.push_back(label_statement { line[0].loc, line[0].lexeme });
            first += 2;
        } else if (line.size() >= 3 && line[0].type == token_type::dot && line[1].type == token_type::identifier && line[2].type == token_type::colon) {
            pending_labels.push_back(label_statement { line[0].loc, "." + line[1].lexeme });
            first += 3;
        }

        const token* comment = nullptr;
        if (first != last && (last - 1)->type == token_type::comment) {
            comment = &*(last - 1);
            --last;
        }

        if (first == last) {
            if (comment) {
                prog.statements.push_back(comment_statement { comment->loc, comment->lexeme });
                if (DEBUG_PARSE)
                    *debug_stream << comment->loc << ": " << statement_string(prog.statements.back()) << "\n";
            }
            continue;
        }

        line_cursor cursor { std::vector<token>(first, last), errors };
        std::optional<operation_statement> op;
        cursor.try_or_register([&] { op = parse_operation(cursor); });
        if (!op)
            continue;

        const auto index = prog.statements.size();
        for (const auto& l : pending_labels) {
            if (DEBUG_PARSE)
                *debug_stream << l.loc << ": Label " << l.name << " bound to statement " << index << "\n";
            prog.labels[l] = index;
        }
        pending_labels.clear();
        prog.statements.push_back(std::move(*op));
        if (DEBUG_PARSE)
            *debug_stream << location_of(prog.statements.back()) << ": " << statement_string(prog.statements.back()) << "\n";
    }

    for (const auto& l : pending_labels)
        errors.add(l.loc, "There should be code after labels, but label " + l.name + " isn't followed by any statements.");

    return prog;
}

operand parse_operand(const std::vector<token>& tokens)
{
    error_collector errors;
    line_cursor cursor { tokens, errors };
    auto res = read_operand(cursor);
    if (!cursor.at_end())
        ASSEMBLER_ERROR_AT(cursor.error_location(), "Unexpected " << cursor.found_string() << " after operand.");
    return res;
}
