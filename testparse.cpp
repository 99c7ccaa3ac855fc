#include <iostream>
#include <string>
#include <vector>
#include "error_collector.h"
#include "lexer.h"
#include "operation.h"
#include "parser.h"
#include "test_util.h"

namespace {

program parse_text(const char* text, error_collector& errors)
{
    return parse(tokenize(text, errors), errors);
}

operand operand_from_text(const std::string& text)
{
    error_collector errors;
    const auto tokens = tokenize(text.c_str(), errors);
    if (!errors.empty())
        throw std::runtime_error { "Tokenizing \"" + text + "\" failed" };
    return parse_operand(tokens);
}

std::string error_text(const error_collector& errors)
{
    std::ostringstream oss;
    for (const auto& d : errors.errors())
        oss << d << "\n";
    return oss.str();
}

const operation_statement& only_operation(const program& prog)
{
    if (prog.statements.size() != 1 || !std::holds_alternative<operation_statement>(prog.statements[0]))
        test_failed("Expected exactly one operation statement", __func__, __FILE__, __LINE__);
    return std::get<operation_statement>(prog.statements[0]);
}

void test_lexer()
{
    {
        error_collector errors;
        const auto tokens = tokenize("loop:\tNOT.W D3 ; invert", errors);
        CHECK_EQ(errors.size(), size_t { 0 });
        CHECK_EQ(tokens.size(), size_t { 7 });
        const struct {
            token_type type;
            const char* lexeme;
            location loc;
        } expected[] = {
            { token_type::identifier, "loop", { 1, 1 } },
            { token_type::colon, ":", { 1, 5 } },
            { token_type::identifier, "NOT", { 1, 9 } },
            { token_type::dot, ".", { 1, 12 } },
            { token_type::identifier, "W", { 1, 13 } },
            { token_type::identifier, "D3", { 1, 15 } },
            { token_type::comment, "invert", { 1, 18 } },
        };
        for (size_t i = 0; i < tokens.size(); ++i) {
            CHECK_EQ(tokens[i].type, expected[i].type);
            CHECK_EQ(tokens[i].lexeme, std::string { expected[i].lexeme });
            CHECK_EQ(tokens[i].loc, expected[i].loc);
        }
    }

    {
        error_collector errors;
        const auto tokens = tokenize("NOP @\nRTS", errors);
        CHECK_EQ(errors.size(), size_t { 1 });
        CHECK_EQ(errors.errors()[0].loc, (location { 1, 5 }));
        CHECK_EQ(errors.errors()[0].message, std::string { "Invalid character: '@'" });
        CHECK_EQ(tokens.size(), size_t { 2 });
        CHECK_EQ(tokens[1].lexeme, std::string { "RTS" });
        CHECK_EQ(tokens[1].loc, (location { 2, 1 }));
    }

    {
        error_collector errors;
        const auto tokens = tokenize("$ff %101 12 #-(", errors);
        CHECK_EQ(errors.size(), size_t { 0 });
        CHECK_EQ(tokens.size(), size_t { 6 });
        CHECK_EQ(tokens[0].type, token_type::number);
        CHECK_EQ(tokens[0].lexeme, std::string { "$ff" });
        CHECK_EQ(tokens[1].lexeme, std::string { "%101" });
        CHECK_EQ(tokens[2].lexeme, std::string { "12" });
        CHECK_EQ(tokens[3].type, token_type::hash);
        CHECK_EQ(tokens[4].type, token_type::minus);
        CHECK_EQ(tokens[5].type, token_type::lparen);
    }

    {
        error_collector errors;
        tokenize("MOVE $", errors);
        CHECK_EQ(error_text(errors), std::string { "1:6: error: No digits in number\n" });
    }
}

void test_operands()
{
    const struct {
        const char* text;
        operand_type type;
        const char* canonical;
    } test_cases[] = {
        { "D3", operand_type::dn, "D3" },
        { "a2", operand_type::an, "A2" },
        { "SP", operand_type::an, "A7" },
        { "(A2)", operand_type::an_ind, "(A2)" },
        { "(a2)+", operand_type::an_ind_post_inc, "(A2)+" },
        { "-(sp)", operand_type::an_ind_pre_dec, "-(A7)" },
        { "(8,A1)", operand_type::an_ind_disp, "(8,A1)" },
        { "8(A1)", operand_type::an_ind_disp, "(8,A1)" },
        { "-1234(a0)", operand_type::an_ind_disp, "(-1234,A0)" },
        { "-5(A3,D2.W)", operand_type::an_ind_index, "(-5,A3,D2.W)" },
        { "(4,A0,A1.L)", operand_type::an_ind_index, "(4,A0,A1.L)" },
        { "(-4,a0,d7.l)", operand_type::an_ind_index, "(-4,A0,D7.L)" },
        { "(5).W", operand_type::abs_word, "(5).W" },
        { "$1234.w", operand_type::abs_word, "(4660).W" },
        { "-12.w", operand_type::abs_word, "(-12).W" },
        { "(5).L", operand_type::abs_long, "(5).L" },
        { "$12345678", operand_type::abs_long, "(305419896).L" },
        { "42.L", operand_type::abs_long, "(42).L" },
        { "10(PC)", operand_type::pc_disp, "(10,PC)" },
        { "(10,pc)", operand_type::pc_disp, "(10,PC)" },
        { "(-2,pc,d0.w)", operand_type::pc_index, "(-2,PC,D0.W)" },
        { "8(PC,A3.L)", operand_type::pc_index, "(8,PC,A3.L)" },
        { "#42", operand_type::immediate, "#42" },
        { "#-1", operand_type::immediate, "#-1" },
        { "#%101", operand_type::immediate, "#5" },
        { "#$ff", operand_type::immediate, "#255" },
        { "ccr", operand_type::ccr, "CCR" },
        { "SR", operand_type::sr, "SR" },
        { "usp", operand_type::usp, "USP" },
    };

    for (const auto& tc : test_cases) {
        try {
            const auto op = operand_from_text(tc.text);
            CHECK_EQ(type_of(op), tc.type);
            CHECK_EQ(operand_string(op), std::string { tc.canonical });
            CHECK_EQ(location_of(op), (location { 1, 1 }));

            const auto reparsed = operand_from_text(operand_string(op));
            CHECK_EQ(reparsed == op, true);
        } catch (const assembler_error& e) {
            test_failed(std::string { "Parsing \"" } + tc.text + "\" failed: " + e.what(), __func__, __FILE__, __LINE__);
        }
    }

    const auto op = std::get<an_ind_index_operand>(operand_from_text("-5(A3,D2.W)"));
    CHECK_EQ(op.reg.index, uint8_t { 3 });
    CHECK_EQ(op.displacement, int64_t { -5 });
    CHECK_EQ(std::holds_alternative<data_register>(op.index), true);
    CHECK_EQ(std::get<data_register>(op.index).index, uint8_t { 2 });
    CHECK_EQ(op.index_size, opsize::w);

    const auto abs = std::get<abs_word_operand>(operand_from_text("(5).W"));
    CHECK_EQ(abs.value, int64_t { 5 });
}

void test_operand_errors()
{
    const struct {
        const char* text;
        const char* message;
        location loc;
    } test_cases[] = {
        { "(5).B", "Only word (W) or long word (L) sizes are permitted after (xxx).s operand.", { 1, 5 } },
        { "PC", "Unexpected identifier PC.", { 1, 1 } },
        { "(8,D0)", "Data register cannot be displaced.", { 1, 4 } },
        { "8(d0)", "Data register cannot be displaced.", { 1, 3 } },
        { "(D0)", "Expected address register, but found D0.", { 1, 2 } },
        { "D8", "Register index 8 of D8 is out of range (0-7).", { 1, 1 } },
        { "FOO", "Expected register, but found 'FOO'.", { 1, 1 } },
        { "#D0", "Immediate data was expected, but found 'D0'.", { 1, 2 } },
        { "(4,A0,PC.W)", "Expected index register, but found PC.", { 1, 7 } },
        { "(4,A0,5)", "Expected index register, but found '5'.", { 1, 7 } },
        { "(4,A0,D1.B)", "Only word (W) or long word (L) index sizes are permitted.", { 1, 10 } },
        { "D0 D1", "Unexpected 'D1' after operand.", { 1, 4 } },
        { "12(A0", "Expected ',' or ')', but found end of line instead.", { 1, 4 } },
        { "#$12x", "Invalid number $12x", { 1, 2 } },
        { ",", "Expected operand, but found ','.", { 1, 1 } },
    };

    for (const auto& tc : test_cases) {
        try {
            operand_from_text(tc.text);
        } catch (const assembler_error& e) {
            CHECK_EQ(std::string { e.what() }, std::string { tc.message });
            CHECK_EQ(e.where(), tc.loc);
            continue;
        }
        test_failed(std::string { "Parsing \"" } + tc.text + "\" didn't fail", __func__, __FILE__, __LINE__);
    }
}

void test_statements()
{
    {
        error_collector errors;
        const auto prog = parse_text("NOT.W D3", errors);
        CHECK_EQ(error_text(errors), std::string {});
        const auto& op = only_operation(prog);
        CHECK_EQ(std::string { op.operation->code }, std::string { "NOT" });
        CHECK_EQ(op.loc, (location { 1, 1 }));
        CHECK_EQ(op.size, opsize::w);
        CHECK_EQ(op.explicit_size, true);
        CHECK_EQ(op.operands.size(), size_t { 1 });
        const auto& dn = std::get<dn_operand>(op.operands[0]);
        CHECK_EQ(dn.loc, (location { 1, 7 }));
        CHECK_EQ(dn.reg.index, uint8_t { 3 });
        CHECK_EQ(statement_string(prog.statements[0]), std::string { "NOT.W D3" });
        CHECK_EQ(aligned_string(prog.statements[0]), std::string { "NOT.W   D3" });
    }

    {
        error_collector errors;
        const auto prog = parse_text("first:\nsecond:\n\tNOT.W D3\n", errors);
        CHECK_EQ(error_text(errors), std::string {});
        CHECK_EQ(prog.statements.size(), size_t { 1 });
        CHECK_EQ(prog.labels.size(), size_t { 2 });
        for (const auto& [label, index] : prog.labels) {
            CHECK_EQ(index, size_t { 0 });
            CHECK_EQ(label.is_global(), true);
        }
        CHECK_EQ(prog.labels.begin()->first.name, std::string { "first" });
        CHECK_EQ(prog.labels.rbegin()->first.name, std::string { "second" });
        CHECK_EQ(prog.labels.rbegin()->first.loc, (location { 2, 1 }));
    }

    {
        error_collector errors;
        const auto prog = parse_text("; header\nstart: ; note\n\tRTS ; done\n", errors);
        CHECK_EQ(error_text(errors), std::string {});
        CHECK_EQ(prog.statements.size(), size_t { 3 });
        const auto& c0 = std::get<comment_statement>(prog.statements[0]);
        CHECK_EQ(c0.text, std::string { "header" });
        CHECK_EQ(c0.loc, (location { 1, 1 }));
        const auto& c1 = std::get<comment_statement>(prog.statements[1]);
        CHECK_EQ(c1.text, std::string { "note" });
        CHECK_EQ(c1.loc, (location { 2, 8 }));
        CHECK_EQ(statement_string(prog.statements[2]), std::string { "RTS" });
        CHECK_EQ(prog.labels.size(), size_t { 1 });
        CHECK_EQ(prog.labels.begin()->second, size_t { 2 });
    }

    {
        error_collector errors;
        const auto prog = parse_text(".loop: NOP", errors);
        CHECK_EQ(error_text(errors), std::string {});
        CHECK_EQ(prog.labels.size(), size_t { 1 });
        const auto& label = prog.labels.begin()->first;
        CHECK_EQ(label.name, std::string { ".loop" });
        CHECK_EQ(label.is_local(), true);
        CHECK_EQ(label.loc, (location { 1, 1 }));
    }

    {
        error_collector errors;
        const auto prog = parse_text("NOP\nend:\n", errors);
        CHECK_EQ(error_text(errors), std::string { "2:1: error: There should be code after labels, but label end isn't followed by any statements.\n" });
        CHECK_EQ(prog.labels.size(), size_t { 0 });
        CHECK_EQ(prog.statements.size(), size_t { 1 });
    }

    {
        // Labels stay pending across comment lines and lines that fail
        error_collector errors;
        const auto prog = parse_text("lab:\n; c\n\tFOO\n\tNOP", errors);
        CHECK_EQ(error_text(errors), std::string { "3:9: error: Unknown operation FOO\n" });
        CHECK_EQ(prog.statements.size(), size_t { 2 });
        CHECK_EQ(prog.labels.size(), size_t { 1 });
        CHECK_EQ(prog.labels.begin()->second, size_t { 1 });
    }

    {
        // Parsing continues with the next operand and the next line
        error_collector errors;
        const auto prog = parse_text("NOP\nNOT.W D9, (A0\nRTS", errors);
        CHECK_EQ(error_text(errors), std::string { "2:7: error: Register index 9 of D9 is out of range (0-7).\n"
                                                   "2:12: error: Expected ')', but found end of line instead.\n" });
        CHECK_EQ(prog.statements.size(), size_t { 2 });
        CHECK_EQ(statement_string(prog.statements[1]), std::string { "RTS" });
    }

    {
        error_collector errors;
        const auto prog = parse_text("MOVE.L #1,D0 D1", errors);
        CHECK_EQ(error_text(errors), std::string { "1:14: error: Expected ',', but found 'D1' instead.\n" });
        CHECK_EQ(prog.statements.size(), size_t { 0 });
    }

    {
        error_collector errors;
        const auto prog = parse_text("CLR D0,", errors);
        CHECK_EQ(error_text(errors), std::string { "1:7: error: Expected operand, but found end of line.\n" });
        CHECK_EQ(prog.statements.size(), size_t { 0 });
    }

    {
        error_collector errors;
        const auto prog = parse_text("NOT.W (D0)", errors);
        CHECK_EQ(errors.size(), size_t { 1 });
        CHECK_EQ(errors.errors()[0].loc, (location { 1, 8 }));
        CHECK_EQ(prog.statements.size(), size_t { 0 });
    }
}

void test_validation_errors()
{
    const struct {
        const char* text;
        const char* expected;
    } test_cases[] = {
        { "NOT.B (A2)+,D0", "1:1: error: You provided operands of the types (An)+, Dn. But the NOT operation on size byte doesn't accept operands of these types. Here are all the combinations that are accepted:\n"
                            "- Dn/(An)/(An)+/-(An)/(d,An)/(d,An,Xn)/(xxx).W/(xxx).L\n" },
        { "NOT.W", "1:1: error: You provided no operands. But the NOT operation on size word doesn't accept operands of these types. Here are all the combinations that are accepted:\n"
                   "- Dn/(An)/(An)+/-(An)/(d,An)/(d,An,Xn)/(xxx).W/(xxx).L\n" },
        { "  CLR.W A0", "1:3: error: You provided operands of the types An. But the CLR operation on size word doesn't accept operands of these types. Here are all the combinations that are accepted:\n"
                        "- Dn/(An)/(An)+/-(An)/(d,An)/(d,An,Xn)/(xxx).W/(xxx).L\n" },
        { "RTS D0", "1:1: error: You provided operands of the types Dn. But the RTS operation on size no size doesn't accept operands of these types. Here are all the combinations that are accepted:\n"
                    "- (no operands)\n" },
        { "NOT.Q D0", "1:5: error: A size was expected. That's either B for byte, W for word or L for long word. But Q was given. That's not a valid size.\n" },
        { "NOP.W", "1:1: error: The operation NOP doesn't take a size, but you tried to use it with the size word.\n" },
        { "EXT.B D0", "1:1: error: The operation EXT only supports the sizes word and long word, but you tried to use it with the size byte. That doesn't work.\n" },
        { "ADD.B A0,D0", "1:1: error: You provided operands of the types An, Dn. But the ADD operation on size byte doesn't accept operands of these types. Here are all the combinations that are accepted:\n"
                         "- Dn/(An)/(An)+/-(An)/(d,An)/(d,An,Xn)/(xxx).W/(xxx).L/(d,PC)/(d,PC,Xn)/#xxx, Dn\n"
                         "- Dn, (An)/(An)+/-(An)/(d,An)/(d,An,Xn)/(xxx).W/(xxx).L\n" },
        { "FOO D0", "1:1: error: Unknown operation FOO\n" },
    };

    for (const auto& tc : test_cases) {
        error_collector errors;
        const auto prog = parse_text(tc.text, errors);
        CHECK_EQ(error_text(errors), std::string { tc.expected });
        CHECK_EQ(prog.statements.size(), size_t { 0 });
    }
}

void test_implied_sizes()
{
    const struct {
        const char* text;
        opsize size;
    } test_cases[] = {
        { "NOT D0", opsize::w },
        { "MOVE USP,A0", opsize::l },
        { "MOVE A3,USP", opsize::l },
        { "MOVE #1,CCR", opsize::w },
        { "MOVE SR,D0", opsize::w },
        { "LEA (A0),A1", opsize::l },
        { "MOVEQ #1,D0", opsize::l },
        { "SWAP D1", opsize::w },
        { "RTS", opsize::none },
        { "jmp (a0)", opsize::none },
    };

    for (const auto& tc : test_cases) {
        error_collector errors;
        const auto prog = parse_text(tc.text, errors);
        CHECK_EQ(error_text(errors), std::string {});
        const auto& op = only_operation(prog);
        CHECK_EQ(op.size, tc.size);
        CHECK_EQ(op.explicit_size, false);
    }
}

void test_configurations()
{
    const auto& move = operation_info_for(operation::MOVE);
    CHECK_EQ(std::string { move.code }, std::string { "MOVE" });
    CHECK_EQ(find_operation("MOVE"), &move);
    CHECK_EQ(find_operation("move"), static_cast<const operation_info*>(nullptr));

    const std::vector<operand> from_sr { sr_operand { location::invalid() }, dn_operand { location::invalid(), data_register { 0 } } };
    const auto& conf = ensure_matching_configuration(move, opsize::w, from_sr);
    CHECK_EQ(conf.operand_types[0], ot_sr);
    CHECK_EQ(conf.operand_types[1], ot_data_alterable);

    // Every entry is at the index of its operation
    const auto& table = operation_table();
    for (size_t i = 0; i < table.size(); ++i)
        CHECK_EQ(static_cast<size_t>(table[i].op), i);

    const operation_info ambiguous {
        operation::NOT,
        "AMBIGUOUS",
        opsize::w,
        {
            { opsize_mask_w, 1, { ot_dn } },
            { opsize_mask_wl, 1, { ot_dn | ot_an } },
        },
    };
    const std::vector<operand> d0 { dn_operand { location::invalid(), data_register { 0 } } };
    bool threw = false;
    try {
        ensure_matching_configuration(ambiguous, opsize::w, d0);
    } catch (const std::logic_error&) {
        threw = true;
    }
    CHECK_EQ(threw, true);
    CHECK_EQ(&ensure_matching_configuration(ambiguous, opsize::l, d0), &ambiguous.configurations[1]);

    CHECK_EQ(sizes_string(opsize_mask_bwl), std::string { "byte, word and long word" });
    CHECK_EQ(operand_types_string(ot_control), std::string { "(An)/(d,An)/(d,An,Xn)/(xxx).W/(xxx).L/(d,PC)/(d,PC,Xn)" });
}

}

int main()
{
    try {
        test_lexer();
        test_operands();
        test_operand_errors();
        test_statements();
        test_validation_errors();
        test_implied_sizes();
        test_configurations();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
