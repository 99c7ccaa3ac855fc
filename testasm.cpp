#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <string>
#include "asm.h"
#include "encoder.h"
#include "error_collector.h"
#include "ioutil.h"
#include "lexer.h"
#include "parser.h"
#include "test_util.h"

namespace {

std::string words_string(const std::vector<uint16_t>& words)
{
    std::string res;
    for (const auto w : words) {
        if (!res.empty())
            res += ' ';
        res += hexstring(w);
    }
    return res;
}

template <typename F>
bool throws_logic_error(F&& f)
{
    try {
        f();
    } catch (const std::logic_error&) {
        return true;
    }
    return false;
}

void test_bit_string()
{
    const auto b = bit_string { 0b0100, 4 } + bit_string { 0b0110, 4 };
    CHECK_EQ(b.width(), uint8_t { 8 });
    CHECK_EQ(b.value(), 0x46U);
    CHECK_EQ(b.to_string(), std::string { "01000110" });
    CHECK_EQ((b + bit_string { 0b01000011, 8 }).word(), uint16_t { 0x4643 });

    CHECK_EQ(throws_logic_error([] { bit_string { 1, 3 }.word(); }), true);
    CHECK_EQ(throws_logic_error([] { bit_string { 8, 3 }; }), true);
    CHECK_EQ(throws_logic_error([] { bit_string { 0, 20 } + bit_string { 0, 13 }; }), true);
}

void test_size_bits()
{
    const struct {
        opsize size;
        const char* zero_based;
        const char* one_based;
        const char* move;
    } test_cases[] = {
        { opsize::b, "00", "01", "01" },
        { opsize::w, "01", "10", "11" },
        { opsize::l, "10", "11", "10" },
    };

    for (const auto& tc : test_cases) {
        CHECK_EQ(size_bits_zero_based(tc.size).to_string(), std::string { tc.zero_based });
        CHECK_EQ(size_bits_one_based(tc.size).to_string(), std::string { tc.one_based });
        CHECK_EQ(size_bits_move(tc.size).to_string(), std::string { tc.move });
    }

    CHECK_EQ(size_bits_single(opsize::w).to_string(), std::string { "0" });
    CHECK_EQ(size_bits_single(opsize::l).to_string(), std::string { "1" });
    CHECK_EQ(throws_logic_error([] { size_bits_single(opsize::b); }), true);
    CHECK_EQ(throws_logic_error([] { size_bits_zero_based(opsize::none); }), true);
}

void test_ea_bits()
{
    const struct {
        const char* text;
        const char* mode;
        const char* reg;
    } test_cases[] = {
        { "D5", "000", "101" },
        { "A1", "001", "001" },
        { "(A2)", "010", "010" },
        { "(A3)+", "011", "011" },
        { "-(A4)", "100", "100" },
        { "2(A5)", "101", "101" },
        { "2(A6,D0.W)", "110", "110" },
        { "$10.W", "111", "000" },
        { "$10.L", "111", "001" },
        { "2(PC)", "111", "010" },
        { "2(PC,D0.W)", "111", "011" },
        { "#1", "111", "100" },
    };

    for (const auto& tc : test_cases) {
        error_collector errors;
        const auto op = parse_operand(tokenize(tc.text, errors));
        CHECK_EQ(mode_bits(op).to_string(), std::string { tc.mode });
        CHECK_EQ(register_bits(op).to_string(), std::string { tc.reg });
    }

    const operand ccr = ccr_operand { location::invalid() };
    CHECK_EQ(throws_logic_error([&] { mode_bits(ccr); }), true);
    CHECK_EQ(throws_logic_error([&] { register_bits(ccr); }), true);
}

void test_encode_statement()
{
    error_collector errors;
    const auto prog = parse(tokenize("NOT.W D3", errors), errors);
    CHECK_EQ(errors.size(), size_t { 0 });
    const auto words = encode(std::get<operation_statement>(prog.statements[0]));
    CHECK_EQ(words.size(), size_t { 1 });
    CHECK_EQ(binstring(words[0]), std::string { "0100011001000011" });
}

bool simple_asm_tests()
{
    const struct {
        const char* text;
        std::vector<uint16_t> code;
    } test_cases[] = {
        { "MOVEQ #42, d2", { 0x742a } },
        { "MOVE.L d3, d4", { 0x2803 } },
        { "RTS", { 0x4e75 } },
        { "move.l #$12345678, $1234.w", { 0x21fc, 0x1234, 0x5678, 0x1234 } },
        { "MOVE.W #$1234, d2", { 0x343c, 0x1234 } },
        { "\trts\n  lab: moveq #0, d0\n", { 0x4e75, 0x7000 } },
        { "move.l d3, (a2)\n", { 0x2483 } },
        { "move.l d4, (a7)+\n", { 0x2ec4 } },
        { "move.l -(a3), a0\n", { 0x2063 } },
        { "move.b #-12, d0\n", { 0x103c, 0x00f4 } },
        { "move.l -12.w, d0\n", { 0x2038, 0xfff4 } },
        { "move.w -1234(a0), d2\n", { 0x3428, 0xfb2e } },
        { "move.w 8(a2,d2.w), d3\n", { 0x3632, 0x2008 } },
        { "move.w 0(a3,d4.l), d3\n", { 0x3633, 0x4800 } },
        { "move.l 10(a2,a1.w), d3\n", { 0x2632, 0x900a } },
        { "move.w 2(pc), a0\n", { 0x307a, 0x0002 } },
        { "move.l 8(pc,d0.w), $12345678\n", { 0x23fb, 0x0008, 0x1234, 0x5678 } },
        { "move.w -2(pc), d0\n", { 0x303a, 0xfffe } },
        { "ADD.B #12, d0\n", { 0xd03c, 0x000c } },
        { "ADD.W #$1234, a0\n", { 0xd0fc, 0x1234 } },
        { "ADD.L #$12345678, a3\n", { 0xd7fc, 0x1234, 0x5678 } },
        { "ADD.B (a0), d0\n", { 0xd010 } },
        { "ADD.L d5, (a3)+\n", { 0xdb9b } },
        { "ADD.L d2, d3\n", { 0xd682 } },
        { "SUB.W #$1234, a0\n", { 0x90fc, 0x1234 } },
        { "SUB.L #$12345678, a3\n", { 0x97fc, 0x1234, 0x5678 } },
        { "SUB.B (a0), d0\n", { 0x9010 } },
        { "SUB.L d5, (a3)+\n", { 0x9b9b } },
        { "SUB.L d2, d3\n", { 0x9682 } },
        { "AND.L d4, -(a2)\n", { 0xc9a2 } },
        { "AND.L d2, d3\n", { 0xc682 } },
        { "EOR.W d3, (a1)\n", { 0xb751 } },
        { "EOR.L d4, -(a2)\n", { 0xb9a2 } },
        { "EOR.L d2, d3\n", { 0xb583 } },
        { "OR.L d4, -(a2)\n", { 0x89a2 } },
        { "OR.L d2, d3\n", { 0x8682 } },
        { "CMP.B (a1)+, d2\n", { 0xb419 } },
        { "CMP.W (a1), a1\n", { 0xb2d1 } },
        { "CMP.L #42, a2\n", { 0xb5fc, 0x0000, 0x002a } },
        { "CMP.W #42, a2\n", { 0xb4fc, 0x002a } },
        { "CMP.L d0, d2\n", { 0xb480 } },
        { "add.w a3, d1", { 0xd24b } },
        { "swap d4", { 0x4844 } },
        { "ext.w d2", { 0x4882 } },
        { "ext.l d3", { 0x48c3 } },
        { "clr.b 12(a0)", { 0x4228, 0x000c } },
        { "clr.w -(a7)", { 0x4267 } },
        { "clr.l d7", { 0x4287 } },
        { "neg.b 2(a0,d0.l)", { 0x4430, 0x0802 } },
        { "neg.w -(a7)", { 0x4467 } },
        { "neg.l d7", { 0x4487 } },
        { "negx.b (a0)", { 0x4010 } },
        { "negx.w -(a7)", { 0x4067 } },
        { "negx.l d7", { 0x4087 } },
        { "not.b (a0)", { 0x4610 } },
        { "not.w -(a7)", { 0x4667 } },
        { "not.l d7", { 0x4687 } },
        { "tst.b (a0)", { 0x4a10 } },
        { "tst.w -(a7)", { 0x4a67 } },
        { "tst.l d7", { 0x4a87 } },
        { "pea 16(a0)", { 0x4868, 0x0010 } },
        { "lea 42(a0,d2.w), a3", { 0x47f0, 0x202a } },
        { "jsr (a0)", { 0x4e90 } },
        { "jmp $1234.w", { 0x4ef8, 0x1234 } },
        { "addq.l #8, d0", { 0x5080 } },
        { "addq.w #3, 2(a0,d0.w)", { 0x5670, 0x0002 } },
        { "subq.w #2, a0", { 0x5548 } },
        { "subq.l #8, -(a7)", { 0x51a7 } },
        { "move #$ab, ccr", { 0x44fc, 0x00ab } },
        { "move #$abcd, sr", { 0x46fc, 0xabcd } },
        { "move sr, d0", { 0x40c0 } },
        { "move.w sr, 12(a2)", { 0x40ea, 0x000c } },
        { "move sp, d0", { 0x300f } },
        { "move usp, a0", { 0x4e68 } },
        { "move a3, usp", { 0x4e63 } },
        { "nop", { 0x4e71 } },
        { "illegal", { 0x4afc } },
        { "rte", { 0x4e73 } },
        { "rtr", { 0x4e77 } },
        { "reset", { 0x4e70 } },
        { "trapv", { 0x4e76 } },
        { "NOT.W D3 ; invert", { 0x4643 } },
        { "; only a comment\nstart:\n\tNOP\n\tRTS\n", { 0x4e71, 0x4e75 } },
    };

    for (const auto& tc : test_cases) {
        error_collector errors;
        const auto res = assemble_text(tc.text, errors);
        if (!errors.empty()) {
            std::cerr << "Failed to assemble:\n" << tc.text << "\n";
            for (const auto& d : errors.errors())
                std::cerr << d << "\n";
            return false;
        }
        if (res.size() & 1) {
            std::cerr << "Odd number of bytes for:\n" << tc.text << "\n";
            return false;
        }
        std::vector<uint16_t> code;
        for (size_t i = 0; i < res.size(); i += 2)
            code.push_back(get_u16(&res[i]));

        if (code != tc.code) {
            std::cerr << "Test case failed for:\n" << tc.text << "\n\n";
            std::cerr << "Expected: " << words_string(tc.code) << "\n";
            std::cerr << "Got:      " << words_string(code) << "\n";
            return false;
        }
    }
    return true;
}

void test_range_errors()
{
    const struct {
        const char* text;
        const char* expected;
    } test_cases[] = {
        { "MOVEQ #200, d0", "1:7: error: Value 200 is out of range for MOVEQ (-128..127)\n" },
        { "MOVEQ #-129, d0", "1:7: error: Value -129 is out of range for MOVEQ (-128..127)\n" },
        { "ADDQ.W #9, d0", "1:8: error: Value 9 is out of range for ADDQ (1..8)\n" },
        { "SUBQ.L #0, d0", "1:8: error: Value 0 is out of range for SUBQ (1..8)\n" },
        { "MOVE.W 40000(a0), d0", "1:8: error: 40000 is out of range for 16-bit displacement\n" },
        { "MOVE.W -32769(pc), d0", "1:8: error: -32769 is out of range for 16-bit displacement\n" },
        { "MOVE.W 200(a0,d0.w), d1", "1:8: error: 200 is out of range for 8-bit displacement\n" },
        { "MOVE.W $12345.W, d0", "1:8: error: 74565 is out of range for 16-bit absolute address\n" },
        { "MOVE.B #256, d0", "1:8: error: Immediate value 256 doesn't fit in a byte\n" },
        { "MOVE.W #-32769, d0", "1:8: error: Immediate value -32769 doesn't fit in a word\n" },
    };

    for (const auto& tc : test_cases) {
        error_collector errors;
        const auto res = assemble_text(tc.text, errors);
        std::ostringstream oss;
        for (const auto& d : errors.errors())
            oss << d << "\n";
        CHECK_EQ(oss.str(), std::string { tc.expected });
        CHECK_EQ(res.size(), size_t { 0 });
    }

    // Encoding goes on after a failing statement
    error_collector errors;
    const auto prog = parse(tokenize("MOVEQ #200, d0\nRTS\n", errors), errors);
    CHECK_EQ(errors.size(), size_t { 0 });
    const auto as = assemble(prog, errors);
    CHECK_EQ(errors.size(), size_t { 1 });
    CHECK_EQ(as.code.size(), size_t { 2 });
    CHECK_EQ(get_u16(&as.code[0]), uint16_t { 0x4e75 });
}

void test_labels_and_listing()
{
    error_collector errors;
    const auto prog = parse(tokenize("start: NOP\n; c\nloop: MOVE.L #1,D0\nend: RTS\n", errors), errors);
    const auto as = assemble(prog, errors);
    CHECK_EQ(errors.size(), size_t { 0 });

    const auto addresses = label_addresses(prog, as, 0x1000);
    CHECK_EQ(addresses.size(), size_t { 3 });
    CHECK_EQ(addresses[0].first.name, std::string { "start" });
    CHECK_EQ(addresses[0].second, 0x1000U);
    CHECK_EQ(addresses[1].first.name, std::string { "loop" });
    CHECK_EQ(addresses[1].second, 0x1002U);
    CHECK_EQ(addresses[2].first.name, std::string { "end" });
    CHECK_EQ(addresses[2].second, 0x1008U);

    std::ostringstream oss;
    write_listing(oss, prog, as, 0x1000);
    const auto listing = oss.str();
    CHECK_EQ(listing.find("00001000                  start:\n") != std::string::npos, true);
    CHECK_EQ(listing.find("00001000  4e71            NOP\n") != std::string::npos, true);
    CHECK_EQ(listing.find("                          ; c\n") != std::string::npos, true);
    CHECK_EQ(listing.find("00001002  203c 0000 0001  MOVE.L  #1, D0\n") != std::string::npos, true);
    CHECK_EQ(listing.find("00001008  4e75            RTS\n") != std::string::npos, true);
}

}

int main()
{
    try {
        test_bit_string();
        test_size_bits();
        test_ea_bits();
        test_encode_statement();
        if (!simple_asm_tests())
            return 1;
        test_range_errors();
        test_labels_and_listing();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
