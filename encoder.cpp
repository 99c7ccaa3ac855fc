#include "encoder.h"
#include "operation.h"
#include "error_collector.h"
#include "ioutil.h"
#include "debug.h"

bit_string::bit_string(uint32_t value, uint8_t width)
    : value_ { value }
    , width_ { width }
{
    if (width > 32 || (width < 32 && value >> width))
        INTERNAL_ERROR("Value $" << hexfmt(value) << " doesn't fit in " << static_cast<int>(width) << " bits");
}

bit_string bit_string::operator+(const bit_string& rhs) const
{
    if (width_ + rhs.width_ > 32)
        INTERNAL_ERROR("Bit string too long: " << static_cast<int>(width_) << " + " << static_cast<int>(rhs.width_));
    const uint32_t shifted = rhs.width_ == 32 ? 0 : value_ << rhs.width_;
    return bit_string { shifted | rhs.value_, static_cast<uint8_t>(width_ + rhs.width_) };
}

uint16_t bit_string::word() const
{
    if (width_ != 16)
        INTERNAL_ERROR("Instruction word has " << static_cast<int>(width_) << " bits: " << to_string());
    return static_cast<uint16_t>(value_);
}

std::string bit_string::to_string() const
{
    return width_ ? binstring(value_, width_) : std::string {};
}

bit_string size_bits_zero_based(opsize size)
{
    switch (size) {
    case opsize::b:
        return { 0b00, 2 };
    case opsize::w:
        return { 0b01, 2 };
    case opsize::l:
        return { 0b10, 2 };
    default:
        INTERNAL_ERROR("Invalid size " << size_string(size));
    }
}

bit_string size_bits_one_based(opsize size)
{
    switch (size) {
    case opsize::b:
        return { 0b01, 2 };
    case opsize::w:
        return { 0b10, 2 };
    case opsize::l:
        return { 0b11, 2 };
    default:
        INTERNAL_ERROR("Invalid size " << size_string(size));
    }
}

bit_string size_bits_single(opsize size)
{
    switch (size) {
    case opsize::w:
        return { 0, 1 };
    case opsize::l:
        return { 1, 1 };
    default:
        INTERNAL_ERROR("Invalid size " << size_string(size));
    }
}

bit_string size_bits_move(opsize size)
{
    switch (size) {
    case opsize::b:
        return { 0b01, 2 };
    case opsize::w:
        return { 0b11, 2 };
    case opsize::l:
        return { 0b10, 2 };
    default:
        INTERNAL_ERROR("Invalid size " << size_string(size));
    }
}

bit_string mode_bits(const operand& op)
{
    switch (type_of(op)) {
    case operand_type::dn:
        return { ea_m_Dn, 3 };
    case operand_type::an:
        return { ea_m_An, 3 };
    case operand_type::an_ind:
        return { ea_m_A_ind, 3 };
    case operand_type::an_ind_post_inc:
        return { ea_m_A_ind_post, 3 };
    case operand_type::an_ind_pre_dec:
        return { ea_m_A_ind_pre, 3 };
    case operand_type::an_ind_disp:
        return { ea_m_A_ind_disp16, 3 };
    case operand_type::an_ind_index:
        return { ea_m_A_ind_index, 3 };
    case operand_type::abs_word:
    case operand_type::abs_long:
    case operand_type::pc_disp:
    case operand_type::pc_index:
    case operand_type::immediate:
        return { ea_m_Other, 3 };
    default:
        INTERNAL_ERROR("No effective address encoding for " << operand_type_string(type_of(op)));
    }
}

bit_string register_bits(const operand& op)
{
    return std::visit(overloaded {
                          [](const dn_operand& o) { return bit_string { o.reg.index, 3 }; },
                          [](const an_operand& o) { return bit_string { o.reg.index, 3 }; },
                          [](const an_ind_operand& o) { return bit_string { o.reg.index, 3 }; },
                          [](const an_ind_post_inc_operand& o) { return bit_string { o.reg.index, 3 }; },
                          [](const an_ind_pre_dec_operand& o) { return bit_string { o.reg.index, 3 }; },
                          [](const an_ind_disp_operand& o) { return bit_string { o.reg.index, 3 }; },
                          [](const an_ind_index_operand& o) { return bit_string { o.reg.index, 3 }; },
                          [](const abs_word_operand&) { return bit_string { ea_other_abs_w, 3 }; },
                          [](const abs_long_operand&) { return bit_string { ea_other_abs_l, 3 }; },
                          [](const pc_disp_operand&) { return bit_string { ea_other_pc_disp16, 3 }; },
                          [](const pc_index_operand&) { return bit_string { ea_other_pc_index, 3 }; },
                          [](const immediate_operand&) { return bit_string { ea_other_imm, 3 }; },
                          [](const auto& o) -> bit_string { INTERNAL_ERROR("No effective address encoding for " << operand_type_string(o.type)); },
                      },
        op);
}

namespace {

bit_string ea_bits(const operand& op)
{
    return mode_bits(op) + register_bits(op);
}

uint8_t register_index(const operand& op)
{
    if (const auto* d = std::get_if<dn_operand>(&op))
        return d->reg.index;
    if (const auto* a = std::get_if<an_operand>(&op))
        return a->reg.index;
    INTERNAL_ERROR("Expected register operand, got " << operand_type_string(type_of(op)));
}

bit_string reg_field(const operand& op)
{
    return { register_index(op), 3 };
}

class instruction_encoder {
public:
    explicit instruction_encoder(const operation_statement& s)
        : s_ { s }
    {
    }

    std::vector<uint16_t> process()
    {
        const auto& ops = s_.operands;
        switch (s_.operation->op) {
        case operation::NEGX:
            single_ea(0b01000000);
            break;
        case operation::CLR:
            single_ea(0b01000010);
            break;
        case operation::NEG:
            single_ea(0b01000100);
            break;
        case operation::NOT:
            single_ea(0b01000110);
            break;
        case operation::TST:
            single_ea(0b01001010);
            break;
        case operation::EXT:
            add_word(bit_string { 0b010010001, 9 } + size_bits_single(s_.size) + bit_string { 0b000, 3 } + reg_field(ops[0]));
            break;
        case operation::SWAP:
            add_word(bit_string { 0b0100100001000, 13 } + reg_field(ops[0]));
            break;
        case operation::ILLEGAL:
            words_.push_back(illegal_instruction_num);
            break;
        case operation::NOP:
            words_.push_back(nop_instruction_num);
            break;
        case operation::RESET:
            words_.push_back(reset_instruction_num);
            break;
        case operation::RTE:
            words_.push_back(rte_instruction_num);
            break;
        case operation::RTR:
            words_.push_back(rtr_instruction_num);
            break;
        case operation::RTS:
            words_.push_back(rts_instruction_num);
            break;
        case operation::TRAPV:
            words_.push_back(trapv_instruction_num);
            break;
        case operation::JMP:
            control_ea(0b0100111011);
            break;
        case operation::JSR:
            control_ea(0b0100111010);
            break;
        case operation::PEA:
            control_ea(0b0100100001);
            break;
        case operation::LEA:
            add_word(bit_string { 0b0100, 4 } + reg_field(ops[1]) + bit_string { 0b111, 3 } + ea_bits(ops[0]));
            add_extension_words(ops[0]);
            break;
        case operation::ADDQ:
            quick(false);
            break;
        case operation::SUBQ:
            quick(true);
            break;
        case operation::MOVEQ: {
            const auto& imm = std::get<immediate_operand>(ops[0]);
            if (!range8(imm.value))
                ASSEMBLER_ERROR_AT(imm.loc, "Value " << imm.value << " is out of range for MOVEQ (-128..127)");
            add_word(bit_string { 0b0111, 4 } + reg_field(ops[1]) + bit_string { 0, 1 } + bit_string { static_cast<uint8_t>(imm.value), 8 });
            break;
        }
        case operation::MOVE:
            move();
            break;
        case operation::ADD:
            binary(0b1101);
            break;
        case operation::SUB:
            binary(0b1001);
            break;
        case operation::AND:
            binary(0b1100);
            break;
        case operation::OR:
            binary(0b1000);
            break;
        case operation::CMP:
        case operation::EOR:
            binary(0b1011);
            break;
        }

        if (DEBUG_ENCODE) {
            *debug_stream << s_.loc << ": " << statement_string(s_) << " =>";
            for (const auto w : words_)
                *debug_stream << " " << hexfmt(w);
            *debug_stream << "\n";
        }
        return std::move(words_);
    }

private:
    const operation_statement& s_;
    std::vector<uint16_t> words_;

    void add_word(const bit_string& bits)
    {
        words_.push_back(bits.word());
    }

    void add_extension_words(const operand& op)
    {
        std::visit(overloaded {
                       [&](const an_ind_disp_operand& o) { add_displacement(o.displacement, o.loc); },
                       [&](const pc_disp_operand& o) { add_displacement(o.displacement, o.loc); },
                       [&](const an_ind_index_operand& o) { add_brief_extension(o.displacement, o.index, o.index_size, o.loc); },
                       [&](const pc_index_operand& o) { add_brief_extension(o.displacement, o.index, o.index_size, o.loc); },
                       [&](const abs_word_operand& o) {
                           if (!range16(o.value))
                               ASSEMBLER_ERROR_AT(o.loc, o.value << " is out of range for 16-bit absolute address");
                           words_.push_back(static_cast<uint16_t>(o.value));
                       },
                       [&](const abs_long_operand& o) {
                           if (!fits_size(o.value, opsize::l))
                               ASSEMBLER_ERROR_AT(o.loc, o.value << " is out of range for 32-bit absolute address");
                           words_.push_back(static_cast<uint16_t>(o.value >> 16));
                           words_.push_back(static_cast<uint16_t>(o.value));
                       },
                       [&](const immediate_operand& o) {
                           if (!fits_size(o.value, s_.size))
                               ASSEMBLER_ERROR_AT(o.loc, "Immediate value " << o.value << " doesn't fit in a " << size_string(s_.size));
                           if (s_.size == opsize::l)
                               words_.push_back(static_cast<uint16_t>(o.value >> 16));
                           words_.push_back(static_cast<uint16_t>(s_.size == opsize::b ? o.value & 0xff : o.value));
                       },
                       [](const auto&) {},
                   },
            op);
    }

    void add_displacement(int64_t disp, const location& loc)
    {
        if (!range16(disp))
            ASSEMBLER_ERROR_AT(loc, disp << " is out of range for 16-bit displacement");
        words_.push_back(static_cast<uint16_t>(disp));
    }

    // D/A | register | W/L | 000 | 8-bit displacement
    void add_brief_extension(int64_t disp, const index_register& index, opsize index_size, const location& loc)
    {
        if (!range8(disp))
            ASSEMBLER_ERROR_AT(loc, disp << " is out of range for 8-bit displacement");
        const bool is_address = std::holds_alternative<address_register>(index);
        const uint8_t reg = std::visit([](const auto& r) { return r.index; }, index);
        add_word(bit_string { is_address, 1 } + bit_string { reg, 3 } + bit_string { index_size == opsize::l, 1 } + bit_string { 0, 3 } + bit_string { static_cast<uint8_t>(disp), 8 });
    }

    void single_ea(uint8_t templ)
    {
        const auto& ea = s_.operands[0];
        add_word(bit_string { templ, 8 } + size_bits_zero_based(s_.size) + ea_bits(ea));
        add_extension_words(ea);
    }

    void control_ea(uint16_t templ)
    {
        const auto& ea = s_.operands[0];
        add_word(bit_string { templ, 10 } + ea_bits(ea));
        add_extension_words(ea);
    }

    void quick(bool is_sub)
    {
        const auto& imm = std::get<immediate_operand>(s_.operands[0]);
        if (imm.value < 1 || imm.value > 8)
            ASSEMBLER_ERROR_AT(imm.loc, "Value " << imm.value << " is out of range for " << s_.operation->code << " (1..8)");
        const auto& ea = s_.operands[1];
        add_word(bit_string { 0b0101, 4 } + bit_string { static_cast<uint8_t>(imm.value & 7), 3 } + bit_string { is_sub, 1 } + size_bits_zero_based(s_.size) + ea_bits(ea));
        add_extension_words(ea);
    }

    void move()
    {
        const auto& src = s_.operands[0];
        const auto& dst = s_.operands[1];
        const auto st = type_of(src);
        const auto dt = type_of(dst);

        if (dt == operand_type::ccr || dt == operand_type::sr) {
            add_word(bit_string { dt == operand_type::ccr ? 0b0100010011U : 0b0100011011U, 10 } + ea_bits(src));
            add_extension_words(src);
        } else if (st == operand_type::sr) {
            add_word(bit_string { 0b0100000011, 10 } + ea_bits(dst));
            add_extension_words(dst);
        } else if (st == operand_type::usp) {
            add_word(bit_string { 0b010011100110, 12 } + bit_string { 1, 1 } + reg_field(dst));
        } else if (dt == operand_type::usp) {
            add_word(bit_string { 0b010011100110, 12 } + bit_string { 0, 1 } + reg_field(src));
        } else {
            // Destination register and mode are swapped compared to the source
            add_word(bit_string { 0b00, 2 } + size_bits_move(s_.size) + register_bits(dst) + mode_bits(dst) + ea_bits(src));
            add_extension_words(src);
            add_extension_words(dst);
        }
    }

    void binary(uint8_t templ)
    {
        const auto& src = s_.operands[0];
        const auto& dst = s_.operands[1];
        const auto t = bit_string { templ, 4 };

        if (type_of(dst) == operand_type::an) {
            // ADDA, SUBA, CMPA
            add_word(t + reg_field(dst) + size_bits_single(s_.size) + bit_string { 0b11, 2 } + ea_bits(src));
            add_extension_words(src);
        } else if (type_of(dst) == operand_type::dn && s_.operation->op != operation::EOR) {
            add_word(t + reg_field(dst) + bit_string { 0, 1 } + size_bits_zero_based(s_.size) + ea_bits(src));
            add_extension_words(src);
        } else {
            add_word(t + reg_field(src) + bit_string { 1, 1 } + size_bits_zero_based(s_.size) + ea_bits(dst));
            add_extension_words(dst);
        }
    }
};

}

std::vector<uint16_t> encode(const operation_statement& s)
{
    return instruction_encoder { s }.process();
}
