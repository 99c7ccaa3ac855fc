#ifndef INSTRUCTION_H
#define INSTRUCTION_H

#include <stdint.h>

enum class opsize {
    none,
    b,
    w,
    l,
};

constexpr uint8_t opsize_mask(opsize size)
{
    return static_cast<uint8_t>(1 << static_cast<uint8_t>(size));
}

constexpr uint8_t opsize_mask_none = opsize_mask(opsize::none);
constexpr uint8_t opsize_mask_b    = opsize_mask(opsize::b);
constexpr uint8_t opsize_mask_w    = opsize_mask(opsize::w);
constexpr uint8_t opsize_mask_l    = opsize_mask(opsize::l);
constexpr uint8_t opsize_mask_bw   = opsize_mask_b | opsize_mask_w;
constexpr uint8_t opsize_mask_wl   = opsize_mask_w | opsize_mask_l;
constexpr uint8_t opsize_mask_bwl  = opsize_mask_b | opsize_mask_w | opsize_mask_l;

constexpr bool range8(int64_t val)
{
    return val >= -128 && val <= 127;
}

constexpr bool range16(int64_t val)
{
    return val >= -32768 && val <= 32767;
}

// Accepts both signed and unsigned interpretations
constexpr bool fits_size(int64_t val, opsize size)
{
    switch (size) {
    case opsize::b:
        return val >= -128 && val <= 0xff;
    case opsize::w:
        return val >= -32768 && val <= 0xffff;
    case opsize::l:
        return val >= -2147483648LL && val <= 0xffffffffLL;
    default:
        return false;
    }
}

enum ea_m {
    ea_m_Dn            = 0b000, // Dn
    ea_m_An            = 0b001, // An
    ea_m_A_ind         = 0b010, // (An)
    ea_m_A_ind_post    = 0b011, // (An)+
    ea_m_A_ind_pre     = 0b100, // -(An)
    ea_m_A_ind_disp16  = 0b101, // (d16, An)
    ea_m_A_ind_index   = 0b110, // (d8, An, Xn)
    ea_m_Other         = 0b111, // (Other)
};

// Register field values for ea_m_Other
enum ea_other {
    ea_other_abs_w     = 0b000, // (addr.W)
    ea_other_abs_l     = 0b001, // (addr.L)
    ea_other_pc_disp16 = 0b010, // (d16, PC)
    ea_other_pc_index  = 0b011, // (d8, PC, Xn)
    ea_other_imm       = 0b100,
};

constexpr uint16_t illegal_instruction_num = 0x4afc; // Designated illegal instruction
constexpr uint16_t reset_instruction_num   = 0x4e70;
constexpr uint16_t nop_instruction_num     = 0x4e71;
constexpr uint16_t rte_instruction_num     = 0x4e73;
constexpr uint16_t rts_instruction_num     = 0x4e75;
constexpr uint16_t trapv_instruction_num   = 0x4e76;
constexpr uint16_t rtr_instruction_num     = 0x4e77;

#endif
