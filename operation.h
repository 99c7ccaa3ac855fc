#ifndef OPERATION_H
#define OPERATION_H

#include <stdint.h>
#include <string>
#include <vector>
#include "instruction.h"
#include "statement.h"

constexpr uint32_t ot_dn              = operand_type_mask(operand_type::dn);
constexpr uint32_t ot_an              = operand_type_mask(operand_type::an);
constexpr uint32_t ot_an_ind          = operand_type_mask(operand_type::an_ind);
constexpr uint32_t ot_an_ind_post_inc = operand_type_mask(operand_type::an_ind_post_inc);
constexpr uint32_t ot_an_ind_pre_dec  = operand_type_mask(operand_type::an_ind_pre_dec);
constexpr uint32_t ot_an_ind_disp     = operand_type_mask(operand_type::an_ind_disp);
constexpr uint32_t ot_an_ind_index    = operand_type_mask(operand_type::an_ind_index);
constexpr uint32_t ot_abs_word        = operand_type_mask(operand_type::abs_word);
constexpr uint32_t ot_abs_long        = operand_type_mask(operand_type::abs_long);
constexpr uint32_t ot_pc_disp         = operand_type_mask(operand_type::pc_disp);
constexpr uint32_t ot_pc_index        = operand_type_mask(operand_type::pc_index);
constexpr uint32_t ot_immediate       = operand_type_mask(operand_type::immediate);
constexpr uint32_t ot_ccr             = operand_type_mask(operand_type::ccr);
constexpr uint32_t ot_sr              = operand_type_mask(operand_type::sr);
constexpr uint32_t ot_usp             = operand_type_mask(operand_type::usp);

// Effective address categories from the 68000 programmer's reference manual
constexpr uint32_t ot_data_alterable   = ot_dn | ot_an_ind | ot_an_ind_post_inc | ot_an_ind_pre_dec | ot_an_ind_disp | ot_an_ind_index | ot_abs_word | ot_abs_long;
constexpr uint32_t ot_memory_alterable = ot_data_alterable & ~ot_dn;
constexpr uint32_t ot_alterable        = ot_data_alterable | ot_an;
constexpr uint32_t ot_data             = ot_data_alterable | ot_pc_disp | ot_pc_index | ot_immediate;
constexpr uint32_t ot_all              = ot_data | ot_an;
constexpr uint32_t ot_control          = ot_an_ind | ot_an_ind_disp | ot_an_ind_index | ot_abs_word | ot_abs_long | ot_pc_disp | ot_pc_index;

constexpr unsigned max_operands = 2;

// One legal (size, operand types) combination of an operation
struct operation_configuration {
    uint8_t sizes;
    uint8_t num_operands;
    uint32_t operand_types[max_operands];

    bool accepts(opsize size) const
    {
        return (sizes & opsize_mask(size)) != 0;
    }

    bool accepts(const std::vector<operand>& operands) const;
};

//     name     default size
#define OPERATIONS(X)   \
    X(ADD     , w    )  \
    X(ADDQ    , w    )  \
    X(AND     , w    )  \
    X(CLR     , w    )  \
    X(CMP     , w    )  \
    X(EOR     , w    )  \
    X(EXT     , w    )  \
    X(ILLEGAL , none )  \
    X(JMP     , none )  \
    X(JSR     , none )  \
    X(LEA     , l    )  \
    X(MOVE    , w    )  \
    X(MOVEQ   , l    )  \
    X(NEG     , w    )  \
    X(NEGX    , w    )  \
    X(NOP     , none )  \
    X(NOT     , w    )  \
    X(OR      , w    )  \
    X(PEA     , l    )  \
    X(RESET   , none )  \
    X(RTE     , none )  \
    X(RTR     , none )  \
    X(RTS     , none )  \
    X(SUB     , w    )  \
    X(SUBQ    , w    )  \
    X(SWAP    , w    )  \
    X(TRAPV   , none )  \
    X(TST     , w    )  \

enum class operation {
#define DEF_OPERATION(name, def_size) name,
    OPERATIONS(DEF_OPERATION)
#undef DEF_OPERATION
};

struct operation_info {
    operation op;
    const char* code;
    opsize default_size;
    std::vector<operation_configuration> configurations;
};

const std::vector<operation_info>& operation_table();
const operation_info& operation_info_for(operation op);

// Looks up an operation by its canonical (upper case) code. Returns nullptr if there is none.
const operation_info* find_operation(const std::string& code);

// Size used when the source doesn't give one: the default size unless only a configuration
// with a different, single size accepts the operands (e.g. MOVE USP,An is long).
opsize implied_size(const operation_info& info, const std::vector<operand>& operands);

// Throws assembler_error describing the legal alternatives unless exactly one configuration
// accepts size and operands. More than one match is a table bug and raises std::logic_error.
const operation_configuration& ensure_matching_configuration(const operation_info& info, opsize size, const std::vector<operand>& operands);

std::string sizes_string(uint8_t sizes);
std::string operand_types_string(uint32_t types);

#endif
