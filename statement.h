#ifndef STATEMENT_H
#define STATEMENT_H

#include <stdint.h>
#include <iosfwd>
#include <map>
#include <string>
#include <variant>
#include <vector>
#include "instruction.h"
#include "location.h"

template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

//
// Registers
//

struct pc_register {
    friend bool operator==(const pc_register&, const pc_register&) = default;
};

struct address_register {
    uint8_t index; // 0-7
    friend bool operator==(const address_register&, const address_register&) = default;
};

struct data_register {
    uint8_t index; // 0-7
    friend bool operator==(const data_register&, const data_register&) = default;
};

using cpu_register = std::variant<pc_register, address_register, data_register>;
using index_register = std::variant<data_register, address_register>;

std::string register_string(const cpu_register& reg);
std::string index_register_string(const index_register& reg);

const char* size_string(opsize size);  // "byte", "word", ...
const char* size_suffix(opsize size);  // "B", "W", "L" or "" for none

//
// Operands
//

enum class operand_type {
    dn,
    an,
    an_ind,
    an_ind_post_inc,
    an_ind_pre_dec,
    an_ind_disp,
    an_ind_index,
    abs_word,
    abs_long,
    pc_disp,
    pc_index,
    immediate,
    ccr,
    sr,
    usp,
    address,
};

constexpr uint32_t operand_type_mask(operand_type t)
{
    return 1U << static_cast<uint32_t>(t);
}

const char* operand_type_string(operand_type t); // Short form, e.g. "(An)+"
const char* operand_type_name(operand_type t);   // e.g. "address register indirect with postincrement"

struct dn_operand {
    static constexpr operand_type type = operand_type::dn;
    location loc;
    data_register reg;
    friend bool operator==(const dn_operand&, const dn_operand&) = default;
};

struct an_operand {
    static constexpr operand_type type = operand_type::an;
    location loc;
    address_register reg;
    friend bool operator==(const an_operand&, const an_operand&) = default;
};

struct an_ind_operand {
    static constexpr operand_type type = operand_type::an_ind;
    location loc;
    address_register reg;
    friend bool operator==(const an_ind_operand&, const an_ind_operand&) = default;
};

struct an_ind_post_inc_operand {
    static constexpr operand_type type = operand_type::an_ind_post_inc;
    location loc;
    address_register reg;
    friend bool operator==(const an_ind_post_inc_operand&, const an_ind_post_inc_operand&) = default;
};

struct an_ind_pre_dec_operand {
    static constexpr operand_type type = operand_type::an_ind_pre_dec;
    location loc;
    address_register reg;
    friend bool operator==(const an_ind_pre_dec_operand&, const an_ind_pre_dec_operand&) = default;
};

struct an_ind_disp_operand {
    static constexpr operand_type type = operand_type::an_ind_disp;
    location loc;
    address_register reg;
    int64_t displacement;
    friend bool operator==(const an_ind_disp_operand&, const an_ind_disp_operand&) = default;
};

struct an_ind_index_operand {
    static constexpr operand_type type = operand_type::an_ind_index;
    location loc;
    address_register reg;
    int64_t displacement;
    index_register index;
    opsize index_size;
    friend bool operator==(const an_ind_index_operand&, const an_ind_index_operand&) = default;
};

struct abs_word_operand {
    static constexpr operand_type type = operand_type::abs_word;
    location loc;
    int64_t value;
    friend bool operator==(const abs_word_operand&, const abs_word_operand&) = default;
};

struct abs_long_operand {
    static constexpr operand_type type = operand_type::abs_long;
    location loc;
    int64_t value;
    friend bool operator==(const abs_long_operand&, const abs_long_operand&) = default;
};

struct pc_disp_operand {
    static constexpr operand_type type = operand_type::pc_disp;
    location loc;
    int64_t displacement;
    friend bool operator==(const pc_disp_operand&, const pc_disp_operand&) = default;
};

struct pc_index_operand {
    static constexpr operand_type type = operand_type::pc_index;
    location loc;
    int64_t displacement;
    index_register index;
    opsize index_size;
    friend bool operator==(const pc_index_operand&, const pc_index_operand&) = default;
};

struct immediate_operand {
    static constexpr operand_type type = operand_type::immediate;
    location loc;
    int64_t value;
    friend bool operator==(const immediate_operand&, const immediate_operand&) = default;
};

struct ccr_operand {
    static constexpr operand_type type = operand_type::ccr;
    location loc;
    friend bool operator==(const ccr_operand&, const ccr_operand&) = default;
};

struct sr_operand {
    static constexpr operand_type type = operand_type::sr;
    location loc;
    friend bool operator==(const sr_operand&, const sr_operand&) = default;
};

struct usp_operand {
    static constexpr operand_type type = operand_type::usp;
    location loc;
    friend bool operator==(const usp_operand&, const usp_operand&) = default;
};

// Placeholder, never produced by the parser
struct address_operand {
    static constexpr operand_type type = operand_type::address;
    location loc;
    friend bool operator==(const address_operand&, const address_operand&) = default;
};

using operand = std::variant<
    dn_operand,
    an_operand,
    an_ind_operand,
    an_ind_post_inc_operand,
    an_ind_pre_dec_operand,
    an_ind_disp_operand,
    an_ind_index_operand,
    abs_word_operand,
    abs_long_operand,
    pc_disp_operand,
    pc_index_operand,
    immediate_operand,
    ccr_operand,
    sr_operand,
    usp_operand,
    address_operand>;

operand_type type_of(const operand& op);
location location_of(const operand& op);

// Canonical text form, accepted by the parser
std::string operand_string(const operand& op);

//
// Statements
//

struct label_statement {
    location loc;
    std::string name;

    bool is_local() const
    {
        return !name.empty() && name[0] == '.';
    }

    bool is_global() const
    {
        return !is_local();
    }

    friend auto operator<=>(const label_statement&, const label_statement&) = default;
};

struct comment_statement {
    location loc;
    std::string text;
    friend bool operator==(const comment_statement&, const comment_statement&) = default;
};

struct operation_info;

struct operation_statement {
    location loc;
    const operation_info* operation;
    opsize size;
    bool explicit_size;
    std::vector<operand> operands;
    friend bool operator==(const operation_statement&, const operation_statement&) = default;
};

using statement = std::variant<label_statement, comment_statement, operation_statement>;

location location_of(const statement& s);
std::string statement_string(const statement& s);
// Like statement_string but with the operation padded to a fixed column
std::string aligned_string(const statement& s);

struct program {
    std::vector<statement> statements;
    // Index into statements of the statement following each label
    std::map<label_statement, size_t> labels;
};

#endif
