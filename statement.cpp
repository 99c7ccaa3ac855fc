#include "statement.h"
#include "operation.h"
#include <algorithm>
#include <sstream>

std::string register_string(const cpu_register& reg)
{
    return std::visit(overloaded {
                          [](const pc_register&) { return std::string { "PC" }; },
                          [](const address_register& r) { return "A" + std::to_string(r.index); },
                          [](const data_register& r) { return "D" + std::to_string(r.index); },
                      },
        reg);
}

std::string index_register_string(const index_register& reg)
{
    return std::visit([](const auto& r) { return register_string(r); }, reg);
}

const char* size_string(opsize size)
{
    switch (size) {
    case opsize::none:
        return "no size";
    case opsize::b:
        return "byte";
    case opsize::w:
        return "word";
    case opsize::l:
        return "long word";
    }
    return "?";
}

const char* size_suffix(opsize size)
{
    switch (size) {
    case opsize::b:
        return "B";
    case opsize::w:
        return "W";
    case opsize::l:
        return "L";
    default:
        return "";
    }
}

const char* operand_type_string(operand_type t)
{
    switch (t) {
    case operand_type::dn: return "Dn";
    case operand_type::an: return "An";
    case operand_type::an_ind: return "(An)";
    case operand_type::an_ind_post_inc: return "(An)+";
    case operand_type::an_ind_pre_dec: return "-(An)";
    case operand_type::an_ind_disp: return "(d,An)";
    case operand_type::an_ind_index: return "(d,An,Xn)";
    case operand_type::abs_word: return "(xxx).W";
    case operand_type::abs_long: return "(xxx).L";
    case operand_type::pc_disp: return "(d,PC)";
    case operand_type::pc_index: return "(d,PC,Xn)";
    case operand_type::immediate: return "#xxx";
    case operand_type::ccr: return "CCR";
    case operand_type::sr: return "SR";
    case operand_type::usp: return "USP";
    case operand_type::address: return "<address>";
    }
    return "?";
}

const char* operand_type_name(operand_type t)
{
    switch (t) {
    case operand_type::dn: return "data register direct";
    case operand_type::an: return "address register direct";
    case operand_type::an_ind: return "address register indirect";
    case operand_type::an_ind_post_inc: return "address register indirect with postincrement";
    case operand_type::an_ind_pre_dec: return "address register indirect with predecrement";
    case operand_type::an_ind_disp: return "address register indirect with displacement";
    case operand_type::an_ind_index: return "address register indirect with index";
    case operand_type::abs_word: return "absolute short";
    case operand_type::abs_long: return "absolute long";
    case operand_type::pc_disp: return "program counter indirect with displacement";
    case operand_type::pc_index: return "program counter indirect with index";
    case operand_type::immediate: return "immediate";
    case operand_type::ccr: return "condition code register";
    case operand_type::sr: return "status register";
    case operand_type::usp: return "user stack pointer";
    case operand_type::address: return "address";
    }
    return "?";
}

operand_type type_of(const operand& op)
{
    return std::visit([](const auto& o) { return std::decay_t<decltype(o)>::type; }, op);
}

location location_of(const operand& op)
{
    return std::visit([](const auto& o) { return o.loc; }, op);
}

std::string operand_string(const operand& op)
{
    std::ostringstream oss;
    std::visit(overloaded {
                   [&](const dn_operand& o) { oss << register_string(o.reg); },
                   [&](const an_operand& o) { oss << register_string(o.reg); },
                   [&](const an_ind_operand& o) { oss << "(" << register_string(o.reg) << ")"; },
                   [&](const an_ind_post_inc_operand& o) { oss << "(" << register_string(o.reg) << ")+"; },
                   [&](const an_ind_pre_dec_operand& o) { oss << "-(" << register_string(o.reg) << ")"; },
                   [&](const an_ind_disp_operand& o) { oss << "(" << o.displacement << "," << register_string(o.reg) << ")"; },
                   [&](const an_ind_index_operand& o) {
                       oss << "(" << o.displacement << "," << register_string(o.reg) << "," << index_register_string(o.index) << "." << size_suffix(o.index_size) << ")";
                   },
                   [&](const abs_word_operand& o) { oss << "(" << o.value << ").W"; },
                   [&](const abs_long_operand& o) { oss << "(" << o.value << ").L"; },
                   [&](const pc_disp_operand& o) { oss << "(" << o.displacement << ",PC)"; },
                   [&](const pc_index_operand& o) {
                       oss << "(" << o.displacement << ",PC," << index_register_string(o.index) << "." << size_suffix(o.index_size) << ")";
                   },
                   [&](const immediate_operand& o) { oss << "#" << o.value; },
                   [&](const ccr_operand&) { oss << "CCR"; },
                   [&](const sr_operand&) { oss << "SR"; },
                   [&](const usp_operand&) { oss << "USP"; },
                   [&](const address_operand&) { oss << "[address operand]"; },
               },
        op);
    return oss.str();
}

location location_of(const statement& s)
{
    return std::visit([](const auto& st) { return st.loc; }, s);
}

static std::string mnemonic_string(const operation_statement& s)
{
    std::string res = s.operation->code;
    if (s.size != opsize::none) {
        res += '.';
        res += size_suffix(s.size);
    }
    return res;
}

static std::string operands_string(const operation_statement& s)
{
    std::string res;
    for (const auto& op : s.operands) {
        if (!res.empty())
            res += ", ";
        res += operand_string(op);
    }
    return res;
}

std::string statement_string(const statement& s)
{
    return std::visit(overloaded {
                          [](const label_statement& st) { return st.name + ":"; },
                          [](const comment_statement& st) { return "; " + st.text; },
                          [](const operation_statement& st) {
                              auto res = mnemonic_string(st);
                              if (!st.operands.empty())
                                  res += " " + operands_string(st);
                              return res;
                          },
                      },
        s);
}

std::string aligned_string(const statement& s)
{
    const auto* op = std::get_if<operation_statement>(&s);
    if (!op || op->operands.empty())
        return statement_string(s);
    auto res = mnemonic_string(*op);
    res.resize(std::max<size_t>(res.size() + 1, 8), ' ');
    return res + operands_string(*op);
}
