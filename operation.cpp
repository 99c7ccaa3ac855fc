#include "operation.h"
#include "error_collector.h"
#include <unordered_map>

namespace {

std::vector<operation_configuration> configurations(operation op)
{
    switch (op) {
    case operation::ADD:
    case operation::SUB:
        return {
            { opsize_mask_b, 2, { ot_data, ot_dn } },
            { opsize_mask_wl, 2, { ot_all, ot_dn } },
            { opsize_mask_bwl, 2, { ot_dn, ot_memory_alterable } },
            { opsize_mask_wl, 2, { ot_all, ot_an } }, // ADDA/SUBA
        };
    case operation::AND:
    case operation::OR:
        return {
            { opsize_mask_bwl, 2, { ot_data, ot_dn } },
            { opsize_mask_bwl, 2, { ot_dn, ot_memory_alterable } },
        };
    case operation::CMP:
        return {
            { opsize_mask_b, 2, { ot_data, ot_dn } },
            { opsize_mask_wl, 2, { ot_all, ot_dn } },
            { opsize_mask_wl, 2, { ot_all, ot_an } }, // CMPA
        };
    case operation::EOR:
        return {
            { opsize_mask_bwl, 2, { ot_dn, ot_data_alterable } },
        };
    case operation::CLR:
    case operation::NEG:
    case operation::NEGX:
    case operation::NOT:
    case operation::TST:
        return {
            { opsize_mask_bwl, 1, { ot_data_alterable } },
        };
    case operation::EXT:
        return {
            { opsize_mask_wl, 1, { ot_dn } },
        };
    case operation::SWAP:
        return {
            { opsize_mask_w, 1, { ot_dn } },
        };
    case operation::ILLEGAL:
    case operation::NOP:
    case operation::RESET:
    case operation::RTE:
    case operation::RTR:
    case operation::RTS:
    case operation::TRAPV:
        return {
            { opsize_mask_none, 0, {} },
        };
    case operation::JMP:
    case operation::JSR:
        return {
            { opsize_mask_none, 1, { ot_control } },
        };
    case operation::PEA:
        return {
            { opsize_mask_l, 1, { ot_control } },
        };
    case operation::LEA:
        return {
            { opsize_mask_l, 2, { ot_control, ot_an } },
        };
    case operation::ADDQ:
    case operation::SUBQ:
        return {
            { opsize_mask_b, 2, { ot_immediate, ot_data_alterable } },
            { opsize_mask_wl, 2, { ot_immediate, ot_alterable } },
        };
    case operation::MOVEQ:
        return {
            { opsize_mask_l, 2, { ot_immediate, ot_dn } },
        };
    case operation::MOVE:
        return {
            { opsize_mask_b, 2, { ot_data, ot_data_alterable } },
            { opsize_mask_wl, 2, { ot_all, ot_alterable } }, // Includes MOVEA
            { opsize_mask_w, 2, { ot_data, ot_ccr } },
            { opsize_mask_w, 2, { ot_data, ot_sr } },
            { opsize_mask_w, 2, { ot_sr, ot_data_alterable } },
            { opsize_mask_l, 2, { ot_usp, ot_an } },
            { opsize_mask_l, 2, { ot_an, ot_usp } },
        };
    }
    INTERNAL_ERROR("No configurations for operation " << static_cast<int>(op));
}

std::string join_list(const std::vector<std::string>& items)
{
    std::string res;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i)
            res += i + 1 == items.size() ? " and " : ", ";
        res += items[i];
    }
    return res;
}

std::string configuration_string(const operation_configuration& conf)
{
    if (!conf.num_operands)
        return "(no operands)";
    std::string res;
    for (unsigned i = 0; i < conf.num_operands; ++i) {
        if (i)
            res += ", ";
        res += operand_types_string(conf.operand_types[i]);
    }
    return res;
}

}

bool operation_configuration::accepts(const std::vector<operand>& operands) const
{
    if (operands.size() != num_operands)
        return false;
    for (unsigned i = 0; i < num_operands; ++i) {
        if (!(operand_types[i] & operand_type_mask(type_of(operands[i]))))
            return false;
    }
    return true;
}

const std::vector<operation_info>& operation_table()
{
    static const std::vector<operation_info> table = {
#define OPERATION_INFO(name, def_size) { operation::name, #name, opsize::def_size, configurations(operation::name) },
        OPERATIONS(OPERATION_INFO)
#undef OPERATION_INFO
    };
    return table;
}

const operation_info& operation_info_for(operation op)
{
    const auto& table = operation_table();
    const auto idx = static_cast<size_t>(op);
    if (idx >= table.size() || table[idx].op != op)
        INTERNAL_ERROR("Operation table out of order for " << static_cast<int>(op));
    return table[idx];
}

const operation_info* find_operation(const std::string& code)
{
    static const std::unordered_map<std::string, const operation_info*> code_map = [] {
        std::unordered_map<std::string, const operation_info*> m;
        for (const auto& info : operation_table())
            m[info.code] = &info;
        return m;
    }();
    auto it = code_map.find(code);
    return it == code_map.end() ? nullptr : it->second;
}

opsize implied_size(const operation_info& info, const std::vector<operand>& operands)
{
    const operation_configuration* only_match = nullptr;
    unsigned matches = 0;
    for (const auto& conf : info.configurations) {
        if (!conf.accepts(operands))
            continue;
        if (conf.accepts(info.default_size))
            return info.default_size;
        only_match = &conf;
        ++matches;
    }
    if (matches == 1) {
        for (const auto size : { opsize::none, opsize::b, opsize::w, opsize::l }) {
            if (only_match->sizes == opsize_mask(size))
                return size;
        }
    }
    return info.default_size;
}

const operation_configuration& ensure_matching_configuration(const operation_info& info, opsize size, const std::vector<operand>& operands)
{
    std::vector<const operation_configuration*> size_matching;
    uint8_t supported_sizes = 0;
    for (const auto& conf : info.configurations) {
        supported_sizes |= conf.sizes;
        if (conf.accepts(size))
            size_matching.push_back(&conf);
    }

    if (size_matching.empty()) {
        if (supported_sizes == opsize_mask_none)
            ASSEMBLER_ERROR("The operation " << info.code << " doesn't take a size, but you tried to use it with the size " << size_string(size) << ".");
        ASSEMBLER_ERROR("The operation " << info.code << " only supports the sizes " << sizes_string(supported_sizes) << ", but you tried to use it with the size " << size_string(size) << ". That doesn't work.");
    }

    const operation_configuration* match = nullptr;
    for (const auto* conf : size_matching) {
        if (!conf->accepts(operands))
            continue;
        if (match)
            INTERNAL_ERROR("More than one configuration of " << info.code << " matches size " << size_string(size));
        match = conf;
    }

    if (!match) {
        std::ostringstream oss;
        if (operands.empty()) {
            oss << "You provided no operands.";
        } else {
            oss << "You provided operands of the types ";
            for (size_t i = 0; i < operands.size(); ++i)
                oss << (i ? ", " : "") << operand_type_string(type_of(operands[i]));
            oss << ".";
        }
        oss << " But the " << info.code << " operation on size " << size_string(size) << " doesn't accept operands of these types. Here are all the combinations that are accepted:";
        for (const auto* conf : size_matching)
            oss << "\n- " << configuration_string(*conf);
        throw assembler_error { oss.str() };
    }

    return *match;
}

std::string sizes_string(uint8_t sizes)
{
    std::vector<std::string> names;
    for (const auto size : { opsize::none, opsize::b, opsize::w, opsize::l }) {
        if (sizes & opsize_mask(size))
            names.push_back(size_string(size));
    }
    return join_list(names);
}

std::string operand_types_string(uint32_t types)
{
    std::string res;
    for (auto t = operand_type::dn; t <= operand_type::address; t = static_cast<operand_type>(static_cast<int>(t) + 1)) {
        if (!(types & operand_type_mask(t)))
            continue;
        if (!res.empty())
            res += "/";
        res += operand_type_string(t);
    }
    return res;
}
