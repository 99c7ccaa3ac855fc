#include "asm.h"
#include "encoder.h"
#include "error_collector.h"
#include "lexer.h"
#include "parser.h"
#include "ioutil.h"
#include <algorithm>
#include <ostream>
#include <string>

assembly assemble(const program& prog, error_collector& errors)
{
    assembly res;
    res.statement_offsets.reserve(prog.statements.size());
    for (const auto& s : prog.statements) {
        res.statement_offsets.push_back(static_cast<uint32_t>(res.code.size()));
        const auto* op = std::get_if<operation_statement>(&s);
        if (!op)
            continue;
        try {
            for (const auto w : encode(*op)) {
                res.code.push_back(0);
                res.code.push_back(0);
                put_u16(&res.code[res.code.size() - 2], w);
            }
        } catch (const assembler_error& e) {
            errors.add(e.where().is_invalid() ? op->loc : e.where(), e.what());
        }
    }
    return res;
}

std::vector<uint8_t> assemble_text(const char* text, error_collector& errors)
{
    const auto tokens = tokenize(text, errors);
    const auto prog = parse(tokens, errors);
    auto res = assemble(prog, errors);
    if (!errors.empty())
        return {};
    return std::move(res.code);
}

std::vector<std::pair<label_statement, uint32_t>> label_addresses(const program& prog, const assembly& as, uint32_t org)
{
    std::vector<std::pair<label_statement, uint32_t>> res;
    for (const auto& [label, index] : prog.labels) {
        if (index >= as.statement_offsets.size())
            INTERNAL_ERROR("Label " << label.name << " bound to statement " << index << " of " << as.statement_offsets.size());
        res.push_back({ label, org + as.statement_offsets[index] });
    }
    return res;
}

void write_listing(std::ostream& os, const program& prog, const assembly& as, uint32_t org)
{
    std::vector<std::vector<const label_statement*>> labels_at(prog.statements.size());
    for (const auto& [label, index] : prog.labels)
        labels_at[index].push_back(&label);

    for (size_t i = 0; i < prog.statements.size(); ++i) {
        const uint32_t start = as.statement_offsets[i];
        const uint32_t end = i + 1 < prog.statements.size() ? as.statement_offsets[i + 1] : static_cast<uint32_t>(as.code.size());

        for (const auto* l : labels_at[i])
            os << hexfmt(org + start) << std::string(18, ' ') << l->name << ":\n";

        const auto& s = prog.statements[i];
        if (std::holds_alternative<comment_statement>(s)) {
            os << std::string(26, ' ') << statement_string(s) << "\n";
            continue;
        }

        std::string words;
        for (uint32_t ofs = start; ofs + 1 < end; ofs += 2) {
            if (!words.empty())
                words += ' ';
            words += hexstring(get_u16(&as.code[ofs]));
        }
        words.resize(std::max<size_t>(words.size(), 15), ' ');
        os << hexfmt(org + start) << "  " << words << " " << aligned_string(s) << "\n";
    }
}
