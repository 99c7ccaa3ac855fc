#include <iostream>
#include <string>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include "asm.h"
#include "debug.h"
#include "error_collector.h"
#include "ioutil.h"
#include "lexer.h"
#include "parser.h"

enum class output_format {
    bin,
    header,
    listing,
};

struct command_line_arguments {
    output_format fmt = output_format::bin;
    const char* input_file = nullptr;
    std::string output_file;
    uint32_t org = 0;
    uint32_t debug_flags = 0;
    bool help = false;
};

constexpr const char* usage_text = "Usage: m68kasm [-ofmt bin/header/listing] input [-o output] [-org address] [-debug tokens,parse,encode/all] [-help]\n";

[[noreturn]] void usage(const std::string& err)
{
    throw std::runtime_error { err + "\n\n" + usage_text };
}

const char* default_ext(output_format fmt)
{
    switch (fmt) {
    case output_format::bin: return "bin";
    case output_format::header: return "h";
    case output_format::listing: return "lst";
    }
    return "bin";
}

command_line_arguments parse_command_line_arguments(int argc, char* argv[])
{
    command_line_arguments args;

    for (int i = 1; i < argc; ++i) {
        if (!strcmp(argv[i], "-ofmt")) {
            ++i;
            if (i == argc)
                usage("Argument missing to -ofmt");
            if (!strcmp(argv[i], "bin")) {
                args.fmt = output_format::bin;
                continue;
            } else if (!strcmp(argv[i], "header")) {
                args.fmt = output_format::header;
                continue;
            } else if (!strcmp(argv[i], "listing")) {
                args.fmt = output_format::listing;
                continue;
            }
            usage("Invalid output format");
        } else if (!strcmp(argv[i], "-o")) {
            ++i;
            if (i == argc)
                usage("Argument missing to -o");
            if (!args.output_file.empty())
                usage("Multiple output files specified");
            args.output_file = argv[i];
            continue;
        } else if (!strcmp(argv[i], "-org")) {
            ++i;
            if (i == argc)
                usage("Argument missing to -org");
            auto res = from_hex(argv[i]);
            if (!res.first)
                usage("Invalid argument to -org");
            args.org = res.second;
            continue;
        } else if (!strcmp(argv[i], "-debug")) {
            ++i;
            if (i == argc)
                usage("Argument missing to -debug");
            args.debug_flags = debug_flags_from_string(argv[i]);
            continue;
        } else if (!strcmp(argv[i], "-help")) {
            args.help = true;
            return args;
        }
        if (!args.input_file)
            args.input_file = argv[i];
        else
            usage("Invalid argument: " + std::string { argv[i] });
    }

    if (!args.input_file)
        usage("Input missing");

    return args;
}

int main(int argc, char* argv[])
{
    try {
        auto args = parse_command_line_arguments(argc, argv);
        if (args.help) {
            std::cout << usage_text;
            return 0;
        }
        debug_flags = args.debug_flags;

        const char* input_file = args.input_file;
        const char* input_file_end = input_file + strlen(input_file);
        const char* input_fname = input_file_end;
        while (input_fname > input_file && input_fname[-1] != '\\' && input_fname[-1] != '/')
            --input_fname;

        const char* basename = strchr(input_fname, '.');
        if (!basename)
            basename = input_file_end;
        if (args.output_file.empty())
            args.output_file = std::string(input_file, basename - input_file) + "." + default_ext(args.fmt);

        auto input = read_file(input_file);
        input.push_back(0);

        error_collector errors;
        const auto tokens = tokenize(reinterpret_cast<const char*>(&input[0]), errors);
        const auto prog = parse(tokens, errors);
        const auto as = assemble(prog, errors);
        if (!errors.empty()) {
            for (const auto& d : errors.errors())
                std::cerr << input_file << ":" << d << "\n";
            return 1;
        }

        std::ofstream out { args.output_file, std::ofstream::binary };
        if (!out || !out.is_open())
            throw std::runtime_error { "Could not create " + args.output_file };

        const auto& code = as.code;
        switch (args.fmt) {
        case output_format::bin:
            out.write(reinterpret_cast<const char*>(code.data()), code.size());
            break;
        case output_format::header:
            out << "const unsigned char " << std::string(input_fname, basename - input_fname) << "[" << code.size() << "] = {\n";
            for (size_t i = 0; i < code.size(); ++i) {
                out << "0x" << hexfmt(code[i]) << ",";
                if (i % 16 == 15 || i == code.size() - 1)
                    out << '\n';
                else
                    out << ' ';
            }
            out << "};\n";
            break;
        case output_format::listing:
            write_listing(out, prog, as, args.org);
            break;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
