#include "cli_formats.hpp"
#include "image_model.hpp"
#include "summary.hpp"
#include <argparse.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace hexmill;

std::vector<uint8_t> read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }

    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// "-" writes to stdout.
void write_file(const std::string& filename, const std::vector<uint8_t>& data) {
    if (filename == "-") {
        std::cout.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        std::cout.flush();
        return;
    }

    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

void add_common_arguments(argparse::ArgumentParser& command) {
    command.add_argument("-s", "--word-size-bits")
        .help("Word size in number of bits")
        .default_value(std::string("8"));

    command.add_argument("-e", "--header-encoding")
        .help("Header encoding: utf-8, or none for raw bytes")
        .default_value(std::string("utf-8"));
}

void add_overwrite_argument(argparse::ArgumentParser& command) {
    command.add_argument("-O", "--overwrite")
        .help("Overwrite overlapping data segments")
        .default_value(false)
        .implicit_value(true);
}

void add_input_format_argument(argparse::ArgumentParser& command, const char* short_name) {
    command.add_argument(short_name, "--input-format")
        .help("Input format: auto, srec, ihex, ti_txt, verilog_vmem, elf or binary[,<address>]")
        .default_value(std::string("auto"));
}

ImageModel make_image(const argparse::ArgumentParser& command) {
    auto word_size_bits = cli::parse_number(command.get<std::string>("--word-size-bits"));
    auto header_codec = cli::parse_header_encoding(command.get<std::string>("--header-encoding"));
    return ImageModel(static_cast<size_t>(word_size_bits), header_codec);
}

// Returns the format the data was read as.
format::Input load(ImageModel& image,
                   const std::string& filename,
                   const std::optional<format::Input>& input_format,
                   bool overwrite) {
    auto data = read_file(filename);
    auto input = input_format ? *input_format : format::detect_format(data);
    image.add(input, data, overwrite);
    return input;
}

void run_info(const argparse::ArgumentParser& command) {
    auto input_format = cli::parse_input_format(command.get<std::string>("--input-format"));
    auto infiles = command.get<std::vector<std::string>>("infiles");
    bool first = true;

    for (const auto& infile : infiles) {
        auto image = make_image(command);
        load(image, infile, input_format, false);

        if (!first) {
            std::cout << '\n';
        }
        first = false;

        std::cout << info(image);

        auto overview = layout(image);
        if (!overview.empty()) {
            std::cout << '\n' << overview;
        }
    }
}

void run_convert(const argparse::ArgumentParser& command) {
    auto input_format = cli::parse_input_format(command.get<std::string>("--input-format"));
    auto output_format = cli::parse_output_format(command.get<std::string>("--output-format"));
    auto files = command.get<std::vector<std::string>>("files");
    bool overwrite = command.get<bool>("--overwrite");

    if (files.size() < 2) {
        throw std::runtime_error("convert needs at least one input file and an output file");
    }

    const std::string outfile = files.back();
    files.pop_back();

    auto image = make_image(command);

    for (const auto& infile : files) {
        load(image, infile, input_format, overwrite);
    }

    write_file(outfile, image.encode(output_format));
}

void run_dump(const argparse::ArgumentParser& command, const format::Output& output_format) {
    auto input_format = cli::parse_input_format(command.get<std::string>("--input-format"));
    auto infiles = command.get<std::vector<std::string>>("infiles");
    bool overwrite = command.get<bool>("--overwrite");
    auto image = make_image(command);

    for (const auto& infile : infiles) {
        load(image, infile, input_format, overwrite);
    }

    write_file("-", image.encode(output_format));
}

void run_fill(const argparse::ArgumentParser& command) {
    auto input_format = cli::parse_input_format(command.get<std::string>("--input-format"));
    auto infile = command.get<std::string>("infile");
    auto outfile = command.get<std::string>("outfile");
    auto image = make_image(command);
    auto input = load(image, infile, input_format, false);

    std::optional<uint64_t> max_words;
    if (auto value = command.present<std::string>("--max-words")) {
        max_words = cli::parse_number(*value);
    }

    auto value = cli::parse_number(command.get<std::string>("--value"));
    image.fill(cli::word_bytes(value, image.word_size_bytes()), max_words);

    write_file(outfile.empty() ? infile : outfile, image.encode(cli::output_for(input)));
}

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("hexmill", "0.1.0", argparse::default_arguments::all);
    program.add_description("Merge, convert and inspect memory images "
                            "(Motorola S-Records, Intel HEX, TI-TXT, Verilog VMEM, ELF and binary).");

    argparse::ArgumentParser info_command("info");
    info_command.add_description("Print general information about given file(s).");
    add_common_arguments(info_command);
    add_input_format_argument(info_command, "-I");
    info_command.add_argument("infiles")
        .help("One or more files")
        .nargs(argparse::nargs_pattern::at_least_one);

    argparse::ArgumentParser convert_command("convert");
    convert_command.add_description("Convert given file(s) to a single output file.");
    add_common_arguments(convert_command);
    add_overwrite_argument(convert_command);
    add_input_format_argument(convert_command, "-i");
    convert_command.add_argument("-o", "--output-format")
        .help("Output format: srec[,<data bytes>[,<address bits>]], ihex[,...], ti_txt, "
              "verilog_vmem, binary[,<minimum>[,<maximum>]], hexdump or array")
        .default_value(std::string("hexdump"));
    convert_command.add_argument("files")
        .help("Input file(s) followed by the output file, - for stdout")
        .nargs(argparse::nargs_pattern::at_least_one);

    std::vector<std::pair<std::string, format::Output>> dumps{
        {"as_srec", format::Srec{}},
        {"as_ihex", format::Ihex{}},
        {"as_ti_txt", format::TiTxt{}},
        {"as_verilog_vmem", format::VerilogVmem{}},
    };
    std::vector<std::unique_ptr<argparse::ArgumentParser>> dump_commands;

    for (const auto& [name, output] : dumps) {
        auto command = std::make_unique<argparse::ArgumentParser>(name);
        command->add_description("Print given file(s) as " + format::name(output) + ".");
        add_common_arguments(*command);
        add_overwrite_argument(*command);
        add_input_format_argument(*command, "-i");
        command->add_argument("infiles")
            .help("One or more files")
            .nargs(argparse::nargs_pattern::at_least_one);
        program.add_subparser(*command);
        dump_commands.push_back(std::move(command));
    }

    argparse::ArgumentParser fill_command("fill");
    fill_command.add_description("Fill empty space between segments.");
    add_common_arguments(fill_command);
    add_input_format_argument(fill_command, "-i");
    fill_command.add_argument("--value")
        .help("Value to fill with, one word")
        .default_value(std::string("0xff"));
    fill_command.add_argument("--max-words")
        .help("Only fill gaps of at most this many words");
    fill_command.add_argument("infile")
        .help("File to fill");
    fill_command.add_argument("outfile")
        .help("Output file, the input file when omitted")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(std::string(""));

    program.add_subparser(info_command);
    program.add_subparser(convert_command);
    program.add_subparser(fill_command);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    try {
        if (program.is_subcommand_used(info_command)) {
            run_info(info_command);
        } else if (program.is_subcommand_used(convert_command)) {
            run_convert(convert_command);
        } else if (program.is_subcommand_used(fill_command)) {
            run_fill(fill_command);
        } else {
            bool dumped = false;

            for (size_t i = 0; i < dumps.size(); ++i) {
                if (program.is_subcommand_used(*dump_commands[i])) {
                    run_dump(*dump_commands[i], dumps[i].second);
                    dumped = true;
                }
            }

            if (!dumped) {
                std::cerr << program;
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
