#include "chunk_reader.hpp"
#include "dump.hpp"
#include "payload.hpp"
#include "selection.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>
#include <argparse.hpp>

std::vector<uint8_t> read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Could not read file: " + filename);
    }
    return bytes;
}

void write_file(const std::string& filename, const std::vector<uint8_t>& bytes) {
    std::ofstream outfile(filename, std::ios::binary);
    if (!outfile.is_open()) {
        throw std::runtime_error("Could not open output file: " + filename);
    }
    outfile.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!outfile) {
        throw std::runtime_error("Could not write output file: " + filename);
    }
}

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("fujitape", "0.1.0", argparse::default_arguments::all);
    program.add_description("Read and convert Atari 8-bit cassette (CAS) images");

    program.add_argument("input")
        .help("The CAS file to read")
        .required();

    program.add_argument("--info")
        .help("Show file info and metadata (default if no other action)")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--to-bin")
        .help("Write the data chunks to a binary file")
        .metavar("OUTPUT");

    argparse::ArgumentParser dump_command("dump");
    dump_command.add_description("Dump chunk contents");

    dump_command.add_argument("--chunk")
        .help("Chunk selection, e.g. \"0\", \"1,3,5\", \"0-5\", \"1,3-7,10\" (default: all)");

    dump_command.add_argument("--hex")
        .help("Show hex output")
        .default_value(false)
        .implicit_value(true);

    dump_command.add_argument("--ascii")
        .help("Show ASCII output")
        .default_value(false)
        .implicit_value(true);

    program.add_subparser(dump_command);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string filename = program.get<std::string>("input");

    try {
        // The bytes stay in scope for as long as the reader looks at them
        const std::vector<uint8_t> image = read_file(filename);
        const std::vector<cas::Chunk> chunks = cas::parse(image);

        if (program.is_subcommand_used(dump_command)) {
            std::vector<size_t> indices;
            if (auto selection = dump_command.present("--chunk")) {
                indices = cas::parse_selection(*selection, chunks.size());
            } else {
                indices = cas::select_all(chunks.size());
            }

            cas::DumpOptions options;
            options.hex = dump_command.get<bool>("--hex");
            options.ascii = dump_command.get<bool>("--ascii");
            if (!options.hex && !options.ascii) {
                options.hex = true;
            }

            std::cout << cas::format_dump(chunks, indices, options);
        } else if (auto output = program.present("--to-bin")) {
            const auto binary = cas::to_byte_array(chunks);
            write_file(*output, binary);
            std::cout << "Wrote " << binary.size() << " bytes to " << *output << "\n";
        } else {
            std::cout << cas::format_info(filename, chunks);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
