#include "commands.hpp"
#include "errors.hpp"

#include <iostream>
#include <string>
#include <argparse.hpp>

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("pngme", "0.1.0", argparse::default_arguments::all);
    program.add_description("Hide and recover messages in PNG chunks");

    argparse::ArgumentParser encode_command("encode");
    encode_command.add_description("Append a message chunk to a PNG file");
    encode_command.add_argument("file").help("The PNG file to read");
    encode_command.add_argument("type").help("Four-letter chunk type, e.g. ruSt");
    encode_command.add_argument("message").help("Text to store in the chunk");
    encode_command.add_argument("-o", "--output")
        .help("The output filename (default: overwrite the input file)")
        .default_value(std::string(""));

    argparse::ArgumentParser decode_command("decode");
    decode_command.add_description("Print the message stored in a chunk");
    decode_command.add_argument("file").help("The PNG file to read");
    decode_command.add_argument("type").help("Four-letter chunk type");

    argparse::ArgumentParser remove_command("remove");
    remove_command.add_description("Remove the first chunk of a type");
    remove_command.add_argument("file").help("The PNG file to rewrite");
    remove_command.add_argument("type").help("Four-letter chunk type");

    argparse::ArgumentParser print_command("print");
    print_command.add_description("List every chunk of a PNG file");
    print_command.add_argument("file").help("The PNG file to read");

    program.add_subparser(encode_command);
    program.add_subparser(decode_command);
    program.add_subparser(remove_command);
    program.add_subparser(print_command);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    try {
        if (program.is_subcommand_used(encode_command)) {
            auto filename = encode_command.get<std::string>("file");
            auto output = encode_command.get<std::string>("--output");
            pngme::encode(filename,
                          encode_command.get<std::string>("type"),
                          encode_command.get<std::string>("message"),
                          output);
            std::cout << "Message written to " << (output.empty() ? filename : output) << "\n";
        } else if (program.is_subcommand_used(decode_command)) {
            std::cout << pngme::decode(decode_command.get<std::string>("file"),
                                       decode_command.get<std::string>("type")) << "\n";
        } else if (program.is_subcommand_used(remove_command)) {
            auto type = remove_command.get<std::string>("type");
            pngme::remove(remove_command.get<std::string>("file"), type);
            std::cout << "Removed " << type << " chunk\n";
        } else if (program.is_subcommand_used(print_command)) {
            pngme::print_chunks(print_command.get<std::string>("file"), std::cout);
        } else {
            std::cerr << program;
            return 1;
        }
    } catch (const pngme::PngmeError& e) {
        std::cerr << "Error (" << pngme::to_string(e.kind()) << "): " << e.what() << "\n";
        return pngme::exit_code(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
