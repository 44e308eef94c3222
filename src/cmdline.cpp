#include "cmdline.hpp"

#include <cstdlib>
#include <iostream>
#include <args.hxx>
#include "version.hpp"

class Version {};

CommandLineOptions parse_command_line_arguments(int argc, char **argv) {

    args::ArgumentParser parser(
        "fastaclean " + version_string() + "\n\n"
        "Uppercase FASTA sequences, remove all characters other than A, C, G "
        "and T, and re-wrap the sequences to the line width of the input. "
        "Header lines are copied unchanged."
    );
    parser.helpParams.showTerminator = false;
    parser.helpParams.helpindent = 20;
    parser.helpParams.width = 90;
    parser.helpParams.programName = "fastaclean";
    parser.helpParams.shortSeparator = " ";

    args::HelpFlag help(parser, "help", "Print help and exit", {'h', "help"});
    args::ActionFlag version(parser, "version", "Print version and exit", {"version"}, []() { throw Version(); });

    args::Group io(parser, "Input/output:");
    args::Flag v(parser, "v", "Verbose output", {'v'});
    args::Flag q(parser, "q", "Only report warnings and errors", {'q'});

    args::Group cleaning(parser, "Cleaning:");
    args::ValueFlag<int> w(parser, "INT", "Line width of the output. Inferred from the first sequence line if not given", {'w', "width"});
    args::ValueFlag<int> threads(parser, "INT", "Number of threads used for re-wrapping [1]", {'t', "threads"});
    args::Flag strict(parser, "strict", "Fail on text before the first header and on '>' within sequence lines", {"strict"});

    args::Positional<std::string> input_filename(parser, "input", "Input FASTA file, optionally gzip compressed ('-' for stdin)", args::Options::Required);
    args::Positional<std::string> output_filename(parser, "output", "Output FASTA file, overwritten if it exists. Compressed if it ends in .gz [stdout]");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Completion& e) {
        std::cout << e.what();
        exit(EXIT_SUCCESS);
    }
    catch (const args::Help&) {
        std::cout << parser;
        exit(EXIT_SUCCESS);
    }
    catch (const Version& e) {
        std::cout << version_string() << std::endl;
        exit(EXIT_SUCCESS);
    }
    catch (const args::Error& e) {
        std::cerr << parser;
        std::cerr << "Error: " << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    CommandLineOptions opt;

    // Input/output
    if (v) { opt.verbose = true; }
    if (q) { opt.quiet = true; }
    opt.input_file_name = args::get(input_filename);
    if (output_filename && args::get(output_filename) != "-") {
        opt.output_file_name = args::get(output_filename);
        opt.write_to_stdout = false;
    }

    // Cleaning
    if (w) { opt.width = args::get(w); opt.width_set = true; }
    if (threads) { opt.n_threads = args::get(threads); }
    if (strict) { opt.strict = true; }

    if (opt.verbose && opt.quiet) {
        std::cerr << "Error: Options -v and -q cannot be used at the same time" << std::endl;
        exit(EXIT_FAILURE);
    }

    return opt;
}
