#ifndef FASTACLEAN_CMDLINE_HPP
#define FASTACLEAN_CMDLINE_HPP

#include <string>

struct CommandLineOptions {
    // Input/output
    std::string input_file_name;
    std::string output_file_name;
    bool write_to_stdout { true };
    bool verbose { false };
    bool quiet { false };

    // Cleaning
    int width { 0 };
    bool width_set { false };
    int n_threads { 1 };
    bool strict { false };
};

CommandLineOptions parse_command_line_arguments(int argc, char **argv);

#endif
