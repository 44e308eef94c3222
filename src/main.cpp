#include <iostream>
#include <string>
#include <filesystem>
#include <iomanip>
#include <cstdlib>

#include "exceptions.hpp"
#include "cmdline.hpp"
#include "io.hpp"
#include "reflow.hpp"
#include "statistics.hpp"
#include "logger.hpp"
#include "timer.hpp"
#include "version.hpp"
#include "buildconfig.hpp"


static Logger& logger = Logger::get();

void warn_if_no_optimizations() {
    if (std::string(CMAKE_BUILD_TYPE) == "Debug") {
        logger.info() << "\n    ***** Binary was compiled without optimizations - this will be slow on large files *****\n\n";
    }
}

/* Refuse to overwrite the input with the output */
void check_distinct_files(const CommandLineOptions& opt) {
    if (opt.write_to_stdout || is_stdio(opt.input_file_name)) {
        return;
    }
    std::error_code ec;
    if (std::filesystem::equivalent(opt.input_file_name, opt.output_file_name, ec)) {
        throw BadParameter("Input and output must not be the same file");
    }
}

CleaningParameters cleaning_parameters(const CommandLineOptions& opt) {
    CleaningParameters parameters;
    if (opt.width_set) {
        if (opt.width <= 0) {
            throw BadParameter("Line width (-w) must be positive");
        }
        parameters.line_width = static_cast<size_t>(opt.width);
    }
    if (opt.n_threads <= 0) {
        throw BadParameter("Number of threads (-t) must be positive");
    }
    parameters.n_threads = opt.n_threads;
    parameters.strict = opt.strict;
    return parameters;
}

void log_statistics(const CleaningStatistics& statistics) {
    if (statistics.line_width) {
        logger.info() << (statistics.width_inferred ? "Inferred" : "Using")
            << " line width " << *statistics.line_width << std::endl;
    } else {
        logger.warning() << "No sequence lines found; line width is undefined" << std::endl;
    }
    if (statistics.width_inferred && statistics.line_width
        && statistics.width_line_kept != *statistics.line_width) {
        logger.warning()
            << "The first sequence line contains " << (*statistics.line_width - statistics.width_line_kept)
            << " character(s) other than A, C, G, T; output lines are " << *statistics.line_width
            << " characters wide" << std::endl;
    }
    if (statistics.n_dropped > 0) {
        logger.warning() << "Removed " << statistics.n_dropped
            << " character(s) other than A, C, G, T" << std::endl;
    }
    logger.info() << "Wrote " << statistics.n_records << " record"
        << (statistics.n_records != 1 ? "s" : "") << std::endl;
    logger.debug()
        << "Records without sequence:  " << std::setw(12) << statistics.n_empty_records << std::endl
        << "Input sequence lines:      " << std::setw(12) << statistics.n_raw_lines << std::endl
        << "Input sequence characters: " << std::setw(12) << statistics.n_raw_chars << std::endl
        << "Kept characters:           " << std::setw(12) << statistics.n_kept << std::endl
        << "Output lines:              " << std::setw(12) << statistics.n_output_lines << std::endl
        << "Time normalizing line breaks: " << statistics.tot_normalize.count() << " s" << std::endl
        << "Time splitting records: " << statistics.tot_segment.count() << " s" << std::endl
        << "Time re-wrapping: " << statistics.tot_render.count() << " s" << std::endl;
}

int run_fastaclean(int argc, char **argv) {
    auto opt = parse_command_line_arguments(argc, argv);

    logger.set_level(opt.verbose ? LOG_DEBUG : (opt.quiet ? LOG_WARNING : LOG_INFO));
    logger.info() << std::setprecision(2) << std::fixed;
    logger.info() << "This is fastaclean " << version_string() << '\n';
    logger.debug() << "Build type: " << CMAKE_BUILD_TYPE << '\n';
    warn_if_no_optimizations();

    auto parameters = cleaning_parameters(opt);
    check_distinct_files(opt);
    logger.debug() << "Using " << parameters.n_threads << " thread"
        << (parameters.n_threads != 1 ? "s" : "") << std::endl;

    Timer read_timer;
    logger.info() << "Reading " << (is_stdio(opt.input_file_name) ? "standard input" : opt.input_file_name) << std::endl;
    auto text = read_input(opt.input_file_name);
    logger.info() << "Read " << text.size() << " bytes in " << read_timer.elapsed() << " s" << std::endl;

    Timer clean_timer;
    CleaningStatistics statistics;
    auto cleaned = clean_fasta(text, parameters, statistics);
    logger.info() << "Cleaned in " << clean_timer.elapsed() << " s" << std::endl;
    log_statistics(statistics);

    logger.info() << "Writing " << (opt.write_to_stdout ? "standard output" : opt.output_file_name) << std::endl;
    write_output(opt.write_to_stdout ? "" : opt.output_file_name, cleaned);
    logger.info() << "Done!\n";

    return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    try {
        return run_fastaclean(argc, argv);
    } catch (BadParameter& e) {
        logger.error() << "A parameter is invalid: " << e.what() << std::endl;
    } catch (const std::runtime_error& e) {
        logger.error() << "fastaclean: " << e.what() << std::endl;
    }
    return EXIT_FAILURE;
}
