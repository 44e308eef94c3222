#ifndef FASTACLEAN_IO_HPP
#define FASTACLEAN_IO_HPP

#include <string>

/* True if *path* is standard input/output ("-") */
bool is_stdio(const std::string& path);

bool is_gzipped(const std::string& path);

/*
 * Read a whole (optionally gzip-compressed) file into memory.
 * Reads standard input if path is "-". Throws InvalidFile.
 */
std::string read_input(const std::string& path);

/*
 * Write *text* to a file, gzip-compressed if the path ends in ".gz".
 * Writes to standard output if path is empty or "-". Throws InvalidFile.
 */
void write_output(const std::string& path, const std::string& text);

#endif
