#include <fstream>
#include <iostream>
#include <iterator>
#include "io.hpp"
#include "exceptions.hpp"
#include "zstr.hpp"

namespace {

template <typename T>
std::string read_stream(T& stream) {
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

}

bool is_stdio(const std::string& path) {
    return path == "-";
}

bool is_gzipped(const std::string& path) {
    return path.length() > 3 && path.substr(path.length() - 3, 3) == ".gz";
}

/* Read compressed or uncompressed input */
std::string read_input(const std::string& path) {
    if (is_stdio(path)) {
        auto text = read_stream(std::cin);
        if (std::cin.bad()) {
            throw InvalidFile("Cannot read from standard input");
        }
        return text;
    }
    {
        std::ifstream probe(path);
        if (!probe.good()) {
            throw InvalidFile("Cannot read from input file '" + path + "'");
        }
    }
    if (is_gzipped(path)) {
        try {
            zstr::ifstream ifs(path);
            return read_stream(ifs);
        } catch (const std::exception& e) {
            throw InvalidFile("Cannot decompress input file '" + path + "': " + e.what());
        }
    } else {
        std::ifstream ifs(path, std::ios::binary);
        auto text = read_stream(ifs);
        if (ifs.bad()) {
            throw InvalidFile("Error while reading input file '" + path + "'");
        }
        return text;
    }
}

void write_output(const std::string& path, const std::string& text) {
    if (path.empty() || is_stdio(path)) {
        std::cout.write(text.data(), text.size());
        std::cout.flush();
        if (!std::cout) {
            throw InvalidFile("Cannot write to standard output");
        }
        return;
    }
    if (is_gzipped(path)) {
        try {
            zstr::ofstream ofs(path);
            ofs.write(text.data(), text.size());
            ofs.flush();
            if (!ofs) {
                throw InvalidFile("Error while writing output file '" + path + "'");
            }
        } catch (const InvalidFile&) {
            throw;
        } catch (const std::exception& e) {
            throw InvalidFile("Cannot write to output file '" + path + "': " + e.what());
        }
    } else {
        std::ofstream ofs(path, std::ios::binary);
        if (!ofs) {
            throw InvalidFile("Cannot write to output file '" + path + "'");
        }
        ofs.write(text.data(), text.size());
        ofs.close();
        if (!ofs) {
            throw InvalidFile("Error while writing output file '" + path + "'");
        }
    }
}
