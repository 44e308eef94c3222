#include <cctype>
#include <sstream>
#include "fasta.hpp"
#include "exceptions.hpp"

size_t Record::raw_length() const {
    size_t length = 0;
    for (auto& line : lines) {
        length += line.size();
    }
    return length;
}

namespace {

bool is_header(const std::string& line) {
    return !line.empty() && line[0] == '>';
}

bool is_blank(const std::string& line) {
    for (auto c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

/* Call f(line, line_num) for each '\n'-separated line of *text* */
template <typename F>
void for_each_line(const std::string& text, F f) {
    size_t line_num = 0;
    std::string::size_type start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        line_num++;
        f(text.substr(start, end - start), line_num);
        start = end + 1;
    }
}

}

std::vector<Record> segment_records(const std::string& normalized) {
    std::vector<Record> records;
    for_each_line(normalized, [&records](std::string line, size_t) {
        if (is_header(line)) {
            records.push_back(Record{std::move(line), {}});
        } else if (!line.empty() && !records.empty()) {
            records.back().lines.push_back(std::move(line));
        }
    });
    return records;
}

void check_strict_fasta(const std::string& normalized) {
    bool seen_header = false;
    for_each_line(normalized, [&seen_header](const std::string& line, size_t line_num) {
        if (is_header(line)) {
            seen_header = true;
            return;
        }
        if (!seen_header) {
            if (!is_blank(line)) {
                std::ostringstream oss;
                oss << "FASTA file must begin with '>' character, found '"
                    << line << "' on line " << line_num;
                throw InvalidFasta(oss.str());
            }
        } else if (line.find('>') != std::string::npos) {
            std::ostringstream oss;
            oss << "Encountered '>' within sequence on line " << line_num;
            throw InvalidFasta(oss.str());
        }
    });
}

std::string filter_sequence(const Record& record) {
    std::string filtered;
    filtered.reserve(record.raw_length());
    for (auto& line : record.lines) {
        for (auto c : line) {
            if (is_nucleotide(c)) {
                filtered.push_back(to_upper(c));
            }
        }
    }
    return filtered;
}

size_t count_nucleotides(const std::string& s) {
    size_t n = 0;
    for (auto c : s) {
        n += is_nucleotide(c);
    }
    return n;
}
