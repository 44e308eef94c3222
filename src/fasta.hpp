#ifndef FASTACLEAN_FASTA_HPP
#define FASTACLEAN_FASTA_HPP

#include <cstddef>
#include <string>
#include <vector>

/*
 * A FASTA record as it appears in the (normalized) input: the header line
 * including the '>' marker and the raw sequence lines that follow it.
 */
struct Record {
    std::string header;
    std::vector<std::string> lines;

    /* Total number of raw sequence characters */
    size_t raw_length() const;
};

/*
 * Split normalized text into records. Lines before the first header are
 * discarded and empty lines are not sequence lines. Never fails.
 */
std::vector<Record> segment_records(const std::string& normalized);

/*
 * Reject input that segment_records() would silently accept: non-whitespace
 * content before the first header and '>' inside a sequence line.
 * Throws InvalidFasta.
 */
void check_strict_fasta(const std::string& normalized);

/* Concatenate the record's lines, uppercase and keep only A, C, G and T */
std::string filter_sequence(const Record& record);

/* Number of characters in *s* that filter_sequence() would keep */
size_t count_nucleotides(const std::string& s);

/* ASCII uppercase of a single character */
inline char to_upper(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c & ~32) : c;
}

inline bool is_nucleotide(char c) {
    switch (to_upper(c)) {
        case 'A':
        case 'C':
        case 'G':
        case 'T':
            return true;
        default:
            return false;
    }
}

#endif
