#ifndef FASTACLEAN_REFLOW_HPP
#define FASTACLEAN_REFLOW_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "fasta.hpp"
#include "statistics.hpp"

struct CleaningParameters {
    std::optional<size_t> line_width; // overrides inference if set
    int n_threads{1};
    bool strict{false};
};

/*
 * Length of the first raw sequence line of the first record that has one.
 * Empty if no record has a sequence line.
 */
std::optional<size_t> infer_line_width(const std::vector<Record>& records);

/*
 * Split *stream* into lines of exactly *width* characters; the last line may
 * be shorter. An empty stream gives no lines. Without a width (or with
 * width 0) the whole stream is returned as a single line, even if empty.
 */
std::vector<std::string> rechunk(const std::string& stream, std::optional<size_t> width);

/* Append the header and the re-chunked, filtered sequence of one record */
void render_record(std::string& out, const Record& record, std::optional<size_t> width);

/*
 * Render all records in order. With n_threads > 1, contiguous batches of
 * records are rendered concurrently and concatenated in order; the result
 * does not depend on the number of threads.
 */
std::string render_document(
    const std::vector<Record>& records, std::optional<size_t> width, int n_threads = 1
);

/* Normalize, segment, infer the width and render */
std::string clean_fasta(
    const std::string& text, const CleaningParameters& parameters, CleaningStatistics& statistics
);

#endif
