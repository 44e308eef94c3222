#include <algorithm>
#include <functional>
#include <thread>
#include "reflow.hpp"
#include "normalize.hpp"
#include "exceptions.hpp"
#include "timer.hpp"

std::optional<size_t> infer_line_width(const std::vector<Record>& records) {
    for (auto& record : records) {
        if (!record.lines.empty()) {
            return record.lines.front().size();
        }
    }
    return std::nullopt;
}

std::vector<std::string> rechunk(const std::string& stream, std::optional<size_t> width) {
    if (!width || *width == 0) {
        return {stream};
    }
    std::vector<std::string> lines;
    lines.reserve((stream.size() + *width - 1) / *width);
    for (size_t pos = 0; pos < stream.size(); pos += *width) {
        lines.push_back(stream.substr(pos, *width));
    }
    return lines;
}

void render_record(std::string& out, const Record& record, std::optional<size_t> width) {
    out += record.header;
    out += '\n';
    for (auto& line : rechunk(filter_sequence(record), width)) {
        out += line;
        out += '\n';
    }
}

namespace {

void render_batch(
    const std::vector<Record>& records,
    size_t start,
    size_t end,
    std::optional<size_t> width,
    std::string& out
) {
    for (size_t i = start; i < end; ++i) {
        render_record(out, records[i], width);
    }
}

}

std::string render_document(
    const std::vector<Record>& records, std::optional<size_t> width, int n_threads
) {
    if (n_threads <= 1 || records.size() < 2) {
        std::string out;
        render_batch(records, 0, records.size(), width, out);
        return out;
    }

    size_t n_batches = std::min(static_cast<size_t>(n_threads), records.size());
    size_t batch_size = (records.size() + n_batches - 1) / n_batches;
    std::vector<std::string> outputs(n_batches);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < n_batches; ++i) {
        size_t start = std::min(i * batch_size, records.size());
        size_t end = std::min(start + batch_size, records.size());
        workers.emplace_back(
            render_batch, std::cref(records), start, end, width, std::ref(outputs[i])
        );
    }
    for (auto& worker : workers) {
        worker.join();
    }

    size_t total_size = 0;
    for (auto& output : outputs) {
        total_size += output.size();
    }
    std::string out;
    out.reserve(total_size);
    for (auto& output : outputs) {
        out += output;
    }
    return out;
}

std::string clean_fasta(
    const std::string& text, const CleaningParameters& parameters, CleaningStatistics& statistics
) {
    if (parameters.line_width && *parameters.line_width == 0) {
        throw BadParameter("Line width must be positive");
    }
    if (parameters.n_threads < 1) {
        throw BadParameter("Number of threads must be positive");
    }

    Timer timer;
    auto normalized = normalize_line_breaks(text);
    statistics.tot_normalize += timer.lap();

    if (parameters.strict) {
        check_strict_fasta(normalized);
    }
    auto records = segment_records(normalized);
    statistics.tot_segment += timer.lap();

    statistics.n_records += records.size();
    for (auto& record : records) {
        if (record.lines.empty()) {
            statistics.n_empty_records++;
        }
        statistics.n_raw_lines += record.lines.size();
        for (auto& line : record.lines) {
            auto kept = count_nucleotides(line);
            statistics.n_raw_chars += line.size();
            statistics.n_kept += kept;
            statistics.n_dropped += line.size() - kept;
        }
    }

    std::optional<size_t> width;
    if (parameters.line_width) {
        width = parameters.line_width;
    } else {
        width = infer_line_width(records);
        statistics.width_inferred = true;
        auto first = std::find_if(records.begin(), records.end(),
            [](const Record& r) { return !r.lines.empty(); });
        if (first != records.end()) {
            statistics.width_line_kept = count_nucleotides(first->lines.front());
        }
    }
    statistics.line_width = width;

    auto out = render_document(records, width, parameters.n_threads);
    statistics.tot_render += timer.lap();
    statistics.n_output_lines += std::count(out.begin(), out.end(), '\n');
    return out;
}
