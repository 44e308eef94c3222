#ifndef FASTACLEAN_STATISTICS_HPP
#define FASTACLEAN_STATISTICS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

struct CleaningStatistics {
    std::chrono::duration<double> tot_normalize{0};
    std::chrono::duration<double> tot_segment{0};
    std::chrono::duration<double> tot_render{0};

    uint64_t n_records{0};
    uint64_t n_empty_records{0}; // records without any sequence line
    uint64_t n_raw_lines{0};
    uint64_t n_raw_chars{0};
    uint64_t n_kept{0};
    uint64_t n_dropped{0};
    uint64_t n_output_lines{0};

    std::optional<size_t> line_width;
    bool width_inferred{false};
    uint64_t width_line_kept{0}; // kept characters on the line the width was inferred from
};

#endif
