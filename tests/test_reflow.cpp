#include <algorithm>
#include <vector>
#include <string>
#include "doctest.h"
#include "reflow.hpp"
#include "normalize.hpp"

TEST_CASE("infer_line_width") {
    CHECK(!infer_line_width({}));
    CHECK(!infer_line_width({Record{">a", {}}, Record{">b", {}}}));
    CHECK(infer_line_width({Record{">a", {"ACGTA", "CG"}}}) == 5);
    CHECK(infer_line_width({Record{">a", {}}, Record{">b", {"AC-GT", "ACGTACGT"}}, Record{">c", {"A"}}}) == 5);
}

TEST_CASE("rechunk") {
    using lines = std::vector<std::string>;
    CHECK(rechunk("", 3) == lines{});
    CHECK(rechunk("A", 3) == lines{"A"});
    CHECK(rechunk("ACG", 3) == lines{"ACG"});
    CHECK(rechunk("ACGT", 3) == lines{"ACG", "T"});
    CHECK(rechunk("ACGTAC", 3) == lines{"ACG", "TAC"});
    CHECK(rechunk("ACGT", 1) == lines{"A", "C", "G", "T"});
    CHECK(rechunk("ACGT", 100) == lines{"ACGT"});
}

TEST_CASE("rechunk without a usable width emits a single line") {
    using lines = std::vector<std::string>;
    CHECK(rechunk("ACGT", std::nullopt) == lines{"ACGT"});
    CHECK(rechunk("ACGT", 0) == lines{"ACGT"});
    CHECK(rechunk("", std::nullopt) == lines{""});
}

TEST_CASE("rechunk conserves characters") {
    std::string stream{"ACGTTGCAACGGTACCATGACGTAGCTAGCATCGATCGA"};
    for (size_t width = 1; width <= stream.size() + 1; ++width) {
        auto lines = rechunk(stream, width);
        std::string joined;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i + 1 < lines.size()) {
                CHECK(lines[i].size() == width);
            } else {
                CHECK(lines[i].size() >= 1);
                CHECK(lines[i].size() <= width);
            }
            joined += lines[i];
        }
        CHECK(joined == stream);
    }
}

TEST_CASE("render_record") {
    std::string out;
    render_record(out, Record{">a x", {"acgtn", "ac"}}, 3);
    CHECK(out == ">a x\nACG\nTAC\n");
    render_record(out, Record{">b", {}}, 3);
    CHECK(out == ">a x\nACG\nTAC\n>b\n");
}

TEST_CASE("render_record without width") {
    std::string out;
    render_record(out, Record{">a", {}}, std::nullopt);
    CHECK(out == ">a\n\n");
}

TEST_CASE("render_document is independent of the number of threads") {
    std::vector<Record> records;
    for (int i = 0; i < 37; ++i) {
        Record record{">r" + std::to_string(i), {}};
        for (int j = 0; j < i % 5; ++j) {
            record.lines.push_back(std::string(static_cast<size_t>(i + j + 3), "ACGTN"[j]));
        }
        records.push_back(record);
    }
    auto width = infer_line_width(records);
    REQUIRE(width);
    auto expected = render_document(records, width, 1);
    for (int n_threads : {2, 3, 8, 36, 37, 64}) {
        CHECK(render_document(records, width, n_threads) == expected);
    }
    CHECK(render_document({}, width, 4) == "");
}

TEST_CASE("rendered headers and nucleotides match the input") {
    std::string input{
        ">one\r\nacgtNacgt\r\nAC\r\n\r\n>two two\rGGG\rcccc\r>three\n\n>four\nT-T-T\n"
    };
    CleaningStatistics statistics;
    auto output = clean_fasta(input, CleaningParameters{}, statistics);
    auto in_records = segment_records(normalize_line_breaks(input));
    auto out_records = segment_records(output);
    REQUIRE(in_records.size() == out_records.size());
    REQUIRE(statistics.line_width);
    for (size_t i = 0; i < in_records.size(); ++i) {
        CHECK(in_records[i].header == out_records[i].header);

        auto in_seq = filter_sequence(in_records[i]);
        auto out_seq = filter_sequence(out_records[i]);
        CHECK(in_seq == out_seq);

        auto& lines = out_records[i].lines;
        for (size_t j = 0; j + 1 < lines.size(); ++j) {
            CHECK(lines[j].size() == *statistics.line_width);
        }
    }
}
