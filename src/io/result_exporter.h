#pragma once

#include "core/records.h"

#include <string>

namespace auctionsim {

/// Writes a finished simulation to <output_dir>. Every export creates the
/// directory if needed, writes one file stamped with the local time
/// (YYYYMMDD_HHMMSS) and returns its path. Throws std::runtime_error on
/// I/O failure.
class ResultExporter {
public:
    explicit ResultExporter(std::string output_dir);

    /// simulation_<stamp>.json: the full SimulationResult.
    std::string exportJson(const SimulationResult& result) const;

    /// simulation_<stamp>.csv: one row per auction, "N/A" winner columns
    /// when an auction had no bids.
    std::string exportCsv(const SimulationResult& result) const;

    /// summary_<stamp>.txt: overview plus the caller's statistics report.
    std::string exportSummary(const SimulationResult& result,
                              const std::string& stats_report) const;

    const std::string& outputDir() const { return output_dir_; }

    /// Quote and escape a string as a JSON literal.
    static std::string jsonString(const std::string& s);

    /// Quote a CSV field when it contains a separator, quote or newline.
    static std::string csvField(const std::string& s);

private:
    std::string pathFor(const char* prefix, const char* ext) const;

    std::string output_dir_;
};

}  // namespace auctionsim
