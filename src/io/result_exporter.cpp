#include "io/result_exporter.h"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace auctionsim {

namespace {

std::string localStamp(const char* fmt) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

std::string clockOfDay(uint64_t wall_ns) {
    std::time_t secs = static_cast<std::time_t>(wall_ns / 1000000000ULL);
    const unsigned ms = static_cast<unsigned>((wall_ns / 1000000ULL) % 1000ULL);
    std::tm tm{};
    localtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03u", tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    return buf;
}

double toMs(uint64_t ns) { return static_cast<double>(ns) / 1e6; }

std::FILE* openOrThrow(const std::string& path) {
    std::FILE* f = std::fopen(path.c_str(), "w");
    if (!f)
        throw std::runtime_error("ResultExporter: cannot open " + path);
    return f;
}

void closeOrThrow(std::FILE* f, const std::string& path) {
    const bool failed = std::ferror(f) != 0;
    if (std::fclose(f) != 0 || failed)
        throw std::runtime_error("ResultExporter: write failed for " + path);
}

void writeItem(std::FILE* f, const Item& it) {
    std::fprintf(f, "      \"item\": {\n");
    std::fprintf(f, "        \"id\": %u,\n", it.id);
    std::fprintf(f, "        \"name\": %s,\n", ResultExporter::jsonString(it.name).c_str());
    std::fprintf(f, "        \"category\": %s,\n", ResultExporter::jsonString(it.category).c_str());
    std::fprintf(f, "        \"brand\": %s,\n", ResultExporter::jsonString(it.brand).c_str());
    std::fprintf(f, "        \"condition\": %s,\n", ResultExporter::jsonString(it.condition).c_str());
    std::fprintf(f, "        \"color\": %s,\n", ResultExporter::jsonString(it.color).c_str());
    std::fprintf(f, "        \"size\": %s,\n", ResultExporter::jsonString(it.size).c_str());
    std::fprintf(f, "        \"weight_kg\": %.2f,\n", it.weight_kg);
    std::fprintf(f, "        \"material\": %s,\n", ResultExporter::jsonString(it.material).c_str());
    std::fprintf(f, "        \"year_made\": %d,\n", it.year_made);
    std::fprintf(f, "        \"origin\": %s,\n", ResultExporter::jsonString(it.origin).c_str());
    std::fprintf(f, "        \"rarity\": %s,\n", ResultExporter::jsonString(it.rarity).c_str());
    std::fprintf(f, "        \"base_price\": %.2f,\n", it.base_price);
    std::fprintf(f, "        \"description\": %s,\n", ResultExporter::jsonString(it.description).c_str());
    std::fprintf(f, "        \"features\": %s,\n", ResultExporter::jsonString(it.features).c_str());
    std::fprintf(f, "        \"warranty_months\": %d,\n", it.warranty_months);
    std::fprintf(f, "        \"ship_weight_kg\": %.2f,\n", it.ship_weight_kg);
    std::fprintf(f, "        \"dimensions\": %s,\n", ResultExporter::jsonString(it.dimensions).c_str());
    std::fprintf(f, "        \"certification\": %s,\n", ResultExporter::jsonString(it.certification).c_str());
    std::fprintf(f, "        \"rating\": %.1f\n", it.rating);
    std::fprintf(f, "      },\n");
}

}  // namespace

ResultExporter::ResultExporter(std::string output_dir)
    : output_dir_(std::move(output_dir)) {}

std::string ResultExporter::jsonString(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char esc[8];
                    std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(c));
                    out += esc;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

std::string ResultExporter::csvField(const std::string& s) {
    if (s.find_first_of(",\"\n\r") == std::string::npos)
        return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

std::string ResultExporter::exportJson(const SimulationResult& result) const {
    const std::string path = pathFor("simulation", "json");
    std::FILE* f = openOrThrow(path);

    std::fprintf(f, "{\n");
    std::fprintf(f, "  \"total_auctions\": %u,\n", result.total_auctions);
    std::fprintf(f, "  \"successful_auctions\": %u,\n", result.successful_auctions);
    std::fprintf(f, "  \"failed_auctions\": %u,\n", result.failed_auctions);
    std::fprintf(f, "  \"total_bids\": %llu,\n", (unsigned long long)result.total_bids);
    std::fprintf(f, "  \"start_ns\": %llu,\n", (unsigned long long)result.start_ns);
    std::fprintf(f, "  \"end_ns\": %llu,\n", (unsigned long long)result.end_ns);
    std::fprintf(f, "  \"duration_ms\": %.3f,\n", toMs(result.duration_ns));

    const ParticipationReport& p = result.participation;
    std::fprintf(f, "  \"participation\": {\n");
    std::fprintf(f, "    \"pairings\": %llu,\n", (unsigned long long)p.pairings);
    std::fprintf(f, "    \"submitted\": %llu,\n", (unsigned long long)p.submitted);
    std::fprintf(f, "    \"not_interested\": %llu,\n", (unsigned long long)p.not_interested);
    std::fprintf(f, "    \"abandoned_in_delay\": %llu,\n", (unsigned long long)p.abandoned_in_delay);
    std::fprintf(f, "    \"abandoned_after_delay\": %llu,\n", (unsigned long long)p.abandoned_after_delay);
    std::fprintf(f, "    \"dropped_at_send\": %llu\n", (unsigned long long)p.dropped_at_send);
    std::fprintf(f, "  },\n");

    const ResourceStats& rs = result.resources;
    std::fprintf(f, "  \"resources\": {\n");
    std::fprintf(f, "    \"initial_memory_mb\": %.2f,\n", rs.initial_memory_mb);
    std::fprintf(f, "    \"final_memory_mb\": %.2f,\n", rs.final_memory_mb);
    std::fprintf(f, "    \"peak_memory_mb\": %.2f,\n", rs.peak_memory_mb);
    std::fprintf(f, "    \"average_memory_mb\": %.2f,\n", rs.average_memory_mb);
    std::fprintf(f, "    \"peak_threads\": %u,\n", rs.peak_threads);
    std::fprintf(f, "    \"hardware_threads\": %u\n", rs.hardware_threads);
    std::fprintf(f, "  },\n");

    std::fprintf(f, "  \"auction_results\": [\n");
    for (size_t i = 0; i < result.auction_results.size(); ++i) {
        const AuctionResult& r = result.auction_results[i];
        std::fprintf(f, "    {\n");
        std::fprintf(f, "      \"auction_id\": %u,\n", r.auction_id);
        writeItem(f, r.item);
        if (r.winning_bid) {
            std::fprintf(f, "      \"winning_bid\": { \"bidder_id\": %u, \"amount\": %.2f, \"ts_ns\": %llu },\n",
                         r.winning_bid->bidder_id, r.winning_bid->amount,
                         (unsigned long long)r.winning_bid->ts_ns);
        } else {
            std::fprintf(f, "      \"winning_bid\": null,\n");
        }
        std::fprintf(f, "      \"total_bids\": %u,\n", r.total_bids);
        std::fprintf(f, "      \"status\": \"%s\",\n", statusName(r.status));
        std::fprintf(f, "      \"start_ns\": %llu,\n", (unsigned long long)r.start_ns);
        std::fprintf(f, "      \"end_ns\": %llu,\n", (unsigned long long)r.end_ns);
        std::fprintf(f, "      \"duration_ms\": %.3f\n", toMs(r.duration_ns));
        std::fprintf(f, "    }%s\n", (i + 1 < result.auction_results.size()) ? "," : "");
    }
    std::fprintf(f, "  ]\n");
    std::fprintf(f, "}\n");

    closeOrThrow(f, path);
    return path;
}

// ---------------------------------------------------------------------------
// CSV
// ---------------------------------------------------------------------------

std::string ResultExporter::exportCsv(const SimulationResult& result) const {
    const std::string path = pathFor("simulation", "csv");
    std::FILE* f = openOrThrow(path);

    std::fprintf(f, "AuctionID,ItemName,ItemCategory,BasePrice,Status,TotalBids,"
                    "WinnerBidderID,WinningAmount,Duration_ms\n");
    for (const auto& r : result.auction_results) {
        std::fprintf(f, "%u,%s,%s,%.2f,%s,%u,",
                     r.auction_id,
                     csvField(r.item.name).c_str(),
                     csvField(r.item.category).c_str(),
                     r.item.base_price,
                     statusName(r.status),
                     r.total_bids);
        if (r.winning_bid)
            std::fprintf(f, "%u,%.2f,", r.winning_bid->bidder_id, r.winning_bid->amount);
        else
            std::fprintf(f, "N/A,N/A,");
        std::fprintf(f, "%llu\n", (unsigned long long)(r.duration_ns / 1000000ULL));
    }

    closeOrThrow(f, path);
    return path;
}

// ---------------------------------------------------------------------------
// Summary
// ---------------------------------------------------------------------------

std::string ResultExporter::exportSummary(const SimulationResult& result,
                                          const std::string& stats_report) const {
    const std::string path = pathFor("summary", "txt");
    std::FILE* f = openOrThrow(path);

    std::fprintf(f, "AUCTION SIMULATION SUMMARY\n");
    std::fprintf(f, "Generated: %s\n", localStamp("%Y-%m-%d %H:%M:%S").c_str());
    std::fprintf(f, "==========================================================\n\n");

    std::fprintf(f, "Timing:\n");
    std::fprintf(f, "  start: %s\n", clockOfDay(result.start_ns).c_str());
    std::fprintf(f, "  end:   %s\n", clockOfDay(result.end_ns).c_str());
    std::fprintf(f, "  total: %.3f s\n\n", static_cast<double>(result.duration_ns) / 1e9);

    std::fprintf(f, "Overview:\n");
    std::fprintf(f, "  total auctions: %u\n", result.total_auctions);
    std::fprintf(f, "  successful:     %u\n", result.successful_auctions);
    std::fprintf(f, "  failed:         %u\n", result.failed_auctions);
    std::fprintf(f, "  total bids:     %llu\n", (unsigned long long)result.total_bids);

    std::fputs(stats_report.c_str(), f);

    closeOrThrow(f, path);
    return path;
}

// --- Private ---

std::string ResultExporter::pathFor(const char* prefix, const char* ext) const {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec)
        throw std::runtime_error("ResultExporter: cannot create " + output_dir_ + ": " + ec.message());

    const std::string name = std::string(prefix) + "_" + localStamp("%Y%m%d_%H%M%S") + "." + ext;
    return (fs::path(output_dir_) / name).string();
}

}  // namespace auctionsim
