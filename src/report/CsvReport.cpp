#include "report/ReportSink.hpp"
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace slack_cleaner {

std::string CsvReport::escape_field(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void CsvReport::write_to(std::ostream& out, const std::vector<RunResultRecord>& records) {
    out << "channel_id,channel_name,verdict,action,reason\r\n";
    for (const auto& r : records) {
        std::string reason = r.verdict.reason;
        if (r.error) reason += " (error: " + *r.error + ")";

        out << escape_field(r.channel_id) << ','
            << escape_field(r.channel_name) << ','
            << to_string(r.verdict.kind) << ','
            << to_string(r.action) << ','
            << escape_field(reason) << "\r\n";
    }
}

void CsvReport::write(const std::vector<RunResultRecord>& records) {
    std::ofstream f(path_, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open CSV report for writing: " + path_);
    }

    write_to(f, records);
    f.flush();
    if (!f) {
        throw std::runtime_error("Failed while writing CSV report: " + path_);
    }
    spdlog::info("📄 CSV report written to {} ({} rows)", path_, records.size());
}

} // namespace slack_cleaner
