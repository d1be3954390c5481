#include "CsvReportWriter.h"
#include "../../include/Logger.h"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

template <typename T>
std::string optionalToString(const std::optional<T>& value) {
    return value ? std::to_string(*value) : std::string();
}

std::ofstream openForWrite(const std::string& path, std::ios::openmode mode) {
    std::ofstream out(path, mode);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open report file for writing: " + path);
    }
    return out;
}

void checkStream(const std::ofstream& out, const std::string& path) {
    if (!out) {
        throw std::runtime_error("Error while writing report file: " + path);
    }
}

} // namespace

CsvReportWriter::CsvReportWriter(std::string outputDir, char delimiter, bool decimalComma)
    : outputDir(std::move(outputDir))
    , delimiter(delimiter)
    , decimalComma(decimalComma) {}

std::vector<std::string> CsvReportWriter::pageHeader() {
    return {"url", "status", "time_ms", "thread", "start_utc", "end_utc", "error",
            "internal_links_found", "final_url", "content_type", "violation_summary", "violations_count"};
}

std::vector<std::string> CsvReportWriter::violationHeader() {
    return {"page_url", "link_url", "violation_type", "status", "final_url", "note"};
}

std::vector<std::string> CsvReportWriter::summaryHeader() {
    return {"ts_utc", "scheduler", "threads", "delay_s", "urls_total", "duration_s", "urls_per_s",
            "broken_links_total", "cascade_logins_total", "pages_with_violations", "total_links_found",
            "cache_mode", "cache_max_size", "cache_accesses", "cache_hits", "cache_misses",
            "cache_hit_ratio", "cpu_percent_avg", "memory_rss_mb"};
}

std::vector<std::string> CsvReportWriter::pageRow(const PageResult& page) const {
    std::ostringstream timeMs;
    timeMs << std::fixed << std::setprecision(2) << page.timeMs;

    return {page.url,
            optionalToString(page.status),
            timeMs.str(),
            page.thread,
            page.startUtc,
            page.endUtc,
            page.error,
            optionalToString(page.internalLinksFound),
            page.finalUrl,
            page.contentType,
            page.violationSummary,
            std::to_string(page.violationsCount)};
}

std::vector<std::string> CsvReportWriter::violationRow(const ViolationRecord& violation) const {
    return {violation.pageUrl,
            violation.linkUrl,
            toString(violation.type),
            optionalToString(violation.status),
            violation.finalUrl,
            violation.note};
}

std::vector<std::string> CsvReportWriter::summaryRow(const RunSummary& summary) const {
    auto optionalDecimal = [this](const std::optional<double>& value) {
        return value ? formatDecimal(*value, 2) : std::string();
    };

    std::ostringstream delay;
    delay << summary.delaySeconds;
    std::string delayText = delay.str();
    if (decimalComma) {
        for (char& c : delayText) {
            if (c == '.') c = ',';
        }
    }

    return {summary.tsUtc,
            summary.scheduler,
            std::to_string(summary.threads),
            delayText,
            std::to_string(summary.urlsTotal),
            formatDecimal(summary.durationSeconds, 2),
            formatDecimal(summary.urlsPerSecond, 2),
            std::to_string(summary.brokenLinksTotal),
            std::to_string(summary.cascadeLoginsTotal),
            std::to_string(summary.pagesWithViolations),
            std::to_string(summary.totalLinksFound),
            summary.cacheMode,
            std::to_string(summary.cacheMaxSize),
            std::to_string(summary.cache.accesses),
            std::to_string(summary.cache.hits),
            std::to_string(summary.cache.misses),
            formatDecimal(summary.cache.hitRatio, 4),
            optionalDecimal(summary.cpuPercentAvg),
            optionalDecimal(summary.memoryRssMb)};
}

std::string CsvReportWriter::escapeField(const std::string& field) const {
    if (field.find_first_of(std::string(1, delimiter) + "\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted += c;
        }
    }
    quoted += "\"";
    return quoted;
}

std::string CsvReportWriter::formatRow(const std::vector<std::string>& fields) const {
    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            line += delimiter;
        }
        line += escapeField(fields[i]);
    }
    return line;
}

std::string CsvReportWriter::formatDecimal(double value, int precision) const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    std::string text = ss.str();
    if (decimalComma) {
        size_t dot = text.find('.');
        if (dot != std::string::npos) {
            text[dot] = ',';
        }
    }
    return text;
}

std::string CsvReportWriter::pathFor(const char* fileName) const {
    return (std::filesystem::path(outputDir) / fileName).string();
}

void CsvReportWriter::ensureOutputDir() const {
    if (outputDir.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + outputDir + ": " + ec.message());
    }
}

std::string CsvReportWriter::writePageResults(const std::vector<PageResult>& pages) const {
    ensureOutputDir();
    std::string path = pathFor(kPagesFile);
    std::ofstream out = openForWrite(path, std::ios::trunc);

    out << formatRow(pageHeader()) << "\n";
    for (const auto& page : pages) {
        out << formatRow(pageRow(page)) << "\n";
    }
    checkStream(out, path);

    LOG_INFO("[report] " + path);
    return path;
}

std::string CsvReportWriter::writeViolations(const std::vector<ViolationRecord>& violations) const {
    ensureOutputDir();
    std::string path = pathFor(kViolationsFile);
    std::ofstream out = openForWrite(path, std::ios::trunc);

    out << formatRow(violationHeader()) << "\n";
    for (const auto& violation : violations) {
        out << formatRow(violationRow(violation)) << "\n";
    }
    checkStream(out, path);

    LOG_INFO("[violations] wrote " + std::to_string(violations.size()) + " rows -> " + path);
    return path;
}

std::string CsvReportWriter::appendRunSummary(const RunSummary& summary) const {
    ensureOutputDir();
    std::string path = pathFor(kSummaryFile);

    std::error_code ec;
    bool writeHeader = !std::filesystem::exists(path, ec) || std::filesystem::file_size(path, ec) == 0;

    std::ofstream out = openForWrite(path, std::ios::app);
    if (writeHeader) {
        out << formatRow(summaryHeader()) << "\n";
    }
    out << formatRow(summaryRow(summary)) << "\n";
    checkStream(out, path);

    LOG_INFO("[summary] appended run -> " + path);
    return path;
}

std::string CsvReportWriter::writeLinkSample(const std::string& pageUrl, const std::vector<std::string>& links) const {
    ensureOutputDir();
    std::string path = pathFor(kLinkSampleFile);
    std::ofstream out = openForWrite(path, std::ios::trunc);

    out << formatRow({"page_url", "link_url"}) << "\n";
    for (const auto& link : links) {
        out << formatRow({pageUrl, link}) << "\n";
    }
    checkStream(out, path);

    LOG_INFO("[report] wrote internal links -> " + path);
    return path;
}
