#pragma once

#include <string>
#include <vector>
#include <optional>
#include <ostream>
#include "../crawler/models/CrawlResult.h"

// Serializes crawl rows into the output directory:
//   links_multithread.csv  one row per page (overwritten)
//   violations_links.csv   one row per violation (overwritten)
//   run_summary.csv        one row per run (appended, header written once)
// I/O failures throw std::runtime_error.
class CsvReportWriter {
public:
    static constexpr const char* kPagesFile = "links_multithread.csv";
    static constexpr const char* kViolationsFile = "violations_links.csv";
    static constexpr const char* kSummaryFile = "run_summary.csv";
    static constexpr const char* kLinkSampleFile = "links_sample.csv";

    CsvReportWriter(std::string outputDir, char delimiter = ',', bool decimalComma = true);

    // Each returns the path it wrote
    std::string writePageResults(const std::vector<PageResult>& pages) const;
    std::string writeViolations(const std::vector<ViolationRecord>& violations) const;
    std::string appendRunSummary(const RunSummary& summary) const;

    // page_url,link_url rows of the offline demonstration
    std::string writeLinkSample(const std::string& pageUrl, const std::vector<std::string>& links) const;

    static std::vector<std::string> pageHeader();
    static std::vector<std::string> violationHeader();
    static std::vector<std::string> summaryHeader();

    std::vector<std::string> pageRow(const PageResult& page) const;
    std::vector<std::string> violationRow(const ViolationRecord& violation) const;
    std::vector<std::string> summaryRow(const RunSummary& summary) const;

    // Quote a field containing the delimiter, a quote or a line break
    std::string escapeField(const std::string& field) const;

    std::string formatRow(const std::vector<std::string>& fields) const;

    // Fixed precision; ',' as decimal separator when configured
    std::string formatDecimal(double value, int precision) const;

private:
    std::string pathFor(const char* fileName) const;
    void ensureOutputDir() const;

    std::string outputDir;
    char delimiter;
    bool decimalComma;
};
