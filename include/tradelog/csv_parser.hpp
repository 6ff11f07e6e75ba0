#pragma once

#include "tradelog/encoding.hpp"
#include "tradelog/types.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <spdlog/spdlog.h>

namespace tradelog {

// Broker export layouts: A = domestic equities (JP), B = foreign equities (US)
enum class CsvLayout {
    DomesticJp,
    ForeignUs
};

const char* to_string(CsvLayout layout);

enum class ImportErrorCode {
    FormatUndetected,
    HeaderMissing,
    NoRecordsParsed
};

class ImportError : public std::runtime_error {
public:
    ImportError(ImportErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ImportErrorCode code() const { return code_; }

private:
    ImportErrorCode code_;
};

struct ParseResult {
    CsvLayout layout = CsvLayout::DomesticJp;
    std::vector<ExecutionRecord> records;
    size_t skipped_rows = 0;
};

// Splits one CSV line on commas outside double quotes; quotes are dropped and
// cells trimmed.
std::vector<std::string> split_csv_line(std::string_view line);

// Non-empty, trimmed lines of a decoded document
std::vector<std::string> split_lines(std::string_view text);

class ExecutionParser {
public:
    ExecutionParser();

    // Decodes raw bytes, then parses. Throws ImportError.
    ParseResult parse_bytes(std::string_view bytes, TextEncoding encoding = TextEncoding::Auto) const;

    // Parses already-decoded UTF-8 text. Throws ImportError.
    ParseResult parse(std::string_view text) const;

    // Throws ImportError(FormatUndetected) when no detector matches
    CsvLayout detect_layout(const std::vector<std::string>& lines) const;

private:
    enum class DetectorScope {
        Header,
        DataRow
    };

    struct LayoutDetector {
        CsvLayout layout;
        DetectorScope scope;
        std::function<bool(const std::string& line, const std::vector<std::string>& cells)> matches;
    };

    std::vector<LayoutDetector> detectors_;
    std::shared_ptr<spdlog::logger> logger_;

    void parse_domestic(const std::vector<std::string>& lines, ParseResult& result) const;
    void parse_foreign(const std::vector<std::string>& lines, ParseResult& result) const;
};

} // namespace tradelog
