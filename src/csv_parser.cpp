#include "tradelog/csv_parser.hpp"
#include "tradelog/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <regex>

namespace tradelog {

namespace {

// Header markers
constexpr std::string_view kTradeDateMarker = "約定日";
constexpr std::string_view kSymbolCodeMarker = "銘柄コード";
constexpr std::string_view kDomesticDateMarker = "国内約定日";
constexpr std::string_view kSymbolNameMarker = "銘柄名";

// Side markers in the trade-type cell ("株式現物買", "買付", "売却", ...)
constexpr std::string_view kBuyMarker = "買";
constexpr std::string_view kSellMarker = "売";

constexpr std::string_view kYearMarker = "年";
constexpr std::string_view kMonthMarker = "月";
constexpr std::string_view kDayMarker = "日";

constexpr std::string_view kNoSymbolCode = "--";
constexpr std::string_view kExchangeSeparator = " / ";

// Only the first lines after the title are worth sniffing
constexpr size_t kHeuristicFirstLine = 1;
constexpr size_t kHeuristicEndLine = 10;

// Column layout of the domestic export
constexpr size_t kDomesticMinCells = 10;
constexpr size_t kDomesticDateCol = 0;
constexpr size_t kDomesticNameCol = 1;
constexpr size_t kDomesticCodeCol = 2;
constexpr size_t kDomesticSideCol = 4;
constexpr size_t kDomesticQuantityCol = 8;
constexpr size_t kDomesticPriceCol = 9;

// Column layout of the foreign export
constexpr size_t kForeignMinCells = 7;
constexpr size_t kForeignDateCol = 0;
constexpr size_t kForeignSymbolCol = 2;
constexpr size_t kForeignSideCol = 3;
constexpr size_t kForeignQuantityCol = 5;
constexpr size_t kForeignPriceCol = 6;

const char* const kFormatUndetectedMessage =
    "Could not detect the CSV format. Make sure the file is an execution history "
    "export from a supported broker.";
const char* const kNoRecordsMessage =
    "No executions could be read from the file. Make sure it is a supported "
    "execution history export.";

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

void replace_all(std::string& text, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool is_symbol_code(std::string_view cell) {
    if (cell.size() < 4 || cell.size() > 5) {
        return false;
    }
    return std::all_of(cell.begin(), cell.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Strips thousands separators; only strictly positive finite values pass
std::optional<double> parse_positive(std::string_view cell) {
    std::string value(cell);
    value.erase(std::remove(value.begin(), value.end(), ','), value.end());
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed) || parsed <= 0.0) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<Side> side_from_trade_type(std::string_view cell) {
    bool buy = contains(cell, kBuyMarker);
    bool sell = contains(cell, kSellMarker);
    if (buy == sell) {
        return std::nullopt;  // neither, or ambiguous
    }
    return buy ? Side::Buy : Side::Sell;
}

// "2026年01月30日" -> "2026/01/30"
std::optional<Date> parse_localized_date(std::string_view cell) {
    std::string value(cell);
    replace_all(value, kYearMarker, "/");
    replace_all(value, kMonthMarker, "/");
    replace_all(value, kDayMarker, "");
    return Date::parse(trim(value));
}

struct ForeignSymbol {
    std::string ticker;
    std::string name;
};

// "アメンタム ホールディングス インク AMTM / New York Stock Exchange"
ForeignSymbol split_foreign_symbol(const std::string& cell) {
    static const std::regex ticker_pattern(R"(([A-Z]{2,5})\s*/)");
    static const std::regex ticker_suffix(R"(\s+[A-Z]{2,5}\s*$)");

    ForeignSymbol out;
    std::smatch match;
    out.ticker = std::regex_search(cell, match, ticker_pattern) ? match[1].str() : cell;

    std::string name = cell.substr(0, cell.find(kExchangeSeparator));
    name = std::regex_replace(name, ticker_suffix, "");
    out.name = std::string(trim(name));
    return out;
}

size_t find_header(const std::vector<std::string>& lines,
                   std::string_view first_marker, std::string_view second_marker) {
    for (size_t i = 0; i < lines.size(); ++i) {
        if (contains(lines[i], first_marker) && contains(lines[i], second_marker)) {
            return i;
        }
    }
    return lines.size();
}

} // namespace

const char* to_string(CsvLayout layout) {
    return layout == CsvLayout::DomesticJp ? "domestic_jp" : "foreign_us";
}

std::vector<std::string> split_csv_line(std::string_view line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            // "" inside a quoted cell is a literal quote
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == ',' && !quoted) {
            cells.emplace_back(trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    cells.emplace_back(trim(cell));
    return cells;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = trim(text.substr(start, end - start));
        if (!line.empty()) {
            lines.emplace_back(line);
        }
        start = end + 1;
    }
    return lines;
}

ExecutionParser::ExecutionParser() {
    logger_ = get_logger("execution_parser");

    // Evaluated in this order; the first match wins
    detectors_ = {
        {CsvLayout::DomesticJp, DetectorScope::Header,
         [](const std::string& line, const std::vector<std::string>&) {
             return contains(line, kSymbolCodeMarker);
         }},
        {CsvLayout::ForeignUs, DetectorScope::Header,
         [](const std::string& line, const std::vector<std::string>&) {
             return contains(line, kDomesticDateMarker) && contains(line, kSymbolNameMarker);
         }},
        {CsvLayout::ForeignUs, DetectorScope::DataRow,
         [](const std::string&, const std::vector<std::string>& cells) {
             return std::any_of(cells.begin(), cells.end(), [](const std::string& cell) {
                 return contains(cell, "New York Stock Exchange") || contains(cell, "NASDAQ");
             });
         }},
        {CsvLayout::DomesticJp, DetectorScope::DataRow,
         [](const std::string&, const std::vector<std::string>& cells) {
             return std::any_of(cells.begin(), cells.end(),
                                [](const std::string& cell) { return is_symbol_code(cell); });
         }},
    };
}

ParseResult ExecutionParser::parse_bytes(std::string_view bytes, TextEncoding encoding) const {
    std::string text = decode_text(bytes, encoding);
    logger_->debug("Decoded {} bytes as {} into {} bytes of UTF-8",
                   bytes.size(), to_string(encoding), text.size());
    return parse(text);
}

ParseResult ExecutionParser::parse(std::string_view text) const {
    std::vector<std::string> lines = split_lines(text);

    ParseResult result;
    result.layout = detect_layout(lines);

    if (result.layout == CsvLayout::DomesticJp) {
        parse_domestic(lines, result);
    } else {
        parse_foreign(lines, result);
    }

    if (result.records.empty()) {
        logger_->warn("Layout {} detected but no rows survived ({} skipped)",
                      to_string(result.layout), result.skipped_rows);
        throw ImportError(ImportErrorCode::NoRecordsParsed, kNoRecordsMessage);
    }

    logger_->info("Parsed {} executions from {} export ({} rows skipped)",
                  result.records.size(), to_string(result.layout), result.skipped_rows);
    return result;
}

CsvLayout ExecutionParser::detect_layout(const std::vector<std::string>& lines) const {
    const std::vector<std::string> no_cells;

    for (const auto& line : lines) {
        for (const auto& detector : detectors_) {
            if (detector.scope == DetectorScope::Header && detector.matches(line, no_cells)) {
                return detector.layout;
            }
        }
    }

    size_t end = std::min(lines.size(), kHeuristicEndLine);
    for (size_t i = kHeuristicFirstLine; i < end; ++i) {
        std::vector<std::string> cells = split_csv_line(lines[i]);
        for (const auto& detector : detectors_) {
            if (detector.scope == DetectorScope::DataRow && detector.matches(lines[i], cells)) {
                logger_->debug("Layout {} inferred from data line {}", to_string(detector.layout), i);
                return detector.layout;
            }
        }
    }

    throw ImportError(ImportErrorCode::FormatUndetected, kFormatUndetectedMessage);
}

void ExecutionParser::parse_domestic(const std::vector<std::string>& lines, ParseResult& result) const {
    size_t header = find_header(lines, kTradeDateMarker, kSymbolCodeMarker);
    if (header == lines.size()) {
        throw ImportError(ImportErrorCode::HeaderMissing,
                          "The header row of the domestic equity export was not found.");
    }

    for (size_t i = header + 1; i < lines.size(); ++i) {
        std::vector<std::string> cells = split_csv_line(lines[i]);
        if (cells.size() < kDomesticMinCells) {
            ++result.skipped_rows;
            continue;
        }

        // Funds and other rows without a listed code
        const std::string& code = cells[kDomesticCodeCol];
        if (code.empty() || code == kNoSymbolCode) {
            ++result.skipped_rows;
            continue;
        }

        auto side = side_from_trade_type(cells[kDomesticSideCol]);
        auto date = Date::parse(cells[kDomesticDateCol]);
        auto quantity = parse_positive(cells[kDomesticQuantityCol]);
        auto price = parse_positive(cells[kDomesticPriceCol]);
        if (!side || !date || !quantity || !price) {
            logger_->debug("Skipping malformed domestic row {}: {}", i, lines[i]);
            ++result.skipped_rows;
            continue;
        }

        ExecutionRecord record;
        record.date = *date;
        record.symbol = code;
        record.name = cells[kDomesticNameCol];
        record.side = *side;
        record.quantity = *quantity;
        record.price = *price;
        record.country = Country::JP;
        result.records.push_back(std::move(record));
    }
}

void ExecutionParser::parse_foreign(const std::vector<std::string>& lines, ParseResult& result) const {
    size_t header = find_header(lines, kDomesticDateMarker, kSymbolNameMarker);
    if (header == lines.size()) {
        throw ImportError(ImportErrorCode::HeaderMissing,
                          "The header row of the foreign equity export was not found.");
    }

    for (size_t i = header + 1; i < lines.size(); ++i) {
        std::vector<std::string> cells = split_csv_line(lines[i]);
        if (cells.size() < kForeignMinCells) {
            ++result.skipped_rows;
            continue;
        }

        auto side = side_from_trade_type(cells[kForeignSideCol]);
        auto date = parse_localized_date(cells[kForeignDateCol]);
        auto quantity = parse_positive(cells[kForeignQuantityCol]);
        auto price = parse_positive(cells[kForeignPriceCol]);
        if (!side || !date || !quantity || !price || cells[kForeignSymbolCol].empty()) {
            logger_->debug("Skipping malformed foreign row {}: {}", i, lines[i]);
            ++result.skipped_rows;
            continue;
        }

        ForeignSymbol symbol = split_foreign_symbol(cells[kForeignSymbolCol]);

        ExecutionRecord record;
        record.date = *date;
        record.symbol = symbol.ticker;
        record.name = symbol.name;
        record.side = *side;
        record.quantity = *quantity;
        record.price = *price;
        record.country = Country::US;
        result.records.push_back(std::move(record));
    }
}

} // namespace tradelog
