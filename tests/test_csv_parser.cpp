#include <gtest/gtest.h>
#include "tradelog/csv_parser.hpp"

using namespace tradelog;

namespace {

const char* const kDomesticHeader =
    "\"約定日\",\"銘柄\",\"銘柄コード\",\"市場\",\"取引\",\"期限\",\"預り\",\"課税\","
    "\"約定数量\",\"約定単価\",\"手数料/諸経費等\",\"税額\",\"受渡日\",\"受渡金額/決済損益\"\n";

const char* const kForeignHeader =
    "\"国内約定日\",\"通貨\",\"銘柄名\",\"取引\",\"預り区分\",\"約定数量\",\"約定単価\","
    "\"約定日\",\"受渡金額\"\n";

std::string from_hex(const std::string& hex) {
    std::string out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out += static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16));
    }
    return out;
}

ImportErrorCode error_code_of(const ExecutionParser& parser, const std::string& text) {
    try {
        parser.parse(text);
    } catch (const ImportError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected ImportError";
    return ImportErrorCode::FormatUndetected;
}

} // namespace

class ExecutionParserTest : public ::testing::Test {
protected:
    ExecutionParser parser_;
};

TEST_F(ExecutionParserTest, DomesticBuyRow) {
    std::string csv =
        "約定日,銘柄,銘柄コード,市場,取引,期限,預り,課税,約定数量,約定単価\n"
        "2025/10/03,トヨタ自動車,7203,東証,株式現物買,当日,特定,申告,100,2500\n";

    ParseResult result = parser_.parse(csv);
    EXPECT_EQ(result.layout, CsvLayout::DomesticJp);
    ASSERT_EQ(result.records.size(), 1u);

    const auto& record = result.records[0];
    EXPECT_EQ(record.side, Side::Buy);
    EXPECT_EQ(record.quantity, 100.0);
    EXPECT_EQ(record.price, 2500.0);
    EXPECT_EQ(record.country, Country::JP);
    EXPECT_EQ(record.symbol, "7203");
    EXPECT_EQ(record.name, "トヨタ自動車");
    EXPECT_EQ(record.date, (Date{2025, 10, 3}));
    EXPECT_FALSE(record.id.has_value());
}

TEST_F(ExecutionParserTest, DomesticExportWithTitleLinesAndQuotedNumbers) {
    std::string csv = std::string("\"約定履歴照会\"\n\"一括表示\"\n\n") + kDomesticHeader +
        "\"2025/10/03\",\"ヘリオス\",\"4593\",\"東証\",\"株式現物買\",\"--\",\"特定\",\"--\",\"1,000\",\"512\",\"--\",\"--\",\"2025/10/07\",\"512,000\"\n"
        "\"2025/11/10\",\"ヘリオス\",\"4593\",\"東証\",\"株式現物売\",\"--\",\"特定\",\"--\",\"1,000\",\"1,250.5\",\"--\",\"--\",\"2025/11/12\",\"1,250,500\"\n";

    ParseResult result = parser_.parse(csv);
    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.records[0].quantity, 1000.0);
    EXPECT_EQ(result.records[0].price, 512.0);
    EXPECT_EQ(result.records[1].side, Side::Sell);
    EXPECT_DOUBLE_EQ(result.records[1].price, 1250.5);
    EXPECT_EQ(result.skipped_rows, 0u);
}

TEST_F(ExecutionParserTest, DomesticSkipsFundsShortRowsAndUnknownSides) {
    std::string csv = std::string(kDomesticHeader) +
        // fund row without a code
        "\"2025/10/01\",\"eMAXIS Slim\",\"--\",\"--\",\"投信金額買付\",\"--\",\"NISA\",\"--\",\"10,000\",\"1\"\n"
        "\"2025/10/01\",\"eMAXIS Slim\",\"\",\"--\",\"投信金額買付\",\"--\",\"NISA\",\"--\",\"10,000\",\"1\"\n"
        // too few cells
        "\"2025/10/02\",\"トヨタ自動車\",\"7203\",\"東証\"\n"
        // neither buy nor sell
        "\"2025/10/02\",\"トヨタ自動車\",\"7203\",\"東証\",\"株式配当\",\"--\",\"特定\",\"--\",\"100\",\"2500\"\n"
        // both markers: ambiguous
        "\"2025/10/02\",\"トヨタ自動車\",\"7203\",\"東証\",\"買売\",\"--\",\"特定\",\"--\",\"100\",\"2500\"\n"
        // unparseable price
        "\"2025/10/02\",\"トヨタ自動車\",\"7203\",\"東証\",\"株式現物買\",\"--\",\"特定\",\"--\",\"100\",\"--\"\n"
        // the one good row
        "\"2025/10/03\",\"トヨタ自動車\",\"7203\",\"東証\",\"株式現物売\",\"--\",\"特定\",\"--\",\"100\",\"2600\"\n";

    ParseResult result = parser_.parse(csv);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].side, Side::Sell);
    EXPECT_EQ(result.records[0].price, 2600.0);
    EXPECT_EQ(result.skipped_rows, 6u);
}

TEST_F(ExecutionParserTest, ForeignExport) {
    std::string csv = std::string(kForeignHeader) +
        "\"2026年01月30日\",\"米国ドル\",\"アメンタム ホールディングス インク AMTM / New York Stock Exchange\",\"買付\",\"特定\",\"10\",\"25.50\",\"2026/01/29\",\"255\"\n"
        "\"2026年02月03日\",\"米国ドル\",\"エヌビディア NVDA / NASDAQ\",\"売却\",\"特定\",\"1,200\",\"130.25\",\"2026/02/02\",\"156,300\"\n";

    ParseResult result = parser_.parse(csv);
    EXPECT_EQ(result.layout, CsvLayout::ForeignUs);
    ASSERT_EQ(result.records.size(), 2u);

    const auto& buy = result.records[0];
    EXPECT_EQ(buy.symbol, "AMTM");
    EXPECT_EQ(buy.name, "アメンタム ホールディングス インク");
    EXPECT_EQ(buy.side, Side::Buy);
    EXPECT_EQ(buy.date, (Date{2026, 1, 30}));
    EXPECT_EQ(buy.quantity, 10.0);
    EXPECT_DOUBLE_EQ(buy.price, 25.5);
    EXPECT_EQ(buy.country, Country::US);

    const auto& sell = result.records[1];
    EXPECT_EQ(sell.symbol, "NVDA");
    EXPECT_EQ(sell.name, "エヌビディア");
    EXPECT_EQ(sell.side, Side::Sell);
    EXPECT_EQ(sell.quantity, 1200.0);
}

TEST_F(ExecutionParserTest, ForeignSymbolWithoutTickerKeepsWholeCell) {
    std::string csv = std::string(kForeignHeader) +
        "\"2026年01月30日\",\"米国ドル\",\"some etf\",\"買付\",\"特定\",\"5\",\"10\"\n";

    ParseResult result = parser_.parse(csv);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].symbol, "some etf");
    EXPECT_EQ(result.records[0].name, "some etf");
}

TEST_F(ExecutionParserTest, ForeignSkipsRowsWithBadDates) {
    std::string csv = std::string(kForeignHeader) +
        "\"2026年02月30日\",\"米国ドル\",\"X CORP XX / NASDAQ\",\"買付\",\"特定\",\"5\",\"10\"\n"
        "\"2026年02月27日\",\"米国ドル\",\"X CORP XX / NASDAQ\",\"買付\",\"特定\",\"5\",\"10\"\n";

    ParseResult result = parser_.parse(csv);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].date, (Date{2026, 2, 27}));
    EXPECT_EQ(result.skipped_rows, 1u);
}

TEST_F(ExecutionParserTest, HeuristicDetection) {
    std::vector<std::string> foreign = {
        "title",
        "2026/01/30,USD,APPLE AAPL / NASDAQ,buy,x,1,100",
    };
    EXPECT_EQ(parser_.detect_layout(foreign), CsvLayout::ForeignUs);

    std::vector<std::string> domestic = {
        "title",
        "2025/10/03,Toyota,7203,TSE,buy,x,x,x,100,2500",
    };
    EXPECT_EQ(parser_.detect_layout(domestic), CsvLayout::DomesticJp);

    // Only lines 2 to 10 are sniffed
    std::vector<std::string> too_late(11, "nothing here");
    too_late.push_back("7203");
    EXPECT_THROW(parser_.detect_layout(too_late), ImportError);
}

TEST_F(ExecutionParserTest, HeaderDetectionTakesPriorityOverData) {
    std::vector<std::string> lines = {
        "x",
        "2025/10/03,Toyota,7203,TSE",
        "国内約定日,通貨,銘柄名",
    };
    EXPECT_EQ(parser_.detect_layout(lines), CsvLayout::ForeignUs);
}

TEST_F(ExecutionParserTest, UnrecognizedFileIsFormatUndetected) {
    EXPECT_EQ(error_code_of(parser_, "date,symbol,qty\n2025-01-01,AAPL,10\n"),
              ImportErrorCode::FormatUndetected);
    EXPECT_EQ(error_code_of(parser_, ""), ImportErrorCode::FormatUndetected);
}

TEST_F(ExecutionParserTest, HeuristicMatchWithoutHeaderIsHeaderMissing) {
    EXPECT_EQ(error_code_of(parser_, "title\n2025/10/03,Toyota,7203,TSE,buy,x,x,x,100,2500\n"),
              ImportErrorCode::HeaderMissing);
}

TEST_F(ExecutionParserTest, HeaderWithoutUsableRowsIsNoRecordsParsed) {
    std::string csv = std::string(kDomesticHeader) +
        "\"2025/10/01\",\"eMAXIS Slim\",\"--\",\"--\",\"投信金額買付\",\"--\",\"NISA\",\"--\",\"10,000\",\"1\"\n";
    EXPECT_EQ(error_code_of(parser_, csv), ImportErrorCode::NoRecordsParsed);
    EXPECT_EQ(error_code_of(parser_, kForeignHeader), ImportErrorCode::NoRecordsParsed);
}

TEST_F(ExecutionParserTest, ParseBytesDecodesShiftJis) {
    // Shift_JIS bytes of:
    //   約定日,銘柄,銘柄コード,市場,取引,期限,預り,課税,約定数量,約定単価
    //   2025/10/03,トヨタ自動車,7203,東証,株式現物買,当日,特定,申告,100,"2,500"
    std::string bytes = from_hex(
        "96f192e893fa2c96c195bf2c96c195bf8352815b83682c8e738fea2c8ee688f82c8afa8cc02c976182e82c"
        "89db90c52c96f192e8909497ca2c96f192e8925089bf0a323032352f31302f30332c83678388835e8ea993"
        "ae8ed42c373230332c938c8fd82c8a948eae8cbb95a894832c939693fa2c93c192e82c905c8d902c313030"
        "2c22322c353030220a");

    ParseResult result = parser_.parse_bytes(bytes, TextEncoding::ShiftJis);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].name, "トヨタ自動車");
    EXPECT_EQ(result.records[0].price, 2500.0);

    ParseResult detected = parser_.parse_bytes(bytes);
    ASSERT_EQ(detected.records.size(), 1u);
    EXPECT_EQ(detected.records[0].symbol, "7203");
}

TEST(CsvSplitTest, QuotedCellsKeepCommas) {
    auto cells = split_csv_line("\"a\", \"1,000\" ,plain,\"say \"\"hi\"\"\",");
    ASSERT_EQ(cells.size(), 5u);
    EXPECT_EQ(cells[0], "a");
    EXPECT_EQ(cells[1], "1,000");
    EXPECT_EQ(cells[2], "plain");
    EXPECT_EQ(cells[3], "say \"hi\"");
    EXPECT_EQ(cells[4], "");
}

TEST(CsvSplitTest, LinesAreTrimmedAndBlankOnesDropped) {
    auto lines = split_lines("a\r\n\r\n  b  \n\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
