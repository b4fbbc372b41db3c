#include <catch2/catch.hpp>

#include "CSVUtils.h"
#include "ItemDataset.h"
#include "PsynetExceptions.h"
#include "Statistics.h"
#include "TestData.h"

#include <cmath>
#include <sstream>

using Catch::Detail::Approx;

TEST_CASE("parseCSVLine handles quotes, escaped quotes and embedded newlines", "[csv]") {
    std::istringstream in("a, \"b,c\" ,\"say \"\"hi\"\"\"\n\"multi\nline\",x\n");
    CSVUtils::RecordStatus status;

    const auto first = CSVUtils::parseCSVLine(in, ',', &status);
    REQUIRE(first.size() == 3);
    CHECK(first[0] == "a");
    CHECK(first[1] == "b,c");
    CHECK(first[2] == "say \"hi\"");

    const auto second = CSVUtils::parseCSVLine(in, ',', &status);
    REQUIRE(second.size() == 2);
    CHECK(second[0] == "multi\nline");
    CHECK(second[1] == "x");
    CHECK(status.consumedLines == 2);
    CHECK_FALSE(status.malformed);
}

TEST_CASE("parseCSVLine flags an unterminated quote", "[csv]") {
    std::istringstream in("1,\"open\n");
    CSVUtils::RecordStatus status;
    CSVUtils::parseCSVLine(in, ',', &status);
    CHECK(status.malformed);
}

TEST_CASE("normalizeHeader fills blanks and de-duplicates", "[csv]") {
    const auto header = CSVUtils::normalizeHeader({"", "A1", "A1", "A1_2"});
    CHECK(header[0] == "column_1");
    CHECK(header[1] == "A1");
    CHECK(header[2] == "A1_2");
    CHECK(header[3] == "A1_2_2");
}

TEST_CASE("skipBOM removes a UTF-8 byte order mark only", "[csv]") {
    std::istringstream withBom("\xEF\xBB\xBFid");
    CSVUtils::skipBOM(withBom);
    std::string rest;
    withBom >> rest;
    CHECK(rest == "id");

    std::istringstream plain("id");
    CSVUtils::skipBOM(plain);
    plain >> rest;
    CHECK(rest == "id");
}

TEST_CASE("ItemDataset drops R row names and records missing values", "[dataset]") {
    TestData::TempCsv csv("psynet_rownames.csv",
                          "\"\",A1,A2,gender\n"
                          "\"61617\",2,4,1\n"
                          "\"61618\",NA,4,2\n"
                          "\"61620\",5,,1\n"
                          "\"61621\",4,4,2\n");
    ItemDataset ds(csv.path());
    ds.load();

    REQUIRE(ds.colCount() == 3);
    CHECK(ds.rowCount() == 4);
    CHECK(ds.findColumnIndex("A1") == 0);
    CHECK(ds.findColumnIndex("missing") == -1);
    CHECK(ds.columns()[0].missing[1] == 1);
    CHECK(ds.columns()[1].missing[2] == 1);

    MissingDataReport report;
    const ObservationMatrix m = ds.completeCases({"A1", "A2"}, &report);
    CHECK(m.rowCount() == 2);
    CHECK(m.itemCount() == 2);
    CHECK(m.at(1, 0) == Approx(4.0));
    CHECK(report.originalRows == 4);
    CHECK(report.keptRows == 2);
    CHECK(report.removedRows == 2);
    CHECK(report.missingPerItem == std::vector<size_t>{1, 1});
    CHECK(report.removedRatio() == Approx(0.5));
}

TEST_CASE("completeCases rejects unknown, non-numeric and empty selections", "[dataset]") {
    TestData::TempCsv csv("psynet_bad_items.csv",
                          "A1,A2,education,empty\n"
                          "1,2,high,NA\n"
                          "3,4,low,\n");
    ItemDataset ds(csv.path());
    ds.load();

    CHECK(ds.numericColumnNames() == std::vector<std::string>{"A1", "A2", "empty"});
    CHECK_THROWS_AS(ds.completeCases({"A1", "Z9"}), Psynet::DatasetException);
    CHECK_THROWS_AS(ds.completeCases({"A1", "education"}), Psynet::DatasetException);
    CHECK_THROWS_AS(ds.completeCases({"A1", "empty"}), Psynet::DatasetException);
    CHECK_THROWS_AS(ds.completeCases({}), Psynet::DatasetException);
}

TEST_CASE("completeCases throws when no complete row remains", "[dataset]") {
    TestData::TempCsv csv("psynet_no_complete.csv",
                          "A1,A2\n"
                          "1,NA\n"
                          "NA,2\n");
    ItemDataset ds(csv.path());
    ds.load();
    MissingDataReport report;
    CHECK_THROWS_AS(ds.completeCases({"A1", "A2"}, &report), Psynet::DatasetException);
    CHECK(report.keptRows == 0);
}

TEST_CASE("ItemDataset load errors are typed", "[dataset]") {
    ItemDataset missingFile("/nonexistent/psynet.csv");
    CHECK_THROWS_AS(missingFile.load(), Psynet::IOException);

    TestData::TempCsv ragged("psynet_ragged.csv", "A1,A2\n1,2,3\n");
    ItemDataset r(ragged.path());
    CHECK_THROWS_AS(r.load(), Psynet::DatasetException);

    TestData::TempCsv headerOnly("psynet_header_only.csv", "A1,A2\n");
    ItemDataset h(headerOnly.path());
    CHECK_THROWS_AS(h.load(), Psynet::DatasetException);
}

TEST_CASE("ItemDataset honours a custom delimiter", "[dataset]") {
    TestData::TempCsv csv("psynet_semicolon.csv", "A1;A2\n1;2\n3;4\n");
    ItemDataset ds(csv.path(), ';');
    ds.load();
    const ObservationMatrix m = ds.completeCases({"A2", "A1"});
    CHECK(m.items == std::vector<std::string>{"A2", "A1"});
    CHECK(m.at(1, 0) == Approx(4.0));
}

TEST_CASE("ObservationMatrix row selection and construction", "[dataset]") {
    const ObservationMatrix m = ObservationMatrix::fromRows({"a", "b"}, {{1, 10}, {2, 20}, {3, 30}});
    const ObservationMatrix s = m.selectRows({2, 2, 0});
    CHECK(s.rowCount() == 3);
    CHECK(s.at(0, 1) == Approx(30.0));
    CHECK(s.at(2, 0) == Approx(1.0));

    CHECK_THROWS_AS(ObservationMatrix::fromRows({"a", "b"}, {{1.0}}), Psynet::DatasetException);
}

TEST_CASE("Statistics uses sample moments and ignores non-finite values", "[stats]") {
    const ColumnStats s = Statistics::calculateStats({1.0, 2.0, 3.0, 4.0, std::nan("")});
    CHECK(s.count == 4);
    CHECK(s.mean == Approx(2.5));
    CHECK(s.median == Approx(2.5));
    CHECK(s.variance == Approx(5.0 / 3.0));
    CHECK(s.min == Approx(1.0));
    CHECK(s.max == Approx(4.0));
    CHECK(s.skewness == Approx(0.0).margin(1e-12));

    const ObservationMatrix m = ObservationMatrix::fromRows({"a", "b"}, {{1, 5}, {2, 5}, {6, 5}});
    const auto described = Statistics::describe(m);
    REQUIRE(described.size() == 2);
    CHECK(described[0].median == Approx(2.0));
    CHECK(described[1].stddev == Approx(0.0));
}
