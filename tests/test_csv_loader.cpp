#include <gtest/gtest.h>
#include "CSVMarketDataLoader.hpp"
#include "InMemoryMarketDataStore.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <vector>

using namespace portsim;

// ═══════════════════════════════════════════════════════════════════════════════
// Mock File Reader для тестирования
// ═══════════════════════════════════════════════════════════════════════════════

class MockFileReader : public IFileReader {
public:
    void setFile(const std::string& path, const std::vector<std::string>& lines) {
        files_[path] = lines;
    }

    std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) override {

        auto it = files_.find(std::string(filePath));
        if (it == files_.end()) {
            return std::unexpected("Failed to open file: " + std::string(filePath));
        }
        if (it->second.empty()) {
            return std::unexpected("File is empty");
        }
        return it->second;
    }

    bool exists(std::string_view filePath) override {
        return files_.contains(std::string(filePath));
    }

    std::expected<std::vector<std::string>, std::string> listFiles(
        std::string_view directory,
        std::string_view extension) override {

        std::vector<std::string> result;
        for (const auto& [path, lines] : files_) {
            std::filesystem::path p(path);
            if (p.parent_path() == std::filesystem::path(directory) &&
                p.extension() == extension) {
                result.push_back(p.filename().string());
            }
        }
        return result;
    }

private:
    std::map<std::string, std::vector<std::string>> files_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixture
// ═══════════════════════════════════════════════════════════════════════════════

class CSVLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockReader_ = std::make_shared<MockFileReader>();
        loader_ = std::make_unique<CSVMarketDataLoader>("/data", mockReader_);
    }

    std::shared_ptr<MockFileReader> mockReader_;
    std::unique_ptr<CSVMarketDataLoader> loader_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Бары
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CSVLoaderTest, LoadBarsFullColumns) {
    mockReader_->setFile("/data/bars/VTI.csv", {
        "date,open,high,low,close,adj_close,volume",
        "2024-01-02,230.1,232.0,229.5,231.0,229.9,3000000",
        "2024-01-03,231.0,231.5,228.0,229.0,227.9,2500000"
    });

    auto bars = loader_->loadBars("VTI");
    ASSERT_TRUE(bars.has_value()) << bars.error();
    ASSERT_EQ(bars->size(), 2u);

    const auto& first = bars->front();
    EXPECT_EQ(first.date, makeDate(2024, 1, 2));
    EXPECT_DOUBLE_EQ(first.open, 230.1);
    EXPECT_DOUBLE_EQ(first.high, 232.0);
    EXPECT_DOUBLE_EQ(first.low, 229.5);
    EXPECT_DOUBLE_EQ(first.close, 231.0);
    EXPECT_DOUBLE_EQ(first.adjClose, 229.9);
    EXPECT_DOUBLE_EQ(first.volume, 3000000.0);
}

TEST_F(CSVLoaderTest, ColumnsMatchedByHeaderName) {
    mockReader_->setFile("/data/bars/VTI.csv", {
        "Volume, Close ,Date",
        "100,50.5,2024-01-02"
    });

    auto bars = loader_->loadBars("VTI");
    ASSERT_TRUE(bars.has_value()) << bars.error();
    ASSERT_EQ(bars->size(), 1u);
    EXPECT_DOUBLE_EQ(bars->front().close, 50.5);
    EXPECT_DOUBLE_EQ(bars->front().open, 50.5);
    EXPECT_DOUBLE_EQ(bars->front().adjClose, 50.5);
    EXPECT_DOUBLE_EQ(bars->front().volume, 100.0);
}

TEST_F(CSVLoaderTest, BadRowsSkippedAndSorted) {
    mockReader_->setFile("/data/bars/VTI.csv", {
        "date,close",
        "2024-01-04,102",
        "not-a-date,100",
        "2024-01-02,abc",
        "2024-01-03,-5",
        "2024-01-02,100",
        "2024-01-04,104"
    });

    auto bars = loader_->loadBars("VTI");
    ASSERT_TRUE(bars.has_value());
    ASSERT_EQ(bars->size(), 2u);
    EXPECT_EQ((*bars)[0].date, makeDate(2024, 1, 2));
    EXPECT_EQ((*bars)[1].date, makeDate(2024, 1, 4));
    EXPECT_DOUBLE_EQ((*bars)[1].close, 104.0);
    EXPECT_EQ(loader_->skippedRows(), 3u);
}

TEST_F(CSVLoaderTest, BarsRequireDateAndClose) {
    mockReader_->setFile("/data/bars/VTI.csv", {"date,open", "2024-01-02,1"});
    auto bars = loader_->loadBars("VTI");
    ASSERT_FALSE(bars.has_value());
    EXPECT_NE(bars.error().find("'close'"), std::string::npos);

    EXPECT_FALSE(loader_->loadBars("BND").has_value());
}

TEST_F(CSVLoaderTest, CustomDelimiter) {
    CSVMarketDataLoader loader("/data", mockReader_, ';');
    mockReader_->setFile("/data/bars/VTI.csv", {"date;close", "2024-01-02;99.5"});

    auto bars = loader.loadBars("VTI");
    ASSERT_TRUE(bars.has_value()) << bars.error();
    EXPECT_DOUBLE_EQ(bars->front().close, 99.5);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Дивиденды, сплиты, метаданные
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CSVLoaderTest, LoadDividends) {
    mockReader_->setFile("/data/dividends/VTI.csv", {
        "ex_date,pay_date,amount,qualified_pct",
        "2024-06-20,2024-06-25,0.88,",
        "2024-03-21,2024-03-26,0.91,1.5",
        "2024-09-26,,-1,0.9"
    });

    auto dividends = loader_->loadDividends("VTI");
    ASSERT_TRUE(dividends.has_value()) << dividends.error();
    ASSERT_EQ(dividends->size(), 2u);

    EXPECT_EQ((*dividends)[0].exDate, makeDate(2024, 3, 21));
    EXPECT_EQ(*(*dividends)[0].payDate, makeDate(2024, 3, 26));
    EXPECT_DOUBLE_EQ(*(*dividends)[0].qualifiedPct, 1.0);
    EXPECT_FALSE((*dividends)[1].qualifiedPct.has_value());
    EXPECT_EQ(loader_->skippedRows(), 1u);
}

TEST_F(CSVLoaderTest, MissingOptionalFilesAreEmpty) {
    auto dividends = loader_->loadDividends("VTI");
    ASSERT_TRUE(dividends.has_value());
    EXPECT_TRUE(dividends->empty());

    auto splits = loader_->loadSplits("VTI");
    ASSERT_TRUE(splits.has_value());
    EXPECT_TRUE(splits->empty());

    auto ratios = loader_->loadExpenseRatios();
    ASSERT_TRUE(ratios.has_value());
    EXPECT_TRUE(ratios->empty());
}

TEST_F(CSVLoaderTest, LoadSplitsAndExpenseRatios) {
    mockReader_->setFile("/data/splits/VTI.csv", {"ex_date,ratio", "2024-06-10,4", "2024-07-01,0"});
    mockReader_->setFile("/data/metadata.csv", {
        "symbol,name,expense_ratio",
        "VTI,Total Stock Market,0.0003",
        "BND,Total Bond,0.0003",
        "BAD,Broken,n/a"
    });

    auto splits = loader_->loadSplits("VTI");
    ASSERT_TRUE(splits.has_value());
    ASSERT_EQ(splits->size(), 1u);
    EXPECT_DOUBLE_EQ(splits->front().ratio, 4.0);

    auto ratios = loader_->loadExpenseRatios();
    ASSERT_TRUE(ratios.has_value()) << ratios.error();
    EXPECT_EQ(ratios->size(), 2u);
    EXPECT_DOUBLE_EQ(ratios->at("VTI"), 0.0003);
    EXPECT_FALSE(ratios->contains("BAD"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Импорт в хранилище
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CSVLoaderTest, DiscoverSymbols) {
    mockReader_->setFile("/data/bars/VTI.csv", {"date,close", "2024-01-02,1"});
    mockReader_->setFile("/data/bars/BND.csv", {"date,close", "2024-01-02,1"});
    mockReader_->setFile("/data/dividends/VXUS.csv", {"ex_date,amount"});

    auto symbols = loader_->discoverSymbols();
    ASSERT_TRUE(symbols.has_value());
    EXPECT_EQ(*symbols, (std::vector<std::string>{"BND", "VTI"}));
}

TEST_F(CSVLoaderTest, ImportIntoStore) {
    mockReader_->setFile("/data/bars/VTI.csv", {"date,close", "2024-01-02,230", "2024-01-03,231"});
    mockReader_->setFile("/data/bars/BND.csv", {"date,close", "2024-01-02,72"});
    mockReader_->setFile("/data/dividends/VTI.csv", {"ex_date,amount", "2024-01-03,0.9"});
    mockReader_->setFile("/data/metadata.csv", {"symbol,expense_ratio", "VTI,0.0003"});

    InMemoryMarketDataStore store;
    auto report = loader_->importInto(store);
    ASSERT_TRUE(report.has_value()) << report.error();

    EXPECT_EQ(report->symbolsLoaded, 2u);
    EXPECT_EQ(report->barsLoaded, 3u);
    EXPECT_EQ(report->dividendsLoaded, 1u);
    EXPECT_TRUE(report->failedSymbols.empty());

    auto ratio = store.getExpenseRatio("VTI");
    ASSERT_TRUE(ratio.has_value());
    EXPECT_DOUBLE_EQ(**ratio, 0.0003);
    EXPECT_FALSE(store.getExpenseRatio("BND")->has_value());
}

TEST_F(CSVLoaderTest, ImportReportsFailedSymbols) {
    mockReader_->setFile("/data/bars/VTI.csv", {"date,close", "2024-01-02,230"});

    InMemoryMarketDataStore store;
    auto report = loader_->importInto(store, {"VTI", "MISSING"});
    ASSERT_TRUE(report.has_value()) << report.error();

    EXPECT_EQ(report->symbolsLoaded, 1u);
    EXPECT_EQ(report->failedSymbols, (std::vector<std::string>{"MISSING"}));
    EXPECT_FALSE(*store.symbolExists("MISSING"));
}

TEST_F(CSVLoaderTest, ImportEmptyDirectoryFails) {
    InMemoryMarketDataStore store;
    auto report = loader_->importInto(store);
    ASSERT_FALSE(report.has_value());
    EXPECT_NE(report.error().find("No symbols found"), std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: FileReader
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FileReaderTest, ReadsRealFiles) {
    auto dir = std::filesystem::temp_directory_path() / "portsim_file_reader_test";
    std::filesystem::create_directories(dir);
    {
        std::ofstream out(dir / "VTI.csv");
        out << "date,close\r\n\r\n2024-01-02,230\r\n";
    }

    FileReader reader;
    auto lines = reader.readLines((dir / "VTI.csv").string());
    ASSERT_TRUE(lines.has_value()) << lines.error();
    EXPECT_EQ(*lines, (std::vector<std::string>{"date,close", "2024-01-02,230"}));

    auto files = reader.listFiles(dir.string(), ".csv");
    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(*files, (std::vector<std::string>{"VTI.csv"}));

    EXPECT_FALSE(reader.readLines((dir / "missing.csv").string()).has_value());
    EXPECT_FALSE(reader.listFiles((dir / "nope").string(), ".csv").has_value());

    std::filesystem::remove_all(dir);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
