#include "SQLiteMarketDataStore.hpp"
#include <stdexcept>

namespace portsim {

namespace {

std::string columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string{};
}

std::expected<TimePoint, std::string> columnDate(sqlite3_stmt* stmt, int column)
{
    return parseDate(columnText(stmt, column));
}

void bindDate(sqlite3_stmt* stmt, int index, const TimePoint& date)
{
    std::string text = formatDate(date);
    sqlite3_bind_text(stmt, index, text.c_str(), -1, SQLITE_TRANSIENT);
}

} // namespace

// ═════════════════════════════════════════════════════════════════════════════
// Конструктор и деструктор
// ═════════════════════════════════════════════════════════════════════════════

SQLiteMarketDataStore::SQLiteMarketDataStore(std::string_view dbPath)
    : dbPath_(dbPath)
{
    if (!dbPath.empty()) {
        auto result = initializeDatabase(dbPath);
        if (!result) {
            throw std::runtime_error("Failed to initialize database: " + result.error());
        }
    }
}

SQLiteMarketDataStore::~SQLiteMarketDataStore()
{
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Инициализация
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteMarketDataStore::initializeFromOptions(
    const boost::program_options::variables_map& options)
{
    if (initialized_) {
        return {};
    }

    if (!options.count("sqlite-path")) {
        return std::unexpected(
            "SQLite database path not specified.\n"
            "Use --sqlite-path <path>");
    }

    return initializeDatabase(options.at("sqlite-path").as<std::string>());
}

Result SQLiteMarketDataStore::initializeDatabase(std::string_view path)
{
    if (initialized_) {
        return {};
    }

    dbPath_ = std::string(path);

    int rc = sqlite3_open(dbPath_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = "Failed to open database: ";
        if (db_) {
            error += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        } else {
            error += "Out of memory";
        }
        return std::unexpected(error);
    }

    sqlite3_exec(db_, "PRAGMA foreign_keys = ON", nullptr, nullptr, nullptr);

    auto createResult = createTables();
    if (!createResult) {
        sqlite3_close(db_);
        db_ = nullptr;
        return createResult;
    }

    initialized_ = true;
    return {};
}

Result SQLiteMarketDataStore::createTables()
{
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS symbols (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            symbol TEXT NOT NULL UNIQUE,
            expense_ratio REAL
        );

        CREATE TABLE IF NOT EXISTS bars (
            symbol_pk INTEGER NOT NULL,
            date TEXT NOT NULL,
            open REAL NOT NULL,
            high REAL NOT NULL,
            low REAL NOT NULL,
            close REAL NOT NULL,
            adj_close REAL NOT NULL,
            volume REAL NOT NULL,
            FOREIGN KEY (symbol_pk) REFERENCES symbols(id) ON DELETE CASCADE,
            UNIQUE(symbol_pk, date)
        );

        CREATE TABLE IF NOT EXISTS dividends (
            symbol_pk INTEGER NOT NULL,
            ex_date TEXT NOT NULL,
            pay_date TEXT,
            amount REAL NOT NULL,
            qualified_pct REAL,
            FOREIGN KEY (symbol_pk) REFERENCES symbols(id) ON DELETE CASCADE,
            UNIQUE(symbol_pk, ex_date)
        );

        CREATE TABLE IF NOT EXISTS splits (
            symbol_pk INTEGER NOT NULL,
            ex_date TEXT NOT NULL,
            ratio REAL NOT NULL,
            FOREIGN KEY (symbol_pk) REFERENCES symbols(id) ON DELETE CASCADE,
            UNIQUE(symbol_pk, ex_date)
        );

        CREATE INDEX IF NOT EXISTS idx_bars_date ON bars(symbol_pk, date);
        CREATE INDEX IF NOT EXISTS idx_dividends_date ON dividends(symbol_pk, ex_date);
        CREATE INDEX IF NOT EXISTS idx_splits_date ON splits(symbol_pk, ex_date);
    )";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return std::unexpected("Failed to create tables: " + error);
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Вспомогательные методы
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteMarketDataStore::ensureReady() const
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }
    return {};
}

std::expected<sqlite3_int64, std::string> SQLiteMarketDataStore::symbolKey(
    std::string_view symbol)
{
    const char* sql = "SELECT id FROM symbols WHERE symbol = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, symbol.data(), static_cast<int>(symbol.size()), SQLITE_TRANSIENT);

    sqlite3_int64 key = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        key = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (key == 0) {
        return std::unexpected("Symbol not found: " + std::string(symbol));
    }
    return key;
}

Result SQLiteMarketDataStore::beginTransaction()
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, "BEGIN TRANSACTION", nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return std::unexpected("Failed to begin transaction: " + error);
    }
    return {};
}

Result SQLiteMarketDataStore::commitTransaction()
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        rollbackTransaction();
        return std::unexpected("Failed to commit transaction: " + error);
    }
    return {};
}

void SQLiteMarketDataStore::rollbackTransaction()
{
    sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
}

std::expected<std::size_t, std::string> SQLiteMarketDataStore::countRows(
    const char* table,
    sqlite3_int64 symbolPk)
{
    std::string sql = std::string("SELECT COUNT(*) FROM ") + table + " WHERE symbol_pk = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, symbolPk);

    std::size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    return count;
}

// ═════════════════════════════════════════════════════════════════════════════
// Запись
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteMarketDataStore::saveSymbol(std::string_view symbol)
{
    if (auto ready = ensureReady(); !ready) {
        return ready;
    }

    if (symbol.empty()) {
        return std::unexpected("Symbol cannot be empty");
    }

    const char* sql = "INSERT OR IGNORE INTO symbols (symbol) VALUES (?)";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, symbol.data(), static_cast<int>(symbol.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to save symbol: " + std::string(sqlite3_errmsg(db_)));
    }

    return {};
}

Result SQLiteMarketDataStore::saveBars(
    std::string_view symbol,
    const std::vector<Bar>& bars)
{
    if (auto ready = ensureReady(); !ready) {
        return ready;
    }

    auto key = symbolKey(symbol);
    if (!key) {
        return std::unexpected(key.error());
    }

    if (auto tx = beginTransaction(); !tx) {
        return tx;
    }

    const char* sql = R"(
        INSERT OR REPLACE INTO bars
        (symbol_pk, date, open, high, low, close, adj_close, volume)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        rollbackTransaction();
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    for (const auto& bar : bars) {
        sqlite3_bind_int64(stmt, 1, *key);
        bindDate(stmt, 2, bar.date);
        sqlite3_bind_double(stmt, 3, bar.open);
        sqlite3_bind_double(stmt, 4, bar.high);
        sqlite3_bind_double(stmt, 5, bar.low);
        sqlite3_bind_double(stmt, 6, bar.close);
        sqlite3_bind_double(stmt, 7, bar.adjClose);
        sqlite3_bind_double(stmt, 8, bar.volume);

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            std::string error = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            rollbackTransaction();
            return std::unexpected("Failed to insert bar: " + error);
        }

        sqlite3_reset(stmt);
    }

    sqlite3_finalize(stmt);
    return commitTransaction();
}

Result SQLiteMarketDataStore::saveDividends(
    std::string_view symbol,
    const std::vector<DividendEvent>& dividends)
{
    if (auto ready = ensureReady(); !ready) {
        return ready;
    }

    auto key = symbolKey(symbol);
    if (!key) {
        return std::unexpected(key.error());
    }

    if (auto tx = beginTransaction(); !tx) {
        return tx;
    }

    const char* sql = R"(
        INSERT OR REPLACE INTO dividends
        (symbol_pk, ex_date, pay_date, amount, qualified_pct)
        VALUES (?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        rollbackTransaction();
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    for (const auto& dividend : dividends) {
        sqlite3_bind_int64(stmt, 1, *key);
        bindDate(stmt, 2, dividend.exDate);

        if (dividend.payDate) {
            bindDate(stmt, 3, *dividend.payDate);
        } else {
            sqlite3_bind_null(stmt, 3);
        }

        sqlite3_bind_double(stmt, 4, dividend.amount);

        if (dividend.qualifiedPct) {
            sqlite3_bind_double(stmt, 5, *dividend.qualifiedPct);
        } else {
            sqlite3_bind_null(stmt, 5);
        }

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            std::string error = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            rollbackTransaction();
            return std::unexpected("Failed to insert dividend: " + error);
        }

        sqlite3_reset(stmt);
    }

    sqlite3_finalize(stmt);
    return commitTransaction();
}

Result SQLiteMarketDataStore::saveSplits(
    std::string_view symbol,
    const std::vector<SplitEvent>& splits)
{
    if (auto ready = ensureReady(); !ready) {
        return ready;
    }

    auto key = symbolKey(symbol);
    if (!key) {
        return std::unexpected(key.error());
    }

    if (auto tx = beginTransaction(); !tx) {
        return tx;
    }

    const char* sql =
        "INSERT OR REPLACE INTO splits (symbol_pk, ex_date, ratio) VALUES (?, ?, ?)";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        rollbackTransaction();
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    for (const auto& split : splits) {
        sqlite3_bind_int64(stmt, 1, *key);
        bindDate(stmt, 2, split.exDate);
        sqlite3_bind_double(stmt, 3, split.ratio);

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            std::string error = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            rollbackTransaction();
            return std::unexpected("Failed to insert split: " + error);
        }

        sqlite3_reset(stmt);
    }

    sqlite3_finalize(stmt);
    return commitTransaction();
}

Result SQLiteMarketDataStore::saveExpenseRatio(
    std::string_view symbol,
    double expenseRatio)
{
    if (auto ready = ensureReady(); !ready) {
        return ready;
    }

    if (expenseRatio < 0.0) {
        return std::unexpected("Expense ratio cannot be negative");
    }

    auto key = symbolKey(symbol);
    if (!key) {
        return std::unexpected(key.error());
    }

    const char* sql = "UPDATE symbols SET expense_ratio = ? WHERE id = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_double(stmt, 1, expenseRatio);
    sqlite3_bind_int64(stmt, 2, *key);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to save expense ratio: " + std::string(sqlite3_errmsg(db_)));
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Чтение
// ═════════════════════════════════════════════════════════════════════════════

std::expected<std::vector<std::string>, std::string> SQLiteMarketDataStore::listSymbols()
{
    if (auto ready = ensureReady(); !ready) {
        return std::unexpected(ready.error());
    }

    const char* sql = "SELECT symbol FROM symbols ORDER BY symbol";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    std::vector<std::string> symbols;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        symbols.push_back(columnText(stmt, 0));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Error reading symbols: " + std::string(sqlite3_errmsg(db_)));
    }

    return symbols;
}

std::expected<bool, std::string> SQLiteMarketDataStore::symbolExists(
    std::string_view symbol)
{
    if (auto ready = ensureReady(); !ready) {
        return std::unexpected(ready.error());
    }

    return symbolKey(symbol).has_value();
}

std::expected<std::vector<Bar>, std::string> SQLiteMarketDataStore::getBars(
    std::string_view symbol,
    const TimePoint& startDate,
    const TimePoint& endDate)
{
    if (auto ready = ensureReady(); !ready) {
        return std::unexpected(ready.error());
    }

    const char* sql = R"(
        SELECT b.date, b.open, b.high, b.low, b.close, b.adj_close, b.volume
        FROM bars b
        JOIN symbols s ON b.symbol_pk = s.id
        WHERE s.symbol = ? AND b.date >= ? AND b.date <= ?
        ORDER BY b.date
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, symbol.data(), static_cast<int>(symbol.size()), SQLITE_TRANSIENT);
    bindDate(stmt, 2, startDate);
    bindDate(stmt, 3, endDate);

    std::vector<Bar> bars;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto date = columnDate(stmt, 0);
        if (!date) {
            sqlite3_finalize(stmt);
            return std::unexpected("Corrupted bar date: " + date.error());
        }

        Bar bar;
        bar.date = *date;
        bar.open = sqlite3_column_double(stmt, 1);
        bar.high = sqlite3_column_double(stmt, 2);
        bar.low = sqlite3_column_double(stmt, 3);
        bar.close = sqlite3_column_double(stmt, 4);
        bar.adjClose = sqlite3_column_double(stmt, 5);
        bar.volume = sqlite3_column_double(stmt, 6);
        bars.push_back(bar);
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Error reading bars: " + std::string(sqlite3_errmsg(db_)));
    }

    return bars;
}

std::expected<std::vector<DividendEvent>, std::string> SQLiteMarketDataStore::getDividends(
    std::string_view symbol,
    const TimePoint& startDate,
    const TimePoint& endDate)
{
    if (auto ready = ensureReady(); !ready) {
        return std::unexpected(ready.error());
    }

    const char* sql = R"(
        SELECT d.ex_date, d.pay_date, d.amount, d.qualified_pct
        FROM dividends d
        JOIN symbols s ON d.symbol_pk = s.id
        WHERE s.symbol = ? AND d.ex_date >= ? AND d.ex_date <= ?
        ORDER BY d.ex_date
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, symbol.data(), static_cast<int>(symbol.size()), SQLITE_TRANSIENT);
    bindDate(stmt, 2, startDate);
    bindDate(stmt, 3, endDate);

    std::vector<DividendEvent> dividends;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto exDate = columnDate(stmt, 0);
        if (!exDate) {
            sqlite3_finalize(stmt);
            return std::unexpected("Corrupted dividend date: " + exDate.error());
        }

        DividendEvent dividend;
        dividend.exDate = *exDate;

        if (sqlite3_column_type(stmt, 1) != SQLITE_NULL) {
            auto payDate = columnDate(stmt, 1);
            if (payDate) {
                dividend.payDate = *payDate;
            }
        }

        dividend.amount = sqlite3_column_double(stmt, 2);

        if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
            dividend.qualifiedPct = sqlite3_column_double(stmt, 3);
        }

        dividends.push_back(dividend);
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Error reading dividends: " + std::string(sqlite3_errmsg(db_)));
    }

    return dividends;
}

std::expected<std::vector<SplitEvent>, std::string> SQLiteMarketDataStore::getSplits(
    std::string_view symbol,
    const TimePoint& startDate,
    const TimePoint& endDate)
{
    if (auto ready = ensureReady(); !ready) {
        return std::unexpected(ready.error());
    }

    const char* sql = R"(
        SELECT sp.ex_date, sp.ratio
        FROM splits sp
        JOIN symbols s ON sp.symbol_pk = s.id
        WHERE s.symbol = ? AND sp.ex_date >= ? AND sp.ex_date <= ?
        ORDER BY sp.ex_date
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, symbol.data(), static_cast<int>(symbol.size()), SQLITE_TRANSIENT);
    bindDate(stmt, 2, startDate);
    bindDate(stmt, 3, endDate);

    std::vector<SplitEvent> splits;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto exDate = columnDate(stmt, 0);
        if (!exDate) {
            sqlite3_finalize(stmt);
            return std::unexpected("Corrupted split date: " + exDate.error());
        }

        splits.push_back(SplitEvent{*exDate, sqlite3_column_double(stmt, 1)});
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Error reading splits: " + std::string(sqlite3_errmsg(db_)));
    }

    return splits;
}

std::expected<std::optional<double>, std::string> SQLiteMarketDataStore::getExpenseRatio(
    std::string_view symbol)
{
    if (auto ready = ensureReady(); !ready) {
        return std::unexpected(ready.error());
    }

    const char* sql = "SELECT expense_ratio FROM symbols WHERE symbol = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, symbol.data(), static_cast<int>(symbol.size()), SQLITE_TRANSIENT);

    std::optional<double> ratio;
    if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        ratio = sqlite3_column_double(stmt, 0);
    }
    sqlite3_finalize(stmt);

    return ratio;
}

std::expected<SymbolInfo, std::string> SQLiteMarketDataStore::getSymbolInfo(
    std::string_view symbol)
{
    if (auto ready = ensureReady(); !ready) {
        return std::unexpected(ready.error());
    }

    auto key = symbolKey(symbol);
    if (!key) {
        return std::unexpected(key.error());
    }

    SymbolInfo info;
    info.symbol = std::string(symbol);

    auto bars = countRows("bars", *key);
    auto dividends = countRows("dividends", *key);
    auto splits = countRows("splits", *key);
    if (!bars || !dividends || !splits) {
        return std::unexpected("Failed to count rows for " + info.symbol);
    }

    info.barCount = *bars;
    info.dividendCount = *dividends;
    info.splitCount = *splits;

    const char* sql = "SELECT MIN(date), MAX(date) FROM bars WHERE symbol_pk = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, *key);

    if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        if (auto first = columnDate(stmt, 0)) {
            info.firstBar = *first;
        }
        if (auto last = columnDate(stmt, 1)) {
            info.lastBar = *last;
        }
    }
    sqlite3_finalize(stmt);

    auto ratio = getExpenseRatio(symbol);
    if (!ratio) {
        return std::unexpected(ratio.error());
    }
    info.expenseRatio = *ratio;

    return info;
}

// ═════════════════════════════════════════════════════════════════════════════
// Удаление
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteMarketDataStore::deleteSymbol(std::string_view symbol)
{
    if (auto ready = ensureReady(); !ready) {
        return ready;
    }

    // Бары, дивиденды и сплиты удаляются каскадно
    const char* sql = "DELETE FROM symbols WHERE symbol = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_text(stmt, 1, symbol.data(), static_cast<int>(symbol.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to delete symbol: " + std::string(sqlite3_errmsg(db_)));
    }

    if (sqlite3_changes(db_) == 0) {
        return std::unexpected("Symbol not found: " + std::string(symbol));
    }

    return {};
}

}  // namespace portsim
