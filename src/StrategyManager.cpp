#include "StrategyManager.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace portsim {

namespace {

std::string currentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

// Имя становится именем файла
Result validateName(const std::string& name)
{
    if (name.empty()) {
        return std::unexpected("Strategy name cannot be empty");
    }

    if (name.find_first_of("/\\") != std::string::npos || name == "." || name == "..") {
        return std::unexpected("Invalid strategy name: " + name);
    }

    return {};
}

} // namespace

StrategyManager::StrategyManager(const std::string& strategiesDir)
{
    if (strategiesDir.empty()) {
        // Используем директорию пользователя по умолчанию
        const char* homeDir = std::getenv("HOME");
        if (!homeDir) {
            homeDir = ".";
        }
        strategiesDir_ = std::filesystem::path(homeDir) / ".portsim" / "strategies";
    } else {
        strategiesDir_ = strategiesDir;
    }

    // Создаем директорию если не существует
    std::error_code ec;
    std::filesystem::create_directories(strategiesDir_, ec);
}

std::filesystem::path StrategyManager::getStrategyFilePath(const std::string& name) const
{
    return strategiesDir_ / (name + ".json");
}

Result StrategyManager::writeStrategy(const StrategyInfo& info) const
{
    auto filePath = getStrategyFilePath(info.config.name);

    try {
        json j = info.config.toJson();
        j["created_date"] = info.createdDate;
        j["modified_date"] = info.modifiedDate;

        std::ofstream file(filePath);
        if (!file) {
            return std::unexpected("Failed to write strategy file: " + filePath.string());
        }

        file << j.dump(2);
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to save strategy: ") + e.what());
    }
}

Result StrategyManager::createStrategy(const StrategyConfig& config)
{
    if (auto valid = validateName(config.name); !valid) {
        return valid;
    }

    if (auto valid = config.validate(); !valid) {
        return std::unexpected("Invalid strategy '" + config.name + "': " + valid.error());
    }

    if (std::filesystem::exists(getStrategyFilePath(config.name))) {
        return std::unexpected("Strategy '" + config.name + "' already exists");
    }

    std::error_code ec;
    std::filesystem::create_directories(strategiesDir_, ec);
    if (ec) {
        return std::unexpected("Failed to create directory " +
                               strategiesDir_.string() + ": " + ec.message());
    }

    auto timestamp = currentTimestamp();
    auto written = writeStrategy(StrategyInfo{config, timestamp, timestamp});
    if (!written) {
        return written;
    }

    std::cout << "Strategy '" << config.name << "' created successfully" << std::endl;
    return {};
}

std::expected<StrategyInfo, std::string> StrategyManager::getStrategy(
    const std::string& name)
{
    if (auto valid = validateName(name); !valid) {
        return std::unexpected(valid.error());
    }

    auto filePath = getStrategyFilePath(name);

    if (!std::filesystem::exists(filePath)) {
        return std::unexpected("Strategy '" + name + "' not found");
    }

    try {
        std::ifstream file(filePath);
        if (!file) {
            return std::unexpected("Failed to open strategy file: " + filePath.string());
        }

        json j;
        file >> j;

        auto config = StrategyConfig::fromJson(j);
        if (!config) {
            return std::unexpected("Strategy '" + name + "': " + config.error());
        }

        StrategyInfo info;
        info.config = std::move(*config);
        info.createdDate = j.value("created_date", "");
        info.modifiedDate = j.value("modified_date", "");
        return info;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to read strategy: ") + e.what());
    }
}

std::expected<std::vector<std::string>, std::string> StrategyManager::listStrategies()
{
    std::vector<std::string> strategies;

    try {
        if (!std::filesystem::exists(strategiesDir_)) {
            return strategies;  // Пустой список
        }

        for (const auto& entry : std::filesystem::directory_iterator(strategiesDir_)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                strategies.push_back(entry.path().stem().string());
            }
        }

        std::sort(strategies.begin(), strategies.end());
        return strategies;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to list strategies: ") + e.what());
    }
}

Result StrategyManager::updateStrategy(const StrategyConfig& config)
{
    auto existing = getStrategy(config.name);
    if (!existing) {
        return std::unexpected(existing.error());
    }

    if (auto valid = config.validate(); !valid) {
        return std::unexpected("Invalid strategy '" + config.name + "': " + valid.error());
    }

    return writeStrategy(StrategyInfo{config, existing->createdDate, currentTimestamp()});
}

Result StrategyManager::deleteStrategy(const std::string& name)
{
    if (auto valid = validateName(name); !valid) {
        return valid;
    }

    auto filePath = getStrategyFilePath(name);

    if (!std::filesystem::exists(filePath)) {
        return std::unexpected("Strategy '" + name + "' not found");
    }

    try {
        std::filesystem::remove(filePath);
        std::cout << "Strategy '" << name << "' deleted successfully" << std::endl;
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to delete strategy: ") + e.what());
    }
}

} // namespace portsim
