#pragma once

#include "domain/EngineConfig.hpp"
#include "domain/ConfigurationError.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace crossover::application {

/**
 * @brief Загрузка снимка конфигурации из JSON
 *
 * Формат:
 * ```json
 * {
 *   "credentials": {"apiKey": "...", "apiSecret": "..."},
 *   "autoTrade": true,
 *   "notifySuppressed": true,
 *   "reconnectDelayMs": 5000,
 *   "retry": {"maxAttempts": 3, "initialBackoffMs": 1000, "multiplier": 2.0, "maxBackoffMs": 10000},
 *   "rateLimit": {"ordersPerSecond": 5, "burst": 5},
 *   "defaults": {"shortWindow": 9, "longWindow": 26, "averageType": "SMA", "quantity": 0.01},
 *   "symbols": ["ETHUSDT", {"symbol": "BTCUSDT", "quantity": 0.001, "averageType": "EMA"}]
 * }
 * ```
 *
 * Ошибки структуры (невалидный JSON, неверные типы, неизвестный averageType)
 * бросают ConfigurationError. Смысловые ошибки параметров символа
 * проверяются движком и выключают только этот символ.
 */
class ConfigLoader {
public:
    /**
     * @brief Загрузить из файла
     * @throws domain::ConfigurationError если файл не открыт или формат неверный
     */
    static domain::EngineConfig loadFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw domain::ConfigurationError("Cannot open config file: " + path);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        std::cout << "[ConfigLoader] Loading " << path << std::endl;
        return parse(buffer.str());
    }

    /**
     * @brief Разобрать JSON-строку
     * @throws domain::ConfigurationError если формат неверный
     */
    static domain::EngineConfig parse(const std::string& text) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw domain::ConfigurationError(std::string("Invalid config JSON: ") + e.what());
        }

        try {
            return fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw domain::ConfigurationError(std::string("Invalid config field: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw domain::ConfigurationError(std::string("Invalid config value: ") + e.what());
        }
    }

private:
    static domain::EngineConfig fromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw domain::ConfigurationError("Config root must be an object");
        }

        domain::EngineConfig config;

        if (j.contains("credentials")) {
            const auto& c = j.at("credentials");
            config.credentials.apiKey = c.value("apiKey", "");
            config.credentials.apiSecret = c.value("apiSecret", "");
        }

        config.autoTrade = j.value("autoTrade", config.autoTrade);
        config.notifySuppressed = j.value("notifySuppressed", config.notifySuppressed);
        config.reconnectDelay = std::chrono::milliseconds(
            j.value("reconnectDelayMs", static_cast<int64_t>(config.reconnectDelay.count())));

        if (j.contains("retry")) {
            const auto& r = j.at("retry");
            config.retry.maxAttempts = r.value("maxAttempts", config.retry.maxAttempts);
            config.retry.initialBackoff = std::chrono::milliseconds(
                r.value("initialBackoffMs", static_cast<int64_t>(config.retry.initialBackoff.count())));
            config.retry.multiplier = r.value("multiplier", config.retry.multiplier);
            config.retry.maxBackoff = std::chrono::milliseconds(
                r.value("maxBackoffMs", static_cast<int64_t>(config.retry.maxBackoff.count())));
        }
        if (config.retry.maxAttempts < 1) {
            throw domain::ConfigurationError("retry.maxAttempts must be >= 1");
        }
        if (config.retry.multiplier < 1.0) {
            throw domain::ConfigurationError("retry.multiplier must be >= 1");
        }
        if (config.retry.initialBackoff.count() < 0) {
            throw domain::ConfigurationError("retry.initialBackoffMs must be >= 0");
        }
        if (config.retry.maxBackoff < config.retry.initialBackoff) {
            throw domain::ConfigurationError("retry.maxBackoffMs must be >= initialBackoffMs");
        }
        if (config.reconnectDelay.count() < 0) {
            throw domain::ConfigurationError("reconnectDelayMs must be >= 0");
        }

        if (j.contains("rateLimit")) {
            const auto& rl = j.at("rateLimit");
            config.rateLimit.ordersPerSecond = rl.value("ordersPerSecond", config.rateLimit.ordersPerSecond);
            config.rateLimit.burst = rl.value("burst", config.rateLimit.burst);
        }
        if (config.rateLimit.ordersPerSecond <= 0.0 || config.rateLimit.burst < 1) {
            throw domain::ConfigurationError("rateLimit must allow at least one order");
        }

        domain::SymbolConfig defaults;
        if (j.contains("defaults")) {
            defaults = symbolFromJson(j.at("defaults"), defaults);
        }

        if (j.contains("symbols")) {
            for (const auto& item : j.at("symbols")) {
                domain::SymbolConfig symbolConfig = defaults;
                if (item.is_string()) {
                    symbolConfig.symbol = item.get<std::string>();
                } else {
                    symbolConfig = symbolFromJson(item, defaults);
                }
                roundQuantity(symbolConfig);
                config.symbols.push_back(symbolConfig);
            }
        }

        std::cout << "[ConfigLoader] Loaded " << config.symbols.size() << " symbols, autoTrade="
                  << (config.autoTrade ? "on" : "off") << std::endl;
        return config;
    }

    static domain::SymbolConfig symbolFromJson(const nlohmann::json& s, const domain::SymbolConfig& defaults) {
        domain::SymbolConfig config = defaults;
        config.symbol = s.value("symbol", defaults.symbol);
        config.shortWindow = s.value("shortWindow", defaults.shortWindow);
        config.longWindow = s.value("longWindow", defaults.longWindow);
        if (s.contains("averageType")) {
            config.averageType = domain::averageTypeFromString(s.at("averageType").get<std::string>());
        }
        config.quantity = s.value("quantity", defaults.quantity);
        config.minReexecutionInterval = std::chrono::milliseconds(
            s.value("minReexecutionIntervalMs", static_cast<int64_t>(defaults.minReexecutionInterval.count())));
        if (s.contains("autoTrade")) {
            config.autoTrade = s.at("autoTrade").get<bool>();
        }
        config.priceDecimals = s.value("priceDecimals", defaults.priceDecimals);
        config.quantityDecimals = s.value("quantityDecimals", defaults.quantityDecimals);
        checkDecimals(config.symbol, "priceDecimals", config.priceDecimals);
        checkDecimals(config.symbol, "quantityDecimals", config.quantityDecimals);
        return config;
    }

    static constexpr int MAX_DECIMALS = 12;

    static void checkDecimals(const std::string& symbol, const char* field, int value) {
        if (value < 0 || value > MAX_DECIMALS) {
            throw domain::ConfigurationError(symbol + ": " + field + " must be in [0, " +
                                             std::to_string(MAX_DECIMALS) + "]");
        }
    }

    static void roundQuantity(domain::SymbolConfig& config) {
        if (config.quantityDecimals < 0 || config.quantity <= 0.0) {
            return;
        }
        double rounded = domain::roundToDecimals(config.quantity, config.quantityDecimals);
        if (rounded != config.quantity) {
            std::cout << "[ConfigLoader] " << config.symbol << ": quantity " << config.quantity
                      << " rounded to " << rounded << std::endl;
        }
        if (rounded <= 0.0) {
            std::cerr << "[ConfigLoader] " << config.symbol << ": quantity rounds to zero with "
                      << config.quantityDecimals << " decimals" << std::endl;
        }
        config.quantity = rounded;
    }
};

} // namespace crossover::application
