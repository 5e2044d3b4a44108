#pragma once

#include <string>
#include <cstdlib>

namespace crossover::settings {

/**
 * @brief Настройки запуска сервиса
 *
 * Читает из ENV:
 * - CROSSOVER_CONFIG_PATH (default: "config/config.json")
 * - CROSSOVER_PRICE_SOURCE: "replay" | "simulated" (default: "simulated")
 * - CROSSOVER_REPLAY_PATH (default: "config/replay.csv")
 * - CROSSOVER_TICK_INTERVAL_MS - период тиков симулятора (default: 1000)
 * - CROSSOVER_LEDGER: "memory" | "file" | "postgres" (default: "file")
 * - CROSSOVER_LEDGER_FILE (default: "data/ledger.json")
 * - CROSSOVER_NOTIFIER: "console" | "rabbitmq" | "both" (default: "console")
 * - CROSSOVER_STATUS_INTERVAL_SEC - период отчёта о состоянии, 0 - выключен (default: 60)
 */
class EngineSettings {
public:
    EngineSettings() {
        configPath_ = getEnvOrDefault("CROSSOVER_CONFIG_PATH", "config/config.json");
        priceSource_ = getEnvOrDefault("CROSSOVER_PRICE_SOURCE", "simulated");
        replayPath_ = getEnvOrDefault("CROSSOVER_REPLAY_PATH", "config/replay.csv");
        tickIntervalMs_ = std::stoi(getEnvOrDefault("CROSSOVER_TICK_INTERVAL_MS", "1000"));
        ledger_ = getEnvOrDefault("CROSSOVER_LEDGER", "file");
        ledgerFile_ = getEnvOrDefault("CROSSOVER_LEDGER_FILE", "data/ledger.json");
        notifier_ = getEnvOrDefault("CROSSOVER_NOTIFIER", "console");
        statusIntervalSec_ = std::stoi(getEnvOrDefault("CROSSOVER_STATUS_INTERVAL_SEC", "60"));
    }

    std::string getConfigPath() const { return configPath_; }
    std::string getPriceSource() const { return priceSource_; }
    std::string getReplayPath() const { return replayPath_; }
    int getTickIntervalMs() const { return tickIntervalMs_; }
    std::string getLedger() const { return ledger_; }
    std::string getLedgerFile() const { return ledgerFile_; }
    std::string getNotifier() const { return notifier_; }
    int getStatusIntervalSec() const { return statusIntervalSec_; }

    /// Путь из аргумента командной строки, если переменная окружения не задана
    void setConfigPathFallback(const std::string& path) {
        if (!std::getenv("CROSSOVER_CONFIG_PATH") && !path.empty()) {
            configPath_ = path;
        }
    }

private:
    std::string configPath_;
    std::string priceSource_;
    std::string replayPath_;
    int tickIntervalMs_;
    std::string ledger_;
    std::string ledgerFile_;
    std::string notifier_;
    int statusIntervalSec_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace crossover::settings
