#pragma once

#include <string>
#include <cstdlib>

namespace crossover::settings {

/**
 * @brief Настройки торговой площадки
 *
 * Читает из ENV:
 * - CROSSOVER_API_KEY / CROSSOVER_API_SECRET - перекрывают ключи из снимка конфигурации
 * - CROSSOVER_PAPER_MODE: "immediate" | "reject" | "fail_first_n" (default: "immediate")
 * - CROSSOVER_PAPER_FAIL_FIRST (default: 0)
 */
class VenueSettings {
public:
    VenueSettings() {
        if (const char* key = std::getenv("CROSSOVER_API_KEY")) {
            apiKey_ = key;
        }
        if (const char* secret = std::getenv("CROSSOVER_API_SECRET")) {
            apiSecret_ = secret;
        }
        if (const char* mode = std::getenv("CROSSOVER_PAPER_MODE")) {
            paperMode_ = mode;
        }
        if (const char* failFirst = std::getenv("CROSSOVER_PAPER_FAIL_FIRST")) {
            paperFailFirst_ = std::stoi(failFirst);
        }
    }

    std::string getApiKey() const { return apiKey_; }
    std::string getApiSecret() const { return apiSecret_; }
    std::string getPaperMode() const { return paperMode_; }
    int getPaperFailFirst() const { return paperFailFirst_; }

private:
    std::string apiKey_;
    std::string apiSecret_;
    std::string paperMode_ = "immediate";
    int paperFailFirst_ = 0;
};

} // namespace crossover::settings
