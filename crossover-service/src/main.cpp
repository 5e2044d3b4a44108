#include "CrossoverApp.hpp"
#include "domain/ConfigurationError.hpp"
#include <csignal>
#include <iostream>

namespace {

// Обработчик сигналов видит приложение только через этот указатель
CrossoverApp* g_app = nullptr;

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ", stopping crossover engine..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

void printBanner() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Crossover Service v1.0.0" << std::endl;
    std::cout << "  MA crossover signals -> paper venue" << std::endl;
    std::cout << "  Usage: crossover-service [config.json]" << std::endl;
    std::cout << "  Ctrl+C for graceful shutdown" << std::endl;
    std::cout << "========================================" << std::endl;
}

} // namespace

/**
 * Коды выхода: 0 - штатная остановка, 1 - ошибка выполнения,
 * 2 - некорректная конфигурация (файл, ключи биржи).
 */
int main(int argc, char* argv[]) {
    printBanner();

    try {
        CrossoverApp app;
        g_app = &app;
        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        // loadEnvironment() -> configureInjection() -> start()
        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Crossover Service stopped" << std::endl;
        return 0;

    } catch (const crossover::domain::ConfigurationError& e) {
        g_app = nullptr;
        std::cerr << "[main] Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
