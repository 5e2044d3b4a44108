#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include <gmock/gmock.h>

namespace crossover::tests {

/**
 * @brief GMock для ILedgerRepository
 */
class MockLedgerRepository : public ports::output::ILedgerRepository {
public:
    MOCK_METHOD(void, save, (const domain::LedgerEntry& entry), (override));
    MOCK_METHOD(std::vector<domain::LedgerEntry>, loadAll, (), (override));
    MOCK_METHOD(void, remove, (const std::string& symbol), (override));
};

} // namespace crossover::tests
