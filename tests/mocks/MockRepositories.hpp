#pragma once

#include <gmock/gmock.h>
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IPresenceRepository.hpp"
#include "ports/output/IVisibilityRepository.hpp"

namespace finger::tests::mocks {

// Используются для проверки реакции на отказ хранилища

class MockAccountRepository : public ports::output::IAccountRepository {
public:
    MOCK_METHOD(bool, create, (const domain::Account&), (override));
    MOCK_METHOD(std::optional<domain::Account>, findByUsername, (const std::string&), (override));
    MOCK_METHOD(size_t, count, (), (override));
};

class MockPresenceRepository : public ports::output::IPresenceRepository {
public:
    MOCK_METHOD(std::optional<domain::PresenceStatus>, find, (const std::string&), (override));
    MOCK_METHOD(void, save, (const domain::PresenceStatus&), (override));
    MOCK_METHOD(std::vector<domain::PresenceStatus>, findAll, (), (override));
};

class MockVisibilityRepository : public ports::output::IVisibilityRepository {
public:
    MOCK_METHOD(void, append, (const domain::VisibilityEntry&), (override));
    MOCK_METHOD(std::vector<domain::VisibilityEntry>, findBySubject, (const std::string&), (override));
};

} // namespace finger::tests::mocks
