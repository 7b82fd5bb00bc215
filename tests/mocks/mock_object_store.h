#pragma once
#ifndef TESTS_MOCKS_MOCK_OBJECT_STORE_H
#define TESTS_MOCKS_MOCK_OBJECT_STORE_H

#include <gmock/gmock.h>
#include "node/object_store.h"
#include <optional>
#include <string>
#include <vector>

class MockObjectStoreClient : public chunkvault::ObjectStoreClient {
public:
    MOCK_METHOD(void, putObject,
                (const std::string &address, const std::string &key, const std::vector<std::byte> &data),
                (override));
    MOCK_METHOD(std::optional<std::vector<std::byte>>, getObject,
                (const std::string &address, const std::string &key), (override));
    MOCK_METHOD(bool, deleteObject, (const std::string &address, const std::string &key), (override));
};

#endif // TESTS_MOCKS_MOCK_OBJECT_STORE_H
