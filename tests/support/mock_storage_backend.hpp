#ifndef OFFLINE_CACHE_TESTS_MOCK_STORAGE_BACKEND_HPP
#define OFFLINE_CACHE_TESTS_MOCK_STORAGE_BACKEND_HPP

#include <gmock/gmock.h>

#include <optional>
#include <string>
#include <vector>

#include "../../src/cache/backend/interface.hpp"

namespace test_support {
    class MockStorageBackend : public cache::backend::IStorageBackend {
       public:
        MOCK_METHOD(std::vector<std::string>, list_partitions, (), (const, override));
        MOCK_METHOD(bool, has_partition, (const std::string&), (const, override));
        MOCK_METHOD(void, open_partition, (const std::string&), (override));
        MOCK_METHOD(bool, delete_partition, (const std::string&), (override));
        MOCK_METHOD(std::optional<cache::entry::CacheEntry>, get, (const std::string&, const std::string&), (const, override));
        MOCK_METHOD(void, put, (const std::string&, const cache::entry::CacheEntry&), (override));
        MOCK_METHOD(std::vector<std::string>, keys, (const std::string&), (const, override));
    };
}  // namespace test_support

#endif
