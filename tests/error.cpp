#include <catch2/catch_test_macros.hpp>
#include <set>
#include <string>

#include "sqlkv/error.h"

TEST_CASE("every error has its own description", "[error]")
{
    using sqlkv::KvError;
    const KvError errors[] = {KvError::NoError,
                              KvError::InvalidArgs,
                              KvError::NotFound,
                              KvError::NotRunning,
                              KvError::InitFailed,
                              KvError::ValueTooLarge,
                              KvError::Corrupted,
                              KvError::TryAgain,
                              KvError::Busy,
                              KvError::Timeout,
                              KvError::BackendErr};
    std::set<std::string> seen;
    for (KvError err : errors)
    {
        std::string str = sqlkv::ErrorString(err);
        REQUIRE(str != "Unknown error");
        REQUIRE(seen.insert(str).second);
    }
    static_assert(sqlkv::ErrorString(KvError::NoError)[0] == 'S');
}

TEST_CASE("retryable errors", "[error]")
{
    using sqlkv::KvError;
    REQUIRE(sqlkv::IsRetryableErr(KvError::TryAgain));
    REQUIRE(sqlkv::IsRetryableErr(KvError::Busy));
    REQUIRE(sqlkv::IsRetryableErr(KvError::Timeout));

    REQUIRE_FALSE(sqlkv::IsRetryableErr(KvError::NoError));
    REQUIRE_FALSE(sqlkv::IsRetryableErr(KvError::InvalidArgs));
    REQUIRE_FALSE(sqlkv::IsRetryableErr(KvError::NotFound));
    REQUIRE_FALSE(sqlkv::IsRetryableErr(KvError::NotRunning));
    REQUIRE_FALSE(sqlkv::IsRetryableErr(KvError::InitFailed));
    REQUIRE_FALSE(sqlkv::IsRetryableErr(KvError::ValueTooLarge));
    REQUIRE_FALSE(sqlkv::IsRetryableErr(KvError::Corrupted));
    REQUIRE_FALSE(sqlkv::IsRetryableErr(KvError::BackendErr));
}
