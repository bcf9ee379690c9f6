#include <catch2/catch_test_macros.hpp>
#include <string>

#include "common.h"

TEST_CASE("put get delete", "[crud]")
{
    sqlkv::SqlKvStore store(test_util::MemOptions());
    REQUIRE(store.Open() == sqlkv::KvError::NoError);

    REQUIRE(store.Get("a").second == sqlkv::KvError::NotFound);
    REQUIRE(store.Put("a", "1") == sqlkv::KvError::NoError);
    auto [value, err] = store.Get("a");
    REQUIRE(err == sqlkv::KvError::NoError);
    REQUIRE(value == "1");

    // Upsert over an existing key.
    REQUIRE(store.Put("a", "11") == sqlkv::KvError::NoError);
    REQUIRE(store.Get("a").first == "11");

    REQUIRE(store.Delete("a") == sqlkv::KvError::NoError);
    REQUIRE(store.Get("a").second == sqlkv::KvError::NotFound);
    // Deleting an absent key is not an error.
    REQUIRE(store.Delete("a") == sqlkv::KvError::NoError);
    REQUIRE(store.Delete("never") == sqlkv::KvError::NoError);
}

TEST_CASE("binary keys and values", "[crud]")
{
    sqlkv::SqlKvStore store(test_util::MemOptions());
    REQUIRE(store.Open() == sqlkv::KvError::NoError);

    const std::string key("\0k\xff", 3);
    const std::string value("\0\x01\x80\xfe v", 6);
    REQUIRE(store.Put(key, value) == sqlkv::KvError::NoError);
    auto [got, err] = store.Get(key);
    REQUIRE(err == sqlkv::KvError::NoError);
    REQUIRE(got == value);

    // A key is not confused with its prefix.
    REQUIRE(store.Get(std::string("\0k", 2)).second ==
            sqlkv::KvError::NotFound);

    REQUIRE(store.Put("empty", "") == sqlkv::KvError::NoError);
    auto [empty, err_empty] = store.Get("empty");
    REQUIRE(err_empty == sqlkv::KvError::NoError);
    REQUIRE(empty.empty());
}

TEST_CASE("key and value size limits", "[crud]")
{
    sqlkv::KvOptions opts = test_util::MemOptions();
    opts.key_size = 16;
    opts.value_size = 32;
    sqlkv::SqlKvStore store(opts);
    REQUIRE(store.Open() == sqlkv::KvError::NoError);

    const std::string max_key(8, 'k');
    const std::string max_value(16, 'v');
    REQUIRE(store.Put(max_key, max_value) == sqlkv::KvError::NoError);
    REQUIRE(store.Get(max_key).first == max_value);

    REQUIRE(store.Put(max_key + "k", "v") == sqlkv::KvError::ValueTooLarge);
    REQUIRE(store.Put("k", max_value + "v") == sqlkv::KvError::ValueTooLarge);
    REQUIRE(store.Get(max_key + "k").second == sqlkv::KvError::ValueTooLarge);
    // Nothing is truncated.
    REQUIRE(store.Get("k").second == sqlkv::KvError::NotFound);

    REQUIRE(store.Put("", "v") == sqlkv::KvError::InvalidArgs);
    REQUIRE(store.Get("").second == sqlkv::KvError::InvalidArgs);
    REQUIRE(store.Delete("") == sqlkv::KvError::InvalidArgs);
}

TEST_CASE("default column widths hold half as many bytes", "[crud]")
{
    sqlkv::KvOptions opts = test_util::MemOptions();
    REQUIRE(opts.key_size == 256);
    REQUIRE(opts.value_size == 1024);
    sqlkv::SqlKvStore store(opts);
    REQUIRE(store.Open() == sqlkv::KvError::NoError);

    const std::string key(128, '\xab');
    const std::string value(512, '\xcd');
    REQUIRE(store.Put(key, value) == sqlkv::KvError::NoError);
    REQUIRE(store.Get(key).first == value);

    // A value of value_size bytes does not fit a value_size wide column.
    REQUIRE(store.Put("k", std::string(1024, 'v')) ==
            sqlkv::KvError::ValueTooLarge);
    REQUIRE(store.Put("k", value + "v") == sqlkv::KvError::ValueTooLarge);
    REQUIRE(store.Put(key + "k", "v") == sqlkv::KvError::ValueTooLarge);
}

TEST_CASE("requests on a closed store", "[crud]")
{
    sqlkv::SqlKvStore store(test_util::MemOptions());
    REQUIRE(store.Get("a").second == sqlkv::KvError::NotRunning);
    REQUIRE(store.Put("a", "1") == sqlkv::KvError::NotRunning);

    sqlkv::ReadRequest req;
    req.SetArgs("a");
    REQUIRE_FALSE(store.ExecAsyn(&req));
    REQUIRE(req.IsDone());
    REQUIRE(req.Error() == sqlkv::KvError::NotRunning);

    REQUIRE(store.Open() == sqlkv::KvError::NoError);
    REQUIRE(store.Put("a", "1") == sqlkv::KvError::NoError);
    store.Close();
    REQUIRE_FALSE(store.IsOpen());
    REQUIRE(store.Get("a").second == sqlkv::KvError::NotRunning);
    REQUIRE(store.Delete("a") == sqlkv::KvError::NotRunning);
    REQUIRE(store.NewIterator(sqlkv::ScanRange()).second ==
            sqlkv::KvError::NotRunning);
    REQUIRE(store.Clear(sqlkv::ScanRange()) == sqlkv::KvError::NotRunning);
    // Closing twice is harmless.
    store.Close();
}

TEST_CASE("map verifier over single writes", "[crud]")
{
    sqlkv::SqlKvStore store(test_util::MemOptions());
    REQUIRE(store.Open() == sqlkv::KvError::NoError);
    test_util::MapVerifier verifier(&store);

    verifier.Upsert(0, 1);
    verifier.Upsert(5, 6);
    verifier.Read(0);
    verifier.Read(5);
    verifier.Read(3);
    verifier.Delete(0, 1);
    verifier.Read(0);
    verifier.Delete(0, 1);
}
