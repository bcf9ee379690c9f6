#include <gflags/gflags.h>
#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "sqlkv/sql_kv_store.h"

DEFINE_string(location, "", "scheme://[user[:password]@]host[:port]/cache");
DEFINE_uint32(key_size,
              256,
              "width of the key column in characters, keys are hex "
              "encoded so at most key_size/2 bytes fit");
DEFINE_uint32(value_size,
              1024,
              "width of the value column in characters, values are hex "
              "encoded so at most value_size/2 bytes fit");
DEFINE_string(data_path, "", "directory of sqlite databases");
DEFINE_string(database, "postgres", "postgresql database");
DEFINE_string(op, "get", "get|put|del|scan|clear");
DEFINE_string(key, "", "key of get/put/del");
DEFINE_string(value, "", "value of put");
DEFINE_string(gt, "", "exclusive lower bound of scan/clear");
DEFINE_string(gte, "", "inclusive lower bound of scan/clear");
DEFINE_string(lt, "", "exclusive upper bound of scan/clear");
DEFINE_string(lte, "", "inclusive upper bound of scan/clear");
DEFINE_bool(reverse, false, "scan in descending key order");
DEFINE_uint64(limit, 0, "max entries of scan/clear, 0 for no limit");

namespace
{
sqlkv::ScanRange RangeFromFlags()
{
    sqlkv::ScanRange range;
    if (!gflags::GetCommandLineFlagInfoOrDie("gt").is_default)
    {
        range.Gt(FLAGS_gt);
    }
    if (!gflags::GetCommandLineFlagInfoOrDie("gte").is_default)
    {
        range.Gte(FLAGS_gte);
    }
    if (!gflags::GetCommandLineFlagInfoOrDie("lt").is_default)
    {
        range.Lt(FLAGS_lt);
    }
    if (!gflags::GetCommandLineFlagInfoOrDie("lte").is_default)
    {
        range.Lte(FLAGS_lte);
    }
    range.Reverse(FLAGS_reverse).Limit(FLAGS_limit);
    return range;
}

void Fail(sqlkv::KvError err)
{
    std::cerr << sqlkv::ErrorString(err) << std::endl;
    exit(-1);
}
}  // namespace

int main(int argc, char **argv)
{
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    google::InitGoogleLogging(argv[0]);

    sqlkv::KvOptions options;
    options.location = FLAGS_location;
    options.key_size = FLAGS_key_size;
    options.value_size = FLAGS_value_size;
    options.data_path = FLAGS_data_path;
    options.database = FLAGS_database;
    sqlkv::SqlKvStore store(options);
    sqlkv::KvError err = store.Open();
    if (err != sqlkv::KvError::NoError)
    {
        Fail(err);
    }

    if (FLAGS_op == "get")
    {
        auto [value, e] = store.Get(FLAGS_key);
        if (e != sqlkv::KvError::NoError)
        {
            Fail(e);
        }
        std::cout << value << std::endl;
    }
    else if (FLAGS_op == "put")
    {
        err = store.Put(FLAGS_key, FLAGS_value);
    }
    else if (FLAGS_op == "del")
    {
        err = store.Delete(FLAGS_key);
    }
    else if (FLAGS_op == "scan")
    {
        auto [iter, e] = store.NewIterator(RangeFromFlags());
        if (e != sqlkv::KvError::NoError)
        {
            Fail(e);
        }
        for (; iter.Valid(); iter.Next())
        {
            std::cout << iter.Key() << '\t' << iter.Value() << '\n';
        }
        std::cout.flush();
    }
    else if (FLAGS_op == "clear")
    {
        err = store.Clear(RangeFromFlags());
    }
    else
    {
        std::cerr << "Invalid argument: " << FLAGS_op << std::endl;
        exit(-1);
    }
    if (err != sqlkv::KvError::NoError)
    {
        Fail(err);
    }

    store.Close();
}
