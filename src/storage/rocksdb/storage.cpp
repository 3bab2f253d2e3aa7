#include <equimint/common/critical.hpp>
#include <equimint/storage/rocksdb/storage.hpp>

namespace equimint::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    equimint::common::critical("cannot open ledger database",
                               status.ToString());
  }
  spdlog::debug("Opened ledger database at '{}'", path);

  auto store = rocksdb_storage_t{};
  store.database.reset(database);
  return store;
}

}  // namespace equimint::storage
