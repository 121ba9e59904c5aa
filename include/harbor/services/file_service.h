#pragma once

#include <memory>
#include <string>

#include "harbor/core/config.h"
#include "harbor/core/result.h"
#include "harbor/metadata/metadata_store.h"
#include "harbor/services/search_indexer.h"
#include "harbor/services/staging_lease.h"
#include "harbor/storage/byte_range.h"
#include "harbor/storage/file_driver.h"

namespace harbor::services {

/// @brief Promotion of staging uploads and access to resident files.
class FileService {
public:
    FileService(std::shared_ptr<metadata::MetadataStore> store,
                std::shared_ptr<storage::FileDriver> driver,
                std::shared_ptr<SearchIndexer> indexer, core::StorageConfig config);

    /// @brief Turn the staging upload `staging_id` into a resident file with the same id.
    ///
    /// The staging row is consumed and the file row created in one metadata
    /// transaction, which also covers moving the bytes. Fails with kNotFound
    /// for unknown uploads and kNotYetFilled when no bytes were ever written;
    /// in both cases nothing changes. A chunk still being written either delays
    /// promotion or, with LeaseWait::kNoWait, fails it with kBusy.
    core::Result<metadata::FileRecord> Promote(const std::string& staging_id,
                                               LeaseWait wait = LeaseWait::kBlock);

    core::Result<metadata::FileRecord> Get(const std::string& id);
    /// @brief Open `range` of a resident file's bytes.
    core::Result<storage::ObjectReader> Read(const std::string& id,
                                             const storage::ByteRange& range);
    /// @brief Delete the file row, then its bytes.
    core::Result<metadata::FileRecord> Remove(const std::string& id);

private:
    std::shared_ptr<metadata::MetadataStore> store_;
    std::shared_ptr<storage::FileDriver> driver_;
    std::shared_ptr<SearchIndexer> indexer_;
    core::StorageConfig config_;
};

}  // namespace harbor::services
