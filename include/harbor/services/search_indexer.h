#pragma once

#include "harbor/core/result.h"
#include "harbor/metadata/metadata_store.h"

namespace harbor::services {

/// @brief Receives newly promoted files for full-text indexing.
///
/// Indexing is not part of the durability contract: callers log and ignore
/// failures.
class SearchIndexer {
public:
    virtual ~SearchIndexer() = default;
    virtual core::Result<void> Index(const metadata::FileRecord& file) = 0;
};

/// @brief Indexer used when no search backend is configured; records the request in the log.
class LoggingSearchIndexer : public SearchIndexer {
public:
    core::Result<void> Index(const metadata::FileRecord& file) override;
};

}  // namespace harbor::services
