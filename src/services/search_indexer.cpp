#include "harbor/services/search_indexer.h"

#include "harbor/core/logger.h"

namespace harbor::services {

core::Result<void> LoggingSearchIndexer::Index(const metadata::FileRecord& file) {
    core::LogDebug("Index request for file " + file.id + " (" + file.name + ", " + file.mime +
                   ")");
    return core::Ok();
}

}  // namespace harbor::services
