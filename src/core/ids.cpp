#include "harbor/core/ids.h"

#include <Poco/UUID.h>
#include <Poco/UUIDGenerator.h>

namespace harbor::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator::defaultGenerator().createOne().toString();
}

std::string GenerateObjectId() {
    return Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}

bool IsObjectId(const std::string& value) {
    Poco::UUID uuid;
    // tryParse also accepts upper-case digits; ids are stored in canonical form only.
    return value.size() == 36 && uuid.tryParse(value) && uuid.toString() == value;
}

}  // namespace harbor::core
