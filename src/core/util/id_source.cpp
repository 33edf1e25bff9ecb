#include "flagsync/core/interfaces/iid_source.hpp"
#include "internal/core/util/random.hpp"

namespace flagsync {

    std::string RandomIdSource::uuid() {
        return randomUuid();
    }

}
