#pragma once

#include "sky_cutout/core/types.hpp"
#include <cstdint>
#include <vector>

namespace sky_cutout::scheduler {

// Produces the encoded bytes of one artifact. Implementations are shared by
// every worker of every task and must be safe to call concurrently.
// Failures are reported by throwing (ProductionError for expected ones).
class ArtifactProducer {
public:
    virtual ~ArtifactProducer() = default;

    virtual std::vector<uint8_t> produce(const ArtifactRequest& request) = 0;
};

} // namespace sky_cutout::scheduler
