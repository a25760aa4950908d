#include "docsum/generation_backend.h"

namespace docsum {

std::string SimulatedBackend::generate(const GenerationRequest& /*request*/,
                                       const CancellationToken& cancellation) {
    cancellation.throw_if_cancelled("simulated generation cancelled");
    return kSimulatedSummary;
}

} // namespace docsum
