#pragma once

#include "docsum/cancellation.h"

#include <chrono>
#include <string>

namespace docsum {

// Output of every call when no generation backend is configured.
inline constexpr const char* kSimulatedSummary = "[Simulated AI summary]";

struct GenerationRequest {
    std::string prompt;
    std::chrono::milliseconds timeout{120000};
};

/**
 * A text generation service. Implementations block until the reply arrives,
 * the timeout elapses or the token is cancelled, and throw BackendError or
 * CancelledError on failure. Implementations must be safe to call from
 * several threads at once.
 */
class GenerationBackend {
public:
    virtual ~GenerationBackend() = default;

    virtual std::string generate(const GenerationRequest& request,
                                 const CancellationToken& cancellation) = 0;

    // True for the offline stand-in that never contacts a service.
    virtual bool simulated() const { return false; }

    virtual std::string name() const = 0;
};

// Null-object backend: always returns kSimulatedSummary.
class SimulatedBackend final : public GenerationBackend {
public:
    std::string generate(const GenerationRequest& request,
                         const CancellationToken& cancellation) override;

    bool simulated() const override { return true; }

    std::string name() const override { return "simulated"; }
};

} // namespace docsum
