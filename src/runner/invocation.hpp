#pragma once

#include "metrics/outcome.hpp"
#include "probe/probe.hpp"
#include "scenarios/scenario.hpp"

namespace probekit::runner {

// Executes one scenario and assigns its verdict. Never throws: transport
// failures and probe exceptions both become failed outcomes with a message.
metrics::InvocationOutcome InvokeScenario(probe::IProbe& probe,
                                          const scenarios::ScenarioDescriptor& scenario);

// Duration-mode variant. Response bodies are not retained.
metrics::InvocationOutcome InvokeTarget(probe::IProbe& probe,
                                        const scenarios::TargetDescriptor& target);

} // namespace probekit::runner
