#pragma once

#include "nifpt/core/clock.h"
#include "nifpt/core/id_generator.h"
#include "nifpt/lookup/nif_registry.h"
#include "nifpt/storage/audit_log.h"

#include <string>

// execute_lookup: run the lookup pipeline for one candidate and print the outcome.
// Takes only interface types; no concrete registry headers may be included in this TU.
// Returns 0 iff the registry produced a record.
int execute_lookup(const std::string& candidate, bool normalize, bool json,
                   nifpt::lookup::INifRegistry& registry, nifpt::storage::IAuditLog& audit_log,
                   nifpt::core::IIdGenerator& id_gen, nifpt::core::IClock& clock);
