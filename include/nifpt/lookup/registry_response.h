#pragma once

#include "nifpt/core/nif.h"
#include "nifpt/core/result.h"
#include "nifpt/lookup/inmemory_nif_registry.h"
#include "nifpt/lookup/lookup_record.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string_view>

namespace nifpt::lookup {

// Decoders for the nif.pt JSON API payload:
//
//   {
//     "result": "success" | "error",
//     "message": "...",                        (error payloads)
//     "nif_validation": true | false,
//     "is_nif": true | false,
//     "records": { "<nif>": { "title": ..., "address": ..., "pc4": ..., "pc3": ...,
//                             "city": ..., "activity": ..., "status": "active",
//                             "cae": ..., "contacts": { "email": ..., "phone": ...,
//                                                       "website": ... } } }
//   }
//
// "records" may also arrive as an array (empty, or of records carrying "nif").
// Never throws: decoding errors become kMalformedResponse.

// parse_registry_response maps one payload for `nif` to a LookupRecord
// (checked_at left unset) or a service failure.
[[nodiscard]] core::Result<LookupRecord, LookupFailure> parse_registry_response(
    const nlohmann::json& payload, const core::Nif& nif);

// Same, starting from the raw response body.
[[nodiscard]] core::Result<LookupRecord, LookupFailure> parse_registry_response_text(
    std::string_view body, const core::Nif& nif);

// load_registry_snapshot seeds `registry` from saved payloads: a single payload
// object or an array of them. Every record becomes a kValidKnown entry.
// Returns the number of records loaded. Fails without partial guarantees on the
// first error payload, undecodable record, or record key that is not a valid NIF.
[[nodiscard]] core::Result<std::size_t, LookupFailure> load_registry_snapshot(
    const nlohmann::json& snapshot, InMemoryNifRegistry& registry);

}  // namespace nifpt::lookup
