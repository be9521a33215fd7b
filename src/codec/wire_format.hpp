#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/schema_errors.hpp"
#include "protocol/agentic_response.hpp"
#include "registry/type_registry.hpp"

// The wire tree: the JSON document that ResponseCodec stores as CBOR after the
// version marker. Every extension value is written as {"t": type_id, "p": payload}.
namespace agentic::codec {

// Fails with UnregisteredExtensionValue when an extension value's type has no
// id in `registry`.
core::errors::Result<nlohmann::json> to_wire(const protocol::AgenticResponse& response,
                                              const registry::TypeRegistry& registry);

// Rebuilds a response from a wire tree. Unknown object keys are ignored.
// Fails with CorruptPayload, UnknownExtensionType or VariantMismatch (a block
// carrying zero or several payloads). Does not run validation::validate.
core::errors::Result<protocol::AgenticResponse> from_wire(
    const nlohmann::json& wire, const registry::TypeRegistry& registry);

}  // namespace agentic::codec
