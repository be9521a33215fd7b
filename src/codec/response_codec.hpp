#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/codec_options.hpp"
#include "core/errors/schema_errors.hpp"
#include "protocol/agentic_response.hpp"
#include "registry/type_registry.hpp"

namespace agentic::codec {

// Versioned binary encoding of AgenticResponse.
//
// Layout: "AGR" magic, one format version byte, then the CBOR encoding of the
// wire tree (see wire_format.hpp). Extension values travel as (type id,
// payload) pairs and are resolved through the registry on decode, so a typed
// value comes back as the same C++ type it was encoded from.
//
// Encode and decode keep no state between calls and are safe to run from many
// threads at once.
class ResponseCodec {
public:
    static constexpr std::uint8_t kMagic[3] = {'A', 'G', 'R'};
    static constexpr std::uint8_t kFormatVersion = 1;
    static constexpr std::size_t kHeaderSize = 4;

    // A null registry behaves like an empty one: only primitive extras round trip.
    explicit ResponseCodec(std::shared_ptr<const registry::TypeRegistry> type_registry,
                           core::config::CodecOptions options = {});

    core::errors::Result<std::vector<std::uint8_t>> encode(
        const protocol::AgenticResponse& response) const;

    // Returns no value on any failure; the result is validated before it is returned.
    core::errors::Result<protocol::AgenticResponse> decode(
        const std::vector<std::uint8_t>& bytes) const;
    core::errors::Result<protocol::AgenticResponse> decode(const std::uint8_t* data,
                                                           std::size_t size) const;

    // The raw wire tree, without resolving extension types. Diagnostics only.
    core::errors::Result<nlohmann::json> inspect(const std::vector<std::uint8_t>& bytes) const;

    const registry::TypeRegistry& type_registry() const { return *registry_; }
    const core::config::CodecOptions& options() const { return options_; }

private:
    core::errors::Result<nlohmann::json> read_envelope(const std::uint8_t* data,
                                                       std::size_t size) const;

    std::shared_ptr<const registry::TypeRegistry> registry_;
    core::config::CodecOptions options_;
};

}  // namespace agentic::codec
