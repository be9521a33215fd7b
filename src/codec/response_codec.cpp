#include "codec/response_codec.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "codec/wire_format.hpp"
#include "core/logging/logger.hpp"
#include "validation/content_validator.hpp"

namespace agentic::codec {

using core::errors::ErrorKind;
using core::errors::SchemaError;
using nlohmann::json;

namespace {

void log_failure(const std::string& operation, const SchemaError& error) {
    LOG_WARN(operation + " failed [" + error.code + "]: " + error.message);
}

// SAX consumer for json::sax_parse that builds the wire tree. It stops the
// reader once arrays and maps nest deeper than max_depth, or when a container
// declares more entries than the body has bytes left.
class BoundedTreeBuilder {
public:
    using number_integer_t = json::number_integer_t;
    using number_unsigned_t = json::number_unsigned_t;
    using number_float_t = json::number_float_t;
    using string_t = json::string_t;
    using binary_t = json::binary_t;

    BoundedTreeBuilder(json& root, const std::size_t max_depth, const std::size_t body_size)
        : root_(root), max_depth_(max_depth), body_size_(body_size) {}

    bool null() { return insert(json(nullptr)); }
    bool boolean(const bool value) { return insert(json(value)); }
    bool number_integer(const number_integer_t value) { return insert(json(value)); }
    bool number_unsigned(const number_unsigned_t value) { return insert(json(value)); }
    bool number_float(const number_float_t value, const string_t& /*raw*/) {
        return insert(json(value));
    }
    bool string(string_t& value) { return insert(json(std::move(value))); }
    bool binary(binary_t& value) {
        return insert(value.has_subtype() ? json::binary(value, value.subtype())
                                          : json::binary(value));
    }

    bool start_object(const std::size_t elements) {
        if (!enter(elements)) {
            return false;
        }
        stack_.push_back(place(json::object()));
        return true;
    }

    bool key(string_t& name) {
        slot_ = &(*stack_.back())[name];
        return true;
    }

    bool end_object() { return leave(); }

    bool start_array(const std::size_t elements) {
        if (!enter(elements)) {
            return false;
        }
        stack_.push_back(place(json::array()));
        return true;
    }

    bool end_array() { return leave(); }

    bool parse_error(std::size_t /*position*/, const std::string& /*last_token*/,
                     const json::exception& e) {
        rejection_ = SchemaError{ErrorKind::CorruptPayload,
                                 std::string("Payload body is not valid CBOR: ") + e.what(),
                                 "corrupt_payload"};
        return false;
    }

    const std::optional<SchemaError>& rejection() const { return rejection_; }

private:
    bool enter(const std::size_t elements) {
        if (stack_.size() >= max_depth_) {
            rejection_ = SchemaError{ErrorKind::CorruptPayload,
                                     "Payload body nests deeper than " +
                                         std::to_string(max_depth_) + " levels.",
                                     "nesting_too_deep"};
            return false;
        }
        // Indefinite-length containers report std::size_t(-1).
        if (elements != static_cast<std::size_t>(-1) && elements > body_size_) {
            rejection_ = SchemaError{ErrorKind::CorruptPayload,
                                     "Container declares " + std::to_string(elements) +
                                         " entries in a body of " +
                                         std::to_string(body_size_) + " bytes.",
                                     "declared_length_exceeds_payload"};
            return false;
        }
        return true;
    }

    bool leave() {
        stack_.pop_back();
        return true;
    }

    bool insert(json value) {
        place(std::move(value));
        return true;
    }

    // Stores value at the current position and returns where it landed.
    json* place(json value) {
        if (stack_.empty()) {
            root_ = std::move(value);
            return &root_;
        }
        json& parent = *stack_.back();
        if (parent.is_array()) {
            parent.push_back(std::move(value));
            return &parent.back();
        }
        *slot_ = std::move(value);
        return slot_;
    }

    json& root_;
    const std::size_t max_depth_;
    const std::size_t body_size_;
    std::vector<json*> stack_;
    json* slot_ = nullptr;
    std::optional<SchemaError> rejection_;
};

}  // namespace

ResponseCodec::ResponseCodec(std::shared_ptr<const registry::TypeRegistry> type_registry,
                             core::config::CodecOptions options)
    : registry_(type_registry ? std::move(type_registry)
                              : std::make_shared<registry::TypeRegistry>()),
      options_(options) {}

core::errors::Result<std::vector<std::uint8_t>> ResponseCodec::encode(
    const protocol::AgenticResponse& response) const {
    if (options_.validate_on_encode) {
        auto status = validation::validate(response);
        if (core::errors::is_error(status)) {
            log_failure("Encode", core::errors::get_error(status));
            return core::errors::get_error(status);
        }
    }

    auto wire = to_wire(response, *registry_);
    if (core::errors::is_error(wire)) {
        log_failure("Encode", core::errors::get_error(wire));
        return core::errors::get_error(wire);
    }

    std::vector<std::uint8_t> body;
    try {
        body = json::to_cbor(core::errors::get_value(wire));
    } catch (const json::exception& e) {
        return SchemaError{ErrorKind::Internal,
                           std::string("CBOR encoding failed: ") + e.what(),
                           "cbor_encode_failed"};
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(kHeaderSize + body.size());
    bytes.insert(bytes.end(), std::begin(kMagic), std::end(kMagic));
    bytes.push_back(kFormatVersion);
    bytes.insert(bytes.end(), body.begin(), body.end());

    LOG_DEBUG("Encoded response " + response.id + " (" +
              std::to_string(response.blocks.size()) + " blocks, " +
              std::to_string(bytes.size()) + " bytes)");
    return bytes;
}

core::errors::Result<json> ResponseCodec::read_envelope(const std::uint8_t* data,
                                                        const std::size_t size) const {
    if (size > options_.max_payload_bytes) {
        return SchemaError{ErrorKind::CorruptPayload,
                           "Payload of " + std::to_string(size) +
                               " bytes exceeds the configured limit of " +
                               std::to_string(options_.max_payload_bytes) + ".",
                           "payload_too_large"};
    }
    if (data == nullptr || size < kHeaderSize) {
        return SchemaError{ErrorKind::CorruptPayload,
                           "Payload is shorter than the format header.", "truncated_header"};
    }
    if (!std::equal(std::begin(kMagic), std::end(kMagic), data)) {
        return SchemaError{ErrorKind::CorruptPayload,
                           "Payload does not start with the response format marker.",
                           "bad_magic"};
    }
    if (data[3] != kFormatVersion) {
        return SchemaError{ErrorKind::UnsupportedVersion,
                           "Payload format version " + std::to_string(data[3]) +
                               " is not supported (expected " +
                               std::to_string(kFormatVersion) + ").",
                           "unsupported_version",
                           "Decode with a build that understands this version."};
    }

    json wire;
    BoundedTreeBuilder builder(wire, options_.max_nesting_depth, size - kHeaderSize);
    bool parsed = false;
    try {
        parsed = json::sax_parse(data + kHeaderSize, data + size, &builder,
                                 json::input_format_t::cbor);
    } catch (const json::exception& e) {
        return SchemaError{ErrorKind::CorruptPayload,
                           std::string("Payload body is not valid CBOR: ") + e.what(),
                           "corrupt_payload"};
    }
    if (!parsed) {
        if (builder.rejection().has_value()) {
            return builder.rejection().value();
        }
        return SchemaError{ErrorKind::CorruptPayload, "Payload body is not valid CBOR.",
                           "corrupt_payload"};
    }
    if (!wire.is_object()) {
        return SchemaError{ErrorKind::CorruptPayload, "Payload body is not an object.",
                           "corrupt_payload"};
    }
    return wire;
}

core::errors::Result<protocol::AgenticResponse> ResponseCodec::decode(
    const std::uint8_t* data, const std::size_t size) const {
    auto wire = read_envelope(data, size);
    if (core::errors::is_error(wire)) {
        log_failure("Decode", core::errors::get_error(wire));
        return core::errors::get_error(wire);
    }

    auto response = from_wire(core::errors::get_value(wire), *registry_);
    if (core::errors::is_error(response)) {
        log_failure("Decode", core::errors::get_error(response));
        return core::errors::get_error(response);
    }

    auto status = validation::validate(core::errors::get_value(response));
    if (core::errors::is_error(status)) {
        log_failure("Decode", core::errors::get_error(status));
        return core::errors::get_error(status);
    }

    LOG_DEBUG("Decoded response " + core::errors::get_value(response).id + " (" +
              std::to_string(size) + " bytes)");
    return response;
}

core::errors::Result<protocol::AgenticResponse> ResponseCodec::decode(
    const std::vector<std::uint8_t>& bytes) const {
    return decode(bytes.data(), bytes.size());
}

core::errors::Result<json> ResponseCodec::inspect(const std::vector<std::uint8_t>& bytes) const {
    return read_envelope(bytes.data(), bytes.size());
}

}  // namespace agentic::codec
