#include "codec/wire_format.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "core/logging/logger.hpp"
#include "protocol/type_names.hpp"

namespace agentic::codec {

using core::errors::ErrorKind;
using core::errors::SchemaError;
using nlohmann::json;
using namespace agentic::protocol;

namespace {

constexpr int kBlockTypeCount = 7;

const char* const kKnownResponseKeys[] = {"id", "finish_reason", "usage", "blocks"};

// Carries a SchemaError out of the recursive readers and writers.
class WireError : public std::runtime_error {
public:
    explicit WireError(SchemaError error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    const SchemaError& error() const { return error_; }

private:
    SchemaError error_;
};

[[noreturn]] void fail(const ErrorKind kind, const std::string& message,
                       const std::string& code) {
    throw WireError(SchemaError{kind, message, code});
}

[[noreturn]] void corrupt(const std::string& message) {
    fail(ErrorKind::CorruptPayload, message, "corrupt_payload");
}

// Prefixes the error with the extension key it came from and rethrows it.
[[noreturn]] void fail_for_key(SchemaError error, const std::string& key) {
    error.message = "Extension '" + key + "': " + error.message;
    throw WireError(std::move(error));
}

void put_optional(json& out, const char* key, const std::optional<std::string>& value) {
    if (value.has_value()) {
        out[key] = value.value();
    }
}

void put_optional(json& out, const char* key, const std::optional<int>& value) {
    if (value.has_value()) {
        out[key] = value.value();
    }
}

class WireWriter {
public:
    explicit WireWriter(const registry::TypeRegistry& registry) : registry_(registry) {}

    json write_response(const AgenticResponse& response) const {
        json out = json::object();
        out["id"] = response.id;
        if (response.finish_reason.has_value()) {
            out["finish_reason"] = {{"status", to_string(response.finish_reason->status)},
                                    {"reason", response.finish_reason->reason}};
        }
        if (response.usage.has_value()) {
            const auto& usage = response.usage.value();
            json wire_usage = json::object();
            wire_usage["input_tokens"] = usage.input_tokens;
            wire_usage["input_tokens_details"] = {
                {"cached_tokens", usage.input_tokens_details.cached_tokens}};
            wire_usage["output_tokens"] = usage.output_tokens;
            wire_usage["output_tokens_details"] = {
                {"reasoning_tokens", usage.output_tokens_details.reasoning_tokens}};
            wire_usage["total_tokens"] = usage.total_tokens;
            out["usage"] = std::move(wire_usage);
        }

        json blocks = json::array();
        for (const auto& block : response.blocks) {
            blocks.push_back(write_block(block));
        }
        out["blocks"] = std::move(blocks);
        return out;
    }

private:
    json write_extra(const Extra& extra) const {
        json out = json::object();
        for (const auto& [key, value] : extra) {
            if (value.is_primitive()) {
                if (value.primitive().is_discarded()) {
                    fail(ErrorKind::UnregisteredExtensionValue,
                         "Extension '" + key + "' holds a discarded JSON value.",
                         "unrepresentable_extension_value");
                }
                out[key] = {{"t", registry::kPrimitiveTypeId}, {"p", value.primitive()}};
                continue;
            }

            auto descriptor_result = registry_.lookup(value.type());
            if (core::errors::is_error(descriptor_result)) {
                fail_for_key(core::errors::get_error(descriptor_result), key);
            }
            const auto& descriptor = core::errors::get_value(descriptor_result);

            json payload;
            try {
                payload = descriptor->encode(value);
            } catch (const std::exception& e) {
                fail(ErrorKind::Internal,
                     "Extension '" + key + "' of type '" + descriptor->type_id +
                         "' failed to encode: " + e.what(),
                     "extension_encode_failed");
            } catch (...) {
                fail(ErrorKind::Internal,
                     "Extension '" + key + "' of type '" + descriptor->type_id +
                         "' failed to encode with a non-standard exception.",
                     "extension_encode_failed");
            }
            out[key] = {{"t", descriptor->type_id}, {"p", std::move(payload)}};
        }
        return out;
    }

    void put_extra(json& out, const Extra& extra) const {
        if (!extra.empty()) {
            out["extra"] = write_extra(extra);
        }
    }

    template <typename Media>
    json write_media(const MessagePartType type, const Media& media) const {
        json out = json::object();
        out["type"] = to_string(type);
        out["mime_type"] = media.mime_type;
        put_optional(out, "url", media.url);
        put_optional(out, "base64_data", media.base64_data);
        put_extra(out, media.extra);
        return out;
    }

    json write_part(const InputText& text) const {
        json out = json::object();
        out["type"] = to_string(MessagePartType::Text);
        out["content"] = text.content;
        return out;
    }

    json write_part(const InputImage& image) const {
        json out = write_media(MessagePartType::Image, image);
        if (image.detail != ImageUrlDetail::Unspecified) {
            out["detail"] = to_string(image.detail);
        }
        return out;
    }

    json write_part(const InputAudio& audio) const {
        return write_media(MessagePartType::Audio, audio);
    }

    json write_part(const InputVideo& video) const {
        return write_media(MessagePartType::Video, video);
    }

    json write_part(const InputFile& file) const {
        json out = write_media(MessagePartType::File, file);
        put_optional(out, "name", file.name);
        return out;
    }

    json write_part(const OutputText& text) const {
        json out = json::object();
        out["type"] = to_string(MessagePartType::Text);
        out["content"] = text.content;
        put_extra(out, text.extra);
        return out;
    }

    json write_part(const OutputImage& image) const {
        return write_media(MessagePartType::Image, image);
    }

    json write_part(const OutputAudio& audio) const {
        return write_media(MessagePartType::Audio, audio);
    }

    json write_part(const OutputVideo& video) const {
        return write_media(MessagePartType::Video, video);
    }

    template <typename Part>
    json write_parts(const std::vector<Part>& parts) const {
        json out = json::array();
        for (const auto& part : parts) {
            out.push_back(std::visit([this](const auto& p) { return write_part(p); }, part));
        }
        return out;
    }

    json write_payload(const ContentBlockMessage& message) const {
        json out = json::object();
        out["role"] = to_string(message.role);
        put_optional(out, "index", message.index);
        if (const auto* text = std::get_if<std::string>(&message.content)) {
            out["input_text"] = *text;
        } else if (const auto* input = std::get_if<std::vector<InputPart>>(&message.content)) {
            out["input_parts"] = write_parts(*input);
        } else if (const auto* output =
                       std::get_if<std::vector<OutputPart>>(&message.content)) {
            out["output_parts"] = write_parts(*output);
        }
        put_extra(out, message.extra);
        return out;
    }

    json write_payload(const ContentBlockReasoning& reasoning) const {
        json out = json::object();
        put_optional(out, "index", reasoning.index);
        put_optional(out, "summary_index", reasoning.summary_index);
        json summary = json::array();
        for (const auto& fragment : reasoning.summary) {
            json wire_fragment = json::object();
            wire_fragment["text"] = fragment.text;
            put_extra(wire_fragment, fragment.extra);
            summary.push_back(std::move(wire_fragment));
        }
        out["summary"] = std::move(summary);
        out["encrypted_content"] = reasoning.encrypted_content;
        put_extra(out, reasoning.extra);
        return out;
    }

    json write_payload(const ContentBlockToolCall& tool_call) const {
        json out = json::object();
        put_optional(out, "index", tool_call.index);
        out["type"] = to_string(tool_call.type);
        out["id"] = tool_call.id;
        out["name"] = tool_call.name;
        out["arguments"] = tool_call.arguments;
        put_extra(out, tool_call.extra);
        return out;
    }

    json write_payload(const ContentBlockToolCallOutput& output) const {
        json out = json::object();
        put_optional(out, "index", output.index);
        out["type"] = to_string(output.type);
        out["tool_call_id"] = output.tool_call_id;
        out["tool_name"] = output.tool_name;
        if (const auto* custom = std::get_if<ToolCallOutputCustom>(&output.output)) {
            out["custom"] = {{"content", custom->content}};
        } else if (const auto* mcp = std::get_if<ToolCallOutputMcp>(&output.output)) {
            json wire_mcp = json::object();
            wire_mcp["content"] = mcp->content;
            wire_mcp["approval_request_id"] = mcp->approval_request_id;
            wire_mcp["status"] = to_string(mcp->status);
            wire_mcp["error"] = mcp->error;
            put_extra(wire_mcp, mcp->extra);
            out["mcp"] = std::move(wire_mcp);
        }
        return out;
    }

    json write_payload(const ContentBlockMCPListTools& list_tools) const {
        json out = json::object();
        out["server_label"] = list_tools.server_label;
        json tools = json::array();
        for (const auto& tool : list_tools.tools) {
            json item = json::object();
            item["name"] = tool.name;
            item["description"] = tool.description;
            if (tool.input_schema.has_value()) {
                item["input_schema"] = tool.input_schema.value();
            }
            tools.push_back(std::move(item));
        }
        out["tools"] = std::move(tools);
        out["error"] = list_tools.error;
        return out;
    }

    json write_payload(const ContentBlockMCPToolApprovalRequest& request) const {
        json out = json::object();
        out["name"] = request.name;
        out["arguments"] = request.arguments;
        out["server_label"] = request.server_label;
        return out;
    }

    json write_payload(const ContentBlockMCPToolApprovalResponse& response) const {
        json out = json::object();
        out["approval_request_id"] = response.approval_request_id;
        out["approve"] = response.approve;
        out["reason"] = response.reason;
        return out;
    }

    json write_block(const ContentBlock& block) const {
        json out = json::object();
        out["type"] = to_string(block.type);
        const auto held = block.payload.index();
        if (held == 0 || held == std::variant_npos) {
            return out;
        }
        // The payload key names what is actually held, so a mismatched block
        // still fails validation after decode.
        const auto payload_key = to_string(static_cast<ContentBlockType>(held - 1));
        out[payload_key] = std::visit(
            [this](const auto& payload) -> json {
                using Payload = std::decay_t<decltype(payload)>;
                if constexpr (std::is_same<Payload, std::monostate>::value) {
                    return json();
                } else {
                    return write_payload(payload);
                }
            },
            block.payload);
        return out;
    }

    const registry::TypeRegistry& registry_;
};

class WireReader {
public:
    explicit WireReader(const registry::TypeRegistry& registry) : registry_(registry) {}

    AgenticResponse read_response(const json& wire) const {
        expect_object(wire, "response");
        for (auto it = wire.begin(); it != wire.end(); ++it) {
            bool known = false;
            for (const char* key : kKnownResponseKeys) {
                known = known || it.key() == key;
            }
            if (!known) {
                LOG_DEBUG("Ignoring unknown response field: " + it.key());
            }
        }

        AgenticResponse response;
        response.id = read_string(wire, "id");

        const auto finish = wire.find("finish_reason");
        if (finish != wire.end()) {
            expect_object(*finish, "finish_reason");
            FinishReason reason;
            reason.status = read_tag(*finish, "status", parse_finish_status, "finish status");
            reason.reason = read_string(*finish, "reason");
            response.finish_reason = std::move(reason);
        }

        const auto usage = wire.find("usage");
        if (usage != wire.end()) {
            expect_object(*usage, "usage");
            TokenUsageMeta meta;
            meta.input_tokens = read_int(*usage, "input_tokens");
            const auto& input_details = field(*usage, "input_tokens_details");
            expect_object(input_details, "input_tokens_details");
            meta.input_tokens_details.cached_tokens = read_int(input_details, "cached_tokens");
            meta.output_tokens = read_int(*usage, "output_tokens");
            const auto& output_details = field(*usage, "output_tokens_details");
            expect_object(output_details, "output_tokens_details");
            meta.output_tokens_details.reasoning_tokens =
                read_int(output_details, "reasoning_tokens");
            meta.total_tokens = read_int(*usage, "total_tokens");
            response.usage = meta;
        }

        const auto& blocks = field(wire, "blocks");
        expect_array(blocks, "blocks");
        response.blocks.reserve(blocks.size());
        for (const auto& block : blocks) {
            response.blocks.push_back(read_block(block));
        }
        return response;
    }

private:
    static void expect_object(const json& value, const std::string& what) {
        if (!value.is_object()) {
            corrupt("Expected '" + what + "' to be an object.");
        }
    }

    static void expect_array(const json& value, const std::string& what) {
        if (!value.is_array()) {
            corrupt("Expected '" + what + "' to be an array.");
        }
    }

    static const json& field(const json& object, const char* key) {
        const auto it = object.find(key);
        if (it == object.end()) {
            corrupt(std::string("Missing field '") + key + "'.");
        }
        return *it;
    }

    static std::string read_string(const json& object, const char* key) {
        const auto& value = field(object, key);
        if (!value.is_string()) {
            corrupt(std::string("Field '") + key + "' is not a string.");
        }
        return value.get<std::string>();
    }

    static std::optional<std::string> read_optional_string(const json& object,
                                                           const char* key) {
        if (object.find(key) == object.end()) {
            return std::nullopt;
        }
        return read_string(object, key);
    }

    static bool read_bool(const json& object, const char* key) {
        const auto& value = field(object, key);
        if (!value.is_boolean()) {
            corrupt(std::string("Field '") + key + "' is not a boolean.");
        }
        return value.get<bool>();
    }

    static std::int64_t read_int(const json& object, const char* key) {
        const auto& value = field(object, key);
        if (!value.is_number_integer()) {
            corrupt(std::string("Field '") + key + "' is not an integer.");
        }
        if (value.is_number_unsigned() &&
            value.get<std::uint64_t>() >
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            corrupt(std::string("Field '") + key + "' is out of range.");
        }
        return value.get<std::int64_t>();
    }

    static std::optional<int> read_optional_index(const json& object, const char* key) {
        if (object.find(key) == object.end()) {
            return std::nullopt;
        }
        const auto value = read_int(object, key);
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            corrupt(std::string("Field '") + key + "' is out of range.");
        }
        return static_cast<int>(value);
    }

    template <typename E>
    static E read_tag(const json& object, const char* key,
                      std::optional<E> (*parse)(const std::string&), const std::string& what) {
        const auto name = read_string(object, key);
        const auto tag = parse(name);
        if (!tag.has_value()) {
            fail(ErrorKind::CorruptPayload, "Unknown " + what + " '" + name + "'.",
                 "tag_out_of_range");
        }
        return tag.value();
    }

    Extra read_extra(const json& object) const {
        Extra extra;
        const auto wire_extra = object.find("extra");
        if (wire_extra == object.end()) {
            return extra;
        }
        expect_object(*wire_extra, "extra");

        for (auto entry = wire_extra->begin(); entry != wire_extra->end(); ++entry) {
            const std::string& key = entry.key();
            const json& record = entry.value();
            expect_object(record, "extra." + key);
            const std::string type_id = read_string(record, "t");
            const json& payload = field(record, "p");

            if (type_id == registry::kPrimitiveTypeId) {
                extra.emplace(key, ExtensionValue(payload));
                continue;
            }

            auto descriptor_result = registry_.lookup(type_id);
            if (core::errors::is_error(descriptor_result)) {
                fail_for_key(core::errors::get_error(descriptor_result), key);
            }
            const auto& descriptor = core::errors::get_value(descriptor_result);
            try {
                extra.emplace(key, descriptor->decode(payload));
            } catch (const std::exception& e) {
                fail(ErrorKind::CorruptPayload,
                     "Extension '" + key + "' of type '" + type_id +
                         "' could not be decoded: " + e.what(),
                     "extension_decode_failed");
            } catch (...) {
                fail(ErrorKind::CorruptPayload,
                     "Extension '" + key + "' of type '" + type_id +
                         "' could not be decoded: non-standard exception.",
                     "extension_decode_failed");
            }
        }
        return extra;
    }

    template <typename Media>
    Media read_media(const json& part) const {
        Media media;
        media.url = read_optional_string(part, "url");
        media.base64_data = read_optional_string(part, "base64_data");
        media.mime_type = read_string(part, "mime_type");
        media.extra = read_extra(part);
        return media;
    }

    InputPart read_input_part(const json& part) const {
        expect_object(part, "input part");
        switch (read_tag(part, "type", parse_message_part_type, "message part type")) {
            case MessagePartType::Text:
                return InputText{read_string(part, "content")};
            case MessagePartType::Image: {
                auto image = read_media<InputImage>(part);
                if (part.find("detail") != part.end()) {
                    image.detail =
                        read_tag(part, "detail", parse_image_url_detail, "image detail");
                }
                return image;
            }
            case MessagePartType::Audio:
                return read_media<InputAudio>(part);
            case MessagePartType::Video:
                return read_media<InputVideo>(part);
            case MessagePartType::File: {
                auto file = read_media<InputFile>(part);
                file.name = read_optional_string(part, "name");
                return file;
            }
        }
        corrupt("Unhandled input part type.");
    }

    OutputPart read_output_part(const json& part) const {
        expect_object(part, "output part");
        switch (read_tag(part, "type", parse_message_part_type, "message part type")) {
            case MessagePartType::Text: {
                OutputText text;
                text.content = read_string(part, "content");
                text.extra = read_extra(part);
                return text;
            }
            case MessagePartType::Image:
                return read_media<OutputImage>(part);
            case MessagePartType::Audio:
                return read_media<OutputAudio>(part);
            case MessagePartType::Video:
                return read_media<OutputVideo>(part);
            case MessagePartType::File:
                fail(ErrorKind::CorruptPayload, "Output parts cannot carry files.",
                     "tag_out_of_range");
        }
        corrupt("Unhandled output part type.");
    }

    ContentBlockMessage read_message(const json& wire) const {
        expect_object(wire, "message");
        ContentBlockMessage message;
        message.role = read_tag(wire, "role", parse_role, "role");
        message.index = read_optional_index(wire, "index");

        const auto text = wire.find("input_text");
        const auto input = wire.find("input_parts");
        const auto output = wire.find("output_parts");
        const int representations = (text != wire.end() ? 1 : 0) +
                                    (input != wire.end() ? 1 : 0) +
                                    (output != wire.end() ? 1 : 0);
        if (representations != 1) {
            fail(ErrorKind::VariantMismatch,
                 "Message must carry exactly one content representation, found " +
                     std::to_string(representations) + ".",
                 "message_content_mismatch");
        }

        if (text != wire.end()) {
            message.content = read_string(wire, "input_text");
        } else if (input != wire.end()) {
            expect_array(*input, "input_parts");
            std::vector<InputPart> parts;
            for (const auto& part : *input) {
                parts.push_back(read_input_part(part));
            }
            message.content = std::move(parts);
        } else {
            expect_array(*output, "output_parts");
            std::vector<OutputPart> parts;
            for (const auto& part : *output) {
                parts.push_back(read_output_part(part));
            }
            message.content = std::move(parts);
        }
        message.extra = read_extra(wire);
        return message;
    }

    ContentBlockReasoning read_reasoning(const json& wire) const {
        expect_object(wire, "reasoning");
        ContentBlockReasoning reasoning;
        reasoning.index = read_optional_index(wire, "index");
        reasoning.summary_index = read_optional_index(wire, "summary_index");
        const auto& summary = field(wire, "summary");
        expect_array(summary, "summary");
        for (const auto& fragment : summary) {
            expect_object(fragment, "summary fragment");
            ReasoningSummary item;
            item.text = read_string(fragment, "text");
            item.extra = read_extra(fragment);
            reasoning.summary.push_back(std::move(item));
        }
        reasoning.encrypted_content = read_string(wire, "encrypted_content");
        reasoning.extra = read_extra(wire);
        return reasoning;
    }

    ContentBlockToolCall read_tool_call(const json& wire) const {
        expect_object(wire, "tool_call");
        ContentBlockToolCall tool_call;
        tool_call.index = read_optional_index(wire, "index");
        tool_call.type = read_tag(wire, "type", parse_tool_call_type, "tool call type");
        tool_call.id = read_string(wire, "id");
        tool_call.name = read_string(wire, "name");
        tool_call.arguments = read_string(wire, "arguments");
        tool_call.extra = read_extra(wire);
        return tool_call;
    }

    ContentBlockToolCallOutput read_tool_call_output(const json& wire) const {
        expect_object(wire, "tool_call_output");
        ContentBlockToolCallOutput output;
        output.index = read_optional_index(wire, "index");
        output.type =
            read_tag(wire, "type", parse_tool_call_output_type, "tool call output type");
        output.tool_call_id = read_string(wire, "tool_call_id");
        output.tool_name = read_string(wire, "tool_name");

        const auto custom = wire.find("custom");
        const auto mcp = wire.find("mcp");
        if (custom != wire.end() && mcp != wire.end()) {
            fail(ErrorKind::VariantMismatch,
                 "Tool call output '" + output.tool_call_id + "' carries both outputs.",
                 "multiple_tool_outputs");
        }
        if (custom != wire.end()) {
            expect_object(*custom, "custom");
            output.output = ToolCallOutputCustom{read_string(*custom, "content")};
        } else if (mcp != wire.end()) {
            expect_object(*mcp, "mcp");
            ToolCallOutputMcp result;
            result.content = read_string(*mcp, "content");
            result.approval_request_id = read_string(*mcp, "approval_request_id");
            result.status =
                read_tag(*mcp, "status", parse_mcp_tool_call_status, "MCP tool call status");
            result.error = read_string(*mcp, "error");
            result.extra = read_extra(*mcp);
            output.output = std::move(result);
        }
        return output;
    }

    ContentBlockMCPListTools read_mcp_list_tools(const json& wire) const {
        expect_object(wire, "mcp_list_tools");
        ContentBlockMCPListTools list_tools;
        list_tools.server_label = read_string(wire, "server_label");
        const auto& tools = field(wire, "tools");
        expect_array(tools, "tools");
        for (const auto& tool : tools) {
            expect_object(tool, "tool");
            MCPListToolsItem item;
            item.name = read_string(tool, "name");
            item.description = read_string(tool, "description");
            const auto schema = tool.find("input_schema");
            if (schema != tool.end()) {
                item.input_schema = *schema;
            }
            list_tools.tools.push_back(std::move(item));
        }
        list_tools.error = read_string(wire, "error");
        return list_tools;
    }

    ContentBlockMCPToolApprovalRequest read_mcp_approval_request(const json& wire) const {
        expect_object(wire, "mcp_tool_approval_request");
        ContentBlockMCPToolApprovalRequest request;
        request.name = read_string(wire, "name");
        request.arguments = read_string(wire, "arguments");
        request.server_label = read_string(wire, "server_label");
        return request;
    }

    ContentBlockMCPToolApprovalResponse read_mcp_approval_response(const json& wire) const {
        expect_object(wire, "mcp_tool_approval_response");
        ContentBlockMCPToolApprovalResponse response;
        response.approval_request_id = read_string(wire, "approval_request_id");
        response.approve = read_bool(wire, "approve");
        response.reason = read_string(wire, "reason");
        return response;
    }

    ContentBlock read_block(const json& wire) const {
        expect_object(wire, "block");
        ContentBlock block;
        block.type = read_tag(wire, "type", parse_content_block_type, "content block type");

        std::optional<ContentBlockType> held;
        for (int i = 0; i < kBlockTypeCount; ++i) {
            const auto candidate = static_cast<ContentBlockType>(i);
            if (wire.find(to_string(candidate)) == wire.end()) {
                continue;
            }
            if (held.has_value()) {
                fail(ErrorKind::VariantMismatch,
                     "Content block of type " + to_string(block.type) +
                         " carries more than one payload.",
                     "multiple_payloads");
            }
            held = candidate;
        }
        if (!held.has_value()) {
            // Left empty; validation reports it.
            return block;
        }

        const auto& payload = wire.at(to_string(held.value()));
        switch (held.value()) {
            case ContentBlockType::Message:
                block.payload = read_message(payload);
                break;
            case ContentBlockType::Reasoning:
                block.payload = read_reasoning(payload);
                break;
            case ContentBlockType::ToolCall:
                block.payload = read_tool_call(payload);
                break;
            case ContentBlockType::ToolCallOutput:
                block.payload = read_tool_call_output(payload);
                break;
            case ContentBlockType::McpListTools:
                block.payload = read_mcp_list_tools(payload);
                break;
            case ContentBlockType::McpToolApprovalRequest:
                block.payload = read_mcp_approval_request(payload);
                break;
            case ContentBlockType::McpToolApprovalResponse:
                block.payload = read_mcp_approval_response(payload);
                break;
        }
        return block;
    }

    const registry::TypeRegistry& registry_;
};

}  // namespace

core::errors::Result<json> to_wire(const AgenticResponse& response,
                                   const registry::TypeRegistry& registry) {
    try {
        return WireWriter(registry).write_response(response);
    } catch (const WireError& e) {
        return e.error();
    } catch (const json::exception& e) {
        return SchemaError{ErrorKind::Internal,
                           std::string("Failed to build wire tree: ") + e.what(),
                           "wire_build_failed"};
    }
}

core::errors::Result<AgenticResponse> from_wire(const json& wire,
                                                const registry::TypeRegistry& registry) {
    try {
        return WireReader(registry).read_response(wire);
    } catch (const WireError& e) {
        return e.error();
    } catch (const json::exception& e) {
        return SchemaError{ErrorKind::CorruptPayload,
                           std::string("Malformed wire tree: ") + e.what(),
                           "corrupt_payload"};
    }
}

}  // namespace agentic::codec
