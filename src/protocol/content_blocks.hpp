#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/extension_value.hpp"
#include "protocol/message_parts.hpp"

namespace agentic::protocol {

    enum class ContentBlockType {
        Message,
        Reasoning,
        ToolCall,
        ToolCallOutput,
        McpListTools,
        McpToolApprovalRequest,
        McpToolApprovalResponse
    };

    // Tool messages are modelled as tool_call_output blocks, so there is no Tool role.
    enum class Role {
        System,
        User,
        Assistant
    };

    // --- message ---

    // Exactly one representation: plain input text, user multi-content, or
    // assistant multi-content.
    using MessageContent =
        std::variant<std::string, std::vector<InputPart>, std::vector<OutputPart>>;

    struct ContentBlockMessage {
        std::optional<int> index;
        Role role = Role::User;
        MessageContent content;

        // Model-specific fields, e.g. a provider's output message id and status.
        Extra extra;

        bool operator==(const ContentBlockMessage& o) const {
            return index == o.index && role == o.role && content == o.content &&
                   extra == o.extra;
        }
    };

    // --- reasoning ---

    struct ReasoningSummary {
        std::string text;
        Extra extra;

        bool operator==(const ReasoningSummary& o) const {
            return text == o.text && extra == o.extra;
        }
    };

    struct ContentBlockReasoning {
        std::optional<int> index;
        std::optional<int> summary_index;
        std::vector<ReasoningSummary> summary;
        // Provider-specific, never interpreted here.
        std::string encrypted_content;
        Extra extra;

        bool operator==(const ContentBlockReasoning& o) const {
            return index == o.index && summary_index == o.summary_index &&
                   summary == o.summary && encrypted_content == o.encrypted_content &&
                   extra == o.extra;
        }
    };

    // --- tool call ---

    enum class ToolCallType {
        Custom,
        Mcp
    };

    struct ContentBlockToolCall {
        std::optional<int> index;
        ToolCallType type = ToolCallType::Custom;
        std::string id;
        std::string name;
        std::string arguments;  // Raw JSON text of the arguments
        Extra extra;

        bool operator==(const ContentBlockToolCall& o) const {
            return index == o.index && type == o.type && id == o.id && name == o.name &&
                   arguments == o.arguments && extra == o.extra;
        }
    };

    // --- tool call output ---

    enum class ToolCallOutputType {
        Custom,
        Mcp
    };

    enum class McpToolCallStatus {
        Success,
        Error
    };

    struct ToolCallOutputCustom {
        std::string content;

        bool operator==(const ToolCallOutputCustom& o) const { return content == o.content; }
    };

    struct ToolCallOutputMcp {
        std::string content;
        // Set when the call ran after an approval round trip.
        std::string approval_request_id;
        McpToolCallStatus status = McpToolCallStatus::Success;
        std::string error;
        Extra extra;

        bool operator==(const ToolCallOutputMcp& o) const {
            return content == o.content && approval_request_id == o.approval_request_id &&
                   status == o.status && error == o.error && extra == o.extra;
        }
    };

    using ToolCallOutputPayload =
        std::variant<std::monostate, ToolCallOutputCustom, ToolCallOutputMcp>;

    struct ContentBlockToolCallOutput {
        std::optional<int> index;
        ToolCallOutputType type = ToolCallOutputType::Custom;
        std::string tool_call_id;
        std::string tool_name;
        // Must hold the alternative matching `type`; see validation::validate.
        ToolCallOutputPayload output;

        bool operator==(const ContentBlockToolCallOutput& o) const {
            return index == o.index && type == o.type && tool_call_id == o.tool_call_id &&
                   tool_name == o.tool_name && output == o.output;
        }
    };

    // --- MCP ---

    struct MCPListToolsItem {
        std::string name;
        std::string description;
        // JSON schema of the tool input. Stored and round-tripped as is.
        std::optional<nlohmann::json> input_schema;

        bool operator==(const MCPListToolsItem& o) const {
            return name == o.name && description == o.description &&
                   input_schema == o.input_schema;
        }
    };

    struct ContentBlockMCPListTools {
        std::string server_label;
        std::vector<MCPListToolsItem> tools;
        // Set when the server could not list its tools.
        std::string error;

        bool operator==(const ContentBlockMCPListTools& o) const {
            return server_label == o.server_label && tools == o.tools && error == o.error;
        }
    };

    struct ContentBlockMCPToolApprovalRequest {
        std::string name;
        std::string arguments;
        std::string server_label;

        bool operator==(const ContentBlockMCPToolApprovalRequest& o) const {
            return name == o.name && arguments == o.arguments &&
                   server_label == o.server_label;
        }
    };

    struct ContentBlockMCPToolApprovalResponse {
        std::string approval_request_id;
        bool approve = false;
        std::string reason;

        bool operator==(const ContentBlockMCPToolApprovalResponse& o) const {
            return approval_request_id == o.approval_request_id && approve == o.approve &&
                   reason == o.reason;
        }
    };

    // --- block ---

    // Alternative order follows ContentBlockType, shifted by one for monostate.
    using ContentBlockPayload = std::variant<
        std::monostate,
        ContentBlockMessage,
        ContentBlockReasoning,
        ContentBlockToolCall,
        ContentBlockToolCallOutput,
        ContentBlockMCPListTools,
        ContentBlockMCPToolApprovalRequest,
        ContentBlockMCPToolApprovalResponse
    >;

    struct ContentBlock {
        ContentBlockType type = ContentBlockType::Message;
        ContentBlockPayload payload;

        bool operator==(const ContentBlock& o) const {
            return type == o.type && payload == o.payload;
        }
        bool operator!=(const ContentBlock& o) const { return !(*this == o); }
    };

    // Payload alternative index expected for a block tag.
    inline std::size_t payload_index_for(const ContentBlockType type) {
        return static_cast<std::size_t>(type) + 1;
    }

    inline std::size_t output_index_for(const ToolCallOutputType type) {
        return type == ToolCallOutputType::Custom ? 1 : 2;
    }

} // namespace agentic::protocol
