#include "protocol/type_names.hpp"

#include <cstddef>
#include <utility>

namespace agentic::protocol {

namespace {

template <typename E>
using NameEntry = std::pair<E, const char*>;

constexpr NameEntry<ContentBlockType> kBlockTypeNames[] = {
    {ContentBlockType::Message, "message"},
    {ContentBlockType::Reasoning, "reasoning"},
    {ContentBlockType::ToolCall, "tool_call"},
    {ContentBlockType::ToolCallOutput, "tool_call_output"},
    {ContentBlockType::McpListTools, "mcp_list_tools"},
    {ContentBlockType::McpToolApprovalRequest, "mcp_tool_approval_request"},
    {ContentBlockType::McpToolApprovalResponse, "mcp_tool_approval_response"},
};

constexpr NameEntry<Role> kRoleNames[] = {
    {Role::System, "system"},
    {Role::User, "user"},
    {Role::Assistant, "assistant"},
};

constexpr NameEntry<MessagePartType> kPartTypeNames[] = {
    {MessagePartType::Text, "text"},
    {MessagePartType::Image, "image"},
    {MessagePartType::Audio, "audio"},
    {MessagePartType::Video, "video"},
    {MessagePartType::File, "file"},
};

constexpr NameEntry<ImageUrlDetail> kImageDetailNames[] = {
    {ImageUrlDetail::Unspecified, ""},
    {ImageUrlDetail::High, "high"},
    {ImageUrlDetail::Low, "low"},
    {ImageUrlDetail::Auto, "auto"},
};

constexpr NameEntry<ToolCallType> kToolCallTypeNames[] = {
    {ToolCallType::Custom, "custom_tool_call"},
    {ToolCallType::Mcp, "mcp_tool_call"},
};

constexpr NameEntry<ToolCallOutputType> kToolCallOutputTypeNames[] = {
    {ToolCallOutputType::Custom, "custom_tool_call_output"},
    {ToolCallOutputType::Mcp, "mcp_tool_call_output"},
};

constexpr NameEntry<McpToolCallStatus> kMcpStatusNames[] = {
    {McpToolCallStatus::Success, "success"},
    {McpToolCallStatus::Error, "error"},
};

constexpr NameEntry<FinishStatus> kFinishStatusNames[] = {
    {FinishStatus::Completed, "completed"},
    {FinishStatus::Incomplete, "incomplete"},
};

template <typename E, std::size_t N>
std::string name_of(const NameEntry<E> (&table)[N], const E value) {
    for (const auto& entry : table) {
        if (entry.first == value) {
            return entry.second;
        }
    }
    return "unknown";
}

template <typename E, std::size_t N>
std::optional<E> value_of(const NameEntry<E> (&table)[N], const std::string& name) {
    for (const auto& entry : table) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

}  // namespace

std::string to_string(const ContentBlockType type) {
    return name_of(kBlockTypeNames, type);
}

std::optional<ContentBlockType> parse_content_block_type(const std::string& name) {
    return value_of(kBlockTypeNames, name);
}

std::string to_string(const Role role) {
    return name_of(kRoleNames, role);
}

std::optional<Role> parse_role(const std::string& name) {
    return value_of(kRoleNames, name);
}

std::string to_string(const MessagePartType type) {
    return name_of(kPartTypeNames, type);
}

std::optional<MessagePartType> parse_message_part_type(const std::string& name) {
    return value_of(kPartTypeNames, name);
}

std::string to_string(const ImageUrlDetail detail) {
    return name_of(kImageDetailNames, detail);
}

std::optional<ImageUrlDetail> parse_image_url_detail(const std::string& name) {
    return value_of(kImageDetailNames, name);
}

std::string to_string(const ToolCallType type) {
    return name_of(kToolCallTypeNames, type);
}

std::optional<ToolCallType> parse_tool_call_type(const std::string& name) {
    return value_of(kToolCallTypeNames, name);
}

std::string to_string(const ToolCallOutputType type) {
    return name_of(kToolCallOutputTypeNames, type);
}

std::optional<ToolCallOutputType> parse_tool_call_output_type(const std::string& name) {
    return value_of(kToolCallOutputTypeNames, name);
}

std::string to_string(const McpToolCallStatus status) {
    return name_of(kMcpStatusNames, status);
}

std::optional<McpToolCallStatus> parse_mcp_tool_call_status(const std::string& name) {
    return value_of(kMcpStatusNames, name);
}

std::string to_string(const FinishStatus status) {
    return name_of(kFinishStatusNames, status);
}

std::optional<FinishStatus> parse_finish_status(const std::string& name) {
    return value_of(kFinishStatusNames, name);
}

}  // namespace agentic::protocol
