#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/agentic_response.hpp"
#include "protocol/content_builders.hpp"

namespace sample {

// Provider status object with nlohmann ADL serializers.
struct ProviderStatus {
    std::string state;
    int attempts = 0;

    bool operator==(const ProviderStatus& o) const {
        return state == o.state && attempts == o.attempts;
    }
};

inline void to_json(nlohmann::json& j, const ProviderStatus& s) {
    j = nlohmann::json{{"state", s.state}, {"attempts", s.attempts}};
}

inline void from_json(const nlohmann::json& j, ProviderStatus& s) {
    j.at("state").get_to(s.state);
    j.at("attempts").get_to(s.attempts);
}

// No ADL serializers; registered with explicit functions.
struct RequestTrace {
    std::vector<std::string> hops;

    bool operator==(const RequestTrace& o) const { return hops == o.hops; }
};

inline nlohmann::json encode_trace(const RequestTrace& trace) {
    return nlohmann::json(trace.hops);
}

inline RequestTrace decode_trace(const nlohmann::json& payload) {
    return RequestTrace{payload.get<std::vector<std::string>>()};
}

inline agentic::protocol::ContentBlock hello_message_block() {
    using namespace agentic::protocol;
    OutputText text;
    text.content = "Hello";
    OutputImage image;
    image.url = "https://example.com/cat.png";
    image.mime_type = "image/png";
    return make_assistant_message_block({text, image});
}

inline agentic::protocol::ContentBlock lookup_tool_call_block() {
    using namespace agentic::protocol;
    ContentBlockToolCall call;
    call.type = ToolCallType::Custom;
    call.id = "call_1";
    call.name = "lookup";
    call.arguments = "{\"q\":\"x\"}";
    return make_tool_call_block(call);
}

// Assistant message with a text and an image part, followed by a custom tool call.
inline agentic::protocol::AgenticResponse hello_lookup_response() {
    auto response = agentic::protocol::make_response("resp-hello");
    response.blocks.push_back(hello_message_block());
    response.blocks.push_back(lookup_tool_call_block());
    return response;
}

// Every block kind, every part kind, typed and primitive extras.
inline agentic::protocol::AgenticResponse full_response() {
    using namespace agentic::protocol;
    auto response = make_response("resp-full");
    response.finish_reason = FinishReason{FinishStatus::Incomplete, "max_output_tokens"};
    TokenUsageMeta usage;
    usage.input_tokens = 120;
    usage.input_tokens_details.cached_tokens = 64;
    usage.output_tokens = 80;
    usage.output_tokens_details.reasoning_tokens = 32;
    usage.total_tokens = 200;
    response.usage = usage;

    response.blocks.push_back(make_text_message_block(Role::System, "Be brief.", 0));

    InputImage image;
    image.base64_data = "iVBORw0KGgo=";
    image.mime_type = "image/png";
    image.detail = ImageUrlDetail::High;
    InputAudio audio;
    audio.url = "https://example.com/a.wav";
    audio.mime_type = "audio/wav";
    InputVideo video;
    video.url = "https://example.com/v.mp4";
    video.base64_data = "AAAA";
    video.mime_type = "video/mp4";
    InputFile file;
    file.name = "report.pdf";
    file.base64_data = "JVBERi0=";
    file.mime_type = "application/pdf";
    file.extra["pages"] = 3;
    response.blocks.push_back(
        make_user_message_block({InputText{"Describe these."}, image, audio, video, file}, 1));

    ContentBlockReasoning reasoning;
    reasoning.index = 2;
    reasoning.summary_index = 0;
    ReasoningSummary fragment;
    fragment.text = "Looking at the attachments.";
    fragment.extra["confidence"] = 0.75;
    reasoning.summary.push_back(fragment);
    reasoning.encrypted_content = "gAAAAB...";
    reasoning.extra["provider_id"] = "rs_123";
    response.blocks.push_back(make_reasoning_block(reasoning));

    OutputText text;
    text.content = "Here is what I found.";
    text.extra["annotations"] = nlohmann::json::array({"a", "b"});
    OutputAudio out_audio;
    out_audio.base64_data = "UklGRg==";
    out_audio.mime_type = "audio/wav";
    OutputVideo out_video;
    out_video.url = "https://example.com/out.mp4";
    out_video.mime_type = "video/mp4";
    ContentBlockMessage assistant;
    assistant.role = Role::Assistant;
    assistant.index = 3;
    assistant.content = std::vector<OutputPart>{text, out_audio, out_video};
    assistant.extra["id"] = "msg_1";
    assistant.extra["status"] = ExtensionValue::of(ProviderStatus{"completed", 2});
    assistant.extra["trace"] = ExtensionValue::of(RequestTrace{{"edge", "router", "model"}});
    assistant.extra["nested"] = nlohmann::json{{"flag", true}, {"list", {1, 2, 3}}};
    response.blocks.push_back(make_message_block(assistant));

    ContentBlockToolCall mcp_call;
    mcp_call.index = 4;
    mcp_call.type = ToolCallType::Mcp;
    mcp_call.id = "call_2";
    mcp_call.name = "search";
    mcp_call.arguments = "{\"term\":\"cats\"}";
    mcp_call.extra["server"] = "docs";
    response.blocks.push_back(make_tool_call_block(mcp_call));

    response.blocks.push_back(
        make_tool_call_output_block("call_1", "lookup", ToolCallOutputCustom{"42"}, 5));

    ToolCallOutputMcp mcp_output;
    mcp_output.content = "no results";
    mcp_output.approval_request_id = "apr_1";
    mcp_output.status = McpToolCallStatus::Error;
    mcp_output.error = "index offline";
    mcp_output.extra["status"] = ExtensionValue::of(ProviderStatus{"failed", 1});
    response.blocks.push_back(make_tool_call_output_block("call_2", "search", mcp_output, 6));

    ContentBlockMCPListTools list_tools;
    list_tools.server_label = "docs";
    MCPListToolsItem search_tool;
    search_tool.name = "search";
    search_tool.description = "Full text search";
    search_tool.input_schema = nlohmann::json{
        {"type", "object"},
        {"properties", {{"term", {{"type", "string"}}}}},
        {"required", {"term"}}};
    MCPListToolsItem ping_tool;
    ping_tool.name = "ping";
    ping_tool.description = "Health check";
    list_tools.tools = {search_tool, ping_tool};
    response.blocks.push_back(make_mcp_list_tools_block(list_tools));

    response.blocks.push_back(make_mcp_approval_request_block(
        ContentBlockMCPToolApprovalRequest{"search", "{\"term\":\"dogs\"}", "docs"}));
    response.blocks.push_back(make_mcp_approval_response_block(
        ContentBlockMCPToolApprovalResponse{"apr_2", false, "not needed"}));
    return response;
}

}  // namespace sample
