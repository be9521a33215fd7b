#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol/content_blocks.hpp"

namespace agentic::protocol {

    enum class FinishStatus {
        Completed,
        Incomplete
    };

    struct FinishReason {
        FinishStatus status = FinishStatus::Completed;
        std::string reason;

        bool operator==(const FinishReason& o) const {
            return status == o.status && reason == o.reason;
        }
    };

    struct InputTokensUsageDetails {
        std::int64_t cached_tokens = 0;

        bool operator==(const InputTokensUsageDetails& o) const {
            return cached_tokens == o.cached_tokens;
        }
    };

    struct OutputTokensUsageDetails {
        std::int64_t reasoning_tokens = 0;

        bool operator==(const OutputTokensUsageDetails& o) const {
            return reasoning_tokens == o.reasoning_tokens;
        }
    };

    // total_tokens is reported by the producer and not recomputed.
    struct TokenUsageMeta {
        std::int64_t input_tokens = 0;
        InputTokensUsageDetails input_tokens_details;
        std::int64_t output_tokens = 0;
        OutputTokensUsageDetails output_tokens_details;
        std::int64_t total_tokens = 0;

        bool operator==(const TokenUsageMeta& o) const {
            return input_tokens == o.input_tokens &&
                   input_tokens_details == o.input_tokens_details &&
                   output_tokens == o.output_tokens &&
                   output_tokens_details == o.output_tokens_details &&
                   total_tokens == o.total_tokens;
        }
    };

    // One model turn: an ordered list of content blocks plus bookkeeping.
    struct AgenticResponse {
        std::string id;
        std::optional<FinishReason> finish_reason;
        std::optional<TokenUsageMeta> usage;
        std::vector<ContentBlock> blocks;

        bool operator==(const AgenticResponse& o) const {
            return id == o.id && finish_reason == o.finish_reason && usage == o.usage &&
                   blocks == o.blocks;
        }
        bool operator!=(const AgenticResponse& o) const { return !(*this == o); }
    };

} // namespace agentic::protocol
