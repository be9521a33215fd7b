#pragma once
#include <optional>
#include <string>
#include <variant>
#include "protocol/extension_value.hpp"

namespace agentic::protocol {

    enum class MessagePartType {
        Text,
        Image,
        Audio,
        Video,
        File
    };

    // Quality hint for image inputs. Unspecified leaves the choice to the model.
    enum class ImageUrlDetail {
        Unspecified,
        High,
        Low,
        Auto
    };

    // --- Input parts (user-authored multi-modal content) ---

    struct InputText {
        std::string content;

        bool operator==(const InputText& o) const { return content == o.content; }
    };

    // For every media part, url may be a plain URL or an RFC-2397 data URL, and
    // base64_data holds the inline bytes. At least one of them is expected to be
    // set; setting both is allowed as a fallback.
    struct InputImage {
        std::optional<std::string> url;
        std::optional<std::string> base64_data;
        std::string mime_type;  // e.g. "image/png"
        ImageUrlDetail detail = ImageUrlDetail::Unspecified;
        Extra extra;

        bool operator==(const InputImage& o) const {
            return url == o.url && base64_data == o.base64_data &&
                   mime_type == o.mime_type && detail == o.detail && extra == o.extra;
        }
    };

    struct InputAudio {
        std::optional<std::string> url;
        std::optional<std::string> base64_data;
        std::string mime_type;
        Extra extra;

        bool operator==(const InputAudio& o) const {
            return url == o.url && base64_data == o.base64_data &&
                   mime_type == o.mime_type && extra == o.extra;
        }
    };

    struct InputVideo {
        std::optional<std::string> url;
        std::optional<std::string> base64_data;
        std::string mime_type;
        Extra extra;

        bool operator==(const InputVideo& o) const {
            return url == o.url && base64_data == o.base64_data &&
                   mime_type == o.mime_type && extra == o.extra;
        }
    };

    struct InputFile {
        std::optional<std::string> url;
        // Used when the file is passed to the model as a string.
        std::optional<std::string> name;
        std::optional<std::string> base64_data;
        std::string mime_type;
        Extra extra;

        bool operator==(const InputFile& o) const {
            return url == o.url && name == o.name && base64_data == o.base64_data &&
                   mime_type == o.mime_type && extra == o.extra;
        }
    };

    using InputPart = std::variant<InputText, InputImage, InputAudio, InputVideo, InputFile>;

    // --- Output parts (assistant-generated multi-modal content, no files) ---

    struct OutputText {
        std::string content;
        Extra extra;

        bool operator==(const OutputText& o) const {
            return content == o.content && extra == o.extra;
        }
    };

    struct OutputImage {
        std::optional<std::string> url;
        std::optional<std::string> base64_data;
        std::string mime_type;
        Extra extra;

        bool operator==(const OutputImage& o) const {
            return url == o.url && base64_data == o.base64_data &&
                   mime_type == o.mime_type && extra == o.extra;
        }
    };

    struct OutputAudio {
        std::optional<std::string> url;
        std::optional<std::string> base64_data;
        std::string mime_type;
        Extra extra;

        bool operator==(const OutputAudio& o) const {
            return url == o.url && base64_data == o.base64_data &&
                   mime_type == o.mime_type && extra == o.extra;
        }
    };

    struct OutputVideo {
        std::optional<std::string> url;
        std::optional<std::string> base64_data;
        std::string mime_type;
        Extra extra;

        bool operator==(const OutputVideo& o) const {
            return url == o.url && base64_data == o.base64_data &&
                   mime_type == o.mime_type && extra == o.extra;
        }
    };

    using OutputPart = std::variant<OutputText, OutputImage, OutputAudio, OutputVideo>;

    inline MessagePartType message_part_type(const InputPart& part) {
        struct PartTypeOf {
            MessagePartType operator()(const InputText&) const { return MessagePartType::Text; }
            MessagePartType operator()(const InputImage&) const { return MessagePartType::Image; }
            MessagePartType operator()(const InputAudio&) const { return MessagePartType::Audio; }
            MessagePartType operator()(const InputVideo&) const { return MessagePartType::Video; }
            MessagePartType operator()(const InputFile&) const { return MessagePartType::File; }
        };
        return std::visit(PartTypeOf{}, part);
    }

    inline MessagePartType message_part_type(const OutputPart& part) {
        struct PartTypeOf {
            MessagePartType operator()(const OutputText&) const { return MessagePartType::Text; }
            MessagePartType operator()(const OutputImage&) const { return MessagePartType::Image; }
            MessagePartType operator()(const OutputAudio&) const { return MessagePartType::Audio; }
            MessagePartType operator()(const OutputVideo&) const { return MessagePartType::Video; }
        };
        return std::visit(PartTypeOf{}, part);
    }

} // namespace agentic::protocol
