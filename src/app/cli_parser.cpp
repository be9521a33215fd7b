#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace agentic::app::cli {

    using namespace agentic::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> input;
        std::optional<std::string> max_bytes;
        bool verbose = false;
    };

    constexpr std::size_t kMaxPayloadLimit = 1024u * 1024u * 1024u;

    Result<InspectRequest> parse_and_validate(int argc, char* argv[]) {
        const std::string usage = "Usage: agentic_inspect <inspect|validate> --input <file>";
        if (argc < 2) {
            return SchemaError{ErrorKind::Input, "No command provided.", "missing_command", usage};
        }

        InspectRequest req;
        std::string command = argv[1];
        if (command == "inspect") {
            req.command = InspectCommand::Inspect;
        } else if (command == "validate") {
            req.command = InspectCommand::Validate;
        } else {
            return SchemaError{ErrorKind::Input, "Unknown command: " + command, "unknown_command", usage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--input") {
                if (i + 1 < args.size()) raw.input = args[++i];
                else return SchemaError{ErrorKind::Input, "Missing value for --input", "missing_value"};
            } else if (args[i] == "--max-bytes") {
                if (i + 1 < args.size()) raw.max_bytes = args[++i];
                else return SchemaError{ErrorKind::Input, "Missing value for --max-bytes", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return SchemaError{ErrorKind::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;

        if (!raw.input.has_value()) {
            return SchemaError{ErrorKind::Input, "Must provide --input", "missing_required_flag", usage};
        }

        // Exception-free integer parsing
        if (raw.max_bytes) {
            std::size_t limit = 0;
            const char* begin = raw.max_bytes->data();
            const char* end = raw.max_bytes->data() + raw.max_bytes->size();
            auto [ptr, ec] = std::from_chars(begin, end, limit);
            if (ec != std::errc() || ptr != end) {
                return SchemaError{ErrorKind::Input, "Invalid number for --max-bytes", "invalid_integer", "Provide a positive integer."};
            }
            if (limit == 0 || limit > kMaxPayloadLimit) {
                return SchemaError{ErrorKind::Input, "--max-bytes out of bounds", "bounds_error", "Must be between 1 and 1073741824."};
            }
            req.codec_options.max_payload_bytes = limit;
        }

        // Path validation
        std::filesystem::path p(raw.input.value());
        std::error_code path_ec;
        const bool is_file = std::filesystem::is_regular_file(p, path_ec);
        if (path_ec || !is_file) {
            return SchemaError{ErrorKind::Input, "Input does not exist or is not a regular file", "invalid_path"};
        }
        req.input = std::move(p);

        return req;
    }

} // namespace agentic::app::cli
