#include "crashrelay/Config.hpp"
#include "crashrelay/Types.hpp"
#include "crashrelay/config/ConfigLoader.hpp"
#include "crashrelay/core/Chunker.hpp"
#include "crashrelay/core/Payload.hpp"
#include "crashrelay/core/Reporter.hpp"
#include "crashrelay/logging/StructuredLogger.hpp"
#include "crashrelay/network/DigestEnvelope.hpp"
#include "crashrelay/network/MemoryRelay.hpp"
#include "crashrelay/protocol/Compression.hpp"
#include "crashrelay/protocol/Wire.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifndef CRASHRELAY_VERSION
#define CRASHRELAY_VERSION "v1.0.0"
#endif

namespace {

constexpr std::string_view kCrashRelayVersion = CRASHRELAY_VERSION;
constexpr std::string_view kSimulatedRecipient = "0000000000000000000000000000000000000000000000000000000000000001";

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

void print_config_error(const crashrelay::config::ConfigError& ex) {
    std::cerr << "Config error " << ex.what() << std::endl;
    if (!ex.hint.empty()) {
        std::cerr << "Hint: " << ex.hint << std::endl;
    }
}

void print_usage() {
    std::cout << "crashrelay CLI" << std::endl;
    std::cout << "Usage: crashrelay [--verbose] <command> [args]\n\n";
    std::cout << "Commands:\n"
              << "  chunk <file> [--chunk-size <bytes>]\n"
              << "                           Split a file into CHK-encrypted chunks and print the root hash\n"
              << "  simulate <file> [--config <path>] [--channels <n>] [--fail-channel <i>]\n"
              << "                  [--rate-ms <ms>] [--recipient <hex>]\n"
              << "                           Deliver a file as a crash report over in-memory relays\n"
              << "  config <path>             Load a JSON configuration file and print the effective values\n"
              << "  help                      Alias for --help\n\n";
    std::cout << "Global options:\n"
              << "  --verbose                Emit debug-level structured logs on stderr\n"
              << "  --quiet                  Disable structured logs\n"
              << "  --version                Print the CLI version and exit\n"
              << "  --help                   Print this help message\n";
}

bool parse_uint64(std::string_view text, std::uint64_t& value) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, value);
    return result.ec == std::errc{} && result.ptr == end;
}

std::uint64_t require_uint(std::string_view option, std::string_view text) {
    std::uint64_t value{};
    if (!parse_uint64(text, value)) {
        throw_cli_error("E_INVALID_NUMBER",
                        std::string(option) + " expects a non-negative integer, got '" + std::string(text) + "'");
    }
    return value;
}

crashrelay::Bytes read_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw_cli_error("E_FILE_NOT_FOUND",
                        "Cannot open " + path.string(),
                        "Verify the path exists and is readable");
    }
    return crashrelay::Bytes(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

class ArgCursor {
public:
    explicit ArgCursor(std::vector<std::string_view> args) : args_(std::move(args)) {}

    bool done() const { return index_ >= args_.size(); }
    std::string_view peek() const { return args_[index_]; }
    std::string_view next() { return args_[index_++]; }

    std::string require_value(std::string_view option) {
        if (done()) {
            throw_cli_error("E_MISSING_VALUE",
                            std::string(option) + " requires a value",
                            "Provide an argument immediately after " + std::string(option));
        }
        return std::string(next());
    }

private:
    std::vector<std::string_view> args_;
    std::size_t index_{0};
};

int run_chunk(ArgCursor& args) {
    std::optional<std::string> file;
    std::size_t chunk_size = crashrelay::Config{}.max_chunk_size;

    while (!args.done()) {
        const auto arg = args.next();
        if (arg == "--chunk-size") {
            const auto value = require_uint(arg, args.require_value(arg));
            if (value == 0) {
                throw_cli_error("E_INVALID_NUMBER", "--chunk-size must be positive");
            }
            chunk_size = static_cast<std::size_t>(value);
        } else if (!arg.starts_with("-") && !file) {
            file = std::string(arg);
        } else {
            throw_cli_error("E_UNKNOWN_OPTION", "Unexpected argument for chunk: " + std::string(arg));
        }
    }
    if (!file) {
        throw_cli_error("E_MISSING_ARGUMENT", "chunk requires a file", "Usage: crashrelay chunk <file>");
    }

    const auto data = read_file(*file);
    const auto result = crashrelay::chunk_payload(data, chunk_size);

    std::cout << "root_hash: " << crashrelay::digest_to_hex(result.root_hash) << "\n"
              << "total_size: " << result.total_size << "\n"
              << "chunks: " << result.chunks.size() << "\n";
    for (const auto& chunk : result.chunks) {
        std::cout << std::setw(6) << chunk.index << "  " << crashrelay::digest_to_hex(chunk.hash) << "  "
                  << chunk.ciphertext.size() << " bytes\n";
    }
    return 0;
}

// Collects every chunk the manifest points at and rebuilds the report, the
// way a receiver would.
bool verify_delivery(const crashrelay::network::MemoryRelayNetwork& network,
                     const crashrelay::protocol::ManifestPayload& manifest) {
    std::vector<crashrelay::Chunk> chunks;
    for (const auto& id : manifest.chunk_ids) {
        const auto hosts = manifest.chunk_relays.find(id);
        if (hosts == manifest.chunk_relays.end()) {
            std::cout << "receiver: chunk " << id << " was lost" << std::endl;
            return false;
        }
        std::optional<crashrelay::network::TransportEvent> event;
        for (const auto& url : hosts->second) {
            if (const auto* relay = network.relay(url)) {
                event = relay->find(id);
                if (event) {
                    break;
                }
            }
        }
        if (!event) {
            std::cout << "receiver: chunk " << id << " not found on its hinted relays" << std::endl;
            return false;
        }
        chunks.push_back(crashrelay::from_wire(crashrelay::protocol::decode_chunk_payload(event->content)));
    }

    const auto bytes = crashrelay::reassemble_payload(manifest, std::move(chunks));
    const auto text = crashrelay::protocol::decompress_envelope(std::string(bytes.begin(), bytes.end()));
    const auto payload = crashrelay::protocol::decode_direct_payload(text);
    std::cout << "receiver: reassembled report '" << payload.message << "' (" << bytes.size() << " bytes)"
              << std::endl;
    return true;
}

int run_simulate(ArgCursor& args) {
    std::optional<std::string> file;
    std::optional<std::string> config_path;
    std::optional<std::uint64_t> channel_count;
    std::vector<std::uint64_t> failing;
    std::optional<std::uint64_t> rate_ms;
    std::string recipient(kSimulatedRecipient);

    while (!args.done()) {
        const auto arg = args.next();
        if (arg == "--config") {
            config_path = args.require_value(arg);
        } else if (arg == "--channels") {
            channel_count = require_uint(arg, args.require_value(arg));
            if (*channel_count == 0) {
                throw_cli_error("E_INVALID_NUMBER", "--channels must be positive");
            }
        } else if (arg == "--fail-channel") {
            failing.push_back(require_uint(arg, args.require_value(arg)));
        } else if (arg == "--rate-ms") {
            rate_ms = require_uint(arg, args.require_value(arg));
        } else if (arg == "--recipient") {
            recipient = args.require_value(arg);
        } else if (!arg.starts_with("-") && !file) {
            file = std::string(arg);
        } else {
            throw_cli_error("E_UNKNOWN_OPTION", "Unexpected argument for simulate: " + std::string(arg));
        }
    }
    if (!file) {
        throw_cli_error("E_MISSING_ARGUMENT", "simulate requires a file", "Usage: crashrelay simulate <file>");
    }

    crashrelay::Config config = config_path ? crashrelay::config::load_config_file(*config_path)
                                            : crashrelay::Config{};
    if (channel_count) {
        config.channels.clear();
        for (std::uint64_t i = 0; i < *channel_count; ++i) {
            config.channels.push_back("mem://relay-" + std::to_string(i));
        }
    }
    if (rate_ms) {
        config.default_rate_interval = std::chrono::milliseconds(*rate_ms);
        config.rate_intervals.clear();
    }
    crashrelay::config::validate_config(config);

    auto network = std::make_shared<crashrelay::network::MemoryRelayNetwork>(config.channels);
    for (const auto index : failing) {
        if (index >= config.channels.size()) {
            throw_cli_error("E_INVALID_NUMBER",
                            "--fail-channel " + std::to_string(index) + " is out of range",
                            "Channels are numbered from 0 to " + std::to_string(config.channels.size() - 1));
        }
        network->relay(config.channels[index])->set_fail_publish(true);
    }

    crashrelay::ReporterHooks hooks;
    hooks.on_progress = [](const crashrelay::ProgressEvent& event) {
        std::cout << "[" << std::setw(3) << static_cast<int>(event.fraction_completed * 100.0) << "%] "
                  << crashrelay::to_string(event.phase) << ": " << event.description << " (~"
                  << event.estimated_seconds_remaining << "s remaining)" << std::endl;
    };

    auto envelope = std::make_shared<crashrelay::network::DigestEnvelope>(config.timestamp_jitter);
    crashrelay::Reporter reporter(config, recipient, network, envelope, std::move(hooks));

    const auto data = read_file(*file);
    auto payload = crashrelay::Payload::now("Simulated crash from " + std::filesystem::path(*file).filename().string(),
                                            std::string(data.begin(), data.end()));

    const auto report = reporter.send_now(std::move(payload));

    std::cout << "transport: "
              << (report.transport == crashrelay::protocol::TransportKind::Direct ? "direct" : "chunked") << "\n"
              << "status: " << report.status.describe() << "\n";
    for (const auto& channel : report.delivered_channels) {
        std::cout << "delivered via: " << channel << "\n";
    }
    if (report.manifest) {
        std::cout << "chunks delivered: " << report.chunks_delivered << " of " << report.chunk_count << "\n"
                  << "manifest: " << crashrelay::protocol::encode_manifest_payload(*report.manifest) << std::endl;
        if (!report.delivered_channels.empty() && !verify_delivery(*network, *report.manifest)) {
            return 2;
        }
    }
    return report.status.ok() ? 0 : 2;
}

int run_config(ArgCursor& args) {
    if (args.done()) {
        throw_cli_error("E_MISSING_ARGUMENT", "config requires a path", "Usage: crashrelay config <path>");
    }
    const std::string path(args.next());
    if (!args.done()) {
        throw_cli_error("E_UNKNOWN_OPTION", "Unexpected argument for config: " + std::string(args.peek()));
    }
    std::cout << crashrelay::config::describe_config(crashrelay::config::load_config_file(path)) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    using Level = crashrelay::logging::StructuredLogger::Level;
    auto& logger = crashrelay::logging::StructuredLogger::instance();

    try {
        std::vector<std::string_view> raw;
        raw.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            raw.emplace_back(argv[i]);
        }

        std::size_t index = 0;
        while (index < raw.size() && raw[index].starts_with("-")) {
            const auto opt = raw[index++];
            if (opt == "--help" || opt == "-h") {
                print_usage();
                return 0;
            }
            if (opt == "--version") {
                std::cout << "crashrelay " << kCrashRelayVersion << std::endl;
                return 0;
            }
            if (opt == "--verbose") {
                logger.set_min_level(Level::Debug);
                continue;
            }
            if (opt == "--quiet") {
                logger.set_enabled(false);
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(opt),
                            "Run 'crashrelay --help' to see the available options");
        }

        if (index >= raw.size()) {
            print_usage();
            return 1;
        }

        const std::string command(raw[index++]);
        ArgCursor args(std::vector<std::string_view>(raw.begin() + static_cast<std::ptrdiff_t>(index), raw.end()));

        if (command == "chunk") {
            return run_chunk(args);
        }
        if (command == "simulate") {
            return run_simulate(args);
        }
        if (command == "config") {
            return run_config(args);
        }
        if (command == "help") {
            print_usage();
            return 0;
        }

        throw_cli_error("E_UNKNOWN_COMMAND",
                        "Unknown command: " + command,
                        "Run 'crashrelay --help' to see the list of available commands");

    } catch (const CliException& ex) {
        print_cli_error(ex);
        return 1;
    } catch (const crashrelay::config::ConfigError& ex) {
        print_config_error(ex);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
