#include <array>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string& executable, const std::string& arguments) {
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
#if defined(_WIN32)
    FILE* pipe = _popen(command.c_str(), "r");
#else
    FILE* pipe = popen(command.c_str(), "r");
#endif
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

#if defined(_WIN32)
    const int exit_code = _pclose(pipe);
#else
    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
#endif

    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::filesystem::path write_temp_file(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot create " + path.string());
    }
    out << contents;
    return path;
}

// Printable text that gzip cannot shrink below the direct threshold.
std::string noisy_text(std::size_t size) {
    static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string text;
    text.reserve(size);
    std::uint32_t state = 0x2545F491u;
    for (std::size_t i = 0; i < size; ++i) {
        state = state * 1664525u + 1013904223u;
        text.push_back(alphabet[(state >> 24) & 0x3F]);
    }
    return text;
}

bool report_failure(const std::string& label, const CommandResult& result) {
    std::cerr << "Failure on " << label << ". exit=" << result.exit_code << "\n" << result.output << std::endl;
    return false;
}

bool check_chunk(const std::string& executable) {
    const auto file = write_temp_file("crashrelay_cli_chunk.bin", std::string(300, 'x'));
    const auto result = run_cli(executable, "chunk \"" + file.string() + "\" --chunk-size 100");
    if (result.exit_code != 0 || !expect_contains(result.output, "root_hash: ") ||
        !expect_contains(result.output, "total_size: 300") || !expect_contains(result.output, "chunks: 3")) {
        return report_failure("chunk", result);
    }

    const auto bad_size = run_cli(executable, "chunk \"" + file.string() + "\" --chunk-size abc");
    std::filesystem::remove(file);
    if (bad_size.exit_code != 1 || !expect_contains(bad_size.output, "E_INVALID_NUMBER")) {
        return report_failure("chunk with a bad --chunk-size", bad_size);
    }

    const auto missing = run_cli(executable, "chunk");
    if (missing.exit_code != 1 || !expect_contains(missing.output, "E_MISSING_ARGUMENT")) {
        return report_failure("chunk without a file", missing);
    }
    return true;
}

bool check_simulate_with_failing_channel(const std::string& executable) {
    const auto file = write_temp_file("crashrelay_cli_crash.txt", noisy_text(120 * 1024));
    const auto result = run_cli(executable,
                                "--quiet simulate \"" + file.string() +
                                    "\" --channels 3 --rate-ms 0 --fail-channel 1");
    if (result.exit_code != 0 || !expect_contains(result.output, "transport: chunked") ||
        !expect_contains(result.output, "receiver: reassembled") ||
        expect_contains(result.output, "delivered via: mem://relay-1")) {
        return report_failure("simulate with a failing channel", result);
    }

    const auto out_of_range = run_cli(executable, "simulate \"" + file.string() + "\" --channels 2 --fail-channel 5");
    std::filesystem::remove(file);
    if (out_of_range.exit_code != 1 || !expect_contains(out_of_range.output, "E_INVALID_NUMBER")) {
        return report_failure("simulate with an out of range --fail-channel", out_of_range);
    }
    return true;
}

bool check_config(const std::string& executable) {
    const auto file = write_temp_file("crashrelay_cli_config.json", "{\"channels\": [");
    const auto result = run_cli(executable, "config \"" + file.string() + "\"");
    std::filesystem::remove(file);
    if (result.exit_code != 1 || !expect_contains(result.output, "E_CONFIG_PARSE")) {
        return report_failure("config with malformed JSON", result);
    }
    return true;
}

bool check_usage_errors(const std::string& executable) {
    const auto option = run_cli(executable, "--bogus chunk");
    if (option.exit_code != 1 || !expect_contains(option.output, "E_UNKNOWN_OPTION")) {
        return report_failure("unknown option", option);
    }

    const auto command = run_cli(executable, "frobnicate");
    if (command.exit_code != 1 || !expect_contains(command.output, "E_UNKNOWN_COMMAND") ||
        !expect_contains(command.output, "Hint: ")) {
        return report_failure("unknown command", command);
    }

    const auto help = run_cli(executable, "--help");
    if (help.exit_code != 0 || !expect_contains(help.output, "Usage: crashrelay")) {
        return report_failure("--help", help);
    }
    return true;
}

}  // namespace

int main() {
    const char* executable_env = std::getenv("CRASHRELAY_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "CRASHRELAY_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }

    const std::string executable = std::filesystem::path(executable_env).string();

    try {
        if (!check_chunk(executable) || !check_simulate_with_failing_channel(executable) ||
            !check_config(executable) || !check_usage_errors(executable)) {
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "CLI test failed: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
