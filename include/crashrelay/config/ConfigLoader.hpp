#pragma once

#include "crashrelay/Config.hpp"

#include <exception>
#include <filesystem>
#include <string>
#include <string_view>

namespace crashrelay::config {

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {});

    const char* what() const noexcept override { return formatted.c_str(); }
};

// Reads a JSON document and overlays it on `base`. Unknown keys are
// ignored. Throws ConfigError.
Config load_config_file(const std::filesystem::path& path, Config base = {});
Config parse_config(std::string_view text, Config base = {});

// Throws ConfigError with code E_CONFIG_VALUE.
void validate_config(const Config& config);

// Effective configuration as a JSON document using the file's key names.
std::string describe_config(const Config& config);

}  // namespace crashrelay::config
