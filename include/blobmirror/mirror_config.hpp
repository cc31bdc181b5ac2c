#pragma once

#include "blobmirror/mirror/mirror_engine.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace blobmirror {

/// Environment variable holding the storage account connection string.
inline constexpr const char* ENV_CONNECTION_STRING = "TGF_AZURE_BLOB_STORAGE_CONNECTION_STRING";
/// Environment variable holding the container name.
inline constexpr const char* ENV_CONTAINER = "TGF_AZURE_BLOB_STORAGE_CONTAINER";

/// A configuration problem and the exit status it maps to.
struct ConfigError {
    ExitStatus status;
    std::string message;
};

/// Configuration for one mirror run.
///
/// Sources, lowest precedence first: JSON config file (--config), the
/// settings file (.env), the process environment, command-line flags.
/// Variables already set in the environment are never replaced by the
/// settings file.
struct MirrorConfig {
    std::filesystem::path output_dir;     // Positional argument

    std::string connection_string;
    std::string container;

    std::filesystem::path env_file;       // Default: ./.env when present
    uint32_t page_size = 5000;            // List Blobs maxresults (1-5000)
    bool verify_ssl = true;
    bool verbose = false;
    bool show_help = false;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Parse command line, then load the settings file and the environment.
    /// Returns empty optional on error (message printed to stderr).
    static std::optional<MirrorConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Export KEY=VALUE lines of a dotenv-style file into the process
    /// environment without replacing variables that are already set.
    /// Returns false if the file cannot be read.
    static bool load_env_file(const std::filesystem::path& path);

    /// Take connection string and container from the environment (trimmed)
    /// when set there.
    void apply_environment();

    /// Check required values in the order the exit statuses are documented:
    /// output dir (2), connection string (3), container (4), output path is a file (5).
    std::optional<ConfigError> validate() const;

    static void print_usage(std::ostream& os);
};

}  // namespace blobmirror
