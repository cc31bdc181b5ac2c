#include "blobmirror/mirror_config.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace blobmirror {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n\v\f");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\v\f");
    return s.substr(begin, end - begin + 1);
}

// Value part of a dotenv line: quotes, escapes and trailing comments
std::string parse_env_value(const std::string& raw) {
    std::string value = trim(raw);
    if (value.empty()) return value;

    if (value.front() == '\'') {
        auto close = value.find('\'', 1);
        return value.substr(1, close == std::string::npos ? std::string::npos : close - 1);
    }

    if (value.front() == '"') {
        std::string result;
        for (size_t i = 1; i < value.size(); ++i) {
            char c = value[i];
            if (c == '"') break;
            if (c == '\\' && i + 1 < value.size()) {
                char e = value[++i];
                switch (e) {
                    case 'n': result += '\n'; break;
                    case 't': result += '\t'; break;
                    case 'r': result += '\r'; break;
                    default: result += e; break;
                }
                continue;
            }
            result += c;
        }
        return result;
    }

    auto comment = value.find(" #");
    if (comment != std::string::npos) {
        value = trim(value.substr(0, comment));
    }
    return value;
}

}  // namespace

std::optional<MirrorConfig> MirrorConfig::from_args(int argc, char* argv[]) {
    MirrorConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    auto parse_count = [](const char* name, const char* v, uint64_t& out) -> bool {
        try {
            size_t used = 0;
            out = std::stoull(v, &used);
            if (used == std::strlen(v)) return true;
        } catch (const std::exception&) {
        }
        std::cerr << "Error: " << name << " expects a number, got '" << v << "'\n";
        return false;
    };

    // The JSON file is the lowest layer: load it before any flag is applied
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") break;
        if (arg != "--config") continue;
        auto* v = next_arg(i, "--config");
        if (!v) return std::nullopt;
        if (!config.load_json(v)) return std::nullopt;
    }

    bool positional_only = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (positional_only || arg.empty() || arg[0] != '-' || arg == "-") {
            if (!config.output_dir.empty()) {
                std::cerr << "Error: unexpected argument: " << arg << "\n";
                return std::nullopt;
            }
            config.output_dir = arg;
            continue;
        }

        if (arg == "--") {
            positional_only = true;
        } else if (arg == "--config") {
            ++i;  // Already loaded
        } else if (arg == "--env-file") {
            auto* v = next_arg(i, "--env-file");
            if (!v) return std::nullopt;
            config.env_file = v;
        } else if (arg == "--page-size") {
            auto* v = next_arg(i, "--page-size");
            if (!v) return std::nullopt;
            uint64_t n = 0;
            if (!parse_count("--page-size", v, n)) return std::nullopt;
            config.page_size = static_cast<uint32_t>(std::min<uint64_t>(n, UINT32_MAX));
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto* v = next_arg(i, "--metrics-interval");
            if (!v) return std::nullopt;
            uint64_t n = 0;
            if (!parse_count("--metrics-interval", v, n)) return std::nullopt;
            config.metrics_interval_secs = n;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--no-verify-ssl") {
            config.verify_ssl = false;
        } else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            return config;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    // Settings file: explicit path must exist, the default one is optional
    if (!config.env_file.empty()) {
        if (!load_env_file(config.env_file)) {
            std::cerr << "Error: cannot read env file: " << config.env_file << "\n";
            return std::nullopt;
        }
    } else if (std::filesystem::is_regular_file(".env")) {
        config.env_file = ".env";
        load_env_file(config.env_file);
    }

    config.apply_environment();
    return config;
}

bool MirrorConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("connection_string"))
            connection_string = trim(j["connection_string"].get<std::string>());
        if (j.contains("container")) container = trim(j["container"].get<std::string>());
        if (j.contains("page_size")) page_size = j["page_size"].get<uint32_t>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval"))
            metrics_interval_secs = j["metrics_interval"].get<size_t>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

bool MirrorConfig::load_env_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) return false;

    std::string line;
    while (std::getline(ifs, line)) {
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') continue;
        if (entry.compare(0, 7, "export ") == 0) {
            entry = trim(entry.substr(7));
        }

        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(entry.substr(0, eq));
        if (key.empty()) continue;

        // Never replace what the process environment already defines
        setenv(key.c_str(), parse_env_value(entry.substr(eq + 1)).c_str(), 0);
    }
    return true;
}

void MirrorConfig::apply_environment() {
    if (const char* v = std::getenv(ENV_CONNECTION_STRING)) {
        auto value = trim(v);
        if (!value.empty()) connection_string = value;
    }
    if (const char* v = std::getenv(ENV_CONTAINER)) {
        auto value = trim(v);
        if (!value.empty()) container = value;
    }
}

std::optional<ConfigError> MirrorConfig::validate() const {
    if (output_dir.empty()) {
        return ConfigError{ExitStatus::MissingOutputDir,
                           "output directory is required (blob-mirror <output-dir>)"};
    }
    if (trim(connection_string).empty()) {
        return ConfigError{ExitStatus::MissingConnectionString,
                           std::string(ENV_CONNECTION_STRING) +
                               " is not set: define the connection string to the storage account"};
    }
    if (trim(container).empty()) {
        return ConfigError{ExitStatus::MissingContainer,
                           std::string(ENV_CONTAINER) +
                               " is not set: define the container inside the storage account"};
    }
    if (page_size == 0 || page_size > 5000) {
        return ConfigError{ExitStatus::MissingOutputDir, "page size must be between 1 and 5000"};
    }
    if (!metrics_file.empty() && metrics_interval_secs == 0) {
        return ConfigError{ExitStatus::MissingOutputDir, "metrics interval must be at least 1 second"};
    }
    // Checked before any storage client is built from the connection string
    if (auto conflict = output_root_conflict(output_dir)) {
        return ConfigError{ExitStatus::OutputIsFile, *conflict};
    }
    return std::nullopt;
}

void MirrorConfig::print_usage(std::ostream& os) {
    os <<
        "Usage: blob-mirror [options] <output-dir>\n"
        "\n"
        "Downloads every blob of an Azure Blob Storage container below <output-dir>.\n"
        "Existing files are never overwritten.\n"
        "\n"
        "Environment (also read from ./.env):\n"
        "  " << ENV_CONNECTION_STRING << "   Storage account connection string\n"
        "  " << ENV_CONTAINER << "           Container name\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file\n"
        "  --env-file <path>                Settings file (default: ./.env if present)\n"
        "  --page-size <N>                  Blobs per listing request (default: 5000)\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --verbose, -v                    Verbose output\n"
        "  --help, -h                       Show this help\n"
        "\n"
        "Exit status:\n"
        "  0 run completed (individual objects may have failed)\n"
        "  1 unexpected error, including listing failures\n"
        "  2 missing output directory or invalid command line\n"
        "  3 missing connection string\n"
        "  4 missing container name\n"
        "  5 output path is a file\n";
}

}  // namespace blobmirror
