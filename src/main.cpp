#include "blobmirror/log.hpp"
#include "blobmirror/metrics.hpp"
#include "blobmirror/mirror/mirror_engine.hpp"
#include "blobmirror/mirror_config.hpp"
#include "blobmirror/storage/azure_backend.hpp"

#include <cctype>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

// Connection string with AccountKey / SharedAccessSignature values masked
std::string mask_connection_string(const std::string& connection_string) {
    std::string masked;
    size_t pos = 0;
    while (pos <= connection_string.size()) {
        auto end = connection_string.find(';', pos);
        if (end == std::string::npos) end = connection_string.size();
        std::string part = connection_string.substr(pos, end - pos);

        auto eq = part.find('=');
        if (eq != std::string::npos) {
            std::string key = part.substr(0, eq);
            std::string lower;
            for (char c : key) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (lower.find("key") != std::string::npos ||
                lower.find("signature") != std::string::npos ||
                lower.find("secret") != std::string::npos ||
                lower.find("token") != std::string::npos) {
                part = key + "=****";
            }
        }
        if (!part.empty()) {
            if (!masked.empty()) masked += ";";
            masked += part;
        }
        pos = end + 1;
    }
    return masked;
}

int run(int argc, char* argv[]) {
    using namespace blobmirror;

    auto config_opt = MirrorConfig::from_args(argc, argv);
    if (!config_opt) {
        MirrorConfig::print_usage(std::cerr);
        return to_exit_code(ExitStatus::MissingOutputDir);
    }
    auto config = std::move(*config_opt);

    if (config.show_help) {
        MirrorConfig::print_usage(std::cout);
        return 0;
    }

    if (auto err = config.validate()) {
        std::cerr << "Configuration error: " << err->message << "\n";
        if (err->status == ExitStatus::MissingOutputDir) {
            MirrorConfig::print_usage(std::cerr);
        }
        return to_exit_code(err->status);
    }

    AzureBlobContainer::Config storage_config;
    try {
        storage_config.connection = AzureConnectionInfo::parse(config.connection_string);
    } catch (const std::invalid_argument& e) {
        log_error("invalid connection string: %s", e.what());
        return to_exit_code(ExitStatus::UnexpectedError);
    }
    storage_config.container = config.container;
    storage_config.page_size = config.page_size;
    storage_config.verify_ssl = config.verify_ssl;
    storage_config.verbose = config.verbose;

    log_info("blob-mirror starting...");
    log_info("  output-dir: %s", config.output_dir.c_str());
    log_info("  connection: %s", mask_connection_string(config.connection_string).c_str());
    log_info("  endpoint: %s", storage_config.connection.blob_endpoint.c_str());
    log_info("  container: %s", config.container.c_str());
    if (!config.env_file.empty()) {
        log_info("  env-file: %s", config.env_file.c_str());
    }
    if (config.verbose) {
        log_info("  page-size: %u", config.page_size);
        log_info("  verify-ssl: %s", config.verify_ssl ? "yes" : "no");
    }

    std::unique_ptr<MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<MetricsExporter>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{
                {"account", storage_config.connection.account_name},
                {"container", config.container}});
        metrics->start();
        log_info("  metrics-file: %s (every %zus)", config.metrics_file.c_str(),
                 config.metrics_interval_secs);
    }

    AzureBlobContainer container(storage_config);

    MirrorOptions options;
    options.report = &std::cout;
    options.verbose = config.verbose;
    options.metrics = metrics.get();

    MirrorEngine engine(options);
    ExitStatus status = engine.run(config.output_dir, container, container);

    if (metrics) {
        if (status != ExitStatus::Success) metrics->run_failed().Set(1);
        metrics->stop();
    }

    if (engine.state() == RunState::Completed && engine.result().failed > 0) {
        log_info("%llu objects failed, run completed",
                 static_cast<unsigned long long>(engine.result().failed));
    }
    return to_exit_code(status);
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        blobmirror::log_error("%s", e.what());
        return blobmirror::to_exit_code(blobmirror::ExitStatus::UnexpectedError);
    }
}
