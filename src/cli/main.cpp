/// @file main.cpp
/// @brief IPI-Shield command line entry point

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>

#include <CLI/CLI.hpp>

#include "common/logging.h"
#include "shield/report_json.h"
#include "shield/shield.h"

namespace {

constexpr const char* kVersion = "1.0.0";

absl::StatusOr<std::string> ReadInput(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return absl::NotFoundError("cannot open input file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

int Fail(const absl::Status& status) {
    IPISHIELD_LOG_ERROR("{}", status.ToString());
    std::cerr << "error: " << status.message() << std::endl;
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"IPI-Shield - indirect prompt injection detection and sanitization"};
    app.require_subcommand(0, 1);

    std::string config_path;
    std::string log_level;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error, off)");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    std::string input_path;
    std::string content_type = "text";
    std::string provenance = "direct";

    auto* analyze_cmd = app.add_subcommand("analyze", "Score content for injection risk");
    analyze_cmd->add_option("-f,--file", input_path, "Input file (default: stdin)");
    analyze_cmd->add_option("--content-type", content_type, "text, html or image");
    analyze_cmd->add_option("--provenance", provenance, "direct, ocr or html");

    std::string mode_name = "balanced";
    std::vector<std::string> custom_patterns;

    auto* sanitize_cmd = app.add_subcommand("sanitize", "Rewrite content to remove injection risk");
    sanitize_cmd->add_option("-f,--file", input_path, "Input file (default: stdin)");
    sanitize_cmd->add_option("--content-type", content_type, "text, html or image");
    sanitize_cmd->add_option("--provenance", provenance, "direct, ocr or html");
    sanitize_cmd->add_option("-m,--mode", mode_name, "strict, balanced or permissive");
    sanitize_cmd->add_option("-p,--pattern", custom_patterns,
                             "Additional regex to scrub (repeatable)");
    bool escape_triggers = false;
    sanitize_cmd->add_flag("--escape-triggers", escape_triggers,
                           "Defuse chat delimiters and code fences in the output");

    bool warmup = false;
    auto* signals_cmd = app.add_subcommand("signals", "Show signal availability");
    signals_cmd->add_flag("--warmup", warmup, "Load optional models before reporting");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "ipishield v" << kVersion << std::endl;
        return 0;
    }
    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        return 1;
    }

    // Configuration first so its log level can be overridden from the command line
    std::optional<std::filesystem::path> path;
    if (!config_path.empty()) {
        path = config_path;
    }
    auto config_or = ipishield::ShieldConfig::Load(path);
    if (!config_or.ok()) {
        std::cerr << "error: " << config_or.status().message() << std::endl;
        return 1;
    }
    ipishield::ShieldConfig config = *std::move(config_or);

    config.logging.name = "ipishield";
    if (!log_level.empty()) {
        auto level = ipishield::ParseLogLevel(log_level);
        if (!level.ok()) {
            std::cerr << "error: " << level.status().message() << std::endl;
            return 1;
        }
        config.logging.level = *level;
    }
    ipishield::InitLogging(config.logging);
    IPISHIELD_LOG_DEBUG("IPI-Shield v{} starting", kVersion);

    auto shield_or = ipishield::Shield::Create(std::move(config));
    if (!shield_or.ok()) {
        return Fail(shield_or.status());
    }
    auto shield = *std::move(shield_or);

    if (*signals_cmd) {
        if (warmup) {
            shield->Warmup();
        }
        nlohmann::json out{
            {"signals", ipishield::HealthToJson(shield->Health())},
            {"available", shield->AvailableSignals()},
        };
        std::cout << out.dump(2) << std::endl;
    } else {
        auto content = ReadInput(input_path);
        if (!content.ok()) {
            return Fail(content.status());
        }
        auto request = ipishield::MakeRequest(*std::move(content), content_type, provenance);
        if (!request.ok()) {
            return Fail(request.status());
        }

        if (*analyze_cmd) {
            auto report = shield->Analyze(*request);
            if (!report.ok()) {
                return Fail(report.status());
            }
            std::cout << ipishield::ToJson(*report).dump(2) << std::endl;
        } else {
            auto mode = ipishield::sanitize::ParseSanitizationMode(mode_name);
            if (!mode.ok()) {
                return Fail(mode.status());
            }
            ipishield::SanitizeOptions options;
            options.custom_patterns = custom_patterns;
            auto result = shield->Sanitize(*request, *mode, options);
            if (!result.ok()) {
                return Fail(result.status());
            }
            if (escape_triggers && result->sanitized_content != ipishield::sanitize::kBlockMarker) {
                result->sanitized_content =
                    ipishield::sanitize::EscapeLlmTriggers(result->sanitized_content);
            }
            std::cout << ipishield::ToJson(*result).dump(2) << std::endl;
        }
    }

    ipishield::ShutdownLogging();
    return 0;
}
