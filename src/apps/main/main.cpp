// gsn_workbench: validate, lay out and route GSN diagram snapshots from the command line.
#include <gsn_analysis/validator.hpp>
#include <gsn_loaders/json_loader.hpp>
#include <gsn_loaders/json_writer.hpp>
#include <gsn_loaders/sample_diagram.hpp>
#include <gsn_placement/auto_layout.hpp>
#include <gsn_placement/relation_routes.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

struct CliArgs {
    std::string command;
    std::string input;
    std::string config;
    std::string output;
    std::string log_file;
    bool sample = false;
    bool verbose = false;
};

void print_usage() {
    (void)fprintf(stderr,
        "usage: gsn_workbench <validate|layout|routes> [--input FILE | --sample]\n"
        "                     [--config FILE] [--output FILE] [--log-file FILE] [--verbose]\n");
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& into) {
            if (i + 1 >= argc) return false;
            into = argv[++i];
            return true;
        };
        if (arg == "--input") {
            if (!value(args.input)) return std::nullopt;
        } else if (arg == "--config") {
            if (!value(args.config)) return std::nullopt;
        } else if (arg == "--output") {
            if (!value(args.output)) return std::nullopt;
        } else if (arg == "--log-file") {
            if (!value(args.log_file)) return std::nullopt;
        } else if (arg == "--sample") {
            args.sample = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (args.command.empty() && !arg.empty() && arg[0] != '-') {
            args.command = arg;
        } else {
            (void)fprintf(stderr, "unknown argument: %s\n", arg.c_str());
            return std::nullopt;
        }
    }
    if (args.command != "validate" && args.command != "layout" && args.command != "routes")
        return std::nullopt;
    if (args.sample == !args.input.empty()) return std::nullopt;
    return args;
}

// Registers the "gsn" logger the libraries look up. stdout carries JSON, so logs go to
// stderr unless a file is requested.
void setup_logging(const CliArgs& args) {
    std::shared_ptr<spdlog::logger> logger;
    try {
        if (!args.log_file.empty())
            logger = spdlog::basic_logger_mt("gsn", args.log_file, true);
        else
            logger = spdlog::stderr_color_mt("gsn");
    } catch (const spdlog::spdlog_ex& e) {
        (void)fprintf(stderr, "logger setup failed (%s); using the default logger\n", e.what());
        logger = spdlog::default_logger();
    }
    logger->set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

bool write_output(const CliArgs& args, const nlohmann::json& doc, spdlog::logger& logger) {
    if (args.output.empty()) {
        std::cout << doc.dump(2) << '\n';
        return true;
    }
    std::ofstream f(args.output);
    if (!f) {
        logger.error("cannot open output file {}", args.output);
        return false;
    }
    f << doc.dump(2) << '\n';
    return static_cast<bool>(f);
}

} // namespace

int main(int argc, char* argv[])
{
    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }
    setup_logging(*args);
    auto logger = spdlog::get("gsn");
    if (!logger) logger = spdlog::default_logger();

    std::optional<gsn_loaders::DiagramSnapshot> snapshot;
    if (args->sample)
        snapshot = gsn_loaders::generate_sample_diagram();
    else
        snapshot = gsn_loaders::load_diagram_from_json_file(args->input);
    if (!snapshot) return 1;

    gsn_placement::LayoutOptions options;
    if (!args->config.empty()) {
        auto loaded = gsn_loaders::load_layout_options_from_json_file(args->config);
        if (!loaded) return 1;
        options = *loaded;
    }

    logger->info("{} '{}': {} elements, {} relations, {} modules", args->command,
        snapshot->diagram.title, snapshot->diagram.elements.size(),
        snapshot->diagram.relations.size(), snapshot->modules.size());

    if (args->command == "validate") {
        const auto result = gsn_analysis::validate(snapshot->diagram);
        logger->info("validation: {} error(s), {} warning(s)", result.errors.size(), result.warnings.size());
        if (!write_output(*args, gsn_loaders::validation_result_to_json(result), *logger)) return 1;
        return result.is_valid ? 0 : 2;
    }

    const auto placed = gsn_placement::auto_layout(snapshot->diagram, &snapshot->modules, options);
    if (args->command == "layout")
        return write_output(*args, gsn_loaders::diagram_to_json(placed), *logger) ? 0 : 1;

    // Routes are anchored on the laid-out positions.
    const auto routes = gsn_placement::compute_relation_routes(placed.elements, placed.relations);
    return write_output(*args, gsn_loaders::relation_routes_to_json(routes), *logger) ? 0 : 1;
}
