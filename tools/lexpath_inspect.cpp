#include "tools/PathJsonExporter.hpp"
#include "tools/cli/CommandLine.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct InspectOptions {
    LP::PathJsonOptions::Style           style  = LP::PathJsonOptions::Style::Windows;
    int                                  indent = 2;
    std::optional<std::filesystem::path> outputPath;
    std::vector<std::string>             paths;
    bool                                 help = false;
};

void print_usage() {
    std::cout << "Usage: lexpath_inspect [options] <path>...\n"
                 "Options:\n"
                 "  --style <windows|posix>    How to read the paths (default windows)\n"
                 "  --indent <n>               JSON indent (default 2, -1 for compact)\n"
                 "  --output <file>            Write JSON to file instead of stdout\n"
                 "  --help                     Show this message\n";
}

auto parse_cli(int argc, char** argv) -> std::optional<InspectOptions> {
    using LP::CLI::CommandLine;
    InspectOptions options;

    CommandLine cli;
    cli.set_program_name("lexpath_inspect");
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });
    cli.set_positional_handler([&](std::string_view token) -> CommandLine::ParseError {
        options.paths.emplace_back(token);
        return std::nullopt;
    });

    cli.add_value("--style", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                      if (value == "windows") {
                          options.style = LP::PathJsonOptions::Style::Windows;
                      } else if (value == "posix") {
                          options.style = LP::PathJsonOptions::Style::Posix;
                      } else {
                          return "--style must be 'windows' or 'posix'";
                      }
                      return std::nullopt;
                  }});
    cli.add_int("--indent", {.on_value = [&](int value) -> CommandLine::ParseError {
                    if (value < -1) {
                        return "--indent must be -1 or larger";
                    }
                    options.indent = value;
                    return std::nullopt;
                }});
    cli.add_value("--output", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                      if (value.empty()) {
                          return "--output requires a file";
                      }
                      options.outputPath = std::filesystem::path(std::string{value});
                      return std::nullopt;
                  }});
    cli.add_flag("--help", {.on_set = [&] { options.help = true; }});
    cli.add_alias("-h", "--help");

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    return options;
}

auto write_output(std::string const& jsonString, std::optional<std::filesystem::path> const& output) -> bool {
    if (!output) {
        std::cout << jsonString << std::endl;
        return true;
    }
    std::ofstream stream(*output, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "Failed to open output file '" << output->string() << "'" << std::endl;
        return false;
    }
    stream << jsonString << '\n';
    if (!stream.good()) {
        std::cerr << "Failed to write JSON output" << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    auto cliOptions = parse_cli(argc, argv);
    if (!cliOptions) {
        print_usage();
        return EXIT_FAILURE;
    }
    if (cliOptions->help) {
        print_usage();
        return EXIT_SUCCESS;
    }
    if (cliOptions->paths.empty()) {
        std::cerr << "lexpath_inspect: no paths given" << std::endl;
        print_usage();
        return EXIT_FAILURE;
    }

    LP::PathJsonOptions jsonOptions;
    jsonOptions.style      = cliOptions->style;
    jsonOptions.dumpIndent = cliOptions->indent;

    auto jsonString = LP::PathJsonExporter::Export(cliOptions->paths, jsonOptions);
    if (!jsonString) {
        std::cerr << "Export failed: " << LP::describeError(jsonString.error()) << std::endl;
        return EXIT_FAILURE;
    }

    if (!write_output(*jsonString, cliOptions->outputPath)) {
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
