/**
 * @file main.cpp
 * @brief sheetscan 命令行工具：读取 CSV 文件，输出检测到的表格摘要
 *
 * 用法: sheetscan_cli [选项] <file.csv>...
 */

#include "sheetscan/SheetScan.hpp"
#include "sheetscan/table/TableFormatter.hpp"
#include "sheetscan/utils/CommonUtils.hpp"
#include "sheetscan/utils/ModuleLoggers.hpp"

#include <fmt/format.h>
#include <cstdio>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {

struct CliOptions {
    std::map<std::string, std::string> config;
    std::vector<std::string> files;
    sheetscan::table::TableMode mode = sheetscan::table::TableMode::Verbose;
    char delimiter = ',';
    size_t threads = 0;
    bool show_context = false;
    sheetscan::Logger::Level log_level = sheetscan::Logger::Level::WARN;
    std::string log_file;
};

void printUsage(const char* program) {
    fmt::print(
        "Usage: {} [options] <file.csv>...\n"
        "\n"
        "Options:\n"
        "  --use-gaps            enable gap based splitting\n"
        "  --gap-threshold N     blank rows that separate tables (default 3, compact 2)\n"
        "  --compact             compact tables (counts and titles only)\n"
        "  --frozen R,C          frozen pane hint applied to every sheet\n"
        "  --delimiter C         field delimiter (default ',', use 'tab' for \\t)\n"
        "  --threads N           worker threads, 1 = sequential (default: hardware)\n"
        "  --context             print header context of every data cell\n"
        "  --log-level L         trace|debug|info|warn|error|critical|off (default warn)\n"
        "  --log-file PATH       also write logs to PATH\n"
        "  --version             print version\n"
        "  -h, --help            show this help\n",
        program);
}

// 读取带参数的选项值
std::string requireValue(int& i, int argc, char** argv) {
    if (i + 1 >= argc) {
        SHEETSCAN_THROW_PARAM(fmt::format("Option {} requires a value", argv[i]), argv[i]);
    }
    return argv[++i];
}

// 返回 false 表示已处理完（--help/--version），不需要继续
bool parseArguments(int argc, char** argv, CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return false;
        } else if (arg == "--version") {
            fmt::print("sheetscan {}\n", sheetscan::getVersion());
            return false;
        } else if (arg == "--use-gaps") {
            options.config["table_detection.use_gaps"] = "true";
        } else if (arg == "--gap-threshold") {
            const std::string value = requireValue(i, argc, argv);
            options.config["table_detection.gap_threshold"] = value;
            options.config["compact.table_detection.gap_threshold"] = value;
        } else if (arg == "--compact") {
            options.mode = sheetscan::table::TableMode::Compact;
        } else if (arg == "--frozen") {
            options.config["sheet_data.frozen"] = requireValue(i, argc, argv);
        } else if (arg == "--delimiter") {
            const std::string value = requireValue(i, argc, argv);
            if (value == "tab" || value == "\\t") {
                options.delimiter = '\t';
            } else if (value.size() == 1) {
                options.delimiter = value[0];
            } else {
                SHEETSCAN_THROW_PARAM(fmt::format("Delimiter must be a single character, got '{}'", value),
                                      "--delimiter");
            }
        } else if (arg == "--threads") {
            const std::string value = requireValue(i, argc, argv);
            auto parsed = sheetscan::utils::CommonUtils::parseInteger(value);
            if (!parsed || *parsed < 0) {
                SHEETSCAN_THROW_PARAM(fmt::format("Invalid thread count '{}'", value), "--threads");
            }
            options.threads = static_cast<size_t>(*parsed);
        } else if (arg == "--context") {
            options.show_context = true;
        } else if (arg == "--log-level") {
            const std::string value = requireValue(i, argc, argv);
            if (!sheetscan::Logger::parseLevel(value, options.log_level)) {
                SHEETSCAN_THROW_PARAM(fmt::format("Unknown log level '{}'", value), "--log-level");
            }
        } else if (arg == "--log-file") {
            options.log_file = requireValue(i, argc, argv);
        } else if (!arg.empty() && arg[0] == '-') {
            SHEETSCAN_THROW_PARAM(fmt::format("Unknown option '{}'", arg), arg);
        } else {
            options.files.push_back(arg);
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    using namespace sheetscan;

    CliOptions cli;
    try {
        if (!parseArguments(argc, argv, cli)) {
            return 0;
        }
    } catch (const core::SheetScanException& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return 2;
    }

    if (cli.files.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    if (!initialize(cli.log_file, cli.log_level, true)) {
        return 1;
    }

    int exit_code = 0;
    try {
        const detection::DetectionOptions options = detection::DetectionOptions::fromKeyValues(cli.config);
        options.validate();

        input::CsvOptions csv_options;
        csv_options.delimiter = cli.delimiter;
        input::CsvGridReader reader(csv_options);

        std::vector<core::Grid> sheets;
        sheets.reserve(cli.files.size());
        for (const auto& file : cli.files) {
            try {
                sheets.push_back(reader.readFile(file));
                CLI_DEBUG("Loaded '{}': {} cells", file, sheets.back().cellCount());
            } catch (const core::FileException& e) {
                CLI_ERROR("{}", e.getDetailedMessage());
                std::cerr << "Error: " << e.what() << "\n";
                exit_code = 1;
            }
        }

        table::WorkbookProcessor processor(cli.threads);
        const auto results = processor.process(sheets, options, cli.mode);

        table::TableFormatter::Options format_options;
        format_options.show_header_context = cli.show_context;
        table::TableFormatter formatter(format_options);
        std::cout << formatter.formatWorkbook(results);

        for (const auto& result : results) {
            if (!result.ok()) {
                exit_code = 1;
            }
        }
    } catch (const core::SheetScanException& e) {
        CLI_ERROR("{}", e.getDetailedMessage());
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = 2;
    }

    cleanup();
    return exit_code;
}
