#include "../pipeline/ConversionPipeline.hpp"
#include "../io/JsonWriter.hpp"
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <fmt/ranges.h>

using namespace gridconv;

// 命令行选项结构
struct CommandLineOptions {
    std::string from{"auto"};   // auto, ll, utm, mgrs
    std::string to{"mgrs"};     // ll, utm, mgrs
    int precision{1};
    std::string inputFile;      // "-" 表示标准输入
    std::vector<std::string> coordinates;  // 负数坐标需放在 "--" 之后
    bool json{false};
    bool stopOnError{false};
    bool verbose{false};
    bool quiet{false};
    std::string logFile;
};

// 解析命令行参数
std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char* argv[]) {
    try {
        cxxopts::Options options("gridconv", "Convert coordinates between lat/lon, UTM and MGRS/UTMREF");

        options.add_options()
            ("f,from", "Source format (auto,ll,utm,mgrs)", cxxopts::value<std::string>()->default_value("auto"))
            ("t,to", "Target format (ll,utm,mgrs)", cxxopts::value<std::string>()->default_value("mgrs"))
            ("p,precision", "MGRS precision in meters (1,10,100,1000,10000)", cxxopts::value<int>()->default_value("1"))
            ("i,input", "Input file with one coordinate per line ('-' for stdin)", cxxopts::value<std::string>())
            ("json", "Write results as JSON", cxxopts::value<bool>()->default_value("false"))
            ("stop-on-error", "Stop at the first line that fails", cxxopts::value<bool>()->default_value("false"))
            ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", "Quiet mode", cxxopts::value<bool>()->default_value("false"))
            ("log-file", "Log file path", cxxopts::value<std::string>())
            ("coordinate", "Coordinate to convert (fields may be split across arguments)", cxxopts::value<std::vector<std::string>>())
            ("h,help", "Show help");

        options.parse_positional({"coordinate"});
        options.positional_help("[coordinate...]");

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            std::exit(0);
        }

        CommandLineOptions opts;
        opts.from = result["from"].as<std::string>();
        opts.to = result["to"].as<std::string>();
        opts.precision = result["precision"].as<int>();
        opts.json = result["json"].as<bool>();
        opts.stopOnError = result["stop-on-error"].as<bool>();
        opts.verbose = result["verbose"].as<bool>();
        opts.quiet = result["quiet"].as<bool>();

        if (result.count("input")) {
            opts.inputFile = result["input"].as<std::string>();
        }

        if (result.count("coordinate")) {
            opts.coordinates = result["coordinate"].as<std::vector<std::string>>();
        }

        if (result.count("log-file")) {
            opts.logFile = result["log-file"].as<std::string>();
        }

        if (opts.inputFile.empty() && opts.coordinates.empty()) {
            return std::unexpected("Either a coordinate or --input is required");
        }

        return opts;

    } catch (const std::exception& e) {
        return std::unexpected(std::string("Command line parsing error: ") + e.what());
    }
}

// 设置日志系统，日志走 stderr，结果走 stdout
void setupLogging(const CommandLineOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;

    if (!opts.quiet) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(opts.verbose ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console_sink);
    }

    if (!opts.logFile.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.logFile, true);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("gridconv", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

// 日志回调
void logCallback(const std::string& level, const std::string& message) {
    if (level == "trace") spdlog::trace(message);
    else if (level == "debug") spdlog::debug(message);
    else if (level == "info") spdlog::info(message);
    else if (level == "warn") spdlog::warn(message);
    else if (level == "error") spdlog::error(message);
    else spdlog::info(message);
}

// 构建管道配置
std::expected<pipeline::PipelineConfig, std::string> buildPipelineConfig(const CommandLineOptions& opts) {
    pipeline::PipelineConfig config;

    if (opts.from != "auto") {
        auto source = io::parseCoordinateKind(opts.from);
        if (!source) {
            return std::unexpected("Unknown source format: " + opts.from);
        }
        config.sourceKind = *source;
    }

    auto target = io::parseCoordinateKind(opts.to);
    if (!target) {
        return std::unexpected("Unknown target format: " + opts.to);
    }
    config.targetKind = *target;

    config.precisionMeters = opts.precision;
    config.stopOnError = opts.stopOnError;
    config.enableLogging = true;
    config.logLevel = opts.verbose ? "debug" : "info";

    return config;
}

// 显示结果
void showResults(const pipeline::PipelineResult& result, bool json) {
    if (json) {
        io::writeJson(std::cout, pipeline::toJson(result));
        return;
    }

    for (const auto& record : result.records) {
        std::cout << pipeline::formatRecord(record) << '\n';
    }
    std::cout.flush();
}

int main(int argc, char* argv[]) {
    try {
        // 解析命令行
        auto optsResult = parseCommandLine(argc, argv);
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error() << std::endl;
            return 1;
        }
        const auto opts = *optsResult;

        // 设置日志
        setupLogging(opts);

        spdlog::debug("gridconv v0.1.0");
        spdlog::debug("From: {}", opts.from);
        spdlog::debug("To: {}", opts.to);
        spdlog::debug("Precision: {} m", opts.precision);

        // 构建并验证管道配置
        auto config = buildPipelineConfig(opts);
        if (!config) {
            spdlog::error(config.error());
            return 1;
        }

        auto validation = pipeline::validateConfig(*config);
        if (!validation) {
            spdlog::error("Configuration validation failed (precision must be 1, 10, 100, 1000 or 10000)");
            return 1;
        }

        const pipeline::ConversionPipeline conversion{std::move(*config)};
        pipeline::PipelineResult result;

        if (!opts.inputFile.empty()) {
            spdlog::debug("Input: {}", opts.inputFile);

            if (opts.inputFile == "-") {
                result = conversion.execute(std::cin, logCallback);
            } else {
                std::ifstream file(opts.inputFile);
                if (!file.is_open()) {
                    spdlog::error("Cannot open input file: {}", opts.inputFile);
                    return 1;
                }
                result = conversion.execute(file, logCallback);
            }
        } else {
            // 位置参数拼成一个坐标，如 "51.95 7.53" 或 "32U 398973 5756497"
            const std::vector<std::string> lines{fmt::format("{}", fmt::join(opts.coordinates, " "))};
            result = conversion.execute(lines, logCallback);
        }

        showResults(result, opts.json);

        return result.success ? 0 : 1;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
