#include "ConversionPipeline.hpp"
#include "../convert/Conversions.hpp"
#include "../io/JsonWriter.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <spdlog/spdlog.h>

namespace gridconv::pipeline {

namespace {
    std::string_view trim(std::string_view text) noexcept {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        return text;
    }

    bool isValidPrecision(int precisionMeters) noexcept {
        return std::find(std::begin(core::kPrecisions), std::end(core::kPrecisions), precisionMeters)
               != std::end(core::kPrecisions);
    }

    bool isValidLogLevel(const std::string& level) noexcept {
        static const std::array<std::string_view, 6> levels = {
            "trace", "debug", "info", "warn", "error", "off"
        };
        return std::find(levels.begin(), levels.end(), level) != levels.end();
    }

    void markFailed(ConversionRecord& record, const core::ConversionError& error) {
        record.status = RecordStatus::ConversionFailed;
        record.errorCode = error.code;
        record.errorMessage = error.message;
    }

    void applyResult(ConversionRecord& record, core::Result<ConvertedValue> converted) {
        if (!converted) {
            markFailed(record, converted.error());
            return;
        }
        record.status = RecordStatus::Converted;
        record.output = std::move(*converted);
    }
}

// ConversionPipeline 实现
core::Result<ConvertedValue>
ConversionPipeline::convertGeodetic(const core::GeodeticPoint& point) const {
    switch (config_.targetKind) {
        case io::CoordinateKind::Utm: {
            auto utm = convert::toUtm(point);
            if (!utm) {
                return std::unexpected(std::move(utm.error()));
            }
            return ConvertedValue{*utm};
        }
        case io::CoordinateKind::Mgrs: {
            auto mgrs = convert::toMgrs(point, config_.precisionMeters);
            if (!mgrs) {
                return std::unexpected(std::move(mgrs.error()));
            }
            return ConvertedValue{std::move(*mgrs)};
        }
        case io::CoordinateKind::Geodetic:
            break;
    }

    // 同类型：只做范围检查
    auto valid = convert::validate(point);
    if (!valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return ConvertedValue{*valid};
}

core::Result<ConvertedValue>
ConversionPipeline::convertUtm(const core::UtmCoordinate& utm) const {
    switch (config_.targetKind) {
        case io::CoordinateKind::Geodetic: {
            auto point = convert::toLatLon(utm);
            if (!point) {
                return std::unexpected(std::move(point.error()));
            }
            return ConvertedValue{*point};
        }
        case io::CoordinateKind::Mgrs:
            return ConvertedValue{convert::toMgrs(utm, config_.precisionMeters)};
        case io::CoordinateKind::Utm:
            break;
    }
    return ConvertedValue{utm};
}

core::Result<ConvertedValue>
ConversionPipeline::convertMgrs(const core::MgrsReference& mgrs, ConversionRecord& record) const {
    if (config_.targetKind == io::CoordinateKind::Geodetic) {
        auto decoded = convert::toLatLon(mgrs);
        if (!decoded) {
            return std::unexpected(std::move(decoded.error()));
        }
        record.precisionMeters = decoded->precisionMeters;
        return ConvertedValue{decoded->point};
    }

    auto decoded = convert::toUtm(mgrs);
    if (!decoded) {
        return std::unexpected(std::move(decoded.error()));
    }
    record.precisionMeters = decoded->precisionMeters;

    if (config_.targetKind == io::CoordinateKind::Utm) {
        return ConvertedValue{decoded->utm};
    }
    // 同类型：解码成功后输出规范化的字符串
    return ConvertedValue{mgrs};
}

ConversionRecord ConversionPipeline::convertLine(std::string_view text, std::size_t lineNumber) const {
    ConversionRecord record;
    record.lineNumber = lineNumber;
    record.input = std::string(trim(text));

    record.sourceKind = config_.sourceKind ? config_.sourceKind : io::detectKind(record.input);
    if (!record.sourceKind) {
        record.status = RecordStatus::ParseFailed;
        record.errorMessage = "unrecognized coordinate: " + record.input;
        return record;
    }

    switch (*record.sourceKind) {
        case io::CoordinateKind::Geodetic: {
            auto point = io::parseGeodetic(record.input);
            if (!point) {
                record.status = RecordStatus::ParseFailed;
                record.errorMessage = "cannot parse latitude/longitude: " + record.input;
                return record;
            }
            applyResult(record, convertGeodetic(*point));
            break;
        }
        case io::CoordinateKind::Utm: {
            auto utm = io::parseUtm(record.input);
            if (!utm) {
                record.status = RecordStatus::ParseFailed;
                record.errorMessage = "cannot parse utm coordinate: " + record.input;
                return record;
            }
            applyResult(record, convertUtm(*utm));
            break;
        }
        case io::CoordinateKind::Mgrs: {
            auto mgrs = io::parseMgrs(record.input);
            if (!mgrs) {
                markFailed(record, mgrs.error());
                return record;
            }
            applyResult(record, convertMgrs(*mgrs, record));
            break;
        }
    }

    return record;
}

PipelineResult ConversionPipeline::execute(std::istream& input, const LogCallback& logCallback) const {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(line);
    }

    if (input.bad()) {
        PipelineResult result;
        result.errorMessage = "failed to read input";
        log("error", result.errorMessage, logCallback);
        return result;
    }

    return execute(lines, logCallback);
}

PipelineResult ConversionPipeline::execute(const std::vector<std::string>& lines,
                                           const LogCallback& logCallback) const {
    PipelineResult result;
    const auto startTime = std::chrono::steady_clock::now();

    log("debug", "converting " + std::to_string(lines.size()) + " lines to " +
        std::string(io::toString(config_.targetKind)), logCallback);

    for (std::size_t i = 0; i < lines.size(); ++i) {
        ++result.stats.totalLines;

        const auto text = trim(lines[i]);
        if (text.empty() || text.front() == '#') {
            ++result.stats.skipped;
            continue;
        }

        auto record = convertLine(text, i + 1);
        if (record.ok()) {
            ++result.stats.converted;
            log("trace", "line " + std::to_string(record.lineNumber) + ": " + formatRecord(record), logCallback);
        } else {
            ++result.stats.failed;
            log("warn", "line " + std::to_string(record.lineNumber) + ": " + record.errorMessage, logCallback);
        }

        const bool failed = !record.ok();
        result.records.push_back(std::move(record));

        if (failed && config_.stopOnError) {
            result.errorMessage = "stopped at line " + std::to_string(i + 1);
            log("error", result.errorMessage, logCallback);
            break;
        }
    }

    result.processingTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    result.success = result.stats.failed == 0;

    log("info", "converted " + std::to_string(result.stats.converted) + ", failed " +
        std::to_string(result.stats.failed) + ", skipped " + std::to_string(result.stats.skipped),
        logCallback);

    return result;
}

void ConversionPipeline::log(const std::string& level, const std::string& message,
                             const LogCallback& callback) const {
    if (!config_.enableLogging) {
        return;
    }

    if (callback) {
        callback(level, message);
        return;
    }

    // 默认写入 spdlog
    if (level == "error") {
        spdlog::error(message);
    } else if (level == "warn") {
        spdlog::warn(message);
    } else if (level == "info") {
        spdlog::info(message);
    } else if (level == "debug") {
        spdlog::debug(message);
    } else {
        spdlog::trace(message);
    }
}

// PipelineBuilder 实现
std::expected<ConversionPipeline, PipelineError> PipelineBuilder::build() const {
    auto validation = validateConfig(config_);
    if (!validation) {
        return std::unexpected(validation.error());
    }
    return ConversionPipeline{config_};
}

PipelineBuilder createPipeline() {
    return PipelineBuilder{};
}

std::expected<void, PipelineError> validateConfig(const PipelineConfig& config) {
    if (!isValidPrecision(config.precisionMeters)) {
        return std::unexpected(PipelineError::ConfigError);
    }

    if (!isValidLogLevel(config.logLevel)) {
        return std::unexpected(PipelineError::ConfigError);
    }

    return {};
}

std::string_view toString(RecordStatus status) noexcept {
    switch (status) {
        case RecordStatus::Converted:        return "converted";
        case RecordStatus::ParseFailed:      return "parse_failed";
        case RecordStatus::ConversionFailed: return "conversion_failed";
    }
    return "unknown";
}

std::string formatValue(const ConvertedValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, core::GeodeticPoint>) {
            return io::formatGeodetic(v);
        } else if constexpr (std::is_same_v<T, core::UtmCoordinate>) {
            return io::formatUtm(v);
        } else {
            return io::formatMgrs(v);
        }
    }, value);
}

std::string formatRecord(const ConversionRecord& record) {
    std::ostringstream oss;
    oss << record.input << " -> ";

    if (!record.ok() || !record.output) {
        oss << "error: " << record.errorMessage;
        return oss.str();
    }

    oss << formatValue(*record.output);
    if (record.precisionMeters) {
        oss << " (accuracy " << *record.precisionMeters << " meters)";
    }
    return oss.str();
}

nlohmann::json toJson(const ConversionRecord& record) {
    nlohmann::json json;
    json["line"] = record.lineNumber;
    json["input"] = record.input;
    json["status"] = std::string(toString(record.status));

    if (record.sourceKind) {
        json["source"] = std::string(io::toString(*record.sourceKind));
    }

    if (record.output) {
        json["output"] = std::visit([](const auto& v) { return io::toJson(v); }, *record.output);
        if (record.precisionMeters) {
            json["output"]["precision"] = *record.precisionMeters;
        }
    }

    if (!record.ok()) {
        nlohmann::json error;
        error["message"] = record.errorMessage;
        if (record.errorCode) {
            error["code"] = std::string(core::toString(*record.errorCode));
        }
        json["error"] = error;
    }

    return json;
}

nlohmann::json toJson(const PipelineResult& result) {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& record : result.records) {
        records.push_back(toJson(record));
    }

    nlohmann::json json;
    json["records"] = records;
    json["stats"] = {
        {"totalLines", result.stats.totalLines},
        {"converted", result.stats.converted},
        {"failed", result.stats.failed},
        {"skipped", result.stats.skipped}
    };
    json["processingTimeMs"] = result.processingTime.count();
    json["success"] = result.success;

    if (!result.errorMessage.empty()) {
        json["errorMessage"] = result.errorMessage;
    }

    return json;
}

} // namespace gridconv::pipeline
