#pragma once

#include "../core/Error.hpp"
#include "../core/Types.hpp"
#include "../io/Formatting.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace gridconv::pipeline {

// 管道错误类型
enum class PipelineError {
    InputError,
    ConfigError
};

// 管道配置
struct PipelineConfig {
    // 输入类型，nullopt 表示逐行自动检测
    std::optional<io::CoordinateKind> sourceKind;
    io::CoordinateKind targetKind{io::CoordinateKind::Mgrs};

    // 输出 MGRS 时的精度（米）
    int precisionMeters{1};

    bool stopOnError{false};
    bool enableLogging{true};
    std::string logLevel{"info"};  // trace, debug, info, warn, error, off
};

using LogCallback = std::function<void(const std::string& level, const std::string& message)>;

using ConvertedValue = std::variant<core::GeodeticPoint, core::UtmCoordinate, core::MgrsReference>;

enum class RecordStatus {
    Converted,
    ParseFailed,        // 文本无法识别为坐标
    ConversionFailed    // 坐标转换返回错误
};

// 单条转换记录
struct ConversionRecord {
    std::size_t lineNumber{0};
    std::string input;
    std::optional<io::CoordinateKind> sourceKind;
    RecordStatus status{RecordStatus::ParseFailed};
    std::optional<ConvertedValue> output;
    std::optional<int> precisionMeters;      // 输入为 MGRS 时的解码精度
    std::optional<core::ErrorCode> errorCode;
    std::string errorMessage;

    bool ok() const noexcept { return status == RecordStatus::Converted; }
};

struct PipelineStats {
    std::size_t totalLines{0};
    std::size_t converted{0};
    std::size_t failed{0};
    std::size_t skipped{0};     // 空行和 # 注释
};

// 管道结果
struct PipelineResult {
    std::vector<ConversionRecord> records;
    PipelineStats stats;
    std::chrono::milliseconds processingTime{0};
    bool success{false};
    std::string errorMessage;
};

// 批量坐标转换管道
class ConversionPipeline {
public:
    explicit ConversionPipeline(PipelineConfig config)
        : config_(std::move(config)) {}

    // 转换一行文本
    [[nodiscard]] ConversionRecord convertLine(std::string_view text, std::size_t lineNumber = 0) const;

    // 逐行转换输入流
    [[nodiscard]] PipelineResult execute(std::istream& input,
                                         const LogCallback& logCallback = nullptr) const;

    [[nodiscard]] PipelineResult execute(const std::vector<std::string>& lines,
                                         const LogCallback& logCallback = nullptr) const;

    const PipelineConfig& config() const noexcept { return config_; }

private:
    PipelineConfig config_;

    core::Result<ConvertedValue> convertGeodetic(const core::GeodeticPoint& point) const;
    core::Result<ConvertedValue> convertUtm(const core::UtmCoordinate& utm) const;
    core::Result<ConvertedValue> convertMgrs(const core::MgrsReference& mgrs, ConversionRecord& record) const;

    void log(const std::string& level, const std::string& message,
             const LogCallback& callback) const;
};

// 链式配置
class PipelineBuilder {
public:
    PipelineBuilder() = default;

    PipelineBuilder& withSource(io::CoordinateKind kind) {
        config_.sourceKind = kind;
        return *this;
    }

    PipelineBuilder& withAutoDetect() {
        config_.sourceKind.reset();
        return *this;
    }

    PipelineBuilder& withTarget(io::CoordinateKind kind) {
        config_.targetKind = kind;
        return *this;
    }

    PipelineBuilder& withPrecision(int precisionMeters) {
        config_.precisionMeters = precisionMeters;
        return *this;
    }

    PipelineBuilder& withStopOnError(bool enable) {
        config_.stopOnError = enable;
        return *this;
    }

    PipelineBuilder& withLogging(bool enable, std::string level = "info") {
        config_.enableLogging = enable;
        config_.logLevel = std::move(level);
        return *this;
    }

    // 校验配置后构建
    [[nodiscard]] std::expected<ConversionPipeline, PipelineError> build() const;

private:
    PipelineConfig config_;
};

[[nodiscard]] PipelineBuilder createPipeline();

// 验证配置
[[nodiscard]] std::expected<void, PipelineError>
validateConfig(const PipelineConfig& config);

[[nodiscard]] std::string_view toString(RecordStatus status) noexcept;

// 文本输出："<输入> -> <输出>"
[[nodiscard]] std::string formatRecord(const ConversionRecord& record);

[[nodiscard]] std::string formatValue(const ConvertedValue& value);

[[nodiscard]] nlohmann::json toJson(const ConversionRecord& record);
[[nodiscard]] nlohmann::json toJson(const PipelineResult& result);

} // namespace gridconv::pipeline
