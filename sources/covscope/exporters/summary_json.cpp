//
// Created by gregorian-rayne on 02/14/26.
//

#include "covscope/exporters/summary_json.hpp"
#include "covscope/utils/json_utils.hpp"

namespace covscope::exporters {

    namespace {

        Result<double> read_ratio(const json& data, const std::string& key) {
            auto value = json_utils::get<double>(data, key);
            if (value.is_err()) {
                return Result<double>::failure(value.error());
            }
            const double ratio = value.value();
            if (!(ratio >= 0.0 && ratio <= 1.0)) {
                return Result<double>::failure(
                    Error::parse_error("Coverage value out of range [0, 1]", key)
                );
            }
            return Result<double>::success(ratio);
        }

    }  // namespace

    json to_json(const CoverageSummary& summary) {
        json j;
        j["success"] = summary.is_success();

        if (summary.is_success()) {
            const auto& metrics = summary.metrics();
            j["error"] = nullptr;
            j["line_coverage"] = metrics.line_coverage;
            j["branch_coverage"] = metrics.branch_coverage;
            j["worst_classes"] = metrics.worst_classes;
        } else {
            j["error"] = summary.error();
            j["line_coverage"] = 0.0;
            j["branch_coverage"] = 0.0;
            j["worst_classes"] = json::array();
        }
        return j;
    }

    Result<CoverageSummary> summary_from_json(const json& data) {
        auto success = json_utils::get<bool>(data, "success");
        if (success.is_err()) {
            return Result<CoverageSummary>::failure(success.error());
        }

        if (!success.value()) {
            std::string message = "unknown error";
            if (data.contains("error") && data["error"].is_string()) {
                message = data["error"].get<std::string>();
            }
            return Result<CoverageSummary>::success(CoverageSummary::failure(std::move(message)));
        }

        CoverageMetrics metrics;

        auto line = read_ratio(data, "line_coverage");
        if (line.is_err()) {
            return Result<CoverageSummary>::failure(line.error());
        }
        metrics.line_coverage = line.value();

        auto branch = read_ratio(data, "branch_coverage");
        if (branch.is_err()) {
            return Result<CoverageSummary>::failure(branch.error());
        }
        metrics.branch_coverage = branch.value();

        auto worst = json_utils::get<std::vector<std::string>>(data, "worst_classes");
        if (worst.is_err()) {
            return Result<CoverageSummary>::failure(worst.error());
        }
        metrics.worst_classes = std::move(worst).value();
        if (metrics.worst_classes.size() > MAX_WORST_CLASSES) {
            return Result<CoverageSummary>::failure(
                Error::parse_error("Too many entries", "worst_classes")
            );
        }

        return Result<CoverageSummary>::success(CoverageSummary::success(std::move(metrics)));
    }

    std::string to_json_string(const CoverageSummary& summary, const int indent) {
        return json_utils::to_string(to_json(summary), indent);
    }

    Result<void> save_summary(const fs::path& path, const CoverageSummary& summary) {
        return json_utils::write_file(path, to_json(summary));
    }

    Result<CoverageSummary> load_summary(const fs::path& path) {
        auto data = json_utils::read_file(path);
        if (data.is_err()) {
            return Result<CoverageSummary>::failure(data.error());
        }

        return summary_from_json(data.value()).with_context(path.string());
    }

    json to_json(const CoverageDelta& delta) {
        json j;
        j["line_delta"] = delta.line_delta;
        j["branch_delta"] = delta.branch_delta;
        j["improved_classes"] = delta.improved_classes;
        j["new_worst_classes"] = delta.new_worst_classes;
        return j;
    }

}  // namespace covscope::exporters
