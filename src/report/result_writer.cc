#include "result_writer.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/time_utils.h"

namespace fs = std::filesystem;

namespace Reloaded {

namespace {

constexpr char kFallbackOutputDir[] = "output";

double UsToMs(double us) {
    return us / 1000.0;
}

} // namespace

ResultWriter::ResultWriter(std::string output_dir) : output_dir_(std::move(output_dir)) {}

std::string ResultWriter::EnsureDirectory(uint64_t execution_id) const {
    const std::string id = std::to_string(execution_id);
    std::error_code ec;
    fs::path dir = fs::path(output_dir_) / id;
    fs::create_directories(dir, ec);
    if (!ec) {
        return dir.string();
    }

    LOG(WARNING) << "Couldn't ensure output folder " << dir << ": " << ec.message()
        << ", defaulting to '" << kFallbackOutputDir << "/" << id << "'";
    dir = fs::path(kFallbackOutputDir) / id;
    fs::create_directories(dir, ec);
    if (ec) {
        LOG(ERROR) << "Failed to create result directory " << dir << ": " << ec.message();
        return "";
    }
    return dir.string();
}

std::string ResultWriter::Write(const StepReport& report) const {
    std::string dir = EnsureDirectory(report.execution_id);
    if (dir.empty()) {
        return "";
    }

    std::string path = (fs::path(dir) / ("report_" + std::to_string(report.step) + "_"
                + std::to_string(TimeNowMs()) + ".yaml")).string();

    std::ofstream file(path);
    if (!file.is_open()) {
        LOG(ERROR) << "Failed to create result file: " << path << ": " << strerror(errno);
        return "";
    }
    file << ToYaml(report) << "\n";
    file.close();
    if (file.fail()) {
        LOG(ERROR) << "Failed to write result file: " << path;
        return "";
    }

    LOG(INFO) << "Step report generated: " << path;
    LogSummary(report);
    return path;
}

std::string ResultWriter::ToYaml(const StepReport& report) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "homeserver" << YAML::Value << report.homeserver;
    out << YAML::Key << "execution_id" << YAML::Value << report.execution_id;
    out << YAML::Key << "step" << YAML::Value << report.step;
    out << YAML::Key << "step_users" << YAML::Value << report.users;
    out << YAML::Key << "step_friendships" << YAML::Value << report.friendships;
    out << YAML::Key << "ticks" << YAML::Value << report.ticks;
    out << YAML::Key << "report" << YAML::Value;
    EmitMetrics(out, report.metrics);
    out << YAML::EndMap;
    return out.c_str();
}

void ResultWriter::EmitMetrics(YAML::Emitter& out, const MetricsReport& metrics) {
    out << YAML::BeginMap;

    out << YAML::Key << "actions" << YAML::Value << YAML::BeginMap;
    for (ActionKind kind : kAllActionKinds) {
        auto it = metrics.actions.find(kind);
        ActionMetrics action = it != metrics.actions.end() ? it->second : ActionMetrics{};

        out << YAML::Key << ActionKindName(kind) << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "requests" << YAML::Value << action.requests;
        out << YAML::Key << "errors" << YAML::Value << action.errors;
        out << YAML::Key << "latency_ms" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "min" << YAML::Value << UsToMs(action.latency.min_us);
        out << YAML::Key << "average" << YAML::Value << UsToMs(action.latency.average_us);
        out << YAML::Key << "p50" << YAML::Value << UsToMs(action.latency.p50_us);
        out << YAML::Key << "p90" << YAML::Value << UsToMs(action.latency.p90_us);
        out << YAML::Key << "p95" << YAML::Value << UsToMs(action.latency.p95_us);
        out << YAML::Key << "p99" << YAML::Value << UsToMs(action.latency.p99_us);
        out << YAML::Key << "max" << YAML::Value << UsToMs(action.latency.max_us);
        out << YAML::EndMap;
        if (!action.error_causes.empty()) {
            out << YAML::Key << "error_details" << YAML::Value << YAML::BeginMap;
            for (const auto& [cause, count] : action.error_causes) {
                out << YAML::Key << cause << YAML::Value << count;
            }
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::Key << "messages" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "sent" << YAML::Value << metrics.messages.sent;
    out << YAML::Key << "received" << YAML::Value << metrics.messages.received;
    out << YAML::Key << "orphan_receipts" << YAML::Value << metrics.messages.orphan_receipts;
    out << YAML::Key << "duplicate_receipts" << YAML::Value << metrics.messages.duplicate_receipts;
    out << YAML::Key << "outstanding" << YAML::Value << metrics.messages.outstanding;
    out << YAML::EndMap;

    out << YAML::Key << "all_messages_sent" << YAML::Value << metrics.all_messages_sent;
    out << YAML::EndMap;
}

void ResultWriter::LogSummary(const StepReport& report) {
    std::stringstream summary;
    summary << "\n===== Step " << report.step << " ====="
        << "\n\t  Homeserver: " << report.homeserver
        << "\n\t  Users: " << report.users
        << "\n\t  Friendships: " << report.friendships
        << "\n\t  Ticks: " << report.ticks;
    for (const auto& [kind, action] : report.metrics.actions) {
        summary << "\n\t  " << std::left << std::setw(14) << ActionKindName(kind)
            << " requests=" << action.requests
            << " errors=" << action.errors
            << " p50=" << std::fixed << std::setprecision(2) << UsToMs(action.latency.p50_us) << "ms"
            << " p99=" << UsToMs(action.latency.p99_us) << "ms";
    }
    summary << "\n\t  Messages sent/received: " << report.metrics.messages.sent << "/"
        << report.metrics.messages.received
        << " (orphans " << report.metrics.messages.orphan_receipts << ")";
    LOG(INFO) << summary.str();
}

} // namespace Reloaded
