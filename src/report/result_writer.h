#pragma once

#include <string>

#include "simulation/simulation.h"

namespace YAML {
class Emitter;
}

namespace Reloaded {

/**
 * Writes step reports as YAML under <output_dir>/<execution_id>/
 */
class ResultWriter {
public:
    /**
     * Constructor
     * @param output_dir Base directory, "output" is used when it can't be created
     */
    explicit ResultWriter(std::string output_dir);

    /**
     * Writes report_<step>_<timestamp>.yaml and logs a summary.
     * Failures are logged, never thrown.
     * @return Path of the written file, empty on failure
     */
    std::string Write(const StepReport& report) const;

    /**
     * Serializes a report without touching the filesystem
     */
    static std::string ToYaml(const StepReport& report);

    /**
     * Resolves and creates the directory for an execution
     */
    std::string EnsureDirectory(uint64_t execution_id) const;

private:
    static void EmitMetrics(YAML::Emitter& out, const MetricsReport& metrics);
    static void LogSummary(const StepReport& report);

    std::string output_dir_;
};

} // namespace Reloaded
