#pragma once

#include "StageResult.hpp"
#include "Diagnostics.hpp"
#include <chrono>
#include <string>
#include <plog/Log.h>
#include <utility>
#include <exception>
#include <optional>

#include "../utils/ErrorReporter.hpp"

namespace processing {

// Runs a stage callable returning std::optional<T>, where std::nullopt means the
// stage failed and already filled `error`. Measures duration, logs the outcome and
// converts library exceptions (json, filesystem, toml) into a failed StageResult.
// Reports raised while it runs carry the stage name.
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    using namespace std::chrono;
    utils::ErrorReporter::StageScope scope(stage_name);
    auto start = steady_clock::now();
    auto elapsed = [&start]() {
        return duration_cast<microseconds>(steady_clock::now() - start);
    };

    try
    {
        std::string error;
        std::optional<T> res = fn(error);
        auto dur = elapsed();
        if (!res)
        {
            PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << error;
            return StageResult<T>::failure(error.empty() ? "stage reported failure" : error, dur, stage_name);
        }
        if (Diagnostics::IsVerbose()) {
            PLOG_INFO_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return StageResult<T>::success(std::move(*res), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        auto dur = elapsed();
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' threw in " << dur.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Unknown,
            "Pipeline stage failed",
            stage_name + ": " + ex.what());
        return StageResult<T>::failure(ex.what(), dur, stage_name);
    }
}

} // namespace processing
