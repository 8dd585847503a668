#include "core/run_context.hpp"
#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace
{
    std::atomic<unsigned long> g_run_counter{0};
}

std::string ArchiveRecord::archivedAtString() const
{
    return RunContext::formatTimestamp(archived_at, "%Y-%m-%d %H:%M:%S");
}

RunStatus DetectionReport::status() const
{
    if (!failures.empty())
        return RunStatus::INCOMPLETE;
    if (groups.empty())
        return RunStatus::NO_DUPLICATES;
    return RunStatus::DUPLICATES_FOUND;
}

std::string DetectionReport::statusName(RunStatus status)
{
    switch (status)
    {
    case RunStatus::NO_DUPLICATES:
        return "NO_DUPLICATES";
    case RunStatus::DUPLICATES_FOUND:
        return "DUPLICATES_FOUND";
    case RunStatus::INCOMPLETE:
        return "INCOMPLETE";
    default:
        return "UNKNOWN";
    }
}

RunContext::RunContext()
{
    run_id_ = formatTimestamp(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S") + "_" +
              std::to_string(g_run_counter.fetch_add(1) + 1);
}

void RunContext::addFailure(const ProcessingFailure &failure)
{
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.push_back(failure);
}

void RunContext::addArchiveRecord(const ArchiveRecord &record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

std::vector<ProcessingFailure> RunContext::failures() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

std::vector<ArchiveRecord> RunContext::archiveRecords() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

size_t RunContext::failureCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_.size();
}

void RunContext::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.clear();
    records_.clear();
}

std::string RunContext::formatTimestamp(std::chrono::system_clock::time_point time_point, const char *format)
{
    std::time_t time = std::chrono::system_clock::to_time_t(time_point);
    std::tm local_tm{};
    localtime_r(&time, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, format);
    return ss.str();
}
