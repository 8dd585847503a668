#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include "core/dedup_errors.hpp"
#include "core/duplicate_resolver.hpp"
#include "core/signature_comparator.hpp"

/**
 * @brief One relocated (or, in a dry run, relocatable) duplicate
 */
struct ArchiveRecord
{
    std::string duplicate_id;
    std::string original_id;
    std::string source_path;      // where the duplicate was before the move
    std::string destination_path; // where it is now
    std::string original_path;    // canonical file left in place
    std::chrono::system_clock::time_point archived_at;
    double similarity;
    bool dry_run;

    ArchiveRecord() : similarity(0.0), dry_run(false) {}

    /**
     * @brief Local time formatted as YYYY-mm-dd HH:MM:SS
     */
    std::string archivedAtString() const;
};

enum class RunStatus
{
    NO_DUPLICATES,    // every asset processed, nothing matched
    DUPLICATES_FOUND, // every asset processed, at least one group
    INCOMPLETE        // at least one failure was recorded
};

/**
 * @brief Structured result of one detection run, handed back to the caller
 */
struct DetectionReport
{
    std::string run_id;
    std::vector<DuplicateGroup> groups;
    std::vector<ArchiveRecord> archive_records;
    std::vector<ProcessingFailure> failures;
    std::vector<ComparisonResult> comparisons; // successful comparisons only
    size_t assets_total = 0;
    size_t assets_signed = 0;
    size_t pairs_compared = 0;
    size_t pairs_skipped = 0;

    RunStatus status() const;
    static std::string statusName(RunStatus status);
};

/**
 * @brief Run-scoped accumulator shared by the components of one run
 *
 * Each run owns its context, so concurrent runs never see each other's
 * records or failures.
 */
class RunContext
{
public:
    RunContext();

    void addFailure(const ProcessingFailure &failure);
    void addArchiveRecord(const ArchiveRecord &record);

    std::vector<ProcessingFailure> failures() const;
    std::vector<ArchiveRecord> archiveRecords() const;
    size_t failureCount() const;

    void reset();

    const std::string &runId() const { return run_id_; }

    static std::string formatTimestamp(std::chrono::system_clock::time_point time_point, const char *format);

private:
    std::string run_id_;
    mutable std::mutex mutex_;
    std::vector<ProcessingFailure> failures_;
    std::vector<ArchiveRecord> records_;
};
