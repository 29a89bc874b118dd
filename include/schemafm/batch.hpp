#pragma once

#include "schemafm/config.hpp"
#include "schemafm/document.hpp"
#include "schemafm/feature_model.hpp"
#include "schemafm/key_mapping.hpp"
#include "schemafm/validator.hpp"
#include "schemafm/warnings.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace schemafm {

// ============================================================================
// Batch Validation
// ============================================================================

struct BatchOptions {
    std::size_t workers = 4;
    std::size_t queue_capacity = 64;
    std::size_t batch_size = 50;
    std::chrono::milliseconds time_budget{5000};
    DocumentOptions documents;
    std::string source = "schemafm";

    std::string checkpoint_path;  // one completed batch per line; empty disables resume
    std::string summary_path;     // CSV rows "filename,source,result,time"
    std::string reports_path;     // one validation report JSON per line
};

BatchOptions batch_options_from_config(const RunConfig& config);

enum class DocumentStatus {
    Valid,
    Invalid,
    Failed  // unreadable file, malformed document or timeout
};

const char* document_status_to_string(DocumentStatus s);

struct DocumentOutcome {
    std::string file;
    std::string document_id;
    DocumentStatus status = DocumentStatus::Failed;
    ValidationReport report;
    std::string error;
    double elapsed_ms = 0.0;  // translation plus validation
};

struct BatchSummary {
    std::size_t batches_total = 0;
    std::size_t batches_run = 0;
    std::size_t batches_resumed = 0;  // skipped, already in the checkpoint
    std::size_t batches_failed = 0;   // rows or reports not written; left out of the checkpoint
    std::size_t files = 0;
    std::size_t documents = 0;
    std::size_t valid = 0;
    std::size_t invalid = 0;
    std::size_t failed = 0;
    bool cancelled = false;
};

// "filename,source,result,time" with time in seconds
std::string summary_row(const DocumentOutcome& outcome, const std::string& source);

// Translate and validate every document of one file
std::vector<DocumentOutcome> process_file(const std::string& path,
                                          const FeatureModel& model,
                                          const KeyMapper& mapper,
                                          const BatchOptions& options,
                                          WarningCollector& warnings);

// Completed batches read back from a checkpoint file. Each line holds a
// batch id followed by the tab separated files the batch covered; lines
// with an id only are accepted too.
struct Checkpoint {
    std::map<std::string, std::vector<std::string>> batches;  // id -> files
    std::set<std::string> files;
};

Checkpoint read_checkpoint(const std::string& path);

// The checkpoint line recording one completed batch
std::string checkpoint_line(const std::vector<std::string>& files);

class BatchRunner {
public:
    // The model and mapper are shared read-only by all workers
    BatchRunner(const FeatureModel& model, const KeyMapper& mapper, BatchOptions options);

    // Process files in sorted order, batch by batch. Files covered by a
    // checkpointed batch are skipped and the rest are batched again, so
    // adding or removing files never skips unprocessed ones. A batch is
    // checkpointed only after all of its rows and reports were written.
    BatchSummary run(std::vector<std::string> files, WarningCollector& warnings);

    // Stop submitting work; tasks already queued or running finish
    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_; }

    // Outcomes of the batches run by the last call to run()
    const std::vector<DocumentOutcome>& outcomes() const { return outcomes_; }

    // "batch-" and 16 hex digits hashing the batch's sorted file paths
    static std::string batch_id(const std::vector<std::string>& files);

private:
    const FeatureModel& model_;
    const KeyMapper& mapper_;
    BatchOptions options_;
    std::atomic<bool> cancelled_{false};
    std::vector<DocumentOutcome> outcomes_;
};

} // namespace schemafm
