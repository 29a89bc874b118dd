#include "schemafm/batch.hpp"
#include "schemafm/platform.hpp"
#include "schemafm/translator.hpp"
#include "schemafm/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <future>
#include <iomanip>
#include <sstream>
#include <utility>

namespace schemafm {

namespace {

struct FileJob {
    std::vector<DocumentOutcome> outcomes;
    WarningCollector warnings;
};

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) return value;
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

double elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

bool append_or_log(const std::string& path, const std::string& line) {
    auto appended = append_line(path, line);
    if (!appended.ok) {
        spdlog::error("failed to append to {}: {}", path, appended.error);
    }
    return appended.ok;
}

std::uint64_t fnv1a64(std::uint64_t h, const std::string& bytes) {
    for (unsigned char c : bytes) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

} // namespace

BatchOptions batch_options_from_config(const RunConfig& config) {
    BatchOptions options;
    options.workers = config.batch.workers;
    options.queue_capacity = config.batch.queue_capacity;
    options.batch_size = config.batch.batch_size;
    options.time_budget = std::chrono::milliseconds(config.batch.document_time_budget_ms);
    options.documents.skip_templated = config.batch.skip_templated;
    options.documents.skip_kinds = config.batch.skip_kinds;
    options.source = config.batch.source;
    return options;
}

const char* document_status_to_string(DocumentStatus s) {
    switch (s) {
        case DocumentStatus::Valid: return "valid";
        case DocumentStatus::Invalid: return "invalid";
        case DocumentStatus::Failed: return "failed";
        default: return "failed";
    }
}

std::string summary_row(const DocumentOutcome& outcome, const std::string& source) {
    std::ostringstream out;
    out << csv_field(outcome.document_id) << ',' << csv_field(source) << ','
        << (outcome.status == DocumentStatus::Valid ? "true" : "false") << ','
        << std::fixed << std::setprecision(6) << outcome.elapsed_ms / 1000.0;
    return out.str();
}

std::vector<DocumentOutcome> process_file(const std::string& path,
                                          const FeatureModel& model,
                                          const KeyMapper& mapper,
                                          const BatchOptions& options,
                                          WarningCollector& warnings) {
    std::vector<DocumentOutcome> outcomes;

    auto loaded = load_documents(path, options.documents, warnings);
    if (loaded.isErr()) {
        warnings.emit(Warning::invalid_document, warnings::invalid_document(loaded.error().message(), path));
        DocumentOutcome failed;
        failed.file = path;
        failed.document_id = path;
        failed.error = loaded.error().toString();
        outcomes.push_back(std::move(failed));
        return outcomes;
    }

    ConfigurationTranslator translator(mapper, TranslatorOptions{options.time_budget});
    ModelValidator validator(model);

    for (const auto& doc : loaded.value()) {
        auto start = std::chrono::steady_clock::now();

        DocumentOutcome outcome;
        outcome.file = path;
        outcome.document_id = doc.id;

        auto selection = translator.translate(doc, warnings);
        if (selection.isErr()) {
            outcome.status = DocumentStatus::Failed;
            outcome.error = selection.error().toString();
            if (selection.error().code() == ErrorCode::DOCUMENT_INVALID) {
                warnings.emit(Warning::invalid_document,
                              warnings::invalid_document(selection.error().message(), doc.id));
            }
        } else {
            outcome.report = validator.validate(selection.value());
            outcome.status = outcome.report.valid ? DocumentStatus::Valid : DocumentStatus::Invalid;
        }
        outcome.elapsed_ms = elapsed_ms_since(start);
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

Checkpoint read_checkpoint(const std::string& path) {
    Checkpoint checkpoint;
    if (path.empty() || !is_regular_file(path)) return checkpoint;

    auto file = read_file(path);
    if (!file.ok) {
        spdlog::warn("cannot read checkpoint {}: {}", path, file.error);
        return checkpoint;
    }
    std::istringstream in(file.content);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        std::vector<std::string> fields;
        std::size_t start = 0;
        for (;;) {
            auto tab = line.find('\t', start);
            fields.push_back(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start));
            if (tab == std::string::npos) break;
            start = tab + 1;
        }
        std::vector<std::string>& covered = checkpoint.batches[fields[0]];
        for (std::size_t i = 1; i < fields.size(); ++i) {
            if (fields[i].empty()) continue;
            covered.push_back(fields[i]);
            checkpoint.files.insert(fields[i]);
        }
    }
    return checkpoint;
}

std::string checkpoint_line(const std::vector<std::string>& files) {
    std::string line = BatchRunner::batch_id(files);
    for (const auto& file : files) {
        line += '\t';
        line += file;
    }
    return line;
}

BatchRunner::BatchRunner(const FeatureModel& model, const KeyMapper& mapper, BatchOptions options)
    : model_(model), mapper_(mapper), options_(std::move(options)) {
    if (options_.batch_size == 0) options_.batch_size = 1;
}

std::string BatchRunner::batch_id(const std::vector<std::string>& files) {
    std::vector<std::string> sorted = files;
    std::sort(sorted.begin(), sorted.end());

    std::uint64_t h = 1469598103934665603ULL;
    for (const auto& file : sorted) {
        h = fnv1a64(h, file);
        h = fnv1a64(h, std::string(1, '\0'));
    }
    std::ostringstream out;
    out << "batch-" << std::hex << std::setw(16) << std::setfill('0') << h;
    return out.str();
}

BatchSummary BatchRunner::run(std::vector<std::string> files, WarningCollector& warnings) {
    BatchSummary summary;
    outcomes_.clear();

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    summary.files = files.size();

    Checkpoint completed = read_checkpoint(options_.checkpoint_path);
    std::set<std::string> present(files.begin(), files.end());
    for (const auto& [id, covered] : completed.batches) {
        if (std::any_of(covered.begin(), covered.end(),
                        [&present](const std::string& f) { return present.count(f) > 0; })) {
            ++summary.batches_resumed;
        }
    }
    files.erase(std::remove_if(files.begin(), files.end(),
                               [&completed](const std::string& f) { return completed.files.count(f) > 0; }),
                files.end());
    std::size_t pending_batches = (files.size() + options_.batch_size - 1) / options_.batch_size;
    summary.batches_total = summary.batches_resumed + pending_batches;

    if (!options_.summary_path.empty() && !path_exists(options_.summary_path)) {
        append_or_log(options_.summary_path, "filename,source,result,time");
    }

    spdlog::info("batch: {} files in {} batches ({} already checkpointed)",
                 summary.files, summary.batches_total, summary.batches_resumed);

    WorkerPool pool(options_.workers, options_.queue_capacity);

    for (std::size_t b = 0; b < pending_batches; ++b) {
        std::size_t begin = b * options_.batch_size;
        std::size_t end = std::min(files.size(), begin + options_.batch_size);
        std::vector<std::string> batch(files.begin() + begin, files.begin() + end);

        std::string id = batch_id(batch);
        if (completed.batches.count(id)) {
            ++summary.batches_resumed;
            continue;
        }
        if (cancelled_) {
            summary.cancelled = true;
            break;
        }

        std::vector<std::future<FileJob>> futures;
        for (std::size_t i = begin; i < end; ++i) {
            if (cancelled_) break;
            const std::string& path = files[i];
            futures.push_back(pool.submit([this, &path, &warnings]() {
                FileJob job;
                job.warnings.set_policy(warnings.policy());
                job.outcomes = process_file(path, model_, mapper_, options_, job.warnings);
                return job;
            }));
        }

        std::vector<FileJob> jobs;
        jobs.reserve(futures.size());
        for (std::size_t i = 0; i < futures.size(); ++i) {
            try {
                jobs.push_back(futures[i].get());
            } catch (const std::exception& e) {
                spdlog::error("{}: {}", files[begin + i], e.what());
                FileJob failed;
                DocumentOutcome outcome;
                outcome.file = files[begin + i];
                outcome.document_id = files[begin + i];
                outcome.error = e.what();
                failed.outcomes.push_back(std::move(outcome));
                jobs.push_back(std::move(failed));
            }
        }

        // A partially submitted batch is rerun on the next start
        if (futures.size() != end - begin) {
            summary.cancelled = true;
            break;
        }

        bool written = true;
        for (auto& job : jobs) {
            warnings.merge(job.warnings);
            for (auto& outcome : job.outcomes) {
                ++summary.documents;
                switch (outcome.status) {
                    case DocumentStatus::Valid: ++summary.valid; break;
                    case DocumentStatus::Invalid: ++summary.invalid; break;
                    case DocumentStatus::Failed: ++summary.failed; break;
                }
                if (!options_.summary_path.empty()) {
                    written = append_or_log(options_.summary_path, summary_row(outcome, options_.source))
                              && written;
                }
                if (!options_.reports_path.empty() && outcome.status != DocumentStatus::Failed) {
                    written = append_or_log(options_.reports_path, report_to_json(outcome.report).dump())
                              && written;
                }
                outcomes_.push_back(std::move(outcome));
            }
        }

        // Unwritten rows would be lost for good once the batch is checkpointed
        if (!written) {
            ++summary.batches_failed;
            spdlog::error("{}: output incomplete, batch left out of the checkpoint", id);
            continue;
        }
        if (!options_.checkpoint_path.empty() && !append_or_log(options_.checkpoint_path, checkpoint_line(batch))) {
            ++summary.batches_failed;
            continue;
        }
        ++summary.batches_run;
        spdlog::info("{} done: {} documents so far ({} valid, {} invalid, {} failed)",
                     id, summary.documents, summary.valid, summary.invalid, summary.failed);
    }

    pool.stop();
    return summary;
}

} // namespace schemafm
