#include "schemafm/pipeline.hpp"
#include "schemafm/platform.hpp"
#include "schemafm/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <utility>
#include <vector>

namespace schemafm {

namespace {

struct KindJob {
    KindOutput output;
    WarningCollector warnings;
};

KindJob run_kind(const SchemaGraph& graph, const FeatureSynthesizer& synthesizer,
                 const KindRoot& kind, const DerivationOptions& derivation,
                 const std::unordered_map<std::string, WarningAction>& policy) {
    KindJob job;
    job.warnings.set_policy(policy);
    job.output.synthesis = synthesizer.synthesize(kind, job.warnings);
    job.output.constraints = derive_constraints(graph, job.output.synthesis, derivation, job.warnings);
    return job;
}

} // namespace

PipelineOptions pipeline_options_from_config(const RunConfig& config) {
    PipelineOptions options;
    options.graph.roots = config.model.roots;
    options.graph.kind_marker = config.model.kind_marker;
    options.synthesis.max_depth = config.model.max_depth;
    options.synthesis.escape_prefix = config.model.escape_prefix;
    options.derivation.rules = config.derivation.rules;
    options.assembly.namespace_name = config.model.namespace_name;
    options.assembly.deduplicate = config.model.deduplicate;
    options.parallel = config.model.parallel_synthesis;
    options.workers = config.batch.workers;
    return options;
}

Result<FeatureModel> build_model(const nlohmann::ordered_json& schema,
                                 const PipelineOptions& options,
                                 WarningCollector& warnings) {
    auto resolved = SchemaGraph::resolve(schema, options.graph, warnings);
    if (!resolved.ok) {
        return Result<FeatureModel>::err(Error(ErrorCode::SCHEMA_INVALID, resolved.error));
    }
    const SchemaGraph& graph = resolved.graph;

    auto kinds = select_kinds(graph, options.synthesis.escape_prefix, warnings);
    spdlog::info("synthesizing {} kinds from {} definitions", kinds.size(), graph.size());

    FeatureSynthesizer synthesizer(graph, options.synthesis);
    std::vector<KindJob> jobs;
    jobs.reserve(kinds.size());

    try {
        if (options.parallel && options.workers > 1 && kinds.size() > 1) {
            WorkerPool pool(options.workers, kinds.size());
            std::vector<std::future<KindJob>> futures;
            futures.reserve(kinds.size());
            for (const auto& kind : kinds) {
                futures.push_back(pool.submit([&graph, &synthesizer, &kind, &options, &warnings]() {
                    return run_kind(graph, synthesizer, kind, options.derivation, warnings.policy());
                }));
            }
            // Joined in kind order so output does not depend on scheduling
            for (auto& future : futures) {
                jobs.push_back(future.get());
            }
        } else {
            for (const auto& kind : kinds) {
                jobs.push_back(run_kind(graph, synthesizer, kind, options.derivation, warnings.policy()));
            }
        }
    } catch (const std::exception& e) {
        return Result<FeatureModel>::err(
            Error(ErrorCode::SCHEMA_INVALID, std::string("synthesis failed: ") + e.what()));
    }

    std::vector<KindOutput> outputs;
    outputs.reserve(jobs.size());
    for (auto& job : jobs) {
        warnings.merge(job.warnings);
        outputs.push_back(std::move(job.output));
    }

    FeatureModel model = assemble_model(std::move(outputs), options.assembly, warnings);

    if (warnings.has_errors()) {
        std::string keys;
        for (const auto& w : warnings.get_warnings()) {
            if (w.action != "error") continue;
            if (!keys.empty()) keys += ", ";
            keys += w.key;
        }
        return Result<FeatureModel>::err(
            Error(ErrorCode::SCHEMA_INVALID, "warnings configured as errors: " + keys));
    }

    return Result<FeatureModel>::ok(std::move(model));
}

Result<FeatureModel> build_model_from_file(const std::string& path,
                                           const PipelineOptions& options,
                                           WarningCollector& warnings) {
    auto file = read_file(path);
    if (!file.ok) {
        return Result<FeatureModel>::err(Error(ErrorCode::FILE_NOT_FOUND, file.error));
    }

    nlohmann::ordered_json schema;
    try {
        schema = nlohmann::ordered_json::parse(file.content);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<FeatureModel>::err(
            Error(ErrorCode::SCHEMA_INVALID, std::string("parse error: ") + e.what()).withContext(path));
    }

    auto result = build_model(schema, options, warnings);
    if (result.isErr()) {
        result.error().withContext(path);
    }
    return result;
}

} // namespace schemafm
