#pragma once

/**
 * @file schemafm.hpp
 * @brief Umbrella header for the schemafm library
 *
 * Schema -> feature model conversion:
 *   SchemaGraph::resolve -> FeatureSynthesizer -> derive_constraints
 *   -> assemble_model -> save_model
 *
 * Configuration checking:
 *   derive_key_mapping -> KeyMapper -> ConfigurationTranslator
 *   -> ModelValidator, batched by BatchRunner
 */

#include "schemafm/types.hpp"
#include "schemafm/result.hpp"
#include "schemafm/warnings.hpp"
#include "schemafm/platform.hpp"
#include "schemafm/config.hpp"

#include "schemafm/schema_graph.hpp"
#include "schemafm/expression.hpp"
#include "schemafm/feature_model.hpp"
#include "schemafm/synthesizer.hpp"
#include "schemafm/constraint_deriver.hpp"
#include "schemafm/assembler.hpp"
#include "schemafm/pipeline.hpp"
#include "schemafm/serializer.hpp"
#include "schemafm/model_diff.hpp"

#include "schemafm/key_mapping.hpp"
#include "schemafm/document.hpp"
#include "schemafm/translator.hpp"
#include "schemafm/validator.hpp"
#include "schemafm/worker_pool.hpp"
#include "schemafm/batch.hpp"

#ifndef SCHEMAFM_VERSION
#define SCHEMAFM_VERSION "0.1.0"
#endif
