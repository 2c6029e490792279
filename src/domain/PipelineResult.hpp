/**
 * @file PipelineResult.hpp
 * @brief Records of which pipeline stages ran and what they decided.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/Adjudication.hpp"

namespace amlgate::domain {

enum class Layer { Statistical, Narrative, Expert };

inline std::string ToString(Layer layer) {
    switch (layer) {
        case Layer::Statistical: return "statistical";
        case Layer::Narrative: return "narrative";
        case Layer::Expert: return "expert";
    }
    return "statistical";
}

/** @brief Result of a single gate. */
struct LayerResult {
    Layer layer = Layer::Statistical;
    double score = 0.0;
    bool passed = false; ///< True when the transaction was not flagged by this layer.
    double processingTimeMs = 0.0;
    std::map<std::string, std::string> details;
};

/**
 * @struct PipelineResult
 * @brief Complete outcome of one transaction, created once regardless of how many stages ran.
 */
struct PipelineResult {
    std::optional<std::string> transactionId;
    LayerResult statisticalResult;
    std::optional<LayerResult> narrativeResult; ///< Only if the statistical gate flagged.
    std::optional<Verdict> expertResult;        ///< Only if the narrative gate flagged.
    Decision finalDecision = Decision::Review;
    double finalConfidence = 0.0;
    double totalProcessingTimeMs = 0.0;
    std::vector<Layer> layersInvoked;
};

} // namespace amlgate::domain
