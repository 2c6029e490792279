/**
 * @file EvaluationMetrics.hpp
 * @brief Confusion-matrix counters for labelled screening runs.
 */

#pragma once

#include "domain/Adjudication.hpp"

namespace amlgate::domain {

struct EvaluationMetrics {
    int truePositives = 0;
    int falsePositives = 0;
    int trueNegatives = 0;
    int falseNegatives = 0;

    /** @brief Counts one labelled outcome. BLOCK and REVIEW count as flagged. */
    void record(Decision decision, bool isLaundering) {
        bool flagged = decision != Decision::Approve;
        if (flagged && isLaundering) truePositives++;
        else if (flagged) falsePositives++;
        else if (isLaundering) falseNegatives++;
        else trueNegatives++;
    }

    int total() const { return truePositives + falsePositives + trueNegatives + falseNegatives; }

    double precision() const {
        int denom = truePositives + falsePositives;
        return denom > 0 ? static_cast<double>(truePositives) / denom : 0.0;
    }

    double recall() const {
        int denom = truePositives + falseNegatives;
        return denom > 0 ? static_cast<double>(truePositives) / denom : 0.0;
    }

    double f1Score() const {
        double p = precision();
        double r = recall();
        return (p + r) > 0.0 ? 2.0 * p * r / (p + r) : 0.0;
    }

    double accuracy() const {
        int n = total();
        return n > 0 ? static_cast<double>(truePositives + trueNegatives) / n : 0.0;
    }
};

} // namespace amlgate::domain
