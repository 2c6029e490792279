/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ExpertConsultationService.hpp"
#include "application/GatePipeline.hpp"
#include "application/VerdictAdjudicator.hpp"
#include "domain/KnowledgeBase.hpp"
#include "domain/ReasoningService.hpp"

namespace amlgate::application {

/**
 * @struct AppServices
 * @brief Collaborators built once at process start. The gates are supplied per run,
 * so pipelines are assembled from these pieces by the caller.
 */
struct AppServices {
    std::shared_ptr<domain::KnowledgeBase> knowledgeBase;
    std::shared_ptr<domain::ReasoningService> reasoningService;
    std::shared_ptr<VerdictAdjudicator> adjudicator;
    std::unique_ptr<ExpertConsultationService> consultationService;
    GateBudgets gateBudgets;
};

} // namespace amlgate::application
