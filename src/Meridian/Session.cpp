// =================================================================
// src/Meridian/Session.cpp
// =================================================================
// Derived session properties and status snapshots.

#include "Meridian/Session.hpp"
#include <algorithm>

namespace Meridian {

std::chrono::milliseconds SessionContext::age(TimePoint now) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - created_at);
}

bool SessionContext::isExpired(TimePoint now, std::chrono::milliseconds ttl) const {
    return (now - last_activity) > ttl;
}

double SessionContext::progress() const {
    if (workflow_plan.empty()) {
        return 0.0;
    }

    auto it = std::find(workflow_plan.begin(), workflow_plan.end(), current_stage);
    if (it == workflow_plan.end()) {
        return 0.0;
    }

    auto index = static_cast<double>(std::distance(workflow_plan.begin(), it));
    return (index + 1.0) / static_cast<double>(workflow_plan.size());
}

SessionStatusView SessionStatusView::fromContext(const SessionContext& context, TimePoint now) {
    SessionStatusView view;
    view.session_id = context.session_id;
    view.status = context.status;
    view.current_stage = context.current_stage;
    view.duration = context.age(now);
    view.progress = context.progress();
    view.complexity_score = context.complexity.score;
    view.workflow_plan = context.workflow_plan;
    view.performance_metrics = context.processing_times;
    view.confidence_scores = context.confidence_scores;
    view.error_count = context.errors.size();
    view.warning_count = context.warnings.size();
    view.results_count = context.results.size();
    return view;
}

} // namespace Meridian
