#pragma once

#include "migration/migration_types.hpp"
#include <vector>

// Share of the overall percent a phase accounts for. The working phases sum to 100.
int phaseWeight(MigrationPhase phase);

// Ordered phases a mode may pass through. Optional phases can be skipped, never reordered.
const std::vector<MigrationPhase>& phasePlan(MigrationMode mode);

// Turns phase entries and per-phase percentages into one overall percentage that
// never decreases and stays below 100 until complete() is called.
class PhaseProgress {
public:
    explicit PhaseProgress(MigrationMode mode);

    // Throws std::logic_error for a phase outside the plan or behind the current one.
    double enter(MigrationPhase phase);
    double update(double phasePercent);
    double complete();

    MigrationPhase current() const { return current_; }
    double overall() const { return overall_; }
    const std::vector<MigrationPhase>& visited() const { return visited_; }

private:
    double raise(double candidate);

    const std::vector<MigrationPhase>& plan_;
    int totalWeight_ = 0;
    int completedWeight_ = 0;
    int position_ = -1;
    MigrationPhase current_ = MigrationPhase::IDLE;
    double overall_ = 0.0;
    std::vector<MigrationPhase> visited_;
};
