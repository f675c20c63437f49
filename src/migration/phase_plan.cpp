#include "migration/phase_plan.hpp"
#include <algorithm>
#include <stdexcept>

namespace {

constexpr double kCeilingBeforeCompletion = 99.9;

} // namespace

int phaseWeight(MigrationPhase phase) {
    switch (phase) {
        case MigrationPhase::INITIALIZING: return 2;
        case MigrationPhase::DISCOVERING: return 3;
        case MigrationPhase::CONNECTING: return 2;
        case MigrationPhase::BACKING_UP: return 37;
        case MigrationPhase::TRANSFERRING: return 22;
        case MigrationPhase::EXTRACTING: return 8;
        case MigrationPhase::REMAPPING_PATHS: return 4;
        case MigrationPhase::UPDATING_PREFERENCES: return 2;
        case MigrationPhase::STOPPING_TARGET: return 2;
        case MigrationPhase::RESTORING: return 13;
        case MigrationPhase::STARTING_TARGET: return 2;
        case MigrationPhase::VERIFYING: return 3;
        case MigrationPhase::IDLE:
        case MigrationPhase::COMPLETED:
        case MigrationPhase::FAILED:
        case MigrationPhase::CANCELLED:
            return 0;
    }
    return 0;
}

const std::vector<MigrationPhase>& phasePlan(MigrationMode mode) {
    using P = MigrationPhase;
    static const std::vector<MigrationPhase> localBackup = {
        P::INITIALIZING, P::BACKING_UP, P::UPDATING_PREFERENCES, P::VERIFYING
    };
    static const std::vector<MigrationPhase> localRestore = {
        P::INITIALIZING, P::EXTRACTING, P::STOPPING_TARGET, P::RESTORING,
        P::REMAPPING_PATHS, P::UPDATING_PREFERENCES, P::STARTING_TARGET
    };
    static const std::vector<MigrationPhase> networkPush = {
        P::INITIALIZING, P::BACKING_UP, P::UPDATING_PREFERENCES, P::VERIFYING,
        P::CONNECTING, P::TRANSFERRING
    };
    static const std::vector<MigrationPhase> networkPull = {
        P::DISCOVERING, P::CONNECTING, P::TRANSFERRING, P::STOPPING_TARGET,
        P::RESTORING, P::REMAPPING_PATHS, P::UPDATING_PREFERENCES, P::STARTING_TARGET
    };
    static const std::vector<MigrationPhase> fullMigration = {
        P::INITIALIZING, P::BACKING_UP, P::UPDATING_PREFERENCES, P::VERIFYING,
        P::CONNECTING, P::TRANSFERRING, P::RESTORING
    };

    switch (mode) {
        case MigrationMode::LOCAL_BACKUP: return localBackup;
        case MigrationMode::LOCAL_RESTORE: return localRestore;
        case MigrationMode::NETWORK_PUSH: return networkPush;
        case MigrationMode::NETWORK_PULL: return networkPull;
        case MigrationMode::FULL_MIGRATION: return fullMigration;
    }
    return localBackup;
}

PhaseProgress::PhaseProgress(MigrationMode mode)
    : plan_(phasePlan(mode)) {
    for (auto phase : plan_) {
        totalWeight_ += phaseWeight(phase);
    }
}

double PhaseProgress::enter(MigrationPhase phase) {
    auto it = std::find(plan_.begin(), plan_.end(), phase);
    if (it == plan_.end()) {
        throw std::logic_error("Phase " + migrationPhaseToString(phase) + " is not part of this migration");
    }

    int position = static_cast<int>(it - plan_.begin());
    if (position <= position_) {
        throw std::logic_error("Phase " + migrationPhaseToString(phase) + " entered after " +
                               migrationPhaseToString(current_));
    }

    // Skipped optional phases count as done
    completedWeight_ = 0;
    for (int i = 0; i < position; ++i) {
        completedWeight_ += phaseWeight(plan_[static_cast<size_t>(i)]);
    }

    position_ = position;
    current_ = phase;
    visited_.push_back(phase);
    return raise(static_cast<double>(completedWeight_) / totalWeight_ * 100.0);
}

double PhaseProgress::update(double phasePercent) {
    if (position_ < 0) {
        return overall_;
    }
    double clamped = std::clamp(phasePercent, 0.0, 100.0);
    double weighted = completedWeight_ + phaseWeight(current_) * clamped / 100.0;
    return raise(weighted / totalWeight_ * 100.0);
}

double PhaseProgress::complete() {
    overall_ = 100.0;
    return overall_;
}

double PhaseProgress::raise(double candidate) {
    candidate = std::min(candidate, kCeilingBeforeCompletion);
    overall_ = std::max(overall_, candidate);
    return overall_;
}
