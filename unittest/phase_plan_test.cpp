#include <gtest/gtest.h>
#include "migration/phase_plan.hpp"
#include <stdexcept>

TEST(PhasePlanTest, WorkingPhaseWeightsSumToHundred) {
    int total = 0;
    for (auto phase : {MigrationPhase::INITIALIZING, MigrationPhase::DISCOVERING, MigrationPhase::CONNECTING,
                       MigrationPhase::BACKING_UP, MigrationPhase::TRANSFERRING, MigrationPhase::EXTRACTING,
                       MigrationPhase::REMAPPING_PATHS, MigrationPhase::UPDATING_PREFERENCES,
                       MigrationPhase::STOPPING_TARGET, MigrationPhase::RESTORING,
                       MigrationPhase::STARTING_TARGET, MigrationPhase::VERIFYING}) {
        total += phaseWeight(phase);
    }
    EXPECT_EQ(total, 100);
    EXPECT_EQ(phaseWeight(MigrationPhase::COMPLETED), 0);
}

TEST(PhasePlanTest, EveryModeHasAPlan) {
    for (auto mode : {MigrationMode::LOCAL_BACKUP, MigrationMode::LOCAL_RESTORE, MigrationMode::NETWORK_PUSH,
                      MigrationMode::NETWORK_PULL, MigrationMode::FULL_MIGRATION}) {
        EXPECT_FALSE(phasePlan(mode).empty()) << migrationModeToString(mode);
    }
    EXPECT_EQ(phasePlan(MigrationMode::LOCAL_BACKUP).front(), MigrationPhase::INITIALIZING);
    EXPECT_EQ(phasePlan(MigrationMode::NETWORK_PULL).front(), MigrationPhase::DISCOVERING);
    EXPECT_EQ(phasePlan(MigrationMode::FULL_MIGRATION).back(), MigrationPhase::RESTORING);
}

TEST(PhaseProgressTest, WeightsScaleToThePlan) {
    PhaseProgress progress(MigrationMode::LOCAL_BACKUP);

    // INITIALIZING 2, BACKING_UP 37, UPDATING_PREFERENCES 2, VERIFYING 3
    EXPECT_DOUBLE_EQ(progress.enter(MigrationPhase::INITIALIZING), 0.0);
    EXPECT_NEAR(progress.update(100.0), 2.0 / 44.0 * 100.0, 1e-9);
    EXPECT_NEAR(progress.enter(MigrationPhase::BACKING_UP), 2.0 / 44.0 * 100.0, 1e-9);
    EXPECT_NEAR(progress.update(50.0), 20.5 / 44.0 * 100.0, 1e-9);
}

TEST(PhaseProgressTest, NeverGoesBackwardsAndStopsShortOfHundred) {
    PhaseProgress progress(MigrationMode::LOCAL_BACKUP);
    progress.enter(MigrationPhase::INITIALIZING);
    progress.enter(MigrationPhase::BACKING_UP);

    double high = progress.update(80.0);
    EXPECT_DOUBLE_EQ(progress.update(10.0), high);

    progress.enter(MigrationPhase::VERIFYING);
    EXPECT_LE(progress.update(100.0), 99.9);
    EXPECT_DOUBLE_EQ(progress.complete(), 100.0);
}

TEST(PhaseProgressTest, SkippedPhasesCountAsDone) {
    PhaseProgress progress(MigrationMode::LOCAL_RESTORE);
    progress.enter(MigrationPhase::INITIALIZING);
    double before = progress.overall();
    double after = progress.enter(MigrationPhase::RESTORING);

    // EXTRACTING and STOPPING_TARGET were skipped
    EXPECT_GT(after, before);
    EXPECT_EQ(progress.visited().size(), 2u);
    EXPECT_EQ(progress.current(), MigrationPhase::RESTORING);
}

TEST(PhaseProgressTest, RejectsPhasesOutsideThePlan) {
    PhaseProgress progress(MigrationMode::LOCAL_BACKUP);
    EXPECT_THROW(progress.enter(MigrationPhase::TRANSFERRING), std::logic_error);
}

TEST(PhaseProgressTest, RejectsGoingBackToAnEarlierPhase) {
    PhaseProgress progress(MigrationMode::NETWORK_PUSH);
    progress.enter(MigrationPhase::BACKING_UP);
    EXPECT_THROW(progress.enter(MigrationPhase::INITIALIZING), std::logic_error);
    EXPECT_THROW(progress.enter(MigrationPhase::BACKING_UP), std::logic_error);
}
