#pragma once

#include "EntityStore.hpp"
#include "Intersection.hpp"
#include "SimulationConfig.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace scramble
{

    class SafetyChecker
    {
    public:
        SafetyChecker() = default;

        // Appends one message per problem to `errors` when given. Returns true when none were found.
        bool isConfigValid(const SimulationConfig &config, std::vector<std::string> *errors = nullptr) const;

        // Lamp aspects that must never be shown together.
        bool isSafe(const IntersectionState &state) const;
        bool isValidTransition(const IntersectionState &prev, const IntersectionState &next) const;

        // Counts followers whose front edge is past their leader's rear edge minus the following
        // gap for the follower's kind.
        std::size_t countFollowingViolations(const EntityStore &store, const KinematicsConfig &kinematics,
                                             double tolerance = 1e-6) const;

    private:
        // Helper methods for isSafe()
        bool hasConflictingGreens(const IntersectionState &state) const;
        bool checkPedestrianSafety(const IntersectionState &state) const;

        // Helper methods for isConfigValid()
        void checkSignalTimings(const SignalTimingConfig &timings, std::vector<std::string> &errors) const;
        void checkKinematics(const KinematicsConfig &kinematics, std::vector<std::string> &errors) const;
        void checkSpawner(const SpawnerConfig &spawner, std::vector<std::string> &errors) const;
        void checkLayout(const SceneLayout &layout, std::vector<std::string> &errors) const;
    };

} // namespace scramble
