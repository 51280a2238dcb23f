#pragma once

#include "Types.hpp"

namespace WordleChain {

    /*
     * Maps each operation to the privilege it needs and checks a caller
     * against the injected configuration. The registry itself never looks at
     * identities; the embedding host runs this check first.
     */
    class AccessPolicy {
    public:
        // NotInitialized when no admin is configured.
        static Outcome<AccessPolicy> create(GameConfig config);

        static Privilege requiredPrivilege(Operation op);

        VoidOutcome authorize(Operation op, const Caller& caller, const PlayerId& actingPlayer = {}) const;

        const GameConfig& config() const { return config_; }

    private:
        explicit AccessPolicy(GameConfig config);

        GameConfig config_;
    };
}
