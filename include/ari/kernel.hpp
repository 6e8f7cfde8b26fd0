#pragma once

#include "audit.hpp"
#include "audit_bridge.hpp"
#include "checkpoint.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "health.hpp"
#include "integrity.hpp"
#include <memory>

namespace ari
{

    /**
     * Owns one instance of every kernel component, wired together:
     * dispatcher -> bridge -> chain -> checkpoints, plus the verifier and
     * health probe. Built and torn down explicitly by the process entry
     * point; components receive their collaborators by reference.
     */
    class Kernel
    {
    public:
        static Result<std::unique_ptr<Kernel>> init(const KernelConfig &cfg);

        ~Kernel();

        Kernel(const Kernel &) = delete;
        Kernel &operator=(const Kernel &) = delete;

        /** Unsubscribe the bridge and probe, then drain and stop the dispatcher. Idempotent. */
        void shutdown();

        Dispatcher &dispatcher() { return *dispatcher_; }
        AuditChain &chain() { return *chain_; }
        CheckpointManager &checkpoints() { return *checkpoints_; }
        const IntegrityVerifier &verifier() const { return *verifier_; }
        AuditBridge &bridge() { return *bridge_; }
        AuditHealthProbe &health() { return *health_; }

    private:
        Kernel() = default;

        // Declaration order is destruction order in reverse: the dispatcher
        // outlives everything that subscribes to it.
        std::unique_ptr<Dispatcher> dispatcher_;
        std::unique_ptr<AuditChain> chain_;
        std::unique_ptr<CheckpointManager> checkpoints_;
        std::unique_ptr<IntegrityVerifier> verifier_;
        std::unique_ptr<AuditBridge> bridge_;
        std::unique_ptr<AuditHealthProbe> health_;
        bool stopped_{false};
    };

} // namespace ari
