#pragma once

#include "audit.hpp"
#include "checkpoint.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ari
{

    struct ChainVerification
    {
        bool valid{true};
        std::optional<std::uint64_t> broken_at_sequence;
        std::string details;
        std::uint64_t entries_checked{0};

        nlohmann::json to_json() const;
    };

    struct CheckpointMismatch
    {
        std::uint64_t at_sequence{0};
        std::string field; // "tipHash" or "signature"
        std::string expected;
        std::string actual;

        nlohmann::json to_json() const;
    };

    struct CheckpointVerification
    {
        bool valid{true};
        std::uint64_t checked{0};
        std::vector<CheckpointMismatch> mismatches;

        nlohmann::json to_json() const;
    };

    struct IntegrityReport
    {
        ChainVerification chain;
        CheckpointVerification checkpoints;
        std::uint64_t entry_count{0};
        std::uint64_t checkpoint_count{0};

        bool valid() const { return chain.valid && checkpoints.valid; }

        nlohmann::json to_json() const;
    };

    /**
     * Read-only verification of the persisted chain and its checkpoints.
     *
     * Every call re-reads both stores, so the result reflects what is on
     * disk at call time, including edits made behind the appender's back.
     * A violation is a successful result with valid == false; an error
     * result means the stores could not be read and integrity is unknown.
     */
    class IntegrityVerifier
    {
    public:
        using SignatureCheck = std::function<bool(const Checkpoint &)>;

        IntegrityVerifier(const AuditChain &chain, const CheckpointManager &checkpoints);

        Result<ChainVerification> verify_chain() const;

        Result<CheckpointVerification> verify_checkpoints() const;

        /** Both verifications over a single read of each store */
        Result<IntegrityReport> verify_all() const;

        /** Walk entries from sequence 0 and stop at the first break */
        static Result<ChainVerification> check_entries(const std::vector<AuditEntry> &entries);

        /**
         * Compare each checkpoint with the chain hash recomputed from entry 0
         * up to its at_sequence, and with its signature.
         */
        static Result<CheckpointVerification> check_checkpoints(const std::vector<AuditEntry> &entries,
                                                                const std::vector<Checkpoint> &checkpoints,
                                                                const SignatureCheck &signature_ok);

    private:
        const AuditChain &chain_;
        const CheckpointManager &checkpoints_;
    };

} // namespace ari
