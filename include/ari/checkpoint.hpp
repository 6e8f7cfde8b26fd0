#pragma once

#include "audit.hpp"
#include "crypto.hpp"
#include "line_store.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ari
{

    /**
     * Signed snapshot of the chain tip.
     * signature = hex HMAC-SHA-256(key, "<at_sequence>:<tip_hash>")
     */
    struct Checkpoint
    {
        std::uint64_t at_sequence{0};
        std::string tip_hash;
        std::string recorded_at;
        std::string signature;

        /** The exact message covered by the signature */
        static std::string signing_input(std::uint64_t at_sequence, const std::string &tip_hash);

        nlohmann::json to_json() const;
        static Result<Checkpoint> from_json(const nlohmann::json &j);
    };

    /** Either trigger is disabled by setting it to zero. */
    struct CheckpointPolicy
    {
        // Counts entries, not sequence numbers: sequences start at 0, so with
        // N the checkpoints land after sequences N-1, 2N-1, ...
        std::uint64_t every_entries{500};
        std::chrono::seconds every_seconds{3600};
    };

    /**
     * Records signed checkpoints of an AuditChain into a separate LineStore.
     *
     * Attach to the chain with AuditChain::attach_checkpoints so every append
     * reaches maybe_checkpoint. Checkpoint sequences are strictly increasing;
     * a request at or below the last recorded sequence is refused and logged,
     * since it means the chain went backwards.
     */
    class CheckpointManager
    {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        /**
         * Build a manager and load the existing checkpoints. A key shorter
         * than crypto::HmacSha256::kMinKeyBytes is a ConfigError: the manager
         * never produces weakly signed checkpoints.
         */
        static Result<std::unique_ptr<CheckpointManager>> create(const AuditChain &chain,
                                                                 std::shared_ptr<LineStore> store,
                                                                 crypto::Bytes key,
                                                                 CheckpointPolicy policy = CheckpointPolicy{},
                                                                 Clock clock = Clock{});

        CheckpointManager(const CheckpointManager &) = delete;
        CheckpointManager &operator=(const CheckpointManager &) = delete;

        Result<void> load();

        /**
         * Called after each append. Writes a checkpoint at after_sequence when
         * (after_sequence + 1) is a multiple of every_entries or every_seconds
         * have elapsed since the last checkpoint. Returns the checkpoint
         * written, if any.
         */
        Result<std::optional<Checkpoint>> maybe_checkpoint(std::uint64_t after_sequence);

        /** Checkpoint the current tip unconditionally. Nothing is written for an empty chain. */
        Result<std::optional<Checkpoint>> checkpoint_now();

        std::vector<Checkpoint> checkpoints() const;

        /** Checkpoints as currently stored, bypassing the in-memory list */
        Result<std::vector<Checkpoint>> read_persisted() const;

        Result<std::string> sign(std::uint64_t at_sequence, const std::string &tip_hash) const;

        bool verify_signature(const Checkpoint &checkpoint) const;

        const CheckpointPolicy &policy() const { return policy_; }

    private:
        CheckpointManager(const AuditChain &chain, std::shared_ptr<LineStore> store, crypto::Bytes key,
                          CheckpointPolicy policy, Clock clock);

        Result<std::optional<Checkpoint>> write_locked(std::uint64_t at_sequence);

        const AuditChain &chain_;
        std::shared_ptr<LineStore> store_;
        crypto::Bytes key_;
        CheckpointPolicy policy_;
        Clock clock_;

        mutable std::mutex mutex_;
        std::vector<Checkpoint> checkpoints_;
        std::chrono::system_clock::time_point last_checkpoint_time_;
    };

} // namespace ari
