#pragma once

#include "line_store.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ari
{

    class CheckpointManager;

    /** prevHash of the first entry in every chain */
    inline constexpr std::string_view kGenesisHash =
        "0000000000000000000000000000000000000000000000000000000000000000";

    /**
     * Entry content supplied by the caller. Sequence and hashes are assigned
     * by AuditChain::append.
     */
    struct AuditDraft
    {
        std::string action;
        std::string actor;
        TrustLevel trust_level{TrustLevel::Standard};
        nlohmann::json details = nlohmann::json::object();
        std::string recorded_at; // ISO 8601; stamped at append time when empty
    };

    /**
     * One persisted, immutable audit record.
     *
     * hash = SHA-256 over the RFC 8785 canonical JSON of every field except
     * hash itself; prev_hash links to the previous entry (kGenesisHash for
     * sequence 0).
     */
    struct AuditEntry
    {
        std::uint64_t sequence{0};
        std::string action;
        std::string actor;
        TrustLevel trust_level{TrustLevel::Standard};
        nlohmann::json details = nlohmann::json::object();
        std::string recorded_at;
        std::string prev_hash;
        std::string hash;

        /** Fields covered by the hash, in their wire names */
        nlohmann::json hash_input() const;

        /** Recompute the hash from the other fields */
        Result<std::string> compute_hash() const;

        nlohmann::json to_json() const;
        static Result<AuditEntry> from_json(const nlohmann::json &j);
    };

    struct AuditQuery
    {
        std::optional<std::string> action;
        std::optional<std::string> actor;
        std::optional<std::string> since; // inclusive, ISO 8601
        std::optional<std::string> until; // inclusive, ISO 8601
        std::size_t offset{0};
        std::optional<std::size_t> limit;
    };

    /** Parse every line of a store into entries. Bad records are parsing errors. */
    Result<std::vector<AuditEntry>> parse_entries(const std::vector<std::string> &lines);

    /**
     * Hash-chained, append-only audit log.
     *
     * Single writer: only the audit bridge calls append. The in-memory index is
     * guarded by a mutex so readers can run concurrently with appends.
     */
    class AuditChain
    {
    public:
        explicit AuditChain(std::shared_ptr<LineStore> store);

        /** (Re)read the store into the in-memory index */
        Result<void> load();

        /**
         * Assign the next sequence, link to the current tip, hash, persist and
         * index. Loads the store first if load() was never called. Notifies the
         * attached checkpoint manager once the entry is durable.
         */
        Result<AuditEntry> append(const AuditDraft &draft);

        /** Copy of every indexed entry in sequence order */
        std::vector<AuditEntry> entries() const;

        std::optional<AuditEntry> entry(std::uint64_t sequence) const;

        std::optional<AuditEntry> last_entry() const;

        std::size_t size() const;

        /** Hash of the last entry, or kGenesisHash when empty */
        std::string tip_hash() const;

        std::vector<AuditEntry> query(const AuditQuery &q) const;

        /** Parse the store as it is on disk now, bypassing the index */
        Result<std::vector<AuditEntry>> read_persisted() const;

        /** Non-owning; the manager must outlive the chain or be detached with nullptr */
        void attach_checkpoints(CheckpointManager *manager);

        const LineStore &store() const { return *store_; }

    private:
        Result<void> load_locked();

        std::shared_ptr<LineStore> store_;
        mutable std::mutex mutex_;
        std::vector<AuditEntry> entries_;
        bool loaded_{false};
        CheckpointManager *checkpoints_{nullptr};
    };

} // namespace ari
