#include "ari/audit.hpp"
#include "ari/checkpoint.hpp"
#include "ari/crypto.hpp"
#include "ari/json_canonicalization.hpp"
#include "ari/logging.hpp"
#include <format>

namespace ari
{

    nlohmann::json AuditEntry::hash_input() const
    {
        return nlohmann::json{{"sequence", sequence},
                              {"action", action},
                              {"actor", actor},
                              {"trustLevel", trust_level_to_string(trust_level)},
                              {"details", details},
                              {"recordedAt", recorded_at},
                              {"prevHash", prev_hash}};
    }

    Result<std::string> AuditEntry::compute_hash() const
    {
        auto canonical = json::RFC8785Canonicalizer::canonicalize(hash_input());
        if (!canonical)
            return std::unexpected(canonical.error());
        return crypto::SHA256::hex_digest(*canonical);
    }

    nlohmann::json AuditEntry::to_json() const
    {
        auto j = hash_input();
        j["hash"] = hash;
        return j;
    }

    Result<AuditEntry> AuditEntry::from_json(const nlohmann::json &j)
    {
        try
        {
            AuditEntry entry;
            entry.sequence = j.at("sequence").get<std::uint64_t>();
            entry.action = j.at("action").get<std::string>();
            entry.actor = j.at("actor").get<std::string>();

            auto trust = trust_level_from_string(j.at("trustLevel").get<std::string>());
            if (!trust)
                return std::unexpected(AriError::parsing(trust.error().what()));
            entry.trust_level = *trust;

            entry.details = j.at("details");
            entry.recorded_at = j.at("recordedAt").get<std::string>();
            entry.prev_hash = j.at("prevHash").get<std::string>();
            entry.hash = j.at("hash").get<std::string>();
            return entry;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(AriError::parsing(std::format("Malformed audit entry: {}", e.what())));
        }
    }

    Result<std::vector<AuditEntry>> parse_entries(const std::vector<std::string> &lines)
    {
        std::vector<AuditEntry> entries;
        entries.reserve(lines.size());
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            nlohmann::json j;
            try
            {
                j = nlohmann::json::parse(lines[i]);
            }
            catch (const nlohmann::json::exception &e)
            {
                return std::unexpected(AriError::parsing(
                    std::format("Corrupt audit record at line {}: {}", i + 1, e.what())));
            }

            auto entry = AuditEntry::from_json(j);
            if (!entry)
            {
                return std::unexpected(AriError::parsing(
                    std::format("Line {}: {}", i + 1, entry.error().what())));
            }
            entries.push_back(std::move(*entry));
        }
        return entries;
    }

    AuditChain::AuditChain(std::shared_ptr<LineStore> store) : store_(std::move(store)) {}

    Result<void> AuditChain::load()
    {
        std::lock_guard lock(mutex_);
        return load_locked();
    }

    Result<void> AuditChain::load_locked()
    {
        auto lines = store_->read_all();
        if (!lines)
            return std::unexpected(lines.error());

        auto parsed = parse_entries(*lines);
        if (!parsed)
            return std::unexpected(parsed.error());

        entries_ = std::move(*parsed);
        loaded_ = true;
        logging::get("audit")->debug("Loaded {} audit entries from {}", entries_.size(), store_->describe());
        return {};
    }

    Result<AuditEntry> AuditChain::append(const AuditDraft &draft)
    {
        AuditEntry entry;
        CheckpointManager *checkpoints = nullptr;
        {
            std::lock_guard lock(mutex_);
            if (!loaded_)
            {
                if (auto res = load_locked(); !res)
                    return std::unexpected(res.error());
            }

            if (!draft.details.is_object())
            {
                return std::unexpected(AriError::invalid_input("Audit details must be a JSON object"));
            }

            entry.sequence = entries_.empty() ? 0 : entries_.back().sequence + 1;
            entry.action = draft.action;
            entry.actor = draft.actor;
            entry.trust_level = draft.trust_level;
            entry.details = draft.details;
            entry.recorded_at = draft.recorded_at.empty() ? now_iso8601() : draft.recorded_at;
            entry.prev_hash = entries_.empty() ? std::string(kGenesisHash) : entries_.back().hash;

            auto hash = entry.compute_hash();
            if (!hash)
                return std::unexpected(hash.error());
            entry.hash = *hash;

            std::string record;
            try
            {
                record = entry.to_json().dump();
            }
            catch (const nlohmann::json::exception &e)
            {
                return std::unexpected(AriError::invalid_input(std::format("Audit entry cannot be serialized: {}", e.what())));
            }

            if (auto written = store_->append(record); !written)
                return std::unexpected(written.error());

            entries_.push_back(entry);
            checkpoints = checkpoints_;
        }

        logging::get("audit")->debug("Audit entry appended: sequence={} action={}", entry.sequence, entry.action);

        if (checkpoints)
        {
            // The entry is durable; a checkpoint failure is reported but does not undo it.
            if (auto cp = checkpoints->maybe_checkpoint(entry.sequence); !cp)
            {
                logging::get("audit")->error("Checkpoint after sequence {} failed: {}", entry.sequence, cp.error().what());
            }
        }
        return entry;
    }

    std::vector<AuditEntry> AuditChain::entries() const
    {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    std::optional<AuditEntry> AuditChain::entry(std::uint64_t sequence) const
    {
        std::lock_guard lock(mutex_);
        if (sequence < entries_.size() && entries_[sequence].sequence == sequence)
            return entries_[sequence];
        for (const auto &e : entries_)
        {
            if (e.sequence == sequence)
                return e;
        }
        return std::nullopt;
    }

    std::optional<AuditEntry> AuditChain::last_entry() const
    {
        std::lock_guard lock(mutex_);
        if (entries_.empty())
            return std::nullopt;
        return entries_.back();
    }

    std::size_t AuditChain::size() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    std::string AuditChain::tip_hash() const
    {
        std::lock_guard lock(mutex_);
        return entries_.empty() ? std::string(kGenesisHash) : entries_.back().hash;
    }

    std::vector<AuditEntry> AuditChain::query(const AuditQuery &q) const
    {
        std::vector<AuditEntry> out;
        std::size_t skipped = 0;

        std::lock_guard lock(mutex_);
        for (const auto &e : entries_)
        {
            if (q.action && e.action != *q.action)
                continue;
            if (q.actor && e.actor != *q.actor)
                continue;
            // ISO 8601 UTC timestamps of equal width order lexicographically
            if (q.since && e.recorded_at < *q.since)
                continue;
            if (q.until && e.recorded_at > *q.until)
                continue;

            if (skipped < q.offset)
            {
                ++skipped;
                continue;
            }

            if (q.limit && out.size() >= *q.limit)
                break;
            out.push_back(e);
        }
        return out;
    }

    Result<std::vector<AuditEntry>> AuditChain::read_persisted() const
    {
        auto lines = store_->read_all();
        if (!lines)
            return std::unexpected(lines.error());
        return parse_entries(*lines);
    }

    void AuditChain::attach_checkpoints(CheckpointManager *manager)
    {
        std::lock_guard lock(mutex_);
        checkpoints_ = manager;
    }

} // namespace ari
