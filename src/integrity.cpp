#include "ari/integrity.hpp"
#include "ari/logging.hpp"
#include <algorithm>
#include <format>

namespace ari
{

    nlohmann::json ChainVerification::to_json() const
    {
        nlohmann::json j{{"valid", valid},
                         {"details", details},
                         {"entriesChecked", entries_checked}};
        j["brokenAtSequence"] = broken_at_sequence ? nlohmann::json(*broken_at_sequence) : nlohmann::json(nullptr);
        return j;
    }

    nlohmann::json CheckpointMismatch::to_json() const
    {
        return nlohmann::json{{"atSequence", at_sequence},
                              {"field", field},
                              {"expected", expected},
                              {"actual", actual}};
    }

    nlohmann::json CheckpointVerification::to_json() const
    {
        nlohmann::json mismatch_list = nlohmann::json::array();
        for (const auto &m : mismatches)
            mismatch_list.push_back(m.to_json());
        return nlohmann::json{{"valid", valid},
                              {"checked", checked},
                              {"mismatches", mismatch_list}};
    }

    nlohmann::json IntegrityReport::to_json() const
    {
        return nlohmann::json{{"valid", valid()},
                              {"entryCount", entry_count},
                              {"checkpointCount", checkpoint_count},
                              {"chain", chain.to_json()},
                              {"checkpoints", checkpoints.to_json()}};
    }

    IntegrityVerifier::IntegrityVerifier(const AuditChain &chain, const CheckpointManager &checkpoints)
        : chain_(chain), checkpoints_(checkpoints) {}

    Result<ChainVerification> IntegrityVerifier::check_entries(const std::vector<AuditEntry> &entries)
    {
        ChainVerification result;
        std::string expected_prev(kGenesisHash);

        for (std::size_t i = 0; i < entries.size(); ++i)
        {
            const auto &e = entries[i];
            const auto position = static_cast<std::uint64_t>(i);

            if (e.sequence != position)
            {
                result.valid = false;
                result.broken_at_sequence = position;
                result.details = std::format("Sequence gap: expected {}, found {}", position, e.sequence);
                return result;
            }

            if (e.prev_hash != expected_prev)
            {
                result.valid = false;
                result.broken_at_sequence = position;
                result.details = std::format("prevHash of entry {} does not match the hash of the previous entry", position);
                return result;
            }

            auto recomputed = e.compute_hash();
            if (!recomputed)
                return std::unexpected(recomputed.error());
            if (*recomputed != e.hash)
            {
                result.valid = false;
                result.broken_at_sequence = position;
                result.details = std::format("Hash mismatch at entry {}: content was modified after it was written", position);
                return result;
            }

            expected_prev = e.hash;
            ++result.entries_checked;
        }

        result.details = entries.empty() ? "Empty chain" : std::format("Chain intact ({} entries)", entries.size());
        return result;
    }

    Result<CheckpointVerification> IntegrityVerifier::check_checkpoints(const std::vector<AuditEntry> &entries,
                                                                        const std::vector<Checkpoint> &checkpoints,
                                                                        const SignatureCheck &signature_ok)
    {
        CheckpointVerification result;

        // Chain hash at each position, recomputed from entry 0 rather than
        // trusting the stored hash and prevHash fields.
        std::uint64_t needed = 0;
        for (const auto &cp : checkpoints)
            needed = std::max(needed, cp.at_sequence + 1);

        std::vector<std::string> rolling;
        rolling.reserve(std::min<std::uint64_t>(needed, entries.size()));
        for (std::size_t i = 0; i < entries.size() && i < needed; ++i)
        {
            AuditEntry relinked = entries[i];
            relinked.prev_hash = i == 0 ? std::string(kGenesisHash) : rolling.back();
            auto h = relinked.compute_hash();
            if (!h)
                return std::unexpected(h.error());
            rolling.push_back(std::move(*h));
        }

        for (const auto &cp : checkpoints)
        {
            ++result.checked;

            std::string actual = cp.at_sequence < rolling.size() ? rolling[cp.at_sequence] : std::string("<missing>");
            if (actual != cp.tip_hash)
            {
                result.mismatches.push_back(CheckpointMismatch{cp.at_sequence, "tipHash", cp.tip_hash, actual});
            }

            if (!signature_ok(cp))
            {
                // The valid tag is never echoed back: it would let whoever can
                // read the report re-sign a forged tip.
                result.mismatches.push_back(CheckpointMismatch{cp.at_sequence, "signature",
                                                               std::format("HMAC-SHA256 of \"{}\"", Checkpoint::signing_input(cp.at_sequence, cp.tip_hash)),
                                                               cp.signature});
            }
        }

        result.valid = result.mismatches.empty();
        return result;
    }

    Result<ChainVerification> IntegrityVerifier::verify_chain() const
    {
        auto entries = chain_.read_persisted();
        if (!entries)
            return std::unexpected(entries.error());

        auto result = check_entries(*entries);
        if (result && !result->valid)
        {
            logging::get("verifier")->warn("Audit chain broken at sequence {}: {}",
                                           *result->broken_at_sequence, result->details);
        }
        return result;
    }

    Result<CheckpointVerification> IntegrityVerifier::verify_checkpoints() const
    {
        auto entries = chain_.read_persisted();
        if (!entries)
            return std::unexpected(entries.error());
        auto stored = checkpoints_.read_persisted();
        if (!stored)
            return std::unexpected(stored.error());

        auto result = check_checkpoints(*entries, *stored,
                                        [this](const Checkpoint &cp) { return checkpoints_.verify_signature(cp); });
        if (result && !result->valid)
        {
            auto log = logging::get("verifier");
            for (const auto &m : result->mismatches)
                log->warn("Checkpoint at sequence {} disagrees on {}", m.at_sequence, m.field);
        }
        return result;
    }

    Result<IntegrityReport> IntegrityVerifier::verify_all() const
    {
        auto entries = chain_.read_persisted();
        if (!entries)
            return std::unexpected(entries.error());
        auto stored = checkpoints_.read_persisted();
        if (!stored)
            return std::unexpected(stored.error());

        auto chain = check_entries(*entries);
        if (!chain)
            return std::unexpected(chain.error());
        auto cps = check_checkpoints(*entries, *stored,
                                     [this](const Checkpoint &cp) { return checkpoints_.verify_signature(cp); });
        if (!cps)
            return std::unexpected(cps.error());

        IntegrityReport report{*chain, *cps, entries->size(), stored->size()};
        if (!report.valid())
        {
            logging::get("verifier")->warn("Integrity check failed: chain={} checkpoints={}",
                                           report.chain.valid, report.checkpoints.valid);
        }
        return report;
    }

} // namespace ari
