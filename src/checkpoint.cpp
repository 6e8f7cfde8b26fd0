#include "ari/checkpoint.hpp"
#include "ari/logging.hpp"
#include <format>

namespace ari
{

    std::string Checkpoint::signing_input(std::uint64_t at_sequence, const std::string &tip_hash)
    {
        return std::to_string(at_sequence) + ":" + tip_hash;
    }

    nlohmann::json Checkpoint::to_json() const
    {
        return nlohmann::json{{"atSequence", at_sequence},
                              {"tipHash", tip_hash},
                              {"recordedAt", recorded_at},
                              {"signature", signature}};
    }

    Result<Checkpoint> Checkpoint::from_json(const nlohmann::json &j)
    {
        try
        {
            Checkpoint cp;
            cp.at_sequence = j.at("atSequence").get<std::uint64_t>();
            cp.tip_hash = j.at("tipHash").get<std::string>();
            cp.recorded_at = j.at("recordedAt").get<std::string>();
            cp.signature = j.at("signature").get<std::string>();
            return cp;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(AriError::parsing(std::format("Malformed checkpoint: {}", e.what())));
        }
    }

    namespace
    {
        Result<std::vector<Checkpoint>> parse_checkpoints(const std::vector<std::string> &lines)
        {
            std::vector<Checkpoint> out;
            out.reserve(lines.size());
            for (std::size_t i = 0; i < lines.size(); ++i)
            {
                try
                {
                    auto cp = Checkpoint::from_json(nlohmann::json::parse(lines[i]));
                    if (!cp)
                        return std::unexpected(cp.error());
                    out.push_back(std::move(*cp));
                }
                catch (const nlohmann::json::exception &e)
                {
                    return std::unexpected(AriError::parsing(
                        std::format("Corrupt checkpoint record at line {}: {}", i + 1, e.what())));
                }
            }
            return out;
        }
    } // namespace

    CheckpointManager::CheckpointManager(const AuditChain &chain, std::shared_ptr<LineStore> store,
                                         crypto::Bytes key, CheckpointPolicy policy, Clock clock)
        : chain_(chain),
          store_(std::move(store)),
          key_(std::move(key)),
          policy_(policy),
          clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
    {
        last_checkpoint_time_ = clock_();
    }

    Result<std::unique_ptr<CheckpointManager>> CheckpointManager::create(const AuditChain &chain,
                                                                         std::shared_ptr<LineStore> store,
                                                                         crypto::Bytes key,
                                                                         CheckpointPolicy policy,
                                                                         Clock clock)
    {
        if (key.size() < crypto::HmacSha256::kMinKeyBytes)
        {
            return std::unexpected(AriError::config(
                std::format("Checkpoint key must be at least {} bytes; refusing to sign checkpoints with a weak key",
                            crypto::HmacSha256::kMinKeyBytes)));
        }
        if (!store)
        {
            return std::unexpected(AriError::config("Checkpoint store is not configured"));
        }

        std::unique_ptr<CheckpointManager> manager(
            new CheckpointManager(chain, std::move(store), std::move(key), policy, std::move(clock)));
        if (auto loaded = manager->load(); !loaded)
            return std::unexpected(loaded.error());
        return manager;
    }

    Result<void> CheckpointManager::load()
    {
        auto stored = read_persisted();
        if (!stored)
            return std::unexpected(stored.error());

        std::lock_guard lock(mutex_);
        checkpoints_ = std::move(*stored);
        if (!checkpoints_.empty())
        {
            // Resume the time trigger from the last checkpoint on disk
            if (auto at = parse_iso8601(checkpoints_.back().recorded_at))
                last_checkpoint_time_ = *at;
            else
                logging::get("checkpoint")->warn("Last checkpoint has an unreadable timestamp: {}", at.error().what());
        }
        return {};
    }

    Result<std::vector<Checkpoint>> CheckpointManager::read_persisted() const
    {
        auto lines = store_->read_all();
        if (!lines)
            return std::unexpected(lines.error());
        return parse_checkpoints(*lines);
    }

    Result<std::optional<Checkpoint>> CheckpointManager::maybe_checkpoint(std::uint64_t after_sequence)
    {
        std::lock_guard lock(mutex_);

        bool count_due = policy_.every_entries > 0 && (after_sequence + 1) % policy_.every_entries == 0;
        bool time_due = policy_.every_seconds.count() > 0 &&
                        clock_() - last_checkpoint_time_ >= policy_.every_seconds;
        if (!count_due && !time_due)
            return std::optional<Checkpoint>{};

        return write_locked(after_sequence);
    }

    Result<std::optional<Checkpoint>> CheckpointManager::checkpoint_now()
    {
        auto tip = chain_.last_entry();
        if (!tip)
            return std::optional<Checkpoint>{};

        std::lock_guard lock(mutex_);
        return write_locked(tip->sequence);
    }

    Result<std::optional<Checkpoint>> CheckpointManager::write_locked(std::uint64_t at_sequence)
    {
        auto log = logging::get("checkpoint");

        if (!checkpoints_.empty() && at_sequence <= checkpoints_.back().at_sequence)
        {
            log->warn("Refusing checkpoint at sequence {}: last checkpoint is at {}",
                      at_sequence, checkpoints_.back().at_sequence);
            return std::optional<Checkpoint>{};
        }

        auto entry = chain_.entry(at_sequence);
        if (!entry)
        {
            return std::unexpected(AriError::not_found(
                std::format("No audit entry at sequence {}", at_sequence)));
        }

        Checkpoint cp;
        cp.at_sequence = at_sequence;
        cp.tip_hash = entry->hash;
        auto now = clock_();
        cp.recorded_at = format_iso8601(now);

        auto signature = sign(cp.at_sequence, cp.tip_hash);
        if (!signature)
            return std::unexpected(signature.error());
        cp.signature = *signature;

        if (auto written = store_->append(cp.to_json().dump()); !written)
            return std::unexpected(written.error());

        checkpoints_.push_back(cp);
        last_checkpoint_time_ = now;
        log->info("Checkpoint written at sequence {} (tip {})", cp.at_sequence, cp.tip_hash);
        return std::optional<Checkpoint>(std::move(cp));
    }

    std::vector<Checkpoint> CheckpointManager::checkpoints() const
    {
        std::lock_guard lock(mutex_);
        return checkpoints_;
    }

    Result<std::string> CheckpointManager::sign(std::uint64_t at_sequence, const std::string &tip_hash) const
    {
        return crypto::HmacSha256::sign_hex(key_, Checkpoint::signing_input(at_sequence, tip_hash));
    }

    bool CheckpointManager::verify_signature(const Checkpoint &checkpoint) const
    {
        return crypto::HmacSha256::verify_hex(key_,
                                              Checkpoint::signing_input(checkpoint.at_sequence, checkpoint.tip_hash),
                                              checkpoint.signature);
    }

} // namespace ari
