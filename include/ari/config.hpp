#pragma once

#include "audit_bridge.hpp"
#include "checkpoint.hpp"
#include "crypto.hpp"
#include "event_bus.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace ari
{

    struct AuditConfig
    {
        std::string path{"~/.ari/audit.jsonl"};
        std::string checkpoint_path; // defaults to <path>.checkpoints
    };

    struct CheckpointConfig
    {
        std::uint64_t every_entries{500};
        std::uint64_t every_seconds{3600};
        std::string key_path{"~/.ari/checkpoint.key"};
        bool create_key{true};
    };

    struct DispatcherSettings
    {
        std::uint64_t handler_timeout_ms{30000};
        std::uint64_t worker_threads{4};
    };

    struct BridgeConfig
    {
        std::uint64_t max_attempts{3};
        std::uint64_t initial_backoff_ms{50};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
    };

    struct KernelConfig
    {
        AuditConfig audit{};
        CheckpointConfig checkpoint{};
        DispatcherSettings dispatcher{};
        BridgeConfig bridge{};
        LoggingConfig logging{};

        DispatcherConfig dispatcher_config() const;
        CheckpointPolicy checkpoint_policy() const;
        RetryPolicy retry_policy() const;
    };

    /**
     * ConfigLoader loads TOML configs with ARI_* environment overrides.
     * Paths have "~/" expanded once everything is merged.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<KernelConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<KernelConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for inspection. The HMAC key is never included. */
        static nlohmann::json to_json(const KernelConfig &cfg);

        /**
         * HMAC key for checkpoint signing: ARI_CHECKPOINT_KEY (base64) if set,
         * else the key file, created on first use when create_key is set.
         * Missing or weak keys are ConfigError.
         */
        static Result<crypto::Bytes> resolve_checkpoint_key(const KernelConfig &cfg);

    private:
        static Result<void> apply_env_overrides(KernelConfig &cfg);
        static void finalize(KernelConfig &cfg);
    };

} // namespace ari
