#include "ari/config.hpp"
#include "ari/logging.hpp"
#include <toml++/toml.h>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace ari
{
    namespace
    {
        Result<std::uint64_t> parse_count(const std::string &key, const std::string &value)
        {
            std::uint64_t out = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
            if (ec != std::errc() || ptr != value.data() + value.size())
            {
                return std::unexpected(AriError::config(std::format("{} must be a non-negative integer, got '{}'", key, value)));
            }
            return out;
        }

        Result<bool> parse_flag(const std::string &key, const std::string &value)
        {
            if (value == "1" || value == "true" || value == "yes")
                return true;
            if (value == "0" || value == "false" || value == "no")
                return false;
            return std::unexpected(AriError::config(std::format("{} must be a boolean, got '{}'", key, value)));
        }

        Result<std::uint64_t> count_value(const toml::node_view<const toml::node> &node, const std::string &key,
                                          std::uint64_t current)
        {
            if (!node)
                return current;
            auto v = node.value<int64_t>();
            if (!v || *v < 0)
                return std::unexpected(AriError::config(std::format("{} must be a non-negative integer", key)));
            return static_cast<std::uint64_t>(*v);
        }

        Result<void> parse_toml(const toml::table &tbl, KernelConfig &cfg)
        {
            if (auto audit = tbl["audit"].as_table())
            {
                if (auto path = (*audit)["path"].value<std::string>())
                    cfg.audit.path = *path;
                if (auto path = (*audit)["checkpoint_path"].value<std::string>())
                    cfg.audit.checkpoint_path = *path;
            }

            if (auto cp = tbl["checkpoint"].as_table())
            {
                const toml::table &t = *cp;
                auto entries = count_value(t["every_entries"], "checkpoint.every_entries", cfg.checkpoint.every_entries);
                if (!entries)
                    return std::unexpected(entries.error());
                cfg.checkpoint.every_entries = *entries;

                auto seconds = count_value(t["every_seconds"], "checkpoint.every_seconds", cfg.checkpoint.every_seconds);
                if (!seconds)
                    return std::unexpected(seconds.error());
                cfg.checkpoint.every_seconds = *seconds;

                if (auto key_path = t["key_path"].value<std::string>())
                    cfg.checkpoint.key_path = *key_path;
                if (auto create = t["create_key"].value<bool>())
                    cfg.checkpoint.create_key = *create;
            }

            if (auto disp = tbl["dispatcher"].as_table())
            {
                const toml::table &t = *disp;
                auto timeout = count_value(t["handler_timeout_ms"], "dispatcher.handler_timeout_ms", cfg.dispatcher.handler_timeout_ms);
                if (!timeout)
                    return std::unexpected(timeout.error());
                cfg.dispatcher.handler_timeout_ms = *timeout;

                auto threads = count_value(t["worker_threads"], "dispatcher.worker_threads", cfg.dispatcher.worker_threads);
                if (!threads)
                    return std::unexpected(threads.error());
                cfg.dispatcher.worker_threads = *threads;
            }

            if (auto bridge = tbl["bridge"].as_table())
            {
                const toml::table &t = *bridge;
                auto attempts = count_value(t["max_attempts"], "bridge.max_attempts", cfg.bridge.max_attempts);
                if (!attempts)
                    return std::unexpected(attempts.error());
                cfg.bridge.max_attempts = *attempts;

                auto backoff = count_value(t["initial_backoff_ms"], "bridge.initial_backoff_ms", cfg.bridge.initial_backoff_ms);
                if (!backoff)
                    return std::unexpected(backoff.error());
                cfg.bridge.initial_backoff_ms = *backoff;
            }

            if (auto lg = tbl["logging"].as_table())
            {
                if (auto level = (*lg)["level"].value<std::string>())
                    cfg.logging.level = *level;
            }

            return {};
        }

        std::optional<std::string> env(const char *name)
        {
            const char *value = std::getenv(name);
            if (!value)
                return std::nullopt;
            return std::string(value);
        }

    } // namespace

    DispatcherConfig KernelConfig::dispatcher_config() const
    {
        DispatcherConfig out;
        out.worker_threads = static_cast<std::size_t>(dispatcher.worker_threads);
        out.handler_timeout = std::chrono::milliseconds(dispatcher.handler_timeout_ms);
        return out;
    }

    CheckpointPolicy KernelConfig::checkpoint_policy() const
    {
        CheckpointPolicy out;
        out.every_entries = checkpoint.every_entries;
        out.every_seconds = std::chrono::seconds(checkpoint.every_seconds);
        return out;
    }

    RetryPolicy KernelConfig::retry_policy() const
    {
        RetryPolicy out;
        out.max_attempts = static_cast<std::uint32_t>(bridge.max_attempts);
        out.initial_backoff = std::chrono::milliseconds(bridge.initial_backoff_ms);
        return out;
    }

    Result<KernelConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(AriError::config(std::format("Unable to open config file: {}", path)));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<KernelConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        KernelConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            if (auto parsed = parse_toml(tbl, cfg); !parsed)
                return std::unexpected(parsed.error());
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(AriError::config(std::format("Failed to parse TOML: {}", e.description())));
        }

        if (auto overridden = apply_env_overrides(cfg); !overridden)
            return std::unexpected(overridden.error());

        if (auto level = logging::parse_level(cfg.logging.level); !level)
            return std::unexpected(level.error());
        if (cfg.bridge.max_attempts == 0 || cfg.bridge.max_attempts > RetryPolicy::kMaxAttempts)
        {
            return std::unexpected(AriError::config(
                std::format("bridge.max_attempts must be between 1 and {}", RetryPolicy::kMaxAttempts)));
        }

        finalize(cfg);
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(KernelConfig &cfg)
    {
        if (auto v = env("ARI_AUDIT_PATH"))
            cfg.audit.path = *v;
        if (auto v = env("ARI_CHECKPOINT_PATH"))
            cfg.audit.checkpoint_path = *v;
        if (auto v = env("ARI_CHECKPOINT_KEY_PATH"))
            cfg.checkpoint.key_path = *v;
        if (auto v = env("ARI_LOG_LEVEL"))
            cfg.logging.level = *v;

        if (auto v = env("ARI_CHECKPOINT_CREATE_KEY"))
        {
            auto flag = parse_flag("ARI_CHECKPOINT_CREATE_KEY", *v);
            if (!flag)
                return std::unexpected(flag.error());
            cfg.checkpoint.create_key = *flag;
        }

        struct CountOverride
        {
            const char *name;
            std::uint64_t *target;
        };
        const CountOverride counts[] = {
            {"ARI_CHECKPOINT_EVERY_ENTRIES", &cfg.checkpoint.every_entries},
            {"ARI_CHECKPOINT_EVERY_SECONDS", &cfg.checkpoint.every_seconds},
            {"ARI_HANDLER_TIMEOUT_MS", &cfg.dispatcher.handler_timeout_ms},
            {"ARI_WORKER_THREADS", &cfg.dispatcher.worker_threads},
            {"ARI_BRIDGE_MAX_ATTEMPTS", &cfg.bridge.max_attempts},
            {"ARI_BRIDGE_BACKOFF_MS", &cfg.bridge.initial_backoff_ms},
        };
        for (const auto &c : counts)
        {
            if (auto v = env(c.name))
            {
                auto parsed = parse_count(c.name, *v);
                if (!parsed)
                    return std::unexpected(parsed.error());
                *c.target = *parsed;
            }
        }
        return {};
    }

    void ConfigLoader::finalize(KernelConfig &cfg)
    {
        cfg.audit.path = expand_home(cfg.audit.path);
        if (cfg.audit.checkpoint_path.empty())
            cfg.audit.checkpoint_path = cfg.audit.path + ".checkpoints";
        else
            cfg.audit.checkpoint_path = expand_home(cfg.audit.checkpoint_path);
        cfg.checkpoint.key_path = expand_home(cfg.checkpoint.key_path);
    }

    Result<crypto::Bytes> ConfigLoader::resolve_checkpoint_key(const KernelConfig &cfg)
    {
        if (auto v = env("ARI_CHECKPOINT_KEY"))
        {
            auto key = crypto::Base64::decode(*v);
            if (!key)
                return std::unexpected(AriError::config("ARI_CHECKPOINT_KEY is not valid base64"));
            if (key->size() < crypto::HmacSha256::kMinKeyBytes)
                return std::unexpected(AriError::config("ARI_CHECKPOINT_KEY is too short; at least 32 bytes are required"));
            return key;
        }

        if (cfg.checkpoint.create_key)
        {
            auto key = crypto::KeyFile::load_or_create(cfg.checkpoint.key_path, crypto::HmacSha256::kMinKeyBytes);
            if (!key)
                return std::unexpected(AriError::config(std::format("Checkpoint key unavailable: {}", key.error().what())));
            return key;
        }

        auto key = crypto::KeyFile::load(cfg.checkpoint.key_path);
        if (!key)
        {
            return std::unexpected(AriError::config(std::format("No checkpoint key: set ARI_CHECKPOINT_KEY or provide {} ({})",
                                                                cfg.checkpoint.key_path, key.error().what())));
        }
        return key;
    }

    nlohmann::json ConfigLoader::to_json(const KernelConfig &cfg)
    {
        nlohmann::json j;
        j["audit"] = {{"path", cfg.audit.path}, {"checkpoint_path", cfg.audit.checkpoint_path}};
        j["checkpoint"] = {
            {"every_entries", cfg.checkpoint.every_entries},
            {"every_seconds", cfg.checkpoint.every_seconds},
            {"key_path", cfg.checkpoint.key_path},
            {"create_key", cfg.checkpoint.create_key}};
        j["dispatcher"] = {
            {"handler_timeout_ms", cfg.dispatcher.handler_timeout_ms},
            {"worker_threads", cfg.dispatcher.worker_threads}};
        j["bridge"] = {
            {"max_attempts", cfg.bridge.max_attempts},
            {"initial_backoff_ms", cfg.bridge.initial_backoff_ms}};
        j["logging"] = {{"level", cfg.logging.level}};
        j["has_env_checkpoint_key"] = std::getenv("ARI_CHECKPOINT_KEY") != nullptr;
        return j;
    }

} // namespace ari
