#include "ari/cli.hpp"
#include "ari/config.hpp"
#include "ari/events.hpp"
#include "ari/kernel.hpp"
#include "ari/logging.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>

namespace ari::cli
{

	namespace
	{
		constexpr const char *kDefaultConfigPath = "ari.toml";

		// A config file is only mandatory when one was named explicitly
		Result<KernelConfig> load_config(const std::string &path, bool explicit_path)
		{
			if (!explicit_path && !std::filesystem::exists(path))
				return ConfigLoader::from_string("");
			return ConfigLoader::load(path);
		}

		nlohmann::json entries_to_json(const std::vector<AuditEntry> &entries)
		{
			nlohmann::json out = nlohmann::json::array();
			for (const auto &e : entries)
				out.push_back(e.to_json());
			return out;
		}

		int log_event(Kernel &kernel, const AuditLogRequest &request)
		{
			auto &dispatcher = kernel.dispatcher();

			std::mutex mutex;
			std::optional<AuditEntry> logged;
			std::optional<AuditUnavailableEvent> failed;

			auto on_logged = dispatcher.subscribe_once(kAuditLogged, [&](const AuditEntry &entry)
													   {
				std::lock_guard lock(mutex);
				logged = entry; });
			auto on_failed = dispatcher.subscribe_once(kAuditUnavailable, [&](const AuditUnavailableEvent &event)
													   {
				std::lock_guard lock(mutex);
				failed = event; });
			if (!on_logged || !on_failed)
			{
				std::cerr << (on_logged ? on_failed.error().what() : on_logged.error().what()) << std::endl;
				return 1;
			}

			dispatcher.publish(kAuditLog, request);

			// The bridge announces its outcome from inside its own handler,
			// which is only covered by a second drain.
			dispatcher.drain().wait();
			dispatcher.drain().wait();
			on_logged->unsubscribe();
			on_failed->unsubscribe();

			std::lock_guard lock(mutex);
			if (logged)
			{
				std::cout << logged->to_json().dump(2) << std::endl;
				return 0;
			}
			if (failed)
			{
				std::cerr << "Audit unavailable: " << failed->error << std::endl;
				return 1;
			}
			std::cerr << "Audit request produced no outcome" << std::endl;
			return 1;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"ari-kernel: event dispatcher and tamper-evident audit log"};
		app.require_subcommand(1);

		std::string config_path{kDefaultConfigPath};
		auto config_opt = app.add_option("--config", config_path, "Path to config TOML");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print the effective config as JSON");

		std::string log_action;
		std::string log_actor;
		std::string log_trust{"standard"};
		std::string log_details{"{}"};
		auto log_cmd = app.add_subcommand("log", "Record one audit entry through the dispatcher");
		log_cmd->add_option("--action", log_action, "Action name")->required();
		log_cmd->add_option("--actor", log_actor, "Actor identifier")->required();
		log_cmd->add_option("--trust", log_trust, "Trust level")
			->check(CLI::IsMember({"system", "operator", "verified", "standard"}));
		log_cmd->add_option("--details", log_details, "Details as a JSON object");

		std::string q_action;
		std::string q_actor;
		std::string q_since;
		std::string q_until;
		std::size_t q_offset{0};
		std::size_t q_limit{0};
		auto entries_cmd = app.add_subcommand("entries", "List audit entries");
		auto q_action_opt = entries_cmd->add_option("--action", q_action, "Only this action");
		auto q_actor_opt = entries_cmd->add_option("--actor", q_actor, "Only this actor");
		auto q_since_opt = entries_cmd->add_option("--since", q_since, "Earliest recordedAt (ISO 8601, inclusive)");
		auto q_until_opt = entries_cmd->add_option("--until", q_until, "Latest recordedAt (ISO 8601, inclusive)");
		entries_cmd->add_option("--offset", q_offset, "Skip this many matches");
		auto q_limit_opt = entries_cmd->add_option("--limit", q_limit, "Return at most this many matches");

		auto checkpoints_cmd = app.add_subcommand("checkpoints", "List stored checkpoints");
		auto checkpoint_cmd = app.add_subcommand("checkpoint", "Write a checkpoint at the current tip");
		auto verify_cmd = app.add_subcommand("verify", "Verify the chain and its checkpoints");
		auto health_cmd = app.add_subcommand("health", "Evaluate audit health");

		CLI11_PARSE(app, argc, argv);

		auto cfg = load_config(config_path, config_opt->count() > 0);
		if (!cfg)
		{
			std::cerr << cfg.error().what() << std::endl;
			return 1;
		}
		if (auto logging_ready = logging::init(cfg->logging.level); !logging_ready)
		{
			std::cerr << logging_ready.error().what() << std::endl;
			return 1;
		}

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		AuditLogRequest request;
		if (*log_cmd)
		{
			try
			{
				request.details = nlohmann::json::parse(log_details);
			}
			catch (const nlohmann::json::exception &e)
			{
				std::cerr << "--details is not valid JSON: " << e.what() << std::endl;
				return 1;
			}
			if (!request.details.is_object())
			{
				std::cerr << "--details must be a JSON object" << std::endl;
				return 1;
			}
			request.action = log_action;
			request.actor = log_actor;
			request.trust_level = log_trust;
		}

		auto kernel = Kernel::init(*cfg);
		if (!kernel)
		{
			std::cerr << kernel.error().what() << std::endl;
			return 1;
		}
		auto &k = **kernel;

		int rc = 0;
		if (*log_cmd)
		{
			rc = log_event(k, request);
		}
		else if (*entries_cmd)
		{
			AuditQuery q;
			if (*q_action_opt)
				q.action = q_action;
			if (*q_actor_opt)
				q.actor = q_actor;
			if (*q_since_opt)
				q.since = q_since;
			if (*q_until_opt)
				q.until = q_until;
			q.offset = q_offset;
			if (*q_limit_opt)
				q.limit = q_limit;
			std::cout << entries_to_json(k.chain().query(q)).dump(2) << std::endl;
		}
		else if (*checkpoints_cmd)
		{
			nlohmann::json out = nlohmann::json::array();
			for (const auto &cp : k.checkpoints().checkpoints())
				out.push_back(cp.to_json());
			std::cout << out.dump(2) << std::endl;
		}
		else if (*checkpoint_cmd)
		{
			auto cp = k.checkpoints().checkpoint_now();
			if (!cp)
			{
				std::cerr << cp.error().what() << std::endl;
				rc = 1;
			}
			else if (!*cp)
			{
				std::cout << "No checkpoint written (empty chain or tip already checkpointed)" << std::endl;
			}
			else
			{
				std::cout << (*cp)->to_json().dump(2) << std::endl;
			}
		}
		else if (*verify_cmd)
		{
			auto report = k.verifier().verify_all();
			if (!report)
			{
				std::cerr << "Integrity unknown: " << report.error().what() << std::endl;
				rc = 1;
			}
			else
			{
				std::cout << report->to_json().dump(2) << std::endl;
				rc = report->valid() ? 0 : 2;
			}
		}
		else if (*health_cmd)
		{
			auto report = k.health().check();
			std::cout << report.to_json().dump(2) << std::endl;
			if (report.status == HealthStatus::Unknown)
				rc = 1;
			else if (report.status == HealthStatus::Unhealthy)
				rc = 2;
		}

		k.shutdown();
		return rc;
	}

} // namespace ari::cli
