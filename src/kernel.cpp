#include "ari/kernel.hpp"
#include "ari/line_store.hpp"
#include "ari/logging.hpp"

namespace ari
{

    Result<std::unique_ptr<Kernel>> Kernel::init(const KernelConfig &cfg)
    {
        auto log = logging::get("kernel");

        auto key = ConfigLoader::resolve_checkpoint_key(cfg);
        if (!key)
            return std::unexpected(key.error());

        std::unique_ptr<Kernel> kernel(new Kernel());
        kernel->dispatcher_ = std::make_unique<Dispatcher>(cfg.dispatcher_config());

        kernel->chain_ = std::make_unique<AuditChain>(std::make_shared<FileLineStore>(cfg.audit.path));
        if (auto loaded = kernel->chain_->load(); !loaded)
            return std::unexpected(loaded.error());

        auto checkpoints = CheckpointManager::create(*kernel->chain_,
                                                     std::make_shared<FileLineStore>(cfg.audit.checkpoint_path),
                                                     std::move(*key),
                                                     cfg.checkpoint_policy());
        if (!checkpoints)
            return std::unexpected(checkpoints.error());
        kernel->checkpoints_ = std::move(*checkpoints);
        kernel->chain_->attach_checkpoints(kernel->checkpoints_.get());

        kernel->verifier_ = std::make_unique<IntegrityVerifier>(*kernel->chain_, *kernel->checkpoints_);

        kernel->bridge_ = std::make_unique<AuditBridge>(*kernel->dispatcher_, *kernel->chain_, cfg.retry_policy());
        if (auto started = kernel->bridge_->start(); !started)
            return std::unexpected(started.error());

        kernel->health_ = std::make_unique<AuditHealthProbe>(*kernel->dispatcher_, *kernel->verifier_);
        if (auto started = kernel->health_->start(); !started)
            return std::unexpected(started.error());

        log->info("Kernel started: audit={} entries={} checkpoints={}",
                  cfg.audit.path, kernel->chain_->size(), kernel->checkpoints_->checkpoints().size());
        return kernel;
    }

    Kernel::~Kernel()
    {
        shutdown();
    }

    void Kernel::shutdown()
    {
        if (stopped_)
            return;
        stopped_ = true;

        // Invocations already scheduled still reach the bridge; shutdown()
        // below waits for them before the workers are joined.
        if (health_)
            health_->stop();
        if (bridge_)
            bridge_->stop();
        if (dispatcher_)
            dispatcher_->shutdown();
        if (chain_)
            chain_->attach_checkpoints(nullptr);
    }

} // namespace ari
