#include "cadence/runtime/daemon.h"
#include "cadence/core/exceptions.h"

namespace cadence {

Daemon::Daemon(IController& controller, ThreadRegistry& registry, std::string name,
               ThreadClass thread_class)
    : controller_(controller)
    , registry_(registry)
    , name_(std::move(name))
    , token_(std::make_shared<ShutdownToken>(registry, thread_class))
    , logger_(LoggerFactory::get_logger("cadence.daemon")) {

    std::weak_ptr<ShutdownToken> weak_token = token_;
    auto& bus = controller_.event_bus();

    subscriptions_.push_back(bus.subscribe(topics::WAKE_DAEMONS, [weak_token](const std::any&) {
        if (auto token = weak_token.lock()) {
            token->wake();
        }
    }));

    subscriptions_.push_back(bus.subscribe(topics::SHUTDOWN, [weak_token](const std::any&) {
        if (auto token = weak_token.lock()) {
            token->request_shutdown();
        }
    }));
}

Daemon::~Daemon() {
    stop();

    auto& bus = controller_.event_bus();
    for (auto id : subscriptions_) {
        bus.unsubscribe(id);
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void Daemon::start() {
    std::lock_guard lock(thread_mutex_);
    if (started_.exchange(true)) {
        throw SchedulerException(name_, "Already started");
    }

    alive_.store(true, std::memory_order_release);
    thread_ = std::thread(&Daemon::thread_main, this);
    logger_->with_field("daemon", name_).debug("Daemon started");
}

void Daemon::join() {
    std::lock_guard lock(thread_mutex_);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void Daemon::stop() {
    shutdown();
    join();
}

void Daemon::wake() {
    token_->wake();
}

void Daemon::shutdown() {
    token_->request_shutdown();
}

// ============================================================================
// Thread Body
// ============================================================================

void Daemon::do_pre_call() {
    if (report_mode_.load(std::memory_order_relaxed)) {
        logger_->info(name_ + " doing a job.");
    }
}

void Daemon::subscribe_wake(const std::string& topic) {
    std::weak_ptr<ShutdownToken> weak_token = token_;
    subscriptions_.push_back(controller_.event_bus().subscribe(topic, [weak_token](const std::any&) {
        if (auto token = weak_token.lock()) {
            token->wake();
        }
    }));
}

void Daemon::thread_main() {
    token_->bind_current_thread();

    try {
        run();
    } catch (const ShutdownSignal&) {
        // normal exit path
    } catch (const std::exception& e) {
        logger_->with_field("daemon", name_).error("Daemon terminated by exception: " + std::string(e.what()));
        controller_.report_exception(name_, std::current_exception());
    } catch (...) {
        logger_->with_field("daemon", name_).error("Daemon terminated by non-standard exception");
        controller_.report_exception(name_, std::current_exception());
    }

    logger_->with_field("daemon", name_).debug("Daemon stopped");
    alive_.store(false, std::memory_order_release);
}

} // namespace cadence
