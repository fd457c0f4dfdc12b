#include "display_service.h"
#include "logger.h"

#include <exception>
#include <memory>
#include <utility>

OtpDisplayService::OtpDisplayService(OtpUriStore& store,
                                     const OtpUriParser& parser,
                                     const PasswordGeneratorFactory& factory,
                                     Logger& log,
                                     Options opts)
    : log_(log),
      opts_(std::move(opts)),
      q_(std::make_shared<EventQueue>(opts_.queue_capacity)),
      registry_(store, parser, factory, log, opts_.bootstrap_policy),
      reducer_(store, log),
      publisher_(q_, log),
      scheduler_(*q_, log, opts_.refresh) {}

OtpDisplayService::~OtpDisplayService() { stop(); }

bool OtpDisplayService::start() {
    if (running_.load()) return true;
    if (q_->closed()) {
        log_.error("display service cannot restart after stop()");
        return false;
    }

    auto boot = registry_.bootstrap();   // Strict: BootstrapError propagates
    failures_ = std::move(boot.failures);
    publisher_.publish(boot.snapshot);

    running_.store(true);
    thr_ = std::thread([this]{ run(); });   // consumer first so the queue drains
    scheduler_.start();
    return true;
}

void OtpDisplayService::stop() {
    if (!running_.exchange(false)) return;
    scheduler_.stop();
    q_->close();
    if (thr_.joinable()) thr_.join();
    log_.info_fmt("display service stopped after ", processed_.load(), " events");
}

void OtpDisplayService::submit(OtpEvent ev) {
    q_->push(std::move(ev));
}

void OtpDisplayService::run() {
    OtpEvent ev;
    while (q_->pop(ev)) {
        Snapshot next;
        try {
            next = reducer_.apply(registry_.current(), ev);
        } catch (const std::exception& e) {
            log_.error(std::string("reduction failed, snapshot kept: ") + e.what());
            processed_.fetch_add(1);
            continue;
        }
        registry_.replace(next);
        publisher_.publish(next);
        processed_.fetch_add(1);
    }
}
