// src/main.cpp
#include "config.h"
#include "display_service.h"
#include "logger.h"
#include "otp_uri_parser.h"
#include "otp_uri_store.h"
#include "password_generator.h"

#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

namespace {

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <config.json>\n"
              << "       " << argv0 << " <config.json> import <otpauth-uri>\n"
              << "commands on stdin: list | delete <n> | quit\n";
}

void print_view(std::ostream& out, const DisplayItems& items) {
    out << "---- " << items.size() << " entries ----\n";
    for (std::size_t i = 0; i < items.size(); ++i) {
        const auto& it = items[i];
        out << "[" << i << "] " << it.code << "  " << it.account;
        if (it.issuer) out << " (" << *it.issuer << ")";
        out << '\n';
    }
    out.flush();
}

int import_uri(JsonFileUriStore& store, const OtpUriParser& parser, Logger& log, const std::string& uri) {
    auto parsed = parser.parse(uri);
    if (!parsed.ok()) {
        log.error("not importing malformed uri: " + parsed.error);
        return 1;
    }
    const auto& p = *parsed.params;
    if (store.add_uri_string(uri)) {
        log.info_fmt("imported ", p.account, " (", otp_type_name(p.type), ", ", otp_algo_name(p.algo),
                     ", ", p.digits, " digits)");
    } else {
        log.info(p.account + " is already stored");
    }
    return 0;
}

int run_console(OtpDisplayService& svc, Logger& log) {
    std::mutex view_mu;
    DisplayItems view;

    svc.publisher().subscribe([&](const DisplayItems& items) {
        std::lock_guard<std::mutex> lk(view_mu);
        view = items;
        print_view(std::cout, view);
    });

    if (!svc.start()) return 1;
    for (const auto& f : svc.bootstrap_failures()) {
        std::cerr << "skipped " << OtpUriParser::redact(f.uri) << ": " << f.reason << '\n';
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        std::istringstream cmd(line);
        std::string verb;
        cmd >> verb;
        if (verb.empty()) continue;
        if (verb == "quit" || verb == "exit") break;

        if (verb == "list") {
            std::lock_guard<std::mutex> lk(view_mu);
            print_view(std::cout, view);
        } else if (verb == "delete") {
            std::size_t idx = 0;
            if (!(cmd >> idx)) { std::cerr << "delete needs an index\n"; continue; }
            std::function<void()> trigger;
            {
                std::lock_guard<std::mutex> lk(view_mu);
                if (idx >= view.size()) { std::cerr << "no entry " << idx << '\n'; continue; }
                trigger = view[idx].on_delete;
            }
            trigger();  // outside the lock: the reducer publishes into view_mu
        } else {
            std::cerr << "unknown command: " << verb << '\n';
        }
    }

    // stdin closed early on a bounded run: let the remaining ticks play out
    if (std::cin.eof() && svc.scheduler().options().max_ticks) {
        using namespace std::chrono_literals;
        while (!svc.scheduler().finished()) std::this_thread::sleep_for(100ms);
    }
    svc.stop();
    log.info("bye");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 2 && !(argc == 4 && std::string(argv[2]) == "import")) {
        usage(argv[0]);
        return 2;
    }

    Logger log("otpdeck", std::cerr);
    try {
        const Config cfg = Config::load_from_file(argv[1]);
        log.set_level(cfg.log_level());

        JsonFileUriStore store(cfg.store_path());
        OtpUriParser parser;
        if (argc == 4) return import_uri(store, parser, log, argv[3]);

        DefaultPasswordGeneratorFactory factory;
        OtpDisplayService::Options opts;
        opts.refresh.interval = cfg.refresh_interval();
        opts.refresh.max_ticks = cfg.max_refresh_cycles();
        opts.queue_capacity = cfg.queue_capacity();
        opts.bootstrap_policy = cfg.bootstrap_policy();

        OtpDisplayService svc(store, parser, factory, log, opts);
        return run_console(svc, log);
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
}
