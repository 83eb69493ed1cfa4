//// scan-notifier: prints the changes under a directory as JSON lines until interrupted
//// usage: scan-notifier <root> [options.json]

#include <iostream>
#include <thread>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <system_error>

#include <json/json.h>

#include "metrics_collector.hpp"
#include "options.hpp"
#include "scan_notifier.hpp"

using namespace scan_notifier;

std::atomic<bool> running(true);

void eventLoop(ScanNotifier& notifier) {
    EventReceiver receiver = notifier.queue();
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";  // one event per line

    auto last_collect = std::chrono::steady_clock::now();
    while (!receiver.closed()) {
        if (!running && notifier.isRunning()) {
            if (auto ec = notifier.stop(); ec && ec != ErrorCode::ScanIsStopping) {
                std::cerr << "stop failed: " << ec.message() << std::endl;
            }
        }

        if (auto event = receiver.receive(std::chrono::milliseconds(100))) {
            std::cout << Json::writeString(builder, event->toJson()) << std::endl;
        }

        // Periodic metrics report (every 10 s)
        if (std::chrono::steady_clock::now() - last_collect > std::chrono::seconds(10)) {
            notifier.metrics().collect(std::cerr);
            last_collect = std::chrono::steady_clock::now();
        }
    }
    notifier.metrics().collect(std::cerr);
}

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cerr << "usage: " << argv[0] << " <root> [options.json]" << std::endl;
        return 2;
    }

    std::shared_ptr<Options> options;
    try {
        options = argc == 3 ? Options::loadFile(argv[2]) : Options::create();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<ScanNotifier> notifier;
    try {
        notifier = std::make_unique<ScanNotifier>(argv[1], options);
    } catch (const std::system_error& e) {
        std::cerr << e.code().message() << ": " << e.what() << std::endl;
        return 1;
    }

    // Graceful shutdown handling
    std::signal(SIGINT, [](int) { running = false; });
    std::signal(SIGTERM, [](int) { running = false; });

    std::thread eventThread(eventLoop, std::ref(*notifier));

    std::error_code result = notifier->start();  // blocks until stopped
    eventThread.join();

    if (result) {
        std::cerr << "scan notifier failed: " << result.message() << std::endl;
        return 1;
    }
    return 0;
}
