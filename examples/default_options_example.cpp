// Lists the content of a directory (as CREATE events) with default options,
// then keeps reporting changes for a few seconds.
#include <chrono>
#include <iostream>
#include <memory>
#include <stop_token>
#include <system_error>
#include <thread>

#include "scan_notifier.hpp"

int main(int argc, char* argv[]) {
    const char* root = argc > 1 ? argv[1] : ".";

    std::unique_ptr<scan_notifier::ScanNotifier> notifier;
    try {
        notifier = std::make_unique<scan_notifier::ScanNotifier>(root);
    } catch (const std::system_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    // Forget the seeded state so that the first pass reports every item
    notifier->flush();

    std::jthread consumer([receiver = notifier->queue()]() mutable {
        while (auto event = receiver.receive()) {
            std::cout << *event << std::endl;
        }
    });

    // Stop after a timeout through the cancellation token
    std::stop_source timeout;
    std::jthread timer([&timeout] {
        std::this_thread::sleep_for(std::chrono::seconds(5));
        timeout.request_stop();
    });

    if (auto ec = notifier->start(timeout.get_token())) {
        std::cerr << "start failed: " << ec.message() << std::endl;
        return 1;
    }
    return 0;
}
