#include <iostream>
#include <mutex>
#include <thread>
#include <vector>
#include <string>
#include "FaultHush.hpp"

// For output synchronization
std::mutex cout_mutex;
#define SYNC_COUT(x) { std::lock_guard<std::mutex> lock(cout_mutex); std::cout << x; }

// ----- Thread Functions -----
void expected_fault(int thread_id) {
    auto hush = FaultHush::hush_this_test();
    const auto report = FaultHush::catch_fault([&] {
        FaultHush::fault("expected fault on worker " + std::to_string(thread_id));
    });
    if (report) {
        SYNC_COUT("Worker " << thread_id << ": faulted quietly with '" << report->message << "'\n");
    }
}

void unexpected_fault(int thread_id) {
    const auto report = FaultHush::catch_fault([&] {
        FaultHush::fault("unexpected fault on worker " + std::to_string(thread_id));
    });
    if (report) {
        SYNC_COUT("Worker " << thread_id << ": faulted and was reported above\n");
    }
}

int main() {
    SYNC_COUT("=== Fault before any hush ===\n");
    static_cast<void>(FaultHush::catch_fault([] { FaultHush::fault("first fault, printed"); }));

    SYNC_COUT("=== Hushed scope on the main thread ===\n");
    {
        auto hush = FaultHush::hush_this_test();
        static_cast<void>(FaultHush::catch_fault([] { FaultHush::fault("inside hushed scope, not printed"); }));
        SYNC_COUT("Main: hushed = " << std::boolalpha << FaultHush::is_panic_hushed() << "\n");
    }
    SYNC_COUT("Main: hushed = " << std::boolalpha << FaultHush::is_panic_hushed() << "\n");
    static_cast<void>(FaultHush::catch_fault([] { FaultHush::fault("after the scope, printed"); }));

    SYNC_COUT("=== Mixed workers ===\n");
    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        if (i % 2 == 0) {
            workers.emplace_back(expected_fault, i);
        } else {
            workers.emplace_back(unexpected_fault, i);
        }
    }
    for (auto& worker : workers) {
        worker.join();
    }

    SYNC_COUT("=== Manual hush / unhush ===\n");
    FaultHush::hush_panic();
    FaultHush::hush_panic();
    SYNC_COUT("Main: first unhush returned " << FaultHush::unhush_panic() << "\n");
    SYNC_COUT("Main: second unhush returned " << FaultHush::unhush_panic() << "\n");

    return 0;
}
