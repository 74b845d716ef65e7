#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace connmon::infra {

AsioContext::AsioContext(size_t threadCount) : threadCount_(threadCount > 0 ? threadCount : 1) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() {
            spdlog::debug("Worker thread {} started", i);
            for (;;) {
                try {
                    ioContext_.run();
                    break;
                } catch (const std::exception& e) {
                    // A handler escaped with an exception; keep the worker alive.
                    spdlog::error("Worker thread {} caught unhandled exception: {}", i, e.what());
                }
            }
            spdlog::debug("Worker thread {} stopped", i);
        });
    }

    spdlog::info("Worker pool started with {} threads", threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
    spdlog::info("Worker pool stopped");
}

} // namespace connmon::infra
