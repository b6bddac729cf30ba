#include "infrastructure/network/AsioContext.hpp"

namespace signfleet::infra {

AsioContext::AsioContext(size_t threadCount)
    : threadCount_(threadCount > 0 ? threadCount : 1) {
    spdlog::debug("AsioContext created with {} threads", threadCount_);
}

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
            ioContext_.run();
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

} // namespace signfleet::infra
