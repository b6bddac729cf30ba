#include "infrastructure/network/DiscoveryScanner.hpp"

#include "core/types/Errors.hpp"
#include "core/types/Host.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <semaphore>
#include <set>
#include <thread>

namespace signfleet::infra {

namespace {

constexpr auto SlotPollInterval = std::chrono::milliseconds(20);

/**
 * @brief One TCP dial. Socket, timer and every handler share a strand.
 */
struct Dial {
    explicit Dial(asio::io_context& io)
        : strand(asio::make_strand(io)), socket(strand), timer(strand) {}

    asio::strand<asio::io_context::executor_type> strand;
    asio::ip::tcp::socket socket;
    asio::steady_timer timer;
    bool timedOut{false};
};

/**
 * @brief State shared by the supervisor, the drivers and the dial handlers of one scan.
 */
struct ScanState {
    ScanState(int maxConcurrency, core::CancellationToken scanToken, uint16_t scanPort)
        : token(std::move(scanToken)), port(scanPort), slots(std::max(maxConcurrency, 1)) {}

    void emit(const std::string& ip) {
        {
            std::lock_guard lock(mutex);
            if (!seen.insert(ip).second) {
                return;
            }
        }
        ++found;
        spdlog::info("Discovery: {}:{} accepted a connection", ip, port);
        stream->push(core::DiscoveryCandidate{ip, port});
    }

    uint64_t track(const std::shared_ptr<Dial>& dial) {
        std::lock_guard lock(mutex);
        auto id = nextDial++;
        inFlight.emplace(id, dial);
        return id;
    }

    void finish(uint64_t id) {
        {
            std::lock_guard lock(mutex);
            inFlight.erase(id);
        }
        slots.release();
        drained.notify_all();
    }

    void abortAll() {
        std::lock_guard lock(mutex);
        for (auto& [id, dial] : inFlight) {
            asio::post(dial->strand, [dial = dial]() {
                asio::error_code ignored;
                dial->socket.close(ignored);
            });
        }
    }

    bool waitDrained(std::chrono::milliseconds limit) {
        std::unique_lock lock(mutex);
        return drained.wait_for(lock, limit, [this]() { return inFlight.empty(); });
    }

    bool acquireSlot() {
        while (!token.isCancelled()) {
            if (slots.try_acquire_for(SlotPollInterval)) {
                return true;
            }
        }
        return false;
    }

    std::shared_ptr<core::CandidateStream> stream{std::make_shared<core::CandidateStream>()};
    core::CancellationToken token;
    uint16_t port;
    std::counting_semaphore<> slots;

    std::mutex mutex;
    std::condition_variable drained;
    std::set<std::string> seen;
    std::map<uint64_t, std::shared_ptr<Dial>> inFlight;
    uint64_t nextDial{0};

    std::atomic<int> dialed{0};
    std::atomic<int> found{0};
};

void startDial(asio::io_context& io, const std::string& ip, std::chrono::milliseconds budget,
               const std::shared_ptr<ScanState>& state) {
    auto dial = std::make_shared<Dial>(io);
    auto id = state->track(dial);
    ++state->dialed;

    asio::ip::tcp::endpoint endpoint(asio::ip::make_address_v4(ip), state->port);
    asio::post(dial->strand, [dial, endpoint, budget, id, state]() {
        if (state->token.isCancelled()) {
            state->finish(id);
            return;
        }

        dial->timer.expires_after(budget);
        dial->timer.async_wait([dial](const asio::error_code& ec) {
            if (!ec) {
                dial->timedOut = true;
                asio::error_code ignored;
                dial->socket.close(ignored);
            }
        });

        dial->socket.async_connect(endpoint, [dial, endpoint, id, state](const asio::error_code& ec) {
            dial->timer.cancel();
            if (!ec && !dial->timedOut) {
                state->emit(endpoint.address().to_string());
            }
            asio::error_code ignored;
            dial->socket.close(ignored);
            state->finish(id);
        });
    });
}

void sweep(asio::io_context& io, std::chrono::milliseconds dialTimeout, const ScanTarget& target,
           const std::shared_ptr<ScanState>& state) {
    auto addresses = target.subnet.hosts(target.ownAddress);
    spdlog::debug("Discovery: sweeping {} ({} addresses)", target.subnet.toString(),
                  addresses.size());

    for (const auto& ip : addresses) {
        if (!state->acquireSlot()) {
            break;
        }

        auto budget = state->token.remaining(dialTimeout);
        if (budget <= std::chrono::milliseconds(0)) {
            state->slots.release();
            break;
        }
        startDial(io, ip, budget, state);
    }
}

} // namespace

DiscoveryScanner::DiscoveryScanner(AsioContext& context, DiscoveryScannerConfig config,
                                   InterfaceSource interfaces)
    : context_(context), config_(config), interfaces_(std::move(interfaces)) {}

std::vector<ScanTarget> DiscoveryScanner::planTargets(
    const std::string& overrideAddress, const std::vector<core::NetworkInterface>& interfaces) {
    std::vector<ScanTarget> targets;

    if (!overrideAddress.empty()) {
        if (!core::isValidIpv4(overrideAddress)) {
            throw core::InvalidAddressError(overrideAddress);
        }
        targets.push_back({core::Subnet::containing(overrideAddress, 24), overrideAddress});
        return targets;
    }

    for (const auto& iface : interfaces) {
        if (!core::isValidIpv4(iface.ipAddress) || iface.prefixLength <= 0) {
            continue;
        }
        auto subnet = core::Subnet::scanRange(iface.ipAddress, iface.prefixLength);
        bool known = std::any_of(targets.begin(), targets.end(),
                                 [&subnet](const ScanTarget& t) { return t.subnet == subnet; });
        if (!known) {
            targets.push_back({subnet, iface.ipAddress});
        }
    }
    return targets;
}

std::shared_ptr<core::CandidateStream> DiscoveryScanner::scan(uint16_t port,
                                                              const std::string& overrideAddress,
                                                              const core::CancellationToken& token) {
    auto targets = planTargets(overrideAddress,
                               overrideAddress.empty() ? interfaces_()
                                                       : std::vector<core::NetworkInterface>{});
    auto state = std::make_shared<ScanState>(config_.maxConcurrency, token, port);
    auto stream = state->stream;

    if (targets.empty()) {
        spdlog::warn("Discovery: no scannable interfaces");
        stream->close();
        return stream;
    }

    for (const auto& target : targets) {
        spdlog::info("Discovery: scanning {} on port {}", target.subnet.toString(), port);
    }

    auto& io = context_.getContext();
    auto dialTimeout = config_.dialTimeout;

    std::thread([&io, dialTimeout, targets, state]() {
        auto callbackId = state->token.onCancel([weak = std::weak_ptr<ScanState>(state)]() {
            if (auto s = weak.lock()) {
                s->abortAll();
            }
        });

        std::vector<std::thread> drivers;
        drivers.reserve(targets.size());
        for (const auto& target : targets) {
            drivers.emplace_back([&io, dialTimeout, target, state]() {
                try {
                    sweep(io, dialTimeout, target, state);
                } catch (const std::exception& e) {
                    spdlog::error("Discovery: sweep of {} failed: {}", target.subnet.toString(),
                                  e.what());
                }
            });
        }
        for (auto& driver : drivers) {
            driver.join();
        }

        // Every dial is bounded by dialTimeout; the margin covers handler scheduling
        if (!state->waitDrained(dialTimeout * 2 + std::chrono::seconds(1))) {
            spdlog::warn("Discovery: dials still in flight at close");
        }
        state->token.removeCallback(callbackId);
        state->stream->close();

        spdlog::info("Discovery finished: {} dials, {} peers found{}", state->dialed.load(),
                     state->found.load(), state->token.isCancelled() ? " (budget reached)" : "");
    }).detach();

    return stream;
}

} // namespace signfleet::infra
