#include "fleet/FleetSyncCoordinator.hpp"

#include "core/Version.hpp"
#include "core/types/Errors.hpp"
#include "core/types/Uuid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <optional>
#include <stdexcept>

namespace signfleet::fleet {

namespace {

constexpr const char* Loopback = "127.0.0.1";
constexpr const char* PlaceholderNickname = "Discovered Host";

/**
 * @brief Cancels a child token when the parent fires, for the lifetime of the scope.
 */
class ScopedLink {
public:
    ScopedLink(core::CancellationToken parent, core::CancellationToken child)
        : parent_(std::move(parent)),
          id_(parent_.onCancel([child]() mutable { child.cancel(); })) {}

    ~ScopedLink() { parent_.removeCallback(id_); }

    ScopedLink(const ScopedLink&) = delete;
    ScopedLink& operator=(const ScopedLink&) = delete;

private:
    core::CancellationToken parent_;
    core::CancellationToken::CallbackId id_;
};

std::string dashboardUrl(const std::string& ip, uint16_t port) {
    return "http://" + ip + ":" + std::to_string(port);
}

// Local probing is authoritative; never trust another node's view of a peer's health
void resetNetworkState(core::NetworkState& state) {
    state.status = core::HostStatus::Unreachable;
    state.cmsStatus = core::CmsStatus::Unknown;
    state.serviceStatus = "NSM Offline";
    state.assetCount = 0;
}

} // namespace

FleetSyncCoordinator::FleetSyncCoordinator(infra::HostStore& store, core::IHealthProber& prober,
                                           core::IDiscoveryScanner& scanner,
                                           core::IPeerClient& peers, infra::LocalNode& localNode,
                                           infra::AsioContext& workers, FleetSyncConfig config)
    : store_(store), prober_(prober), scanner_(scanner), peers_(peers), localNode_(localNode),
      workers_(workers), config_(config) {}

FleetSyncCoordinator::~FleetSyncCoordinator() {
    shutdown();
    if (workers_.isRunning() && !waitIdle(std::chrono::seconds(30))) {
        spdlog::warn("Fleet tasks still running at shutdown");
    }
}

template <typename Task>
void FleetSyncCoordinator::spawn(const std::string& name, Task&& task) {
    {
        std::lock_guard lock(tasksMutex_);
        ++runningTasks_;
    }

    workers_.spawn(name, [this, task = std::forward<Task>(task)]() mutable {
        struct Finished {
            FleetSyncCoordinator* self;
            ~Finished() { self->taskFinished(); }
        } finished{this};
        task();
    });
}

void FleetSyncCoordinator::taskFinished() {
    // The destructor may destroy tasksIdle_ as soon as it observes zero; notify under the lock
    std::lock_guard lock(tasksMutex_);
    --runningTasks_;
    tasksIdle_.notify_all();
}

bool FleetSyncCoordinator::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(tasksMutex_);
    return tasksIdle_.wait_for(lock, timeout, [this]() { return runningTasks_ == 0; });
}

void FleetSyncCoordinator::shutdown() {
    shutdown_.cancel();
}

// Gossip

std::vector<std::string> FleetSyncCoordinator::pushTargets(
    const std::vector<std::string>& explicitTargets) const {
    std::vector<std::string> targets;
    auto addUnique = [&targets](const std::string& ip) {
        if (std::find(targets.begin(), targets.end(), ip) == targets.end()) {
            targets.push_back(ip);
        }
    };

    if (!explicitTargets.empty()) {
        for (const auto& ip : explicitTargets) {
            if (!core::isValidIpv4(ip)) {
                throw core::InvalidAddressError(ip);
            }
            addUnique(ip);
        }
        return targets;
    }

    auto own = localNode_.address();
    for (const auto& host : store_.getAll()) {
        if (host.ipAddress.empty() || host.ipAddress == Loopback || host.ipAddress == own) {
            continue;
        }
        addUnique(host.ipAddress);
    }
    return targets;
}

void FleetSyncCoordinator::pushRoster(const std::vector<std::string>& targets) {
    auto resolved = pushTargets(targets);
    spawn("push", [this, resolved]() {
        if (!resolved.empty()) {
            pushRosterNow(resolved, shutdown_);
        }
    });
}

PushReport FleetSyncCoordinator::pushRosterNow(const std::vector<std::string>& targets,
                                               const core::CancellationToken& token) {
    PushReport report;
    auto resolved = pushTargets(targets);
    if (resolved.empty()) {
        spdlog::info("Push: no peers to push to");
        return report;
    }

    auto roster = store_.getAll();
    spdlog::info("Pushing {} hosts to {} peers", roster.size(), resolved.size());

    std::vector<std::future<void>> deliveries;
    deliveries.reserve(resolved.size());
    for (const auto& target : resolved) {
        deliveries.push_back(std::async(std::launch::async, [this, &roster, &token, target]() {
            peers_.pushRoster(target, roster, false, token);
        }));
    }

    for (size_t i = 0; i < deliveries.size(); ++i) {
        try {
            deliveries[i].get();
            report.delivered.push_back(resolved[i]);
            spdlog::info("Pushed roster to {}", resolved[i]);
        } catch (const std::exception& e) {
            report.failed.push_back(resolved[i]);
            spdlog::warn("Push to {} failed: {}", resolved[i], e.what());
        }
    }
    return report;
}

size_t FleetSyncCoordinator::receiveRoster(const std::vector<core::Host>& hosts, bool merge) {
    if (merge) {
        size_t applied = 0;
        for (const auto& host : hosts) {
            try {
                store_.upsert(host);
                ++applied;
            } catch (const std::exception& e) {
                spdlog::warn("Skipping received host {} ({}): {}", host.ipAddress, host.id,
                             e.what());
            }
        }
        spdlog::info("Merged {} of {} received hosts", applied, hosts.size());
        return applied;
    }

    auto backup = store_.backupCurrent(config_.maxBackups);
    store_.replaceAll(hosts);
    if (backup.empty()) {
        spdlog::info("Received roster of {} hosts", hosts.size());
    } else {
        spdlog::info("Received roster of {} hosts; previous roster saved to {}", hosts.size(),
                     backup.string());
    }
    return hosts.size();
}

void FleetSyncCoordinator::announce(const core::Host& host) {
    if (host.id.empty()) {
        throw std::invalid_argument("host id is required");
    }
    if (!core::isValidIpv4(host.ipAddress)) {
        throw core::InvalidAddressError(host.ipAddress);
    }
    store_.upsert(host);
    spdlog::info("Host announced: {} ({})", host.ipAddress, host.id);
}

// Discovery

void FleetSyncCoordinator::startDiscovery(const std::string& overrideAddress) {
    if (!overrideAddress.empty() && !core::isValidIpv4(overrideAddress)) {
        throw core::InvalidAddressError(overrideAddress);
    }

    spawn("discovery", [this, overrideAddress]() {
        auto token = core::CancellationToken::withTimeout(config_.discoveryBudget);
        ScopedLink link(shutdown_, token);
        runDiscovery(overrideAddress, token);
    });
}

DiscoveryReport FleetSyncCoordinator::runDiscovery(const std::string& overrideAddress,
                                                   const core::CancellationToken& token) {
    DiscoveryReport report;
    spdlog::info("Discovery pass started{}",
                 overrideAddress.empty() ? "" : " around " + overrideAddress);

    auto candidates = scanner_.scan(config_.managementPort, overrideAddress, token);

    // Resolution uses the coordinator's token: results already found stay valid past the scan budget
    while (auto candidate = candidates->next()) {
        ++report.candidates;
        try {
            switch (resolveCandidate(*candidate, shutdown_)) {
            case Resolution::SelfDescribed:
                ++report.selfDescribed;
                break;
            case Resolution::Migrated:
                ++report.migrated;
                break;
            case Resolution::Known:
                ++report.known;
                break;
            case Resolution::Created:
                ++report.created;
                break;
            case Resolution::Skipped:
                break;
            }
        } catch (const std::exception& e) {
            ++report.failed;
            spdlog::warn("Could not resolve discovered peer {}: {}", candidate->ip, e.what());
        }
    }

    try {
        auto local = store_.getById(localNode_.id());
        probeNow(local.ipAddress, shutdown_);
    } catch (const core::NotFoundError&) {
        spdlog::debug("Local node not in roster; skipping post-discovery probe");
    }

    spdlog::info("Discovery pass complete: {} candidates, {} self-described, {} migrated, "
                 "{} created, {} already known, {} failed",
                 report.candidates, report.selfDescribed, report.migrated, report.created,
                 report.known, report.failed);
    return report;
}

Resolution FleetSyncCoordinator::resolveCandidate(const core::DiscoveryCandidate& candidate,
                                                  const core::CancellationToken& token) {
    const auto& ip = candidate.ip;
    if (ip == localNode_.address()) {
        return Resolution::Skipped;
    }

    Resolution resolution;
    try {
        auto remote = peers_.fetchSelfDescription(ip, token);
        if (remote.id == localNode_.id()) {
            return Resolution::Skipped;
        }

        remote.ipAddress = ip;
        resetNetworkState(remote.primary);
        remote.primary.dashboardUrl = dashboardUrl(ip, config_.managementPort);
        if (remote.id.empty()) {
            remote.id = core::generateUuid();
        }

        store_.upsert(remote);
        resolution = Resolution::SelfDescribed;
        spdlog::info("Discovered {} ({}) at {}", remote.hostname, remote.id, ip);

        spawn("announce to " + ip, [this, ip]() {
            try {
                peers_.pushRoster(ip, {localDescription()}, true, shutdown_);
                spdlog::debug("Announced local node to {}", ip);
            } catch (const core::PeerUnreachableError& e) {
                spdlog::warn("Mutual announce to {} failed: {}", ip, e.what());
            }
        });
    } catch (const core::PeerUnreachableError& e) {
        spdlog::debug("No self-description from {}: {}", ip, e.what());

        std::string remoteId;
        try {
            remoteId = peers_.fetchIdentity(ip, token).id;
        } catch (const core::PeerUnreachableError& identityError) {
            spdlog::debug("No identity from {}: {}", ip, identityError.what());
        }
        if (!remoteId.empty() && remoteId == localNode_.id()) {
            return Resolution::Skipped;
        }

        std::optional<core::Host> existing;
        if (!remoteId.empty()) {
            try {
                existing = store_.getById(remoteId);
            } catch (const core::NotFoundError&) {
                spdlog::debug("Peer {} reports unknown id {}", ip, remoteId);
            }
        }

        if (existing) {
            if (existing->ipAddress != ip) {
                spdlog::info("Host {} moved from {} to {}", remoteId, existing->ipAddress, ip);
            }
            existing->ipAddress = ip;
            existing->primary.dashboardUrl = dashboardUrl(ip, config_.managementPort);
            existing->primary.status = core::HostStatus::Unreachable;
            store_.upsert(*existing);
            resolution = Resolution::Migrated;
        } else {
            bool occupied = true;
            try {
                store_.getByIp(ip);
            } catch (const core::NotFoundError&) {
                occupied = false;
            }
            if (occupied) {
                return Resolution::Known;
            }

            auto placeholder = core::Host::withDefaults(ip, config_.managementPort);
            placeholder.nickname = PlaceholderNickname;
            placeholder.id = remoteId.empty() ? core::generateUuid() : remoteId;
            store_.upsert(placeholder);
            resolution = Resolution::Created;
            spdlog::info("Added placeholder for discovered host {}", ip);
        }
    }

    spawn("probe " + ip, [this, ip]() {
        try {
            probeNow(ip, shutdown_);
        } catch (const core::NotFoundError& e) {
            spdlog::debug("Probe of {} skipped: {}", ip, e.what());
        }
    });
    return resolution;
}

// Probing

void FleetSyncCoordinator::startProbeAll() {
    spawn("probe sweep", [this]() { probeAllNow(shutdown_); });
}

size_t FleetSyncCoordinator::probeAllNow(const core::CancellationToken& token) {
    auto hosts = store_.getAll();
    auto parallelism = std::max<size_t>(config_.probeParallelism, 1);

    for (size_t start = 0; start < hosts.size(); start += parallelism) {
        auto end = std::min(start + parallelism, hosts.size());

        std::vector<std::future<core::Host>> batch;
        batch.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            batch.push_back(std::async(std::launch::async, [this, &token, host = hosts[i]]() {
                return prober_.probe(host, token);
            }));
        }

        for (size_t i = start; i < end; ++i) {
            try {
                hosts[i] = batch[i - start].get();
            } catch (const std::exception& e) {
                spdlog::warn("Probe of {} failed: {}", hosts[i].ipAddress, e.what());
            }
        }
    }

    // TODO: records added or edited while the sweep ran are overwritten here; apply per-record updates instead
    store_.replaceAll(hosts);
    spdlog::info("Probe sweep complete: {} hosts", hosts.size());
    return hosts.size();
}

void FleetSyncCoordinator::startProbe(const std::string& ip) {
    store_.getByIp(ip);
    spawn("probe " + ip, [this, ip]() { probeNow(ip, shutdown_); });
}

core::Host FleetSyncCoordinator::probeNow(const std::string& ip,
                                          const core::CancellationToken& token) {
    auto probed = prober_.probe(store_.getByIp(ip), token);

    core::Host updated;
    store_.update(ip, [&probed, &updated](core::Host& current) {
        current.copyNetworkState(probed);
        updated = current;
    });
    spdlog::debug("Probed {}: {}", ip, core::hostStatusToString(updated.primary.status));
    return updated;
}

// Local node

core::Host FleetSyncCoordinator::localDescription() const {
    try {
        return store_.getById(localNode_.id());
    } catch (const core::NotFoundError&) {
        return localNode_.describe();
    }
}

void FleetSyncCoordinator::registerLocalHost() {
    auto self = localNode_.describe();

    try {
        auto stored = store_.getById(self.id);
        if (!stored.nickname.empty()) {
            self.nickname = stored.nickname;
        }
        self.notes = stored.notes;
        self.vpnIpAddress = stored.vpnIpAddress;
        self.copyNetworkState(stored);
        self.primary.serviceVersion = core::Version;
        if (stored.ipAddress != self.ipAddress) {
            self.primary.dashboardUrl = dashboardUrl(self.ipAddress, config_.managementPort);
            spdlog::info("Local address changed from {} to {}", stored.ipAddress,
                         self.ipAddress);
        }
        if (stored == self) {
            return;
        }
    } catch (const core::NotFoundError&) {
        spdlog::info("Registering local node {} at {}", self.id, self.ipAddress);
    }

    store_.upsert(self);
}

} // namespace signfleet::fleet
