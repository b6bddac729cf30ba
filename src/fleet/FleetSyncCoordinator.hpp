/**
 * @file FleetSyncCoordinator.hpp
 * @brief Gossip push/receive, discovery resolution and probe sweeps.
 */

#pragma once

#include "core/concurrency/CancellationToken.hpp"
#include "core/services/IDiscoveryScanner.hpp"
#include "core/services/IHealthProber.hpp"
#include "core/services/IPeerClient.hpp"
#include "infrastructure/database/HostStore.hpp"
#include "infrastructure/identity/LocalNode.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace signfleet::fleet {

/**
 * @brief Tunables of the coordinator.
 */
struct FleetSyncConfig {
    uint16_t managementPort{8080};                         ///< Port peers serve the API on.
    int maxBackups{infra::HostStore::DefaultMaxBackups};  ///< Retention for replace-mode receives.
    std::chrono::seconds discoveryBudget{30};              ///< Wall-clock limit of one scan.
    size_t probeParallelism{16};                           ///< Concurrent probes in a sweep.
};

/**
 * @brief Outcome of an outbound push.
 */
struct PushReport {
    std::vector<std::string> delivered; ///< Targets that accepted the roster.
    std::vector<std::string> failed;    ///< Targets that could not be reached.
};

/**
 * @brief How a discovered address was folded into the roster.
 */
enum class Resolution {
    SelfDescribed, ///< Peer sent its own record; it was upserted.
    Migrated,      ///< Known id found at a new address; address updated.
    Known,         ///< Address already in the roster; left as is.
    Created,       ///< Placeholder record created.
    Skipped        ///< The address is this node.
};

/**
 * @brief Summary of one discovery pass.
 */
struct DiscoveryReport {
    int candidates{0};
    int selfDescribed{0};
    int migrated{0};
    int known{0};
    int created{0};
    int failed{0};
};

/**
 * @brief Orchestrates roster synchronization between peers.
 *
 * Synchronous operations (the *Now variants, receiveRoster, announce,
 * registerLocalHost) run on the caller's thread. The start* and pushRoster
 * variants run as detached tasks on the worker pool and return at once;
 * their failures are logged, never propagated.
 *
 * @note This class is non-copyable. All collaborators must outlive it.
 */
class FleetSyncCoordinator {
public:
    FleetSyncCoordinator(infra::HostStore& store, core::IHealthProber& prober,
                         core::IDiscoveryScanner& scanner, core::IPeerClient& peers,
                         infra::LocalNode& localNode, infra::AsioContext& workers,
                         FleetSyncConfig config = {});

    /**
     * @brief Cancels outstanding work and waits for detached tasks to finish.
     */
    ~FleetSyncCoordinator();

    FleetSyncCoordinator(const FleetSyncCoordinator&) = delete;
    FleetSyncCoordinator& operator=(const FleetSyncCoordinator&) = delete;

    // --- Gossip ---

    /**
     * @brief Pushes the roster in the background.
     * @param targets Addresses to push to; empty means every eligible roster member.
     * @throws core::InvalidAddressError for a malformed explicit target.
     */
    void pushRoster(const std::vector<std::string>& targets);

    /**
     * @brief Pushes the roster to each target concurrently, in replace mode.
     *
     * A failing target is logged and reported; the others are unaffected.
     */
    PushReport pushRosterNow(const std::vector<std::string>& targets,
                             const core::CancellationToken& token);

    /**
     * @brief Resolves the addresses a push goes to.
     *
     * Explicit targets are validated and de-duplicated. The default set is
     * every roster address except empty ones, 127.0.0.1 and this node's own.
     */
    std::vector<std::string> pushTargets(const std::vector<std::string>& explicitTargets) const;

    /**
     * @brief Applies a roster received from a peer.
     *
     * Merge mode upserts each record and skips (and logs) records that fail.
     * Replace mode backs up the live roster, then replaces it atomically.
     *
     * @return Number of records applied.
     * @throws core::StoreIoError if the backup or the replacement fails.
     */
    size_t receiveRoster(const std::vector<core::Host>& hosts, bool merge);

    /**
     * @brief Upserts a single record a peer announced.
     * @throws std::invalid_argument if the id is empty.
     * @throws core::InvalidAddressError if the address is invalid.
     */
    void announce(const core::Host& host);

    // --- Discovery ---

    /**
     * @brief Starts a discovery pass in the background.
     * @param overrideAddress Scan only the /24 around this address when set.
     * @throws core::InvalidAddressError for a malformed override.
     */
    void startDiscovery(const std::string& overrideAddress);

    /**
     * @brief Runs one discovery pass on the calling thread.
     *
     * Consumes scanner results as they arrive, resolves each, then re-probes
     * this node's own record.
     */
    DiscoveryReport runDiscovery(const std::string& overrideAddress,
                                 const core::CancellationToken& token);

    /**
     * @brief Folds one discovered address into the roster.
     *
     * Identifier first, then address: the peer's own record (or its id
     * from the identification fallback) selects the target record, and
     * upsert evicts whatever else occupies the address. Records created or
     * moved get a background probe.
     *
     * @throws core::StoreIoError if the roster cannot be written.
     */
    Resolution resolveCandidate(const core::DiscoveryCandidate& candidate,
                                const core::CancellationToken& token);

    // --- Probing ---

    void startProbeAll();

    /**
     * @brief Probes every record and writes the results back with replaceAll.
     * @return Number of records probed.
     */
    size_t probeAllNow(const core::CancellationToken& token);

    /**
     * @brief Probes one record in the background.
     * @throws core::NotFoundError if no record has that address.
     */
    void startProbe(const std::string& ip);

    /**
     * @brief Probes one record and stores its new network state.
     * @return The updated record.
     * @throws core::NotFoundError if the record disappeared.
     */
    core::Host probeNow(const std::string& ip, const core::CancellationToken& token);

    // --- Local node ---

    /**
     * @brief Upserts this node's own record.
     *
     * Descriptive fields and network state an operator or probe stored
     * for this node are kept; identity, host name and address are refreshed.
     */
    void registerLocalHost();

    /**
     * @brief Returns this node's record as peers should see it.
     */
    core::Host localDescription() const;

    // --- Lifecycle ---

    /**
     * @brief Cancels running passes and pushes.
     */
    void shutdown();

    /**
     * @brief Waits until no detached task is running.
     * @return False on timeout.
     */
    bool waitIdle(std::chrono::milliseconds timeout);

private:
    template <typename Task>
    void spawn(const std::string& name, Task&& task);

    void taskFinished();

    infra::HostStore& store_;
    core::IHealthProber& prober_;
    core::IDiscoveryScanner& scanner_;
    core::IPeerClient& peers_;
    infra::LocalNode& localNode_;
    infra::AsioContext& workers_;
    FleetSyncConfig config_;

    core::CancellationToken shutdown_;
    std::mutex tasksMutex_;
    std::condition_variable tasksIdle_;
    int runningTasks_{0};
};

} // namespace signfleet::fleet
