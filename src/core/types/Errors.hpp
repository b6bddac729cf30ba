/**
 * @file Errors.hpp
 * @brief Exception types raised by the roster store and fleet services.
 *
 * The HTTP layer maps each type to a distinct status code so callers can
 * tell "fix your input" from "retry" from "alert an operator".
 */

#pragma once

#include <stdexcept>
#include <string>

namespace signfleet::core {

/**
 * @brief A record (or other named resource) does not exist.
 */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief No backup exists, or the requested backup cannot be read.
 */
class BackupUnavailableError : public NotFoundError {
public:
    explicit BackupUnavailableError(const std::string& what) : NotFoundError(what) {}
};

/**
 * @brief A supplied address is not a valid IPv4 address.
 */
class InvalidAddressError : public std::runtime_error {
public:
    explicit InvalidAddressError(const std::string& address)
        : std::runtime_error("invalid IPv4 address: '" + address + "'"), address_(address) {}

    const std::string& address() const { return address_; }

private:
    std::string address_;
};

/**
 * @brief An added record collides with an existing address or id.
 */
class DuplicateHostError : public std::runtime_error {
public:
    explicit DuplicateHostError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief An uploaded snapshot is not a readable roster database.
 */
class InvalidSnapshotError : public std::runtime_error {
public:
    explicit InvalidSnapshotError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Persisting a change to the backing file failed.
 */
class StoreIoError : public std::runtime_error {
public:
    explicit StoreIoError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief The backing file failed its integrity probe.
 *
 * Only raised while opening a store; HostStore recovers from it.
 */
class StoreCorruptError : public std::runtime_error {
public:
    explicit StoreCorruptError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A remote peer could not be reached or answered with an error.
 */
class PeerUnreachableError : public std::runtime_error {
public:
    PeerUnreachableError(const std::string& peer, const std::string& reason)
        : std::runtime_error("peer " + peer + " unreachable: " + reason), peer_(peer) {}

    const std::string& peer() const { return peer_; }

private:
    std::string peer_;
};

} // namespace signfleet::core
