// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/address.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace meshwire {
namespace network {

// The two names ("nyms") a remote peer is known by
struct PeerNyms {
  Address ephemeral;   // transport source endpoint (host:source-port)
  Address advertised;  // logical endpoint (host:listening-port)

  bool operator==(const PeerNyms& other) const = default;
};

/**
 * PeerIdentityTable - ephemeral <-> advertised address remapping
 *
 * A peer reaches us from an ephemeral source port but listens on the port it
 * advertises in package metadata. Everything above the transport (dispatcher,
 * handlers, sendAndReceive callers) sees the advertised Address; transports use
 * the table to find an existing connection under either name.
 *
 * One mapping per advertised address: a reconnect from a new source port
 * replaces the stale ephemeral nym.
 *
 * Thread-safety: all methods are thread-safe.
 */
class PeerIdentityTable {
public:
  // Map a transport-level peer plus its advertised port to the logical Address,
  // recording the pair.
  Address Resolve(const Address& transport_peer, uint16_t advertised_port);

  // Record an (ephemeral, advertised) pair explicitly
  void AddMapping(const Address& ephemeral, const Address& advertised);

  // Lookup by either nym
  std::optional<PeerNyms> Lookup(const Address& either) const;
  std::optional<Address> AdvertisedFor(const Address& either) const;
  std::optional<Address> EphemeralFor(const Address& either) const;

  // Forget a mapping by either nym (e.g. its connection closed). Returns true if found.
  bool Remove(const Address& either);

  // Forget the mapping whose ephemeral nym is `ephemeral`. A mapping that has
  // since moved to another ephemeral address is kept. Returns true if removed.
  bool RemoveEphemeral(const Address& ephemeral);

  size_t size() const;
  std::vector<PeerNyms> Snapshot() const;

private:
  std::optional<PeerNyms> LookupLocked(const Address& either) const;
  void EraseLocked(const PeerNyms& nyms);

  mutable std::mutex mutex_;
  std::unordered_map<Address, PeerNyms> by_advertised_;
  std::unordered_map<Address, Address> advertised_by_ephemeral_;
};

}  // namespace network
}  // namespace meshwire
