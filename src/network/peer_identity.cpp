// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_identity.hpp"

#include "util/logging.hpp"

namespace meshwire {
namespace network {

Address PeerIdentityTable::Resolve(const Address& transport_peer, uint16_t advertised_port) {
  Address advertised(transport_peer.host, advertised_port);
  AddMapping(transport_peer, advertised);
  return advertised;
}

void PeerIdentityTable::AddMapping(const Address& ephemeral, const Address& advertised) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto existing = by_advertised_.find(advertised);
  if (existing != by_advertised_.end()) {
    if (existing->second.ephemeral == ephemeral) {
      return;
    }
    LOG_NET_DEBUG("peer {} moved from {} to {}", advertised.ToString(), existing->second.ephemeral.ToString(),
                  ephemeral.ToString());
    EraseLocked(existing->second);
  }

  // The ephemeral endpoint may have been reused by another logical peer
  auto stale = advertised_by_ephemeral_.find(ephemeral);
  if (stale != advertised_by_ephemeral_.end()) {
    auto old = by_advertised_.find(stale->second);
    if (old != by_advertised_.end()) {
      EraseLocked(old->second);
    } else {
      advertised_by_ephemeral_.erase(stale);
    }
  }

  PeerNyms nyms{ephemeral, advertised};
  by_advertised_[advertised] = nyms;
  advertised_by_ephemeral_[ephemeral] = advertised;
  LOG_NET_TRACE("{} is {}", ephemeral.ToString(), advertised.ToString());
}

std::optional<PeerNyms> PeerIdentityTable::LookupLocked(const Address& either) const {
  auto by_adv = by_advertised_.find(either);
  if (by_adv != by_advertised_.end()) {
    return by_adv->second;
  }
  auto by_eph = advertised_by_ephemeral_.find(either);
  if (by_eph != advertised_by_ephemeral_.end()) {
    auto it = by_advertised_.find(by_eph->second);
    if (it != by_advertised_.end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

void PeerIdentityTable::EraseLocked(const PeerNyms& nyms) {
  // Copy first: nyms may reference an element of by_advertised_
  const PeerNyms copy = nyms;
  advertised_by_ephemeral_.erase(copy.ephemeral);
  by_advertised_.erase(copy.advertised);
}

std::optional<PeerNyms> PeerIdentityTable::Lookup(const Address& either) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return LookupLocked(either);
}

std::optional<Address> PeerIdentityTable::AdvertisedFor(const Address& either) const {
  auto nyms = Lookup(either);
  if (!nyms)
    return std::nullopt;
  return nyms->advertised;
}

std::optional<Address> PeerIdentityTable::EphemeralFor(const Address& either) const {
  auto nyms = Lookup(either);
  if (!nyms)
    return std::nullopt;
  return nyms->ephemeral;
}

bool PeerIdentityTable::Remove(const Address& either) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto nyms = LookupLocked(either);
  if (!nyms) {
    return false;
  }
  EraseLocked(*nyms);
  return true;
}

bool PeerIdentityTable::RemoveEphemeral(const Address& ephemeral) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = advertised_by_ephemeral_.find(ephemeral);
  if (it == advertised_by_ephemeral_.end()) {
    return false;
  }
  auto nyms = by_advertised_.find(it->second);
  if (nyms != by_advertised_.end() && nyms->second.ephemeral == ephemeral) {
    by_advertised_.erase(nyms);
  }
  advertised_by_ephemeral_.erase(it);
  return true;
}

size_t PeerIdentityTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return by_advertised_.size();
}

std::vector<PeerNyms> PeerIdentityTable::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerNyms> out;
  out.reserve(by_advertised_.size());
  for (const auto& [advertised, nyms] : by_advertised_) {
    out.push_back(nyms);
  }
  return out;
}

}  // namespace network
}  // namespace meshwire
