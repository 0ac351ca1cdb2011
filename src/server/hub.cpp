#include "server/hub.hpp"

#include "util/my_logging.hpp"

namespace hookhub {

ConnectionId Hub::Register(std::shared_ptr<IClientSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  const ConnectionId id = next_id_++;
  members_.emplace(id, std::move(sink));
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Hub registered connection " << id << " (members=" << members_.size()
      << ")";
  return id;
}

bool Hub::Unregister(ConnectionId id) {
  // Released outside the lock so a session destructor never runs under it.
  std::shared_ptr<IClientSink> removed;
  std::size_t remaining = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(id);
    if (it == members_.end()) {
      return false;
    }
    removed = std::move(it->second);
    members_.erase(it);
    remaining = members_.size();
  }
  BOOST_LOG_SEV(lg_, trivial::debug) << "Hub unregistered connection " << id
                                     << " (members=" << remaining << ")";
  return true;
}

std::size_t Hub::Broadcast(Frame frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &kv : members_) {
    kv.second->Deliver(frame);
  }
  return members_.size();
}

std::size_t Hub::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return members_.size();
}

} // namespace hookhub
