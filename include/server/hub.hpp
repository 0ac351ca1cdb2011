#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace hookhub {

using ConnectionId = std::uint64_t;
using Frame = std::shared_ptr<const std::string>;

// Outbound side of one authenticated tunnel. Deliver() must only enqueue:
// it runs under the Hub lock and must neither block nor call back into the
// Hub.
class IClientSink {
public:
  virtual ~IClientSink() = default;
  virtual void Deliver(Frame frame) = 0;
};

// Registry of authenticated tunnel sessions. Owned by RelayServer and passed
// by reference to every session.
class Hub {
public:
  Hub() = default;
  Hub(const Hub &) = delete;
  Hub &operator=(const Hub &) = delete;

  ConnectionId Register(std::shared_ptr<IClientSink> sink);

  // Idempotent. Returns true when a member was actually removed.
  bool Unregister(ConnectionId id);

  // Hands the frame to every current member and returns how many there were.
  // Fan-out happens under the lock, so each member observes frames in the
  // order they were broadcast.
  std::size_t Broadcast(Frame frame);

  std::size_t Size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<ConnectionId, std::shared_ptr<IClientSink>> members_;
  ConnectionId next_id_{1};
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

} // namespace hookhub
