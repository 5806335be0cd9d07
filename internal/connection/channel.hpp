#pragma once

#include <memory>

#include "internal/model/interest.hpp"

namespace discovery::connection {

enum class ChannelState {
  kIdle,
  kConnected,
  kClosed,
};

/*
  Subscription session bound to one remote registry endpoint.

  Not reusable: once Closed, a new channel must be requested from the
  factory.
*/
class InterestChannel {
 public:
  virtual ~InterestChannel() = default;

  // Returns once the remote accepted the interest. Throws ConnectionClosed
  // after Close(), or the transport failure.
  virtual void ChangeInterest(const discovery::model::Interest& interest) = 0;

  // Blocks until the channel terminates. Returns on orderly close, throws
  // when the session failed.
  virtual void AwaitTermination() = 0;

  virtual void Close() = 0;

  virtual ChannelState State() const = 0;
};

template <typename ChannelT>
class ChannelFactory {
 public:
  virtual ~ChannelFactory() = default;

  virtual std::shared_ptr<ChannelT> NewChannel() = 0;
};

using InterestChannelFactory = ChannelFactory<InterestChannel>;

} // namespace discovery::connection
