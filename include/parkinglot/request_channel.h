#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "parkinglot/error.h"
#include "parkinglot/gateway.h"

namespace parkinglot {

// What a caller on the other side of the channel gets back: a result, or the
// error code and message of the ParkingError that ended the request.
template <typename Result>
struct Response {
  std::optional<Result> result;
  std::optional<ErrorCode> error;
  std::string message;

  bool ok() const { return result.has_value(); }
};

using EntryResponse = Response<AllocationResult>;
using ExitResponse = Response<ExitResult>;

/*
 Optional queued delivery in front of the Gateway: a fixed pool of workers
 takes requests in arrival order. It adds no consistency of its own; that
 still comes from the registry and the ledger.
*/
class RequestChannel {
public:
  RequestChannel(Gateway& gateway, int workers);
  ~RequestChannel();

  RequestChannel(const RequestChannel&) = delete;
  RequestChannel& operator=(const RequestChannel&) = delete;

  // Throw ParkingError(ChannelClosed) after shutdown().
  std::future<EntryResponse> submit(EntryRequest request);
  std::future<ExitResponse> submit(ExitRequest request);

  // Runs everything already queued, then joins the workers. Idempotent.
  void shutdown();

  std::size_t pending() const;

private:
  void enqueue(std::function<void()> task);
  void workerLoop();

  Gateway& gateway_;
  std::deque<std::function<void()>> queue_;
  std::vector<std::thread> workers_;
  bool stopping_ = false;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace parkinglot
