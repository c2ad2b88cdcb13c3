#include "parkinglot/request_channel.h"

#include <memory>

#include "parkinglot/logging.h"

using namespace std;

namespace parkinglot {

namespace {

template <typename Result, typename Call>
Response<Result> respond(Call&& call) {
  Response<Result> r;
  try {
    r.result = call();
  } catch (const ParkingError& e) {
    r.error = e.code();
    r.message = e.what();
  }
  return r;
}

}  // namespace

RequestChannel::RequestChannel(Gateway& gateway, int workers) : gateway_(gateway) {
  if (workers < 1) {
    throw ParkingError(ErrorCode::InvalidConfiguration, "request channel needs a worker");
  }
  try {
    workers_.reserve(workers);
    for (int i = 0; i < workers; ++i) workers_.emplace_back([this] { workerLoop(); });
  } catch (...) {
    // joinable threads must not be destroyed
    shutdown();
    throw;
  }
  logger()->info("request channel started with {} worker(s)", workers);
}

RequestChannel::~RequestChannel() {
  shutdown();
}

future<EntryResponse> RequestChannel::submit(EntryRequest request) {
  auto task = make_shared<packaged_task<EntryResponse()>>(
    [this, request = std::move(request)] {
      return respond<AllocationResult>([&] { return gateway_.enter(request); });
    });
  auto fut = task->get_future();
  enqueue([task] { (*task)(); });
  return fut;
}

future<ExitResponse> RequestChannel::submit(ExitRequest request) {
  auto task = make_shared<packaged_task<ExitResponse()>>(
    [this, request = std::move(request)] {
      return respond<ExitResult>([&] { return gateway_.exit(request); });
    });
  auto fut = task->get_future();
  enqueue([task] { (*task)(); });
  return fut;
}

void RequestChannel::shutdown() {
  {
    lock_guard lock(mtx_);
    if (stopping_) return;
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& w : workers_) {
    if (w.joinable()) w.join();
  }
  logger()->info("request channel stopped");
}

size_t RequestChannel::pending() const {
  lock_guard lock(mtx_);
  return queue_.size();
}

void RequestChannel::enqueue(function<void()> task) {
  {
    lock_guard lock(mtx_);
    if (stopping_) throw ParkingError(ErrorCode::ChannelClosed, "request channel is shut down");
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void RequestChannel::workerLoop() {
  while (true) {
    function<void()> task;
    {
      unique_lock lock(mtx_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) return;  // stopping and drained
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    task();
  }
}

}  // namespace parkinglot
