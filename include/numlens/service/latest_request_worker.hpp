#ifndef NUMLENS_SERVICE_LATEST_REQUEST_WORKER_HPP
#define NUMLENS_SERVICE_LATEST_REQUEST_WORKER_HPP

// Single background thread that only ever applies the newest request.
//
// submit() stamps each request with a monotonically increasing sequence
// number and replaces whatever has not started yet. The worker waits out
// a debounce window after the newest submission, computes, and delivers
// the result only if no newer request (or cancelPending) has arrived in
// the meantime. A superseded computation is never interrupted; its result
// is dropped on arrival.
//
// A compute that throws std::exception is reported through Fail (when
// still current) and the worker keeps serving requests.
//
// Deliver, Drop and Fail callbacks run on the worker thread.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <exception>
#include <string>
#include <thread>
#include <utility>

namespace numlens {

struct WorkerConfig {
  std::chrono::milliseconds Debounce{30};
};

struct WorkerStats {
  uint64_t Submitted = 0;
  uint64_t Coalesced = 0; // replaced before the worker picked them up
  uint64_t Applied = 0;
  uint64_t Dropped = 0;   // computed, then found stale
  uint64_t Failed = 0;    // current, but the compute threw
  uint64_t Skipped = 0;   // same key as the previous submission
};

struct RequestTiming {
  double DebounceMs = 0.0; // submit -> start of compute
  double ComputeMs = 0.0;
  double TotalMs = 0.0;    // submit -> delivery decision
};

template <typename Input, typename Output> class LatestRequestWorker {
public:
  using Clock = std::chrono::steady_clock;
  using ComputeFn = std::function<Output(const Input &)>;
  using DeliverFn =
      std::function<void(uint64_t Sequence, Output &&, const RequestTiming &)>;
  using DropFn = std::function<void(uint64_t Sequence, const RequestTiming &)>;
  using FailFn = std::function<void(uint64_t Sequence, const std::string &What,
                                    const RequestTiming &)>;

  LatestRequestWorker(ComputeFn Fn, DeliverFn OnDeliver,
                      DropFn OnDrop = nullptr, WorkerConfig Cfg = {},
                      FailFn OnFail = nullptr)
      : Compute(std::move(Fn)), Deliver(std::move(OnDeliver)),
        Drop(std::move(OnDrop)), Fail(std::move(OnFail)), Config(Cfg),
        Thread([this] { run(); }) {}

  LatestRequestWorker(const LatestRequestWorker &) = delete;
  LatestRequestWorker &operator=(const LatestRequestWorker &) = delete;

  ~LatestRequestWorker() {
    {
      std::lock_guard<std::mutex> Lock(Mtx);
      Stopping = true;
      Pending.reset();
    }
    WorkCv.notify_all();
    Thread.join();
  }

  uint64_t submit(Input Value) {
    uint64_t Seq;
    {
      std::lock_guard<std::mutex> Lock(Mtx);
      Seq = ++Latest;
      ++Stats.Submitted;
      if (Pending)
        ++Stats.Coalesced;
      Pending = Request{Seq, std::move(Value), Clock::now()};
      LastKey.reset();
    }
    WorkCv.notify_all();
    return Seq;
  }

  // submit() unless Key equals the key of the previous submission; an
  // unchanged request keeps its original sequence number, which is
  // returned. cancelPending() and plain submit() forget the key.
  uint64_t submitIfChanged(Input Value, std::string Key) {
    {
      std::lock_guard<std::mutex> Lock(Mtx);
      if (LastKey && *LastKey == Key) {
        ++Stats.Skipped;
        return Latest;
      }
    }
    uint64_t Seq = submit(std::move(Value));
    std::lock_guard<std::mutex> Lock(Mtx);
    if (Seq == Latest)
      LastKey = std::move(Key);
    return Seq;
  }

  // Invalid input: forget queued work and make any in-flight result stale.
  void cancelPending() {
    {
      std::lock_guard<std::mutex> Lock(Mtx);
      ++Latest;
      if (Pending)
        ++Stats.Coalesced;
      Pending.reset();
      LastKey.reset();
    }
    IdleCv.notify_all();
  }

  uint64_t latestSequence() const {
    std::lock_guard<std::mutex> Lock(Mtx);
    return Latest;
  }

  WorkerStats stats() const {
    std::lock_guard<std::mutex> Lock(Mtx);
    return Stats;
  }

  // Blocks until nothing is queued or running.
  void waitIdle() {
    std::unique_lock<std::mutex> Lock(Mtx);
    IdleCv.wait(Lock, [this] { return !Pending && !Busy; });
  }

private:
  struct Request {
    uint64_t Sequence;
    Input Value;
    Clock::time_point SubmittedAt;
  };

  static double msBetween(Clock::time_point A, Clock::time_point B) {
    return std::chrono::duration<double, std::milli>(B - A).count();
  }

  void run() {
    std::unique_lock<std::mutex> Lock(Mtx);
    while (true) {
      WorkCv.wait(Lock, [this] { return Stopping || Pending.has_value(); });
      if (Stopping)
        return;

      // Debounce: every new submission pushes the deadline out again.
      while (Pending && !Stopping) {
        Clock::time_point Deadline = Pending->SubmittedAt + Config.Debounce;
        if (Clock::now() >= Deadline)
          break;
        WorkCv.wait_until(Lock, Deadline);
      }
      if (Stopping)
        return;
      if (!Pending) {
        IdleCv.notify_all();
        continue;
      }

      Request Req = std::move(*Pending);
      Pending.reset();
      Busy = true;
      Lock.unlock();

      Clock::time_point Start = Clock::now();
      std::optional<Output> Result;
      std::string Error;
      try {
        Result.emplace(Compute(Req.Value));
      } catch (const std::exception &E) {
        Error = E.what();
      }
      Clock::time_point Done = Clock::now();

      RequestTiming Timing;
      Timing.DebounceMs = msBetween(Req.SubmittedAt, Start);
      Timing.ComputeMs = msBetween(Start, Done);
      Timing.TotalMs = msBetween(Req.SubmittedAt, Done);

      Lock.lock();
      bool Current = Req.Sequence == Latest;
      if (!Current)
        ++Stats.Dropped;
      else if (Result)
        ++Stats.Applied;
      else
        ++Stats.Failed;
      Lock.unlock();

      if (!Current) {
        if (Drop)
          Drop(Req.Sequence, Timing);
      } else if (Result) {
        Deliver(Req.Sequence, std::move(*Result), Timing);
      } else if (Fail) {
        Fail(Req.Sequence, Error, Timing);
      }

      Lock.lock();
      Busy = false;
      IdleCv.notify_all();
    }
  }

  ComputeFn Compute;
  DeliverFn Deliver;
  DropFn Drop;
  FailFn Fail;
  WorkerConfig Config;

  mutable std::mutex Mtx;
  std::condition_variable WorkCv;
  std::condition_variable IdleCv;
  std::optional<Request> Pending;
  uint64_t Latest = 0;
  std::optional<std::string> LastKey;
  bool Busy = false;
  bool Stopping = false;
  WorkerStats Stats;

  std::thread Thread; // last: starts after every member above is ready
};

} // namespace numlens

#endif // NUMLENS_SERVICE_LATEST_REQUEST_WORKER_HPP
