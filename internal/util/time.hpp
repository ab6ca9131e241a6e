#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace vkyc::util {

/*
  Time utilities.

  Components read wall-clock time through a TimeSource so tests can drive
  expiry, grace periods and scheduling with a manual clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d);

int64_t   ToUnixMillis(TimePoint tp);
int64_t   ToUnixMicros(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);
TimePoint FromUnixMicros(int64_t us);

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemTimeSource final : public TimeSource {
 public:
  TimePoint Now() const override {
    return Clock::now();
  }
};

class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(TimePoint start = Clock::now()) : now_(start) {
  }

  TimePoint Now() const override {
    std::lock_guard lock(mutex_);
    return now_;
  }

  void Set(TimePoint tp) {
    std::lock_guard lock(mutex_);
    now_ = tp;
  }

  void Advance(Clock::duration d) {
    std::lock_guard lock(mutex_);
    now_ += d;
  }

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

} // namespace vkyc::util
