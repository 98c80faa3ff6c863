#pragma once
#include <algorithm>
#include <cstdint>
#include <optional>
#include <utility>
#include <bustrk/geo.hpp>

namespace bustrk {

enum class Easing { Linear, EaseOutCubic, EaseInOutCubic };

// Map normalized progress t in [0,1] through an easing curve.
inline double apply_easing(Easing e, double t) {
  t = std::clamp(t, 0.0, 1.0);
  switch (e) {
    case Easing::EaseOutCubic: {
      const double u = 1.0 - t;
      return 1.0 - u * u * u;
    }
    case Easing::EaseInOutCubic: {
      if (t < 0.5) return 4.0 * t * t * t;
      const double u = -2.0 * t + 2.0;
      return 1.0 - (u * u * u) / 2.0;
    }
    case Easing::Linear:
    default:
      return t;
  }
}

inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

inline GeoPoint lerp(const GeoPoint& a, const GeoPoint& b, double t) {
  return GeoPoint{ lerp(a.lat, b.lat, t), lerp(a.lng, b.lng, t) };
}

inline Vec2 lerp(const Vec2& a, const Vec2& b, double t) {
  return Vec2{ lerp(a.x, b.x, t), lerp(a.y, b.y, t) };
}

// Time-based interpolation from `from` to `to`, stepped by the caller.
// T needs a free lerp(const T&, const T&, double).
template <class T>
class Tween {
public:
  enum class Phase { Running, Finished, Cancelled };

  Tween(T from, T to, double duration_ms, Easing easing = Easing::Linear)
    : from_(std::move(from)), to_(std::move(to)),
      duration_ms_(duration_ms > 0.0 ? duration_ms : 0.0),
      easing_(easing), value_(from_) {
    if (duration_ms_ <= 0.0) { value_ = to_; phase_ = Phase::Finished; }
  }

  // Step the clock forward and return the value at the new time.
  // Finished or cancelled tweens keep returning their last value.
  const T& advance(double elapsed_ms) {
    if (phase_ != Phase::Running) return value_;
    if (elapsed_ms > 0.0) elapsed_ms_ += elapsed_ms;
    if (elapsed_ms_ >= duration_ms_) {
      elapsed_ms_ = duration_ms_;
      value_ = to_;
      phase_ = Phase::Finished;
      return value_;
    }
    value_ = lerp(from_, to_, apply_easing(easing_, elapsed_ms_ / duration_ms_));
    return value_;
  }

  void cancel() { if (phase_ == Phase::Running) phase_ = Phase::Cancelled; }

  bool running()   const { return phase_ == Phase::Running; }
  bool finished()  const { return phase_ == Phase::Finished; }
  bool cancelled() const { return phase_ == Phase::Cancelled; }

  const T& value()  const { return value_; }
  const T& from()   const { return from_; }
  const T& target() const { return to_; }
  double duration_ms() const { return duration_ms_; }
  double elapsed_ms()  const { return elapsed_ms_; }
  Easing easing()      const { return easing_; }

private:
  T from_;
  T to_;
  double duration_ms_{0.0};
  double elapsed_ms_{0.0};
  Easing easing_{Easing::Linear};
  T value_;
  Phase phase_{Phase::Running};
};

// Owner of at most one in-flight tween. replace() cancels and drops the
// previous job before taking the new one; a job that reaches its target
// is released on the advance() that finishes it.
template <class T>
class JobSlot {
public:
  void replace(Tween<T> job) {
    cancel();
    job_.emplace(std::move(job));
    ++generation_;
  }

  void cancel() {
    if (job_) {
      job_->cancel();
      job_.reset();
    }
  }

  bool active() const { return job_.has_value() && job_->running(); }
  const Tween<T>* job() const { return job_ ? &*job_ : nullptr; }

  // Number of jobs ever installed; lets callers tell jobs apart.
  std::uint64_t generation() const { return generation_; }

  std::optional<T> advance(double elapsed_ms) {
    if (!job_) return std::nullopt;
    T v = job_->advance(elapsed_ms);
    if (!job_->running()) job_.reset();
    return v;
  }

private:
  std::optional<Tween<T>> job_{};
  std::uint64_t generation_{0};
};

} // namespace bustrk
