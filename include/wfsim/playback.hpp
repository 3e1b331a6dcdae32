#pragma once
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>
#include <wfsim/feature.hpp>

namespace wfsim {

// Time cursor over a built FireSequence. One frame per time step; a frame
// covers the contiguous run of features sharing that step.
class Playback {
public:
  Playback() = default;
  explicit Playback(const FireSequence& seq) { reset(seq); }

  void reset(const FireSequence& seq) {
    starts_.clear();
    times_.clear();
    total_ = seq.features.size();
    for (std::size_t i = 0; i < seq.features.size(); ++i) {
      const auto& f = seq.features[i];
      if (i == 0 || !(f.step == seq.features[i-1].step)) {
        starts_.push_back(i);
        times_.push_back(static_cast<double>(f.step.elapsed_hours()));
      }
    }
    loop_ = seq.playback.loop;
    duration_ = static_cast<double>(seq.playback.duration_hours);
    playing = seq.playback.auto_play;
    frame_ = 0;
    time_ = times_.empty() ? 0.0 : times_.front();
  }

  // Advance the cursor by dt simulated hours (no-op while paused).
  // Past the last frame: wrap to the first when looping, else hold and pause.
  void advance(double dt_hours) {
    if (!playing || times_.empty() || dt_hours <= 0.0) return;
    time_ += dt_hours;
    // The last frame stays up for one step-equivalent before wrapping/stopping.
    const double end = times_.back() + last_hold_();
    if (time_ >= end) {
      if (loop_) {
        time_ = times_.front();
        frame_ = 0;
        return;
      }
      time_ = times_.back();
      frame_ = times_.size() - 1;
      playing = false;
      return;
    }
    frame_ = frame_at_(time_);
  }

  void seek_frame(std::size_t frame) {
    if (times_.empty()) return;
    frame_ = std::min(frame, times_.size() - 1);
    time_ = times_[frame_];
  }
  void step_forward() { seek_frame(frame_ + 1); }
  void step_back() { seek_frame(frame_ == 0 ? 0 : frame_ - 1); }

  std::size_t frame() const { return frame_; }
  std::size_t frame_count() const { return times_.size(); }
  double time_hours() const { return time_; }
  bool loop() const { return loop_; }
  void set_loop(bool on) { loop_ = on; }
  bool at_end() const { return !times_.empty() && frame_ + 1 == times_.size(); }

  // [begin, end) feature indices drawn for a frame.
  std::pair<std::size_t, std::size_t> frame_range(std::size_t frame) const {
    if (frame >= starts_.size()) return {total_, total_};
    const std::size_t b = starts_[frame];
    const std::size_t e = (frame + 1 < starts_.size()) ? starts_[frame + 1] : total_;
    return {b, e};
  }

  bool playing = true;

private:
  std::size_t frame_at_(double t) const {
    auto it = std::upper_bound(times_.begin(), times_.end(), t);
    if (it == times_.begin()) return 0;
    return static_cast<std::size_t>(std::distance(times_.begin(), it)) - 1;
  }
  double last_hold_() const {
    if (times_.size() < 2) return duration_;
    return times_[times_.size() - 1] - times_[times_.size() - 2];
  }

  std::vector<std::size_t> starts_;
  std::vector<double> times_;
  std::size_t total_{0};
  std::size_t frame_{0};
  double time_{0.0};
  double duration_{1.0};
  bool loop_{false};
};

} // namespace wfsim
