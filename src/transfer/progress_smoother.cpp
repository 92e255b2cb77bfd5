#include "chunkflow/transfer/progress_smoother.hpp"
#include <algorithm>
#include <cmath>

namespace chunkflow::transfer {

ProgressSmoother::ProgressSmoother(SmoothingOptions options)
    : options_(options)
{
}

ProgressSnapshot ProgressSmoother::clamp(double progress, double speed, double eta_seconds,
                                         const ProgressSnapshot& previous) {
    ProgressSnapshot snapshot;
    snapshot.progress = std::isfinite(progress) ? std::clamp(progress, 0.0, 1.0) : previous.progress;
    snapshot.speed = std::isfinite(speed) ? std::max(0.0, speed) : previous.speed;
    snapshot.eta_seconds = std::isfinite(eta_seconds) ? std::max(0.0, eta_seconds) : previous.eta_seconds;
    return snapshot;
}

void ProgressSmoother::set_target(double progress, double speed, double eta_seconds) {
    target_ = clamp(progress, speed, eta_seconds, target_);
    step();
}

void ProgressSmoother::set_immediate(double progress, double speed, double eta_seconds) {
    target_ = clamp(progress, speed, eta_seconds, target_);
    display_ = target_;
}

bool ProgressSmoother::step() {
    bool changed = false;
    
    double progress_gap = target_.progress - display_.progress;
    if (std::abs(progress_gap) > options_.min_change) {
        double limit = options_.max_change_per_step;
        display_.progress += std::clamp(progress_gap * options_.factor, -limit, limit);
        changed = true;
    }
    
    double speed_gap = target_.speed - display_.speed;
    if (std::abs(speed_gap) > options_.speed_threshold) {
        display_.speed += speed_gap * options_.factor;
        changed = true;
    }
    
    double eta_gap = target_.eta_seconds - display_.eta_seconds;
    if (std::abs(eta_gap) > options_.eta_threshold) {
        display_.eta_seconds += eta_gap * options_.factor;
        changed = true;
    }
    
    if (at_target()) {
        changed = changed || display_.progress != target_.progress ||
                  display_.speed != target_.speed || display_.eta_seconds != target_.eta_seconds;
        display_ = target_;
    }
    return changed;
}

bool ProgressSmoother::at_target() const {
    return std::abs(target_.progress - display_.progress) < options_.min_change &&
           std::abs(target_.speed - display_.speed) < options_.speed_threshold &&
           std::abs(target_.eta_seconds - display_.eta_seconds) < options_.eta_threshold;
}

void ProgressSmoother::reset() {
    display_ = {};
    target_ = {};
}

} // namespace chunkflow::transfer
