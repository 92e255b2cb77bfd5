#pragma once

namespace chunkflow::transfer {

struct SmoothingOptions {
    double factor = 0.15;               // share of the gap closed per step
    double min_change = 0.001;          // progress gap treated as reached
    double max_change_per_step = 0.05;  // progress movement cap per step
    double speed_threshold = 0.1;       // bytes per second
    double eta_threshold = 0.1;         // seconds
};

struct ProgressSnapshot {
    double progress = 0.0;      // 0.0 - 1.0
    double speed = 0.0;         // bytes per second
    double eta_seconds = 0.0;
};

// Eases displayed progress, speed and ETA toward the latest measured values
// so bursty chunk completions do not make the display jump. Progress never
// moves more than max_change_per_step in one step.
class ProgressSmoother {
public:
    explicit ProgressSmoother(SmoothingOptions options = {});
    
    // Sets new targets and advances the display by one step. A non-finite
    // ETA keeps the previous ETA target.
    void set_target(double progress, double speed, double eta_seconds);
    
    // Jumps the display straight to the given values.
    void set_immediate(double progress, double speed, double eta_seconds);
    
    // Returns true if any displayed value moved.
    bool step();
    bool at_target() const;
    void reset();
    
    const ProgressSnapshot& display() const { return display_; }
    const ProgressSnapshot& target() const { return target_; }
    const SmoothingOptions& options() const { return options_; }

private:
    SmoothingOptions options_;
    ProgressSnapshot display_;
    ProgressSnapshot target_;
    
    static ProgressSnapshot clamp(double progress, double speed, double eta_seconds, const ProgressSnapshot& previous);
};

} // namespace chunkflow::transfer
