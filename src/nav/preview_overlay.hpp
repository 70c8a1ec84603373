#pragma once

#include <fivenav/config.hpp>
#include <fivenav/frame.hpp>

namespace fivenav
{

// Visuals of the preview card shown while a preview-mode drag is locked.
// Purely a function of progress and wall-clock time; the content itself
// does not move in preview mode.
class PreviewOverlayEngine
{
   public:
    PreviewOverlayEngine() = default;
    explicit PreviewOverlayEngine(const PreviewConfig& config) : config_(config) {}

    void                 set_config(const PreviewConfig& config) { config_ = config; }
    const PreviewConfig& config() const { return config_; }

    // clamp(progress / appearance_threshold, 0, 1)
    static float appearance_ratio(float progress, float appearance_threshold);

    // clamp((progress - threshold) / (1 - threshold), 0, 1); zero at or
    // below the commit threshold.
    static float overscroll_ratio(float progress, float commit_threshold);

    // Point on the edge of the region being revealed, inset toward the
    // viewport center.
    Vec2 anchor_for(Direction d, Size2 viewport) const;

    PreviewVisual compute(Direction d,
                          float     progress,
                          float     commit_threshold,
                          Size2     viewport,
                          double    wall_clock) const;

   private:
    PreviewConfig config_;
};

}   // namespace fivenav
