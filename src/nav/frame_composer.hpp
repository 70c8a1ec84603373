#pragma once

#include <array>
#include <fivenav/frame.hpp>
#include <optional>

#include "preview_overlay.hpp"

namespace fivenav
{

class TransitionSession;

using RegionContents = std::array<std::optional<RegionContent>, REGION_COUNT>;

// Builds the per-frame render description from the session state. Center
// always sits below the peripheral it trades places with.
class FrameComposer
{
   public:
    void set_preview_config(const PreviewConfig& config) { preview_.set_config(config); }

    RenderFrame compose(const TransitionSession& session, const RegionContents& contents) const;

   private:
    PreviewOverlayEngine preview_;
};

}   // namespace fivenav
