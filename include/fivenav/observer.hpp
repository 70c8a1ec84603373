#pragma once

#include <fivenav/types.hpp>
#include <functional>

namespace fivenav
{

// Receives navigator notifications. Calls are synchronous and happen at
// phase-completion points; the navigator drops facade calls (navigate,
// return_to_center, handle_back_signal, pointer_down) made from inside a
// notification, so observers must not rely on them.
class NavigatorObserver
{
   public:
    virtual ~NavigatorObserver() = default;

    virtual void on_page_changed(Region /*region*/) {}
    virtual void on_region_opened(Region /*region*/) {}
    virtual void on_returned_to_center() {}
    virtual void on_haptic(HapticIntensity /*intensity*/) {}
};

// Adapter for hosts that prefer plain callbacks.
class CallbackObserver : public NavigatorObserver
{
   public:
    std::function<void(Region)>          page_changed;
    std::function<void(Region)>          region_opened;
    std::function<void()>                returned_to_center;
    std::function<void(HapticIntensity)> haptic;

    void on_page_changed(Region region) override
    {
        if (page_changed)
            page_changed(region);
    }
    void on_region_opened(Region region) override
    {
        if (region_opened)
            region_opened(region);
    }
    void on_returned_to_center() override
    {
        if (returned_to_center)
            returned_to_center();
    }
    void on_haptic(HapticIntensity intensity) override
    {
        if (haptic)
            haptic(intensity);
    }
};

}   // namespace fivenav
