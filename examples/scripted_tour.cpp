// Headless walk through every way of moving between regions, driven by a
// fake clock. Prints the navigator's notifications and a summary of each
// rendered frame.

#include <cstdio>
#include <string>
#include <fivenav/fivenav.hpp>

using namespace fivenav;

namespace
{

constexpr double FRAME = 1.0 / 60.0;

class PrintingObserver : public NavigatorObserver
{
   public:
    void on_page_changed(Region r) override { FIVENAV_LOG_INFO("tour", "page changed → {}", to_string(r)); }
    void on_region_opened(Region r) override { FIVENAV_LOG_INFO("tour", "opened {}", to_string(r)); }
    void on_returned_to_center() override { FIVENAV_LOG_INFO("tour", "back on center"); }
    void on_haptic(HapticIntensity h) override { FIVENAV_LOG_INFO("tour", "haptic ({})", to_string(h)); }
};

struct Tour
{
    Navigator& nav;
    double     now = 0.0;

    void tick()
    {
        now += FRAME;
        nav.update(now);
    }

    void settle()
    {
        for (int i = 0; i < 600 && nav.is_transitioning(); ++i)
            tick();
        // A released swipe-back is still animating while the phase reads
        // PeripheralActive.
        for (int i = 0; i < 60; ++i)
            tick();
    }

    void drag(Vec2 from, Vec2 to, int steps = 12)
    {
        nav.pointer_down(from);
        for (int i = 1; i <= steps; ++i)
        {
            float t = static_cast<float>(i) / static_cast<float>(steps);
            nav.pointer_move(from + (to - from) * t);
            tick();
        }
        describe();
        nav.pointer_up(to);
    }

    void describe() const
    {
        RenderFrame f = nav.frame();
        std::printf("  [%s] progress %.2f, %zu layer(s)",
                    std::string(to_string(f.phase)).c_str(),
                    static_cast<double>(f.progress),
                    f.layers.size());
        for (const auto& l : f.layers)
        {
            std::printf("  %s@(%.0f,%.0f) a=%.2f",
                        std::string(to_string(l.region)).c_str(),
                        static_cast<double>(l.offset.x),
                        static_cast<double>(l.offset.y),
                        static_cast<double>(l.opacity));
        }
        if (f.preview)
            std::printf("  preview '%s' a=%.2f", f.preview->label.c_str(), static_cast<double>(f.preview->opacity));
        if (f.return_button)
            std::printf("  return button");
        std::printf("\n");
    }
};

}   // anonymous namespace

int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    NavigatorConfig cfg;
    cfg.swipe_back.left       = true;
    cfg.swipe_back.right      = true;
    cfg.return_button.visible = true;
    cfg.preview.top_label     = "Notifications";

    Navigator nav(cfg);
    nav.set_viewport({400.0f, 800.0f});
    nav.set_region(Region::Center, {"home"});
    nav.set_region(Region::Left, {"settings"});
    nav.set_region(Region::Right, {"camera"});
    nav.set_region(Region::Top, {"notifications"});
    nav.set_region(Region::Bottom, {"search"});

    PrintingObserver printer;
    nav.add_observer(&printer);

    Tour tour{nav};
    nav.update(tour.now);

    std::printf("1. Drag right from the left edge band\n");
    tour.drag({40.0f, 400.0f}, {220.0f, 400.0f});
    tour.settle();
    tour.describe();

    std::printf("2. Tap the return button\n");
    if (auto button = nav.frame().return_button)
    {
        nav.pointer_down(button->center);
        nav.pointer_up(button->center);
    }
    tour.settle();
    tour.describe();

    std::printf("3. Short drag up from the bottom band, released early\n");
    tour.drag({200.0f, 760.0f}, {200.0f, 700.0f});
    tour.settle();
    tour.describe();

    std::printf("4. Open Right programmatically, swipe back from its left edge\n");
    nav.navigate_to(Region::Right);
    tour.settle();
    tour.drag({20.0f, 400.0f}, {300.0f, 400.0f});
    tour.settle();
    tour.describe();

    std::printf("5. Open Top with a drag, leave with the back signal\n");
    tour.drag({200.0f, 80.0f}, {200.0f, 500.0f});
    tour.settle();
    nav.handle_back_signal();
    tour.settle();
    tour.describe();

    std::printf("6. Back signal at Center is left to the host: %s\n",
                nav.handle_back_signal() ? "consumed" : "not consumed");

    nav.remove_observer(&printer);
    return 0;
}
