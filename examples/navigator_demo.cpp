// Interactive demo: drag from a window edge to reveal a region, use the
// arrow keys to navigate, Escape or Backspace to go back.
//
// Built only with FIVENAV_USE_GLFW and FIVENAV_USE_IMGUI.

#include <fivenav/fivenav.hpp>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl2.h>

#include "ui/glfw_adapter.hpp"
#include "ui/imgui/navigator_painter.hpp"

#include <GLFW/glfw3.h>

using namespace fivenav;

int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    NavigatorConfig cfg;
    if (!cfg.load(NavigatorConfig::default_path()))
    {
        cfg.swipe_back.left       = true;
        cfg.swipe_back.right      = true;
        cfg.swipe_back.top        = true;
        cfg.swipe_back.bottom     = true;
        cfg.return_button.visible = true;
        cfg.preview.enabled       = true;
        cfg.animate_center_entrance = true;
    }

    Navigator nav(cfg);
    nav.set_region(Region::Center, {"Home"});
    nav.set_region(Region::Left, {"Settings"});
    nav.set_region(Region::Right, {"Camera"});
    nav.set_region(Region::Top, {"Notifications"});
    nav.set_region(Region::Bottom, {"Search"});

    CallbackObserver observer;
    observer.region_opened      = [](Region r) { FIVENAV_LOG_INFO("demo", "Now showing {}", to_string(r)); };
    observer.returned_to_center = [] { FIVENAV_LOG_INFO("demo", "Now showing Center"); };
    nav.add_observer(&observer);

    GlfwAdapter window;
    if (!window.init(420, 860, "fivenav demo"))
        return 1;

    bool quit = false;
    window.set_callbacks({.on_key            = nullptr,
                          .on_unhandled_back = [&quit] { quit = true; }});
    window.attach(&nav);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window.window(), true);
    ImGui_ImplOpenGL2_Init();

    NavigatorPainter painter;

    while (!window.should_close() && !quit)
    {
        window.poll_events();
        nav.update(window.time());

        ImGui_ImplOpenGL2_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        painter.draw(ImGui::GetBackgroundDrawList(), nav.frame(), nav.config(), {});

        ImGui::Render();
        uint32_t fb_w = 0, fb_h = 0;
        window.framebuffer_size(fb_w, fb_h);
        glViewport(0, 0, static_cast<int>(fb_w), static_cast<int>(fb_h));
        glClearColor(0.07f, 0.07f, 0.08f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL2_RenderDrawData(ImGui::GetDrawData());

        window.swap_buffers();
    }

    ImGui_ImplOpenGL2_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    nav.remove_observer(&observer);
    window.attach(nullptr);
    window.shutdown();
    return 0;
}
