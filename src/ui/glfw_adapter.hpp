#pragma once

#ifdef FIVENAV_USE_GLFW

    #include <cstdint>
    #include <functional>
    #include <string>

struct GLFWwindow;

namespace fivenav
{

class Navigator;

// Host-side hooks for events the navigator does not consume.
struct HostCallbacks
{
    std::function<void(int key, int action, int mods)> on_key;
    // Back signal arrived while Center was settled.
    std::function<void()> on_unhandled_back;
};

// Owns a GLFW window with an OpenGL context and routes its input into a
// Navigator: left button drags, window size → viewport, Escape/Backspace →
// platform back, arrow keys → navigate(), focus loss → pointer_cancel().
class GlfwAdapter
{
   public:
    GlfwAdapter() = default;
    ~GlfwAdapter();

    GlfwAdapter(const GlfwAdapter&)            = delete;
    GlfwAdapter& operator=(const GlfwAdapter&) = delete;

    bool init(uint32_t width, uint32_t height, const std::string& title);
    void shutdown();

    // Not owned. Pass nullptr to detach.
    void attach(Navigator* navigator);
    void set_callbacks(const HostCallbacks& callbacks) { callbacks_ = callbacks; }

    void poll_events();
    bool should_close() const;
    void swap_buffers();

    // Seconds since GLFW initialization, for Navigator::update().
    double time() const;

    GLFWwindow* window() const { return window_; }
    void        framebuffer_size(uint32_t& width, uint32_t& height) const;
    void        window_size(int& width, int& height) const;

   private:
    void sync_viewport();

    GLFWwindow*   window_    = nullptr;
    Navigator*    navigator_ = nullptr;
    HostCallbacks callbacks_;
    bool          dragging_ = false;

    static void cursor_pos_callback(GLFWwindow* window, double x, double y);
    static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    static void window_size_callback(GLFWwindow* window, int width, int height);
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void focus_callback(GLFWwindow* window, int focused);
};

}   // namespace fivenav

#endif   // FIVENAV_USE_GLFW
