#ifdef FIVENAV_USE_GLFW

    #include "glfw_adapter.hpp"

    #include <fivenav/logger.hpp>
    #include <fivenav/navigator.hpp>

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>

namespace fivenav
{

namespace
{

GlfwAdapter* adapter_from(GLFWwindow* window)
{
    return static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
}

void glfw_error_callback(int code, const char* description)
{
    FIVENAV_LOG_ERROR("glfw", "GLFW error {}: {}", code, description ? description : "");
}

}   // anonymous namespace

GlfwAdapter::~GlfwAdapter()
{
    shutdown();
}

bool GlfwAdapter::init(uint32_t width, uint32_t height, const std::string& title)
{
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit())
    {
        FIVENAV_LOG_ERROR("glfw", "Failed to initialize GLFW");
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    window_ = glfwCreateWindow(
        static_cast<int>(width), static_cast<int>(height), title.c_str(), nullptr, nullptr);
    if (!window_)
    {
        FIVENAV_LOG_ERROR("glfw", "Failed to create GLFW window");
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);

    glfwSetWindowUserPointer(window_, this);
    glfwSetCursorPosCallback(window_, cursor_pos_callback);
    glfwSetMouseButtonCallback(window_, mouse_button_callback);
    glfwSetWindowSizeCallback(window_, window_size_callback);
    glfwSetKeyCallback(window_, key_callback);
    glfwSetWindowFocusCallback(window_, focus_callback);

    FIVENAV_LOG_INFO("glfw", "Window {}x{} created", width, height);
    sync_viewport();
    return true;
}

void GlfwAdapter::shutdown()
{
    if (window_)
    {
        glfwDestroyWindow(window_);
        window_ = nullptr;
        glfwTerminate();
    }
}

void GlfwAdapter::attach(Navigator* navigator)
{
    if (navigator_ && dragging_)
        navigator_->pointer_cancel();
    dragging_  = false;
    navigator_ = navigator;
    sync_viewport();
}

void GlfwAdapter::poll_events()
{
    glfwPollEvents();
}

bool GlfwAdapter::should_close() const
{
    return window_ ? glfwWindowShouldClose(window_) : true;
}

void GlfwAdapter::swap_buffers()
{
    if (window_)
        glfwSwapBuffers(window_);
}

double GlfwAdapter::time() const
{
    return glfwGetTime();
}

void GlfwAdapter::framebuffer_size(uint32_t& width, uint32_t& height) const
{
    int w = 0, h = 0;
    if (window_)
        glfwGetFramebufferSize(window_, &w, &h);
    width  = static_cast<uint32_t>(w);
    height = static_cast<uint32_t>(h);
}

void GlfwAdapter::window_size(int& width, int& height) const
{
    width  = 0;
    height = 0;
    if (window_)
        glfwGetWindowSize(window_, &width, &height);
}

void GlfwAdapter::sync_viewport()
{
    if (!window_ || !navigator_)
        return;
    int w = 0, h = 0;
    glfwGetWindowSize(window_, &w, &h);
    navigator_->set_viewport({static_cast<float>(w), static_cast<float>(h)});
}

// ─── Static callback trampolines ────────────────────────────────────────────

void GlfwAdapter::cursor_pos_callback(GLFWwindow* window, double x, double y)
{
    auto* adapter = adapter_from(window);
    if (adapter && adapter->navigator_ && adapter->dragging_)
        adapter->navigator_->pointer_move({static_cast<float>(x), static_cast<float>(y)});
}

void GlfwAdapter::mouse_button_callback(GLFWwindow* window, int button, int action, int /*mods*/)
{
    auto* adapter = adapter_from(window);
    if (!adapter || !adapter->navigator_ || button != GLFW_MOUSE_BUTTON_LEFT)
        return;

    double x = 0.0, y = 0.0;
    glfwGetCursorPos(window, &x, &y);
    const Vec2 pos{static_cast<float>(x), static_cast<float>(y)};

    if (action == GLFW_PRESS)
    {
        adapter->dragging_ = adapter->navigator_->pointer_down(pos);
    }
    else if (action == GLFW_RELEASE && adapter->dragging_)
    {
        adapter->dragging_ = false;
        adapter->navigator_->pointer_up(pos);
    }
}

void GlfwAdapter::window_size_callback(GLFWwindow* window, int /*width*/, int /*height*/)
{
    auto* adapter = adapter_from(window);
    if (adapter)
        adapter->sync_viewport();
}

void GlfwAdapter::key_callback(GLFWwindow* window, int key, int /*scancode*/, int action, int mods)
{
    auto* adapter = adapter_from(window);
    if (!adapter)
        return;

    if (adapter->navigator_ && action == GLFW_PRESS)
    {
        Navigator& nav = *adapter->navigator_;
        switch (key)
        {
            case GLFW_KEY_ESCAPE:
            case GLFW_KEY_BACKSPACE:
                if (!nav.handle_back_signal() && adapter->callbacks_.on_unhandled_back)
                    adapter->callbacks_.on_unhandled_back();
                return;
            case GLFW_KEY_LEFT:
                nav.navigate(Direction::Left);
                return;
            case GLFW_KEY_RIGHT:
                nav.navigate(Direction::Right);
                return;
            case GLFW_KEY_UP:
                nav.navigate(Direction::Up);
                return;
            case GLFW_KEY_DOWN:
                nav.navigate(Direction::Down);
                return;
            default:
                break;
        }
    }

    if (adapter->callbacks_.on_key)
        adapter->callbacks_.on_key(key, action, mods);
}

void GlfwAdapter::focus_callback(GLFWwindow* window, int focused)
{
    auto* adapter = adapter_from(window);
    if (!adapter || focused || !adapter->dragging_)
        return;
    adapter->dragging_ = false;
    if (adapter->navigator_)
        adapter->navigator_->pointer_cancel();
}

}   // namespace fivenav

#endif   // FIVENAV_USE_GLFW
