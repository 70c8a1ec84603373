#pragma once

namespace fivenav
{

class Navigator;
class NavigatorObserver;
class CallbackObserver;
class Logger;

struct NavigatorConfig;
struct PreviewConfig;
struct ReturnButtonConfig;
struct SwipeBackConfig;
struct DetectionZone;

struct RenderFrame;
struct LayerVisual;
struct PreviewVisual;
struct ReturnButtonLayout;
struct RegionContent;

class TransitionSession;
class FrameComposer;

#ifdef FIVENAV_USE_GLFW
class GlfwAdapter;
#endif

}   // namespace fivenav
