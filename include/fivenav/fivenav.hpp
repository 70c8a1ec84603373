#pragma once

// Umbrella header: includes the whole public API.

#include <fivenav/config.hpp>
#include <fivenav/easing.hpp>
#include <fivenav/frame.hpp>
#include <fivenav/fwd.hpp>
#include <fivenav/logger.hpp>
#include <fivenav/navigator.hpp>
#include <fivenav/observer.hpp>
#include <fivenav/types.hpp>
