#pragma once

#include <fivenav/config.hpp>
#include <fivenav/frame.hpp>
#include <optional>

namespace fivenav::return_button
{

// Layout of the return-to-center button for a peripheral region: on the
// edge facing Center, centred along it, chevron pointing toward Center.
// nullopt for Center or an empty viewport.
std::optional<ReturnButtonLayout> layout_for(Region                    region,
                                             Size2                     viewport,
                                             const ReturnButtonConfig& config);

bool hit_test(const ReturnButtonLayout& layout, Vec2 pos);

}   // namespace fivenav::return_button
