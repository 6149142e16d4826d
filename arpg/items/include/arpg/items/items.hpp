#pragma once

// Umbrella header for arpg::items module

#include <arpg/items/item_types.hpp>
#include <arpg/items/equipment.hpp>
