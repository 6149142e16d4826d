#pragma once

// Umbrella header for arpg::stats module

#include <arpg/stats/attribute_scaling.hpp>
#include <arpg/stats/final_stats.hpp>
#include <arpg/stats/stat_calculator.hpp>
