#pragma once

// Umbrella header for arpg::affix module
#include <arpg/affix/bonus_channel.hpp>
#include <arpg/affix/gem_bonus.hpp>
#include <arpg/affix/world_view.hpp>
#include <arpg/affix/condition_types.hpp>
#include <arpg/affix/conditional_routing.hpp>
#include <arpg/affix/affix_definition.hpp>
#include <arpg/affix/affix_catalog.hpp>
#include <arpg/affix/condition_tracker.hpp>
#include <arpg/affix/condition_evaluator.hpp>
#include <arpg/affix/buff_timer_manager.hpp>
#include <arpg/affix/gear_aggregator.hpp>
#include <arpg/affix/bonus_router.hpp>
#include <arpg/affix/proc_query.hpp>
