/**
 * @file scottqueue.hpp
 * @brief Umbrella header: both Michael-Scott queue variants and the reclamation manager.
 * @author scottqueue contributors
 * @version 0.1.0
 */

#pragma once

#include <scottqueue/config.hpp>
#include <scottqueue/ebr.hpp>
#include <scottqueue/lockfree_queue.hpp>
#include <scottqueue/node.hpp>
#include <scottqueue/two_lock_queue.hpp>
