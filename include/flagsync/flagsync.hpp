// This is the single entry point for the flagsync library.
// Include this file to get access to the core public API.

#pragma once

// Client and its configuration
#include "flagsync/core/client.hpp"
#include "flagsync/core/client_options.hpp"

// Flag values and settings synchronization
#include "flagsync/core/config/config_value.hpp"
#include "flagsync/core/config/settings_synchronizer.hpp"

// Analytics payloads and queues
#include "flagsync/core/delivery/event.hpp"
#include "flagsync/core/delivery/summary.hpp"
#include "flagsync/core/delivery/delivery_queue.hpp"

// Session and connectivity
#include "flagsync/core/session/session_lifecycle.hpp"
#include "flagsync/core/network/connection_monitor.hpp"

// Public interfaces for host integration
#include "flagsync/core/interfaces/itransport.hpp"
#include "flagsync/core/interfaces/istore.hpp"
#include "flagsync/core/interfaces/iid_source.hpp"
#include "flagsync/core/interfaces/IBackoffStrategy.hpp"

// In-memory store for hosts without persistence
#include "flagsync/core/storage/memory_store.hpp"

// Utilities
#include "flagsync/core/util/logger.hpp"
#include "flagsync/core/util/error_types.hpp"
