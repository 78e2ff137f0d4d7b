#pragma once

// High-level Ledgit facade
// Composes the registries, events and storage modules

#include "ledgit/common/error.hpp"
#include "ledgit/common/types.hpp"
#include "ledgit/events/event_sink.hpp"
#include "ledgit/evolving/evolving_registry.hpp"
#include "ledgit/registry/content_registry.hpp"
#include "ledgit/storage/event_journal.hpp"
#include "ledgit/storage/ledgit_store.hpp"
#include "ledgit/storage/snapshot_store.hpp"
#include "ledgit/token/token_ledger.hpp"
