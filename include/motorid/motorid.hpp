#pragma once

// High-level motorid facade
// Composes identity, registry and storage modules

#include "motorid/common/error.hpp"
#include "motorid/identity/address.hpp"
#include "motorid/identity/wallet_key.hpp"
#include "motorid/registry/registry.hpp"
#include "motorid/registry/state_machine.hpp"
#include "motorid/storage/journal_store.hpp"
