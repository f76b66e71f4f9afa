/// @file crdt_kit.hpp
/// @brief Umbrella header for the crdt-kit library.
///
/// Include this single header for access to every CRDT type, the hybrid
/// logical clock, the binary codec and the capability concepts. JSON
/// interop, parallel merge, sync helpers and logging live in their own
/// headers (json.hpp, parallel.hpp, sync.hpp, logging.hpp) because they
/// pull in third-party libraries.

#pragma once

#include <crdt-kit/clock.hpp>
#include <crdt-kit/codec.hpp>
#include <crdt-kit/crdt.hpp>
#include <crdt-kit/error.hpp>
#include <crdt-kit/gcounter.hpp>
#include <crdt-kit/gset.hpp>
#include <crdt-kit/lww_register.hpp>
#include <crdt-kit/mv_register.hpp>
#include <crdt-kit/or_set.hpp>
#include <crdt-kit/pncounter.hpp>
#include <crdt-kit/rga.hpp>
#include <crdt-kit/text.hpp>
#include <crdt-kit/twop_set.hpp>
#include <crdt-kit/types.hpp>
