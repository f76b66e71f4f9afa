/// @file logging.hpp
/// @brief Boost.Log-backed logging for sync helpers and applications.
///
/// The CRDT types themselves never log.

#pragma once

#include <string>
#include <string_view>

namespace crdt_kit::logging {

enum class sink_type { null, file, console };

enum class level { trace, debug, info, warning, error };

/// Replace all sinks with one of the given type.
/// Records below @p min_level are dropped. @p name is the file name for
/// sink_type::file and is ignored otherwise.
void init(level min_level, sink_type t, const std::string& name = "");

/// Emit one record.
void write(level lvl, std::string_view message);

}  // namespace crdt_kit::logging
