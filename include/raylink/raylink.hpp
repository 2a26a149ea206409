#pragma once

/// Convenience umbrella header for the raylink library.

#include <raylink/bridge/bridge.hpp>
#include <raylink/codec/decoder.hpp>
#include <raylink/codec/encoder.hpp>
#include <raylink/codec/format.hpp>
#include <raylink/codec/value.hpp>
#include <raylink/core/column.hpp>
#include <raylink/engine/evaluator.hpp>
#include <raylink/ipc/frame.hpp>
#include <raylink/ipc/transport.hpp>
#include <raylink/runtime/client.hpp>
#include <raylink/runtime/directives.hpp>
#include <raylink/runtime/result.hpp>
