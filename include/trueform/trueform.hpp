#pragma once

// Trueform - TrueNAS JSON-RPC client
// One authenticated WebSocket session shared by many calling threads

// Core types and utilities
#include <trueform/common.hpp>
#include <trueform/config.hpp>
#include <trueform/context.hpp>
#include <trueform/endpoint.hpp>
#include <trueform/version.hpp>

// Transports
#include <trueform/stream.hpp>
#include <trueform/stream/tcp.hpp>
#include <trueform/stream/tls.hpp>
#include <trueform/stream/websocket.hpp>

// Remote calls
#include <trueform/remote/error.hpp>
#include <trueform/remote/metrics.hpp>
#include <trueform/remote/protocol.hpp>
#include <trueform/remote/router.hpp>

// Client surface
#include <trueform/client.hpp>
#include <trueform/query.hpp>

// All types are in the trueform:: namespace
// Available types:
//   - trueform::Client, ClientConfig, Context, QueryParams
//   - trueform::Error, ErrorKind, Res<T>
//   - trueform::Stream (base class), WsStream
//   - trueform::Json (nlohmann::json)
