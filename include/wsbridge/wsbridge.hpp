// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file wsbridge.hpp
/// @brief Master include for the wsbridge workspace server
///
/// This header includes all public API headers for convenience.
/// You can also include individual headers for finer-grained control.

#include <wsbridge/committer.hpp>
#include <wsbridge/dispatcher.hpp>
#include <wsbridge/file_store.hpp>
#include <wsbridge/handlers.hpp>
#include <wsbridge/jsonrpc.hpp>
#include <wsbridge/logging.hpp>
#include <wsbridge/options.hpp>
#include <wsbridge/process.hpp>
#include <wsbridge/server.hpp>
#include <wsbridge/transport.hpp>
#include <wsbridge/transport_stdio.hpp>
#include <wsbridge/transport_tcp.hpp>
#include <wsbridge/types.hpp>
#include <wsbridge/workspace.hpp>
