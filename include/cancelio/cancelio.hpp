#pragma once

/**
 * @file
 * @brief Umbrella include for the complete cancelio public API.
 */

#include "cancelio/blocking/endpoint.hpp"
#include "cancelio/blocking/fd_stream.hpp"
#include "cancelio/blocking/tcp.hpp"
#include "cancelio/cancel/guard.hpp"
#include "cancelio/cancel/token.hpp"
#include "cancelio/core/error.hpp"
#include "cancelio/core/log.hpp"
#include "cancelio/core/result.hpp"
#include "cancelio/io/buffered_reader.hpp"
#include "cancelio/io/cancellable.hpp"
#include "cancelio/io/concepts.hpp"
#include "cancelio/io/memory.hpp"
#include "cancelio/io/seek.hpp"
#include "cancelio/io/stream_ops.hpp"
