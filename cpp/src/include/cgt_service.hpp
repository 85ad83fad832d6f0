#pragma once
/**
 * @file cgt_service.hpp
 * @brief Layer 2: Service modules built on cgt_base.
 *
 * Provides the asynchronous logger, run cancellation and child process execution.
 * Include this when you need logging or need to run external tools.
 */
#include "cgt_base.hpp"

#include "utils/cancellation.hpp"
#include "utils/child_process.hpp"
#include "utils/logger.hpp"
