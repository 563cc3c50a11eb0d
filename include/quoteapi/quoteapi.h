/**
 * @file quoteapi.h
 * @brief
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 */

#pragma once

#ifndef QUOTEAPI_QUOTEAPI_H_
#define QUOTEAPI_QUOTEAPI_H_

#include "quoteapi/console_logger.h"
#include "quoteapi/http_request_aspect_handler.h"
#include "quoteapi/http_request_handler.h"
#include "quoteapi/http_request_method.h"
#include "quoteapi/http_route_result.h"
#include "quoteapi/http_server.h"
#include "quoteapi/http_server_task.h"
#include "quoteapi/logger.h"
#include "quoteapi/process_memory.h"
#include "quoteapi/quote.h"
#include "quoteapi/quote_catalog.h"
#include "quoteapi/quote_json.h"
#include "quoteapi/quote_routes.h"
#include "quoteapi/service_config.h"

#endif
