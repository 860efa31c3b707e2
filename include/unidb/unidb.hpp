// Copyright (c) 2024 liudegui. MIT License.
//
// unidb -- umbrella header.

#pragma once

#include "unidb/async_connector.hpp"
#include "unidb/column_batch.hpp"
#include "unidb/config.hpp"
#include "unidb/connector.hpp"
#include "unidb/error.hpp"
#include "unidb/factory.hpp"
#include "unidb/log.hpp"
#include "unidb/query_builder.hpp"
#include "unidb/value.hpp"
