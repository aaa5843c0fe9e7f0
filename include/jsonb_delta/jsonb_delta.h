// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file jsonb_delta.h
/// @brief Convenience header pulling in the whole public API.

#pragma once

#include <jsonb_delta/config.h>

#include <jsonb_delta/array_ops.h>
#include <jsonb_delta/builders.h>
#include <jsonb_delta/error.h>
#include <jsonb_delta/merge.h>
#include <jsonb_delta/number.h>
#include <jsonb_delta/path_core.h>
#include <jsonb_delta/path_parser.h>
#include <jsonb_delta/path_types.h>
#include <jsonb_delta/value.h>
#include <jsonb_delta/value_diff.h>
