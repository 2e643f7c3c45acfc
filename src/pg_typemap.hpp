// SPDX-License-Identifier: MIT

// src/pg_typemap.hpp - Convenience header for array mappings and their element mappings.
#pragma once

#include "pg_typemap/array/array_mapping_cache.hpp"
#include "pg_typemap/array/array_type_mapping.hpp"
#include "pg_typemap/custom_mapping.hpp"
#include "pg_typemap/dense_array.hpp"
#include "pg_typemap/pg/scalar_mapping.hpp"
