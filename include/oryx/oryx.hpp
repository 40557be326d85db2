#pragma once

/// Convenience umbrella header for the Oryx library.

#include <oryx/codegen/sql.hpp>
#include <oryx/codegen/tree.hpp>
#include <oryx/core/error.hpp>
#include <oryx/dsl/feature.hpp>
#include <oryx/dsl/kind.hpp>
#include <oryx/dsl/schema.hpp>
#include <oryx/dsl/source.hpp>
#include <oryx/runtime/closure.hpp>
#include <oryx/runtime/csv.hpp>
