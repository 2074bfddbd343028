#pragma once

// ToolGov - execution governor for strongly-typed agent tools
//
// Single-include header for the entire library.

#include "toolgov/types.hpp"
#include "toolgov/config.hpp"
#include "toolgov/error_record.hpp"
#include "toolgov/exceptions.hpp"
#include "toolgov/cancellation.hpp"
#include "toolgov/monitor.hpp"
#include "toolgov/error_catalog.hpp"
#include "toolgov/validation.hpp"
#include "toolgov/shape.hpp"
#include "toolgov/cost_estimator.hpp"
#include "toolgov/budget_policy.hpp"
#include "toolgov/middleware.hpp"
#include "toolgov/tool.hpp"
#include "toolgov/resource_lifecycle.hpp"
#include "toolgov/governor.hpp"
#include "toolgov/tool_registry.hpp"

// Built-in middleware
#include "toolgov/middleware/logging_middleware.hpp"
#include "toolgov/middleware/token_counting_middleware.hpp"
#include "toolgov/middleware/type_verification_middleware.hpp"
