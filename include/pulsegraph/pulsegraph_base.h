/*
 * The core imports for pulsegraph. Use this to ensure the correct import order can be maintained.
 */

#ifndef PULSEGRAPH_BASE_H
#define PULSEGRAPH_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <pulsegraph/pulsegraph_export.h>
#include <pulsegraph/pulsegraph_forward_declarations.h>
#include <pulsegraph/util/date_time.h>
#include <pulsegraph/util/errors.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#endif //PULSEGRAPH_BASE_H
