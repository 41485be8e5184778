// render.hpp - canonical text of runtime values
#pragma once
#include "deepeq/value.hpp"
#include <string>

namespace deepeq {

// Canonical rendering used by the leaf fallback comparison, map-key locators and diagnostics.
// References and callables render their identity; a node already being rendered renders <cycle>.
std::string render(const TypeContext& types, const value* v);

// Shortest round-trip text for a float of the given width (NaN, +Inf, -Inf for specials).
std::string render_float(double d, BaseType width);

std::string render_identity(const void* p);

} // namespace deepeq
