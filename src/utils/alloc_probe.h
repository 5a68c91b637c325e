#pragma once
#ifndef COSTCONFORM_ALLOC_PROBE_H
#define COSTCONFORM_ALLOC_PROBE_H

#include <cstddef>
#include <optional>

namespace costconform {

// Bytes currently allocated on the process heap, or std::nullopt where the
// allocator cannot report it. The figure is process wide, so concurrent work
// on other threads shows up in any delta taken from it.
std::optional<size_t> heap_in_use_bytes();

}  // namespace costconform

#endif  // COSTCONFORM_ALLOC_PROBE_H
