#pragma once

#include <sevclass/core/error.hpp>
#include <onnxruntime_cxx_api.h>
#include <expected>

namespace sevclass::vision::detail {

/// Runs fn, turning any Ort::Exception it throws into AdapterFailed.
/// fn must return std::expected<T, core::ClassifyError>.
template <typename Fn>
auto guarded_ort_call(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const Ort::Exception&) {
    return std::unexpected(core::ClassifyError::AdapterFailed);
  }
}

}  // namespace sevclass::vision::detail
