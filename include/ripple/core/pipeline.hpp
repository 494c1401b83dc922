#pragma once
#include <utility>
#include <ripple/core/observable.hpp>

namespace ripple {

// src | op  ==  op(src). Restricted to observables on the left-hand side.
template <class Src, class Op>
  requires is_observable_v<Src>
auto operator|(Src&& src, Op&& op) -> decltype(std::forward<Op>(op)(std::forward<Src>(src))) {
  return std::forward<Op>(op)(std::forward<Src>(src));
}

} // namespace ripple
