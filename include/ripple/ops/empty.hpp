#pragma once
#include <exception>
#include <stdexcept>
#include <string>
#include <ripple/core/observable.hpp>

namespace ripple {

// Completes immediately.
template <class T>
inline observable<T> empty() {
  return observable<T>::create([](observer<T> o){
    o.on_completed();
    return subscription{};
  });
}

// Never emits, never terminates.
template <class T>
inline observable<T> never() {
  return observable<T>::create([](observer<T>){ return subscription{}; });
}

// Errors immediately with `e`.
template <class T>
inline observable<T> throw_error(std::exception_ptr e) {
  return observable<T>::create([e](observer<T> o){
    o.on_error(e);
    return subscription{};
  });
}

template <class T>
inline observable<T> throw_error(const std::string& message) {
  return throw_error<T>(std::make_exception_ptr(std::runtime_error(message)));
}

} // namespace ripple
