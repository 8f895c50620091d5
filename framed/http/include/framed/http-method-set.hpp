#pragma once

#include <amc/fixedcapacityvector.hpp>
#include <cstddef>
#include <initializer_list>

#include "framed/http-method.hpp"

namespace framed::http {

// Methods a route declares itself willing to accept, in declaration order.
// A method is stored at most once. An empty set accepts any method.
class MethodSet {
 public:
  using storage_type = amc::FixedCapacityVector<Method, kNbMethods>;
  using const_iterator = storage_type::const_iterator;

  MethodSet() noexcept = default;

  MethodSet(std::initializer_list<Method> methods) {
    for (Method method : methods) {
      insert(method);
    }
  }

  // Appends method if not already present. Returns true if it was added.
  bool insert(Method method) {
    if (contains(method)) {
      return false;
    }
    _methods.push_back(method);
    _bmp = _bmp | method;
    return true;
  }

  [[nodiscard]] bool contains(Method method) const noexcept { return IsMethodSet(_bmp, method); }

  [[nodiscard]] bool accepts(Method method) const noexcept { return _bmp == 0U || contains(method); }

  [[nodiscard]] bool empty() const noexcept { return _methods.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return _methods.size(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _methods.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _methods.end(); }

  [[nodiscard]] MethodBmp bmp() const noexcept { return _bmp; }

  // Membership equality, declaration order is not significant.
  bool operator==(const MethodSet& rhs) const noexcept { return _bmp == rhs._bmp; }

 private:
  storage_type _methods;
  MethodBmp _bmp{};
};

}  // namespace framed::http
