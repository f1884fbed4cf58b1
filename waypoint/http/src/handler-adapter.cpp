#include "waypoint/handler-adapter.hpp"

#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "waypoint/http-request.hpp"
#include "waypoint/http-response.hpp"
#include "waypoint/path-params.hpp"

namespace waypoint {

namespace {

constexpr std::string_view kValueTypeNames[] = {"string", "integer", "float", "uuid"};

}  // namespace

std::string_view ParamValueTypeToStr(ParamValueType type) noexcept {
  return kValueTypeNames[static_cast<uint8_t>(type)];
}

HandlerAdapter::HandlerAdapter(HandlerFunction handler, std::initializer_list<ParamBinding> bindings,
                               RequestSlot requestSlot)
    : HandlerAdapter(std::move(handler), std::span<const ParamBinding>(bindings.begin(), bindings.size()),
                     requestSlot) {}

HandlerAdapter::HandlerAdapter(HandlerFunction handler, std::span<const ParamBinding> bindings,
                               RequestSlot requestSlot)
    : _handler(std::move(handler)), _bindings(bindings.begin(), bindings.end()), _requestSlot(requestSlot) {
  validate();
}

void HandlerAdapter::validate() const {
  if (!_handler) {
    throw std::invalid_argument("Cannot set empty handler");
  }
  for (auto it = _bindings.begin(); it != _bindings.end(); ++it) {
    if (it->name.empty()) {
      throw std::invalid_argument("Handler parameter binding name cannot be empty");
    }
    if (it->name == kRequestSlotName) {
      throw std::invalid_argument("Handler parameter binding cannot be named 'request', use RequestSlot::Wanted");
    }
    for (auto nextIt = std::next(it); nextIt != _bindings.end(); ++nextIt) {
      if (nextIt->name == it->name) {
        throw std::invalid_argument("Duplicate handler parameter binding '" + it->name + "'");
      }
    }
  }
}

const ParamBinding* HandlerAdapter::findBinding(std::string_view name) const noexcept {
  for (const ParamBinding& binding : _bindings) {
    if (binding.name == name) {
      return &binding;
    }
  }
  return nullptr;
}

HttpResponse HandlerAdapter::operator()(HttpRequest& request, const PathParams& params) const {
  return _handler(wantsRequest() ? &request : nullptr, params);
}

}  // namespace waypoint
