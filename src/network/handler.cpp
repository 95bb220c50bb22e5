// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/handler.hpp"

#include <algorithm>

namespace meshwire {
namespace network {

const char* ArgKindName(ArgKind kind) {
  switch (kind) {
  case ArgKind::Payload:
    return "payload";
  case ArgKind::Sender:
    return "sender";
  case ArgKind::Session:
    return "session";
  }
  return "unknown";
}

void ValidateShape(const ArgumentShape& shape) {
  for (auto it = shape.begin(); it != shape.end(); ++it) {
    if (std::find(std::next(it), shape.end(), *it) != shape.end()) {
      throw std::invalid_argument(std::string("argument kind '") + ArgKindName(*it) + "' listed more than once in " +
                                  ShapeToString(shape));
    }
  }
}

std::string ShapeToString(const ArgumentShape& shape) {
  std::string out = "(";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i > 0)
      out += ", ";
    out += ArgKindName(shape[i]);
  }
  out += ")";
  return out;
}

}  // namespace network
}  // namespace meshwire
