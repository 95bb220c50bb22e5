// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/address.hpp"
#include "network/errors.hpp"
#include "network/session.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace meshwire {
namespace network {

// What a handler consumes, in call order
enum class ArgKind { Payload, Sender, Session };

const char* ArgKindName(ArgKind kind);

using ArgumentShape = std::vector<ArgKind>;

// One built argument: the decoded payload (absent for a zero-length payload),
// the sender's advertised Address, or the package's Session
using HandlerArgument = std::variant<std::optional<nlohmann::json>, Address, Session>;

// Type-erased handler. Arguments arrive in shape order; a returned value is
// the reply payload (REQUEST sessions only).
using HandlerFn = std::function<std::optional<nlohmann::json>(const std::vector<HandlerArgument>& args)>;

struct TypedHandler {
  HandlerFn fn;
  ArgumentShape shape;
};

// Throws std::invalid_argument if a kind is listed twice
void ValidateShape(const ArgumentShape& shape);

std::string ShapeToString(const ArgumentShape& shape);

namespace detail {

template <typename T>
struct callable_traits : callable_traits<decltype(&std::decay_t<T>::operator())> {};

template <typename R, typename... A>
struct callable_traits<R (*)(A...)> {
  using result_type = R;
  using args_tuple = std::tuple<A...>;
};

template <typename R, typename... A>
struct callable_traits<R(A...)> : callable_traits<R (*)(A...)> {};

template <typename C, typename R, typename... A>
struct callable_traits<R (C::*)(A...) const> : callable_traits<R (*)(A...)> {};

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
T ConvertPayload(const nlohmann::json& value) {
  if constexpr (std::is_same_v<T, nlohmann::json>) {
    return value;
  } else {
    try {
      return value.template get<T>();
    } catch (const nlohmann::json::exception& e) {
      throw DecodeError(std::string("payload has unexpected shape: ") + e.what());
    }
  }
}

template <ArgKind Kind, typename Param>
std::decay_t<Param> ConvertArgument(const HandlerArgument& arg) {
  using P = std::decay_t<Param>;
  if constexpr (Kind == ArgKind::Payload) {
    const auto* payload = std::get_if<std::optional<nlohmann::json>>(&arg);
    if (!payload) {
      throw std::invalid_argument("handler argument is not a payload");
    }
    if constexpr (is_optional<P>::value) {
      if (!*payload) {
        return std::nullopt;
      }
      return ConvertPayload<typename P::value_type>(**payload);
    } else {
      if (!*payload) {
        throw DecodeError("handler requires a payload but the package carries none");
      }
      return ConvertPayload<P>(**payload);
    }
  } else if constexpr (Kind == ArgKind::Sender) {
    static_assert(std::is_same_v<P, Address>, "Sender arguments must be declared as Address");
    const auto* sender = std::get_if<Address>(&arg);
    if (!sender) {
      throw std::invalid_argument("handler argument is not a sender address");
    }
    return *sender;
  } else {
    static_assert(std::is_same_v<P, Session>, "Session arguments must be declared as Session");
    const auto* session = std::get_if<Session>(&arg);
    if (!session) {
      throw std::invalid_argument("handler argument is not a session");
    }
    return *session;
  }
}

template <typename R>
std::optional<nlohmann::json> ConvertResult(R&& result) {
  using T = std::decay_t<R>;
  if constexpr (is_optional<T>::value) {
    if (!result) {
      return std::nullopt;
    }
    return nlohmann::json(*result);
  } else {
    return nlohmann::json(std::forward<R>(result));
  }
}

template <ArgKind... Kinds, typename F, size_t... I>
std::optional<nlohmann::json> Invoke(const F& fn, const std::vector<HandlerArgument>& args,
                                     std::index_sequence<I...>) {
  using Args = typename callable_traits<F>::args_tuple;
  using R = typename callable_traits<F>::result_type;
  if (args.size() != sizeof...(Kinds)) {
    throw std::invalid_argument("handler expects " + std::to_string(sizeof...(Kinds)) + " arguments, got " +
                                std::to_string(args.size()));
  }
  if constexpr (std::is_void_v<R>) {
    fn(ConvertArgument<Kinds, std::tuple_element_t<I, Args>>(args[I])...);
    return std::nullopt;
  } else {
    return ConvertResult(fn(ConvertArgument<Kinds, std::tuple_element_t<I, Args>>(args[I])...));
  }
}

}  // namespace detail

/**
 * MakeHandler - build a TypedHandler from a plain callable
 *
 * The kinds list the callable's parameters in order; arity is checked at
 * compile time. Parameter types:
 *   Payload: nlohmann::json, std::optional<T>, or any T with from_json
 *            (non-optional types raise DecodeError on an absent payload)
 *   Sender:  Address
 *   Session: Session
 * Return void or std::nullopt for no reply; anything else convertible to
 * nlohmann::json becomes the reply payload.
 *
 * Usage:
 *   node.RegisterHandler("KAD", "PING",
 *       MakeHandler<ArgKind::Payload, ArgKind::Sender>(
 *           [](const Ping& ping, const Address& from) { return Pong{ping.nonce}; }));
 *
 * The callable may run concurrently on several handler threads.
 */
template <ArgKind... Kinds, typename F>
TypedHandler MakeHandler(F fn) {
  using Args = typename detail::callable_traits<F>::args_tuple;
  static_assert(std::tuple_size_v<Args> == sizeof...(Kinds), "handler arity does not match its argument kinds");

  TypedHandler handler;
  handler.shape = ArgumentShape{Kinds...};
  handler.fn = [fn = std::move(fn)](const std::vector<HandlerArgument>& args) -> std::optional<nlohmann::json> {
    return detail::Invoke<Kinds...>(fn, args, std::make_index_sequence<sizeof...(Kinds)>{});
  };
  return handler;
}

}  // namespace network
}  // namespace meshwire
