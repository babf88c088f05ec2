#pragma once

#include "id.hpp"
#include "packets.hpp"
#include <string_view>

// Routing key of a named RPC function. Both ends hash the same declared
// name, so no type information has to be shared.
constexpr FunctionId function_id_of(std::string_view name) { return fnv1a64(name); }

/*
 * A remote function taking one argument of type Arg, declared once and
 * used by both the caller and the receiver:
 *
 *   inline constexpr RpcFn<std::string> CHAT_SAY{"chat.say"};
 *
 * Arg must be encodable with the wire format.
 */
template <typename Arg> struct RpcFn {
  std::string_view name;

  constexpr explicit RpcFn(std::string_view name) : name(name) {}
  constexpr FunctionId id() const { return function_id_of(name); }
};

// Kind of client-side handle a messenger asks its subscribers to create
struct HandleType {
  std::string_view name;

  constexpr explicit HandleType(std::string_view name) : name(name) {}
  handle_type_id id() const { return Id::from_name(name); }
};

enum class RouteResult {
  Delivered,
  UnknownEntity,
  NoMessenger,
  UnknownFunction,
  DecodeFailed,
  HandlerFailed
};

const char *to_string(RouteResult result);
