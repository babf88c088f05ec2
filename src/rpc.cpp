#include "rpc.hpp"

const char *to_string(RouteResult result) {
    switch (result) {
    case RouteResult::Delivered:
        return "delivered";
    case RouteResult::UnknownEntity:
        return "unknown entity";
    case RouteResult::NoMessenger:
        return "no messenger";
    case RouteResult::UnknownFunction:
        return "unknown function";
    case RouteResult::DecodeFailed:
        return "decode failed";
    case RouteResult::HandlerFailed:
        return "handler failed";
    }
    return "unknown";
}
