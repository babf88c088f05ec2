#include "net_types.hpp"
#include <string>

const char *to_string(SendMode mode) {
    switch (mode) {
    case SendMode::Quick:
        return "quick";
    case SendMode::Safe:
        return "safe";
    }
    return "unknown";
}

const char *to_string(SendResult result) {
    switch (result) {
    case SendResult::Ok:
        return "ok";
    case SendResult::TooLarge:
        return "packet too large";
    case SendResult::UnknownClient:
        return "unknown client";
    case SendResult::NotConnected:
        return "not connected";
    case SendResult::QueueFull:
        return "outbound queue full";
    case SendResult::IoError:
        return "i/o error";
    }
    return "unknown";
}

const char *to_string(ConnectionState state) {
    switch (state) {
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Connected:
        return "connected";
    case ConnectionState::Disconnected:
        return "disconnected";
    }
    return "unknown";
}

std::string Endpoint::to_string() const {
    return std::to_string((address >> 24) & 0xFF) + "." +
           std::to_string((address >> 16) & 0xFF) + "." +
           std::to_string((address >> 8) & 0xFF) + "." +
           std::to_string(address & 0xFF) + ":" + std::to_string(port);
}
