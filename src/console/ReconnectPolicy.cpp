#include "ReconnectPolicy.hpp"

namespace vc {
ostream& operator<<(ostream& os, TunnelState state) {
  switch (state) {
    case TunnelState::DISCONNECTED:
      return os << "DISCONNECTED";
    case TunnelState::CONNECTED:
      return os << "CONNECTED";
    case TunnelState::GAVE_UP:
      return os << "GAVE_UP";
    case TunnelState::FINISHED:
      return os << "FINISHED";
  }
  return os << "UNKNOWN";
}

ostream& operator<<(ostream& os, TunnelEvent event) {
  switch (event) {
    case TunnelEvent::CONNECT_SUCCEEDED:
      return os << "CONNECT_SUCCEEDED";
    case TunnelEvent::CONNECT_FAILED:
      return os << "CONNECT_FAILED";
    case TunnelEvent::TUNNEL_BROKEN:
      return os << "TUNNEL_BROKEN";
    case TunnelEvent::SESSION_ENDED:
      return os << "SESSION_ENDED";
  }
  return os << "UNKNOWN";
}

ostream& operator<<(ostream& os, TunnelAction action) {
  switch (action) {
    case TunnelAction::RECONNECT:
      return os << "RECONNECT";
    case TunnelAction::SLEEP_AND_RETRY:
      return os << "SLEEP_AND_RETRY";
    case TunnelAction::PROXY:
      return os << "PROXY";
    case TunnelAction::GIVE_UP:
      return os << "GIVE_UP";
    case TunnelAction::STOP:
      return os << "STOP";
  }
  return os << "UNKNOWN";
}

ReconnectPolicy::ReconnectPolicy(std::chrono::milliseconds _initialDelay,
                                 std::chrono::milliseconds _ceiling)
    : initialDelay(_initialDelay),
      ceiling(_ceiling),
      delay(_initialDelay),
      lastSleep(0),
      state(TunnelState::DISCONNECTED) {
  if (initialDelay.count() <= 0) {
    throw std::invalid_argument("Initial reconnect delay must be positive");
  }
}

TunnelAction ReconnectPolicy::onEvent(TunnelEvent event) {
  if (state == TunnelState::GAVE_UP || state == TunnelState::FINISHED) {
    STFATAL << "Event " << event << " after the tunnel stopped (" << state
            << ")";
  }

  TunnelAction action = TunnelAction::STOP;
  switch (event) {
    case TunnelEvent::CONNECT_SUCCEEDED:
      state = TunnelState::CONNECTED;
      delay = initialDelay;
      action = TunnelAction::PROXY;
      break;
    case TunnelEvent::CONNECT_FAILED:
      if (state != TunnelState::DISCONNECTED) {
        STFATAL << "Connect failed while " << state;
      }
      if (delay <= ceiling) {
        lastSleep = delay;
        delay *= 2;
        action = TunnelAction::SLEEP_AND_RETRY;
      } else {
        state = TunnelState::GAVE_UP;
        action = TunnelAction::GIVE_UP;
      }
      break;
    case TunnelEvent::TUNNEL_BROKEN:
      state = TunnelState::DISCONNECTED;
      delay = initialDelay;
      action = TunnelAction::RECONNECT;
      break;
    case TunnelEvent::SESSION_ENDED:
      state = TunnelState::FINISHED;
      action = TunnelAction::STOP;
      break;
  }
  VLOG(2) << "Tunnel event " << event << " -> " << state << ", " << action
          << " (delay " << delay.count() << "ms)";
  return action;
}
}  // namespace vc
