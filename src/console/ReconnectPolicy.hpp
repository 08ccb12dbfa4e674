#ifndef __VC_RECONNECT_POLICY_HPP__
#define __VC_RECONNECT_POLICY_HPP__

#include "Headers.hpp"

namespace vc {
enum class TunnelState { DISCONNECTED, CONNECTED, GAVE_UP, FINISHED };

enum class TunnelEvent {
  CONNECT_SUCCEEDED,
  CONNECT_FAILED,
  TUNNEL_BROKEN,
  SESSION_ENDED
};

enum class TunnelAction {
  RECONNECT,
  SLEEP_AND_RETRY,
  PROXY,
  GIVE_UP,
  STOP
};

ostream& operator<<(ostream& os, TunnelState state);
ostream& operator<<(ostream& os, TunnelEvent event);
ostream& operator<<(ostream& os, TunnelAction action);

/**
 * @brief Connection state machine of a reconnecting tunnel.
 *
 * Failed connects back off exponentially, starting at the initial delay and
 * doubling after each failure, until the delay would exceed the ceiling.  A
 * successful connect, or a tunnel that breaks after being connected, starts
 * over from the initial delay.  The class does no I/O and never sleeps.
 */
class ReconnectPolicy {
 public:
  ReconnectPolicy(
      std::chrono::milliseconds _initialDelay =
          std::chrono::milliseconds(DEFAULT_INITIAL_RECONNECT_DELAY_MS),
      std::chrono::milliseconds _ceiling =
          std::chrono::milliseconds(DEFAULT_RETRY_CEILING_MS));

  /**
   * @brief Applies `event` and returns what the caller must do next.
   *
   * For SLEEP_AND_RETRY the caller sleeps for getLastSleep() and connects
   * again.
   */
  TunnelAction onEvent(TunnelEvent event);

  TunnelState getState() const { return state; }
  std::chrono::milliseconds getDelay() const { return delay; }
  std::chrono::milliseconds getLastSleep() const { return lastSleep; }

 protected:
  std::chrono::milliseconds initialDelay;
  std::chrono::milliseconds ceiling;
  std::chrono::milliseconds delay;
  std::chrono::milliseconds lastSleep;
  TunnelState state;
};
}  // namespace vc

#endif  // __VC_RECONNECT_POLICY_HPP__
