#ifndef __VC_CONSOLE_SELECTOR_HPP__
#define __VC_CONSOLE_SELECTOR_HPP__

#include "ConsoleBackend.hpp"
#include "Headers.hpp"

namespace vc {
/**
 * @brief Picks a console for a VM and attaches the operator to it.
 *
 * Text consoles are tried before graphical ones.  The first console that
 * opens ends the search; when none does, the fallback console runs instead.
 */
class ConsoleSelector {
 public:
  explicit ConsoleSelector(shared_ptr<ConsoleBackend> _backend);

  /**
   * @brief Returns the consoles in the order they will be tried.  Text
   * consoles keep their relative order and come before graphical ones.
   */
  static vector<ConsoleDescriptor> orderByPreference(
      const ConsoleList& consoles);

  /**
   * @brief Attaches to the best available console.
   * @return 0 after a session, the fallback's status if it ran, 1 otherwise.
   */
  int attach(const ConsoleList& consoles);

 protected:
  shared_ptr<ConsoleBackend> backend;

  void open(const ConsoleDescriptor& descriptor);
  int runFallback(const ConsoleList& consoles);
};
}  // namespace vc

#endif  // __VC_CONSOLE_SELECTOR_HPP__
