#pragma once
/** @file  ActionRegistry.hpp
 *  @brief Runtime registry that maps CLI flags to one-shot actions.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <functional>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <vector>

namespace hyprdock::core {

  /**
 * @class ActionRegistry
 * @brief Register & invoke actions by flag (`--extend`, `-eo`, ...).
 *
 *  * Keeps `main` decoupled from the controller/actuator wiring.
 *  * Several flags may share one action; help text is kept per action.
 */
  class ActionRegistry {
  public:
    using Action = std::function<void()>;

    /// Register \p action under every name in \p names.  Returns false on duplicate.
    bool registerAction(std::initializer_list<std::string> names, std::string help, Action action);

    bool contains(const std::string& name) const;

    /// Run the action or throw `std::out_of_range` if unknown.
    void invoke(const std::string& name) const;

    /// One line per action: `  --extend/-eo    Extends monitors`.
    std::string helpText() const;

  private:
    struct Entry {
      std::vector<std::string> names;
      std::string help;
      Action action;
    };

    std::vector<Entry> entries_;                      ///< registration order for help
    std::unordered_map<std::string, std::size_t> byName_; ///< flag → index into entries_
  };

} // namespace hyprdock::core
