/* @file ActionRegistry.cpp
 * @brief flag → action lookup
 *
 * © 2025 HyprDock - MIT-licensed.
 */

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "core/ActionRegistry.hpp"

namespace hyprdock::core {

  bool ActionRegistry::registerAction(std::initializer_list<std::string> names, std::string help,
                                      Action action) {
    if (names.size() == 0 || !action)
      return false;
    for (const auto& n : names)
      if (byName_.count(n))
        return false;

    const std::size_t index = entries_.size();
    entries_.push_back({ std::vector<std::string>(names), std::move(help), std::move(action) });
    for (const auto& n : names)
      byName_.emplace(n, index);
    return true;
  }

  bool ActionRegistry::contains(const std::string& name) const { return byName_.count(name) != 0; }

  void ActionRegistry::invoke(const std::string& name) const {
    auto it = byName_.find(name);
    if (it == byName_.end())
      throw std::out_of_range("[ActionRegistry] unknown action: " + name);
    entries_[it->second].action();
  }

  std::string ActionRegistry::helpText() const {
    std::ostringstream out;
    for (const auto& e : entries_) {
      std::string flags;
      for (const auto& n : e.names)
        flags += (flags.empty() ? "" : "/") + n;
      out << "  " << std::left << std::setw(20) << flags << e.help << '\n';
    }
    return out.str();
  }

} // namespace hyprdock::core
