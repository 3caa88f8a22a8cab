#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch named commands (CLI parameters, rc settings).
 * Design: map name → handler (args vector, msg); handler returns false with
 * msg when the arguments are unusable.
 */
#include <string>
#include <map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  /* false with msg for unknown names or rejected arguments */
  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return false; }
    return it->second(args, msg);
  }
private:
  std::map<std::string, Handler> map_;
};
