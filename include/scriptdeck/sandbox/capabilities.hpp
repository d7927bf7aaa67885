/*
 * scriptdeck C++ - Capability Allowlist
 *
 * The fixed table of what executed scripts may touch:
 *   - allowed built-ins: the only names placed in the script's __builtins__
 *   - deny-list: module names that must never resolve through import
 *
 * Process-wide, immutable, compiled in. Every worker applies the same
 * table; nothing about it can be changed by a request.
 */
#ifndef scriptdeck_SANDBOX_CAPABILITIES_HPP
#define scriptdeck_SANDBOX_CAPABILITIES_HPP

#include <string>
#include <vector>
#include <set>

namespace scriptdeck {

struct ImportDecision {
    bool allowed;
    std::string denied_name;    // module or symbol that triggered the denial
    std::string reason;         // message raised as ImportError inside the script
    
    ImportDecision() : allowed(true) {}
    
    static ImportDecision allow() { return ImportDecision(); }
    
    static ImportDecision deny(const std::string& name, const std::string& reason) {
        ImportDecision d;
        d.allowed = false;
        d.denied_name = name;
        d.reason = reason;
        return d;
    }
};

class CapabilityAllowlist {
public:
    static const CapabilityAllowlist& instance();
    
    // True if `name` may appear in the script's built-ins
    bool resolve_builtin(const std::string& name) const;
    
    // Decide an import statement. `level` > 0 means a relative import.
    // Denied when the module (or its top-level package) is deny-listed or
    // private, or when any imported name is.
    ImportDecision resolve_import(const std::string& module_name,
                                  const std::vector<std::string>& imported_names,
                                  int level = 0) const;
    
    bool is_module_denied(const std::string& module_name) const;
    
    // Enumeration order of the allowed built-ins
    const std::vector<std::string>& builtins() const { return builtin_order_; }
    const std::set<std::string>& denied_modules() const { return denied_modules_; }
    
private:
    CapabilityAllowlist();
    CapabilityAllowlist(const CapabilityAllowlist&);
    CapabilityAllowlist& operator=(const CapabilityAllowlist&);
    
    std::vector<std::string> builtin_order_;
    std::set<std::string> builtins_;
    std::set<std::string> denied_modules_;
};

} // namespace scriptdeck

#endif // scriptdeck_SANDBOX_CAPABILITIES_HPP
