#include <functional>
#include <map>
#include <string>
#include <vector>

#include "utils/util.hh"

#ifndef CADAVAE_REGISTRY_HH_
#define CADAVAE_REGISTRY_HH_

namespace cadavae {

/// Model name -> training procedure, filled in by whoever owns it
template <typename FUN>
struct procedure_registry_t {

    void add(const std::string &name, FUN fun)
    {
        ASSERT(table.count(name) == 0, "already registered: " << name);
        table[name] = fun;
    }

    bool has(const std::string &name) const { return table.count(name) > 0; }

    const FUN &get(const std::string &name) const
    {
        if (!has(name)) {
            std::string avail;
            for (const auto &n : names())
                avail += " " + n;
            ASSERT(false, "unknown model: " << name << "; available:" << avail);
        }
        return table.at(name);
    }

    std::vector<std::string> names() const
    {
        std::vector<std::string> ret;
        for (const auto &pp : table)
            ret.emplace_back(pp.first);
        return ret;
    }

private:
    std::map<std::string, FUN> table;
};

} // namespace
#endif
