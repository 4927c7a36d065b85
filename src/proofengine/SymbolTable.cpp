#include "SymbolTable.h"

namespace ProofEngine
{
    int SymbolTable::insert(const std::string &name)
    {
        auto it = nameToId.find(name);
        if (it != nameToId.end())
        {
            return it->second;
        }
        int newId = static_cast<int>(names.size());
        names.push_back(name);
        nameToId[name] = newId;
        return newId;
    }

    std::string SymbolTable::get(int id) const
    {
        if (id >= 0 && id < static_cast<int>(names.size()))
        {
            return names[id];
        }
        return "";
    }

    int SymbolTable::getId(const std::string &name) const
    {
        auto it = nameToId.find(name);
        if (it != nameToId.end())
        {
            return it->second;
        }
        return -1;
    }
}
