#include "Term.h"
#include "KnowledgeBase.h"

namespace ProofEngine
{
    Term::Term(const SymbolId &head, std::vector<Term> arguments)
        : head(head), arguments(std::move(arguments)) {}

    Term Term::variable(int id)
    {
        return Term(SymbolId{SymbolType::VARIABLE, id});
    }

    Term Term::constant(int id)
    {
        return Term(SymbolId{SymbolType::CONSTANT, id});
    }

    Term Term::compound(int functorId, std::vector<Term> arguments)
    {
        return Term(SymbolId{SymbolType::FUNCTOR, functorId}, std::move(arguments));
    }

    bool Term::isGround() const
    {
        if (isVariable())
            return false;
        for (const auto &arg : arguments)
        {
            if (!arg.isGround())
                return false;
        }
        return true;
    }

    bool Term::contains(const SymbolId &var) const
    {
        if (head == var)
            return true;
        for (const auto &arg : arguments)
        {
            if (arg.contains(var))
                return true;
        }
        return false;
    }

    void Term::collectVariables(std::set<SymbolId> &variables) const
    {
        if (isVariable())
        {
            variables.insert(head);
            return;
        }
        for (const auto &arg : arguments)
        {
            arg.collectVariables(variables);
        }
    }

    std::string Term::toString(const KnowledgeBase &kb) const
    {
        std::string result = kb.getSymbolName(head);
        if (!isCompound())
        {
            return result;
        }
        result += "(";
        for (size_t i = 0; i < arguments.size(); ++i)
        {
            result += arguments[i].toString(kb);
            if (i < arguments.size() - 1)
            {
                result += ",";
            }
        }
        result += ")";
        return result;
    }

    size_t Term::hash() const
    {
        size_t h = std::hash<SymbolId>{}(head);
        for (const auto &arg : arguments)
        {
            h ^= arg.hash() + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }
}
