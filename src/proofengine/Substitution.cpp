#include "Substitution.h"
#include "KnowledgeBase.h"
#include <algorithm>
#include <vector>

namespace ProofEngine
{
    void Substitution::bind(const SymbolId &var, const Term &term)
    {
        bindings.insert_or_assign(var, term);
    }

    const Term *Substitution::lookup(const SymbolId &var) const
    {
        auto it = bindings.find(var);
        if (it == bindings.end())
        {
            return nullptr;
        }
        return &it->second;
    }

    bool Substitution::contains(const SymbolId &var) const
    {
        return bindings.find(var) != bindings.end();
    }

    Term Substitution::walk(const Term &term) const
    {
        const Term *current = &term;
        while (current->isVariable())
        {
            const Term *next = lookup(current->getHead());
            if (next == nullptr)
            {
                break;
            }
            current = next;
        }
        return *current;
    }

    Term Substitution::apply(const Term &term) const
    {
        if (term.isVariable())
        {
            const Term *bound = lookup(term.getHead());
            if (bound == nullptr)
            {
                return term;
            }
            return apply(*bound);
        }
        if (!term.isCompound())
        {
            return term;
        }

        std::vector<Term> newArgs;
        newArgs.reserve(term.arity());
        for (const auto &arg : term.getArguments())
        {
            newArgs.push_back(apply(arg));
        }
        return Term(term.getHead(), std::move(newArgs));
    }

    Literal Substitution::apply(const Literal &lit) const
    {
        return Literal(apply(lit.getAtom()), lit.isNegated());
    }

    Clause Substitution::apply(const Clause &clause) const
    {
        Clause result;
        for (const auto &lit : clause.getLiterals())
        {
            result.addLiteral(apply(lit));
        }
        return result;
    }

    bool Substitution::isAcyclic() const
    {
        // 0 = 未访问, 1 = 在当前路径上, 2 = 已确认无环
        std::unordered_map<SymbolId, int> state;
        for (const auto &[var, term] : bindings)
        {
            if (reaches(var, term, state))
            {
                return false;
            }
        }
        return true;
    }

    bool Substitution::reaches(const SymbolId &var, const Term &term, std::unordered_map<SymbolId, int> &state) const
    {
        int &mark = state[var];
        if (mark == 1)
            return true;
        if (mark == 2)
            return false;
        mark = 1;

        std::set<SymbolId> variables;
        term.collectVariables(variables);
        for (const auto &next : variables)
        {
            const Term *bound = lookup(next);
            if (bound != nullptr && reaches(next, *bound, state))
            {
                return true;
            }
            if (next == var)
            {
                return true;
            }
        }
        state[var] = 2;
        return false;
    }

    std::string Substitution::toString(const KnowledgeBase &kb) const
    {
        if (bindings.empty())
        {
            return "{}";
        }

        std::vector<std::string> entries;
        for (const auto &[var, term] : bindings)
        {
            entries.push_back(kb.getSymbolName(var) + " -> " + term.toString(kb));
        }
        std::sort(entries.begin(), entries.end());

        std::string result = "{";
        for (size_t i = 0; i < entries.size(); ++i)
        {
            result += entries[i];
            if (i < entries.size() - 1)
            {
                result += ", ";
            }
        }
        return result + "}";
    }
}
