#ifndef PROOF_ENGINE_SUBSTITUTION_H
#define PROOF_ENGINE_SUBSTITUTION_H

#include <string>
#include <unordered_map>
#include "Clause.h"
#include "Literal.h"
#include "Term.h"

namespace ProofEngine
{
    class KnowledgeBase;

    // 变量 -> 项 的映射。绑定以三角形式保存：被绑定的项里可以出现其它已绑定变量，
    // apply 会一直展开到底。由 Unifier 写入时保证无环。
    class Substitution
    {
    public:
        void bind(const SymbolId &var, const Term &term);

        const Term *lookup(const SymbolId &var) const;
        bool contains(const SymbolId &var) const;
        bool empty() const { return bindings.empty(); }
        size_t size() const { return bindings.size(); }
        const std::unordered_map<SymbolId, Term> &getBindings() const { return bindings; }

        // 只展开最外层的变量链
        Term walk(const Term &term) const;

        Term apply(const Term &term) const;
        Literal apply(const Literal &lit) const;
        Clause apply(const Clause &clause) const;

        bool isAcyclic() const;

        std::string toString(const KnowledgeBase &kb) const;

        bool operator==(const Substitution &other) const { return bindings == other.bindings; }
        bool operator!=(const Substitution &other) const { return !(*this == other); }

    private:
        bool reaches(const SymbolId &var, const Term &term, std::unordered_map<SymbolId, int> &state) const;

        std::unordered_map<SymbolId, Term> bindings;
    };
}

#endif // PROOF_ENGINE_SUBSTITUTION_H
