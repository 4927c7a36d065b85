#ifndef PROOF_ENGINE_CLAUSE_H
#define PROOF_ENGINE_CLAUSE_H

#include <set>
#include <string>
#include <vector>
#include "Literal.h"

namespace ProofEngine
{
    class KnowledgeBase;

    // 文字的析取，按值去重，文字顺序不影响相等性和哈希
    class Clause
    {
    public:
        Clause() = default;
        explicit Clause(const std::vector<Literal> &lits);

        // 重复的文字只保留一个
        void addLiteral(const Literal &lit);
        const std::vector<Literal> &getLiterals() const;
        bool isEmpty() const;
        size_t size() const { return literals.size(); }

        bool contains(const Literal &lit) const;
        int findLiteralIndex(const Literal &lit) const;

        bool isTautology() const; // 同时含有 L 和 ¬L
        std::set<SymbolId> collectVariables() const;

        std::string toString(const KnowledgeBase &kb) const;

        // 变量按首次出现重新编号后的规范串，变量改名后的同一子句得到相同结果
        std::string variantKey() const;

        size_t hash() const;
        bool operator==(const Clause &other) const;
        bool operator!=(const Clause &other) const { return !(*this == other); }

    private:
        std::vector<Literal> literals;

        mutable size_t hashValue = 0;
        mutable bool hashComputed = false;
    };
}

namespace std
{
    template <>
    struct hash<ProofEngine::Clause>
    {
        size_t operator()(const ProofEngine::Clause &clause) const
        {
            return clause.hash();
        }
    };
}

#endif // PROOF_ENGINE_CLAUSE_H
