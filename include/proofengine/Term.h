#ifndef PROOF_ENGINE_TERM_H
#define PROOF_ENGINE_TERM_H

#include <set>
#include <string>
#include <vector>
#include "SymbolType.h"

namespace ProofEngine
{
    class KnowledgeBase;

    // 项：变量、常量，或 函数符号 + 参数列表。
    // 种类由 head.type 直接给出，解析之后不再从文本形状推断。
    class Term
    {
    public:
        explicit Term(const SymbolId &head, std::vector<Term> arguments = {});

        static Term variable(int id);
        static Term constant(int id);
        static Term compound(int functorId, std::vector<Term> arguments);

        const SymbolId &getHead() const { return head; }
        const std::vector<Term> &getArguments() const { return arguments; }
        size_t arity() const { return arguments.size(); }

        bool isVariable() const { return head.type == SymbolType::VARIABLE; }
        bool isConstant() const { return head.type == SymbolType::CONSTANT; }
        bool isCompound() const { return head.type == SymbolType::FUNCTOR; }
        bool isGround() const;

        // 变量 var 是否出现在本项中（不展开任何替换）
        bool contains(const SymbolId &var) const;
        void collectVariables(std::set<SymbolId> &variables) const;

        std::string toString(const KnowledgeBase &kb) const;

        bool operator==(const Term &other) const
        {
            return head == other.head && arguments == other.arguments;
        }
        bool operator!=(const Term &other) const
        {
            return !(*this == other);
        }

        size_t hash() const;

    private:
        SymbolId head;
        std::vector<Term> arguments;
    };
}

namespace std
{
    template <>
    struct hash<ProofEngine::Term>
    {
        size_t operator()(const ProofEngine::Term &term) const
        {
            return term.hash();
        }
    };
}

#endif // PROOF_ENGINE_TERM_H
