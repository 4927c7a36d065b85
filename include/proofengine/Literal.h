#ifndef PROOF_ENGINE_LITERAL_H
#define PROOF_ENGINE_LITERAL_H

#include <string>
#include "Term.h"

namespace ProofEngine
{
    class KnowledgeBase;

    class Literal
    {
    public:
        Literal(const Term &atom, bool negated);

        const Term &getAtom() const;
        bool isNegated() const;

        // 极性取反后的文字
        Literal complement() const;

        std::string toString(const KnowledgeBase &kb) const;

        bool operator==(const Literal &other) const;
        bool operator!=(const Literal &other) const;

        size_t hash() const
        {
            size_t h = atom.hash();
            h ^= std::hash<bool>{}(negated) + 0x9e3779b9 + (h << 6) + (h >> 2);
            return h;
        }

    private:
        Term atom;
        bool negated;
    };
}

namespace std
{
    template <>
    struct hash<ProofEngine::Literal>
    {
        size_t operator()(const ProofEngine::Literal &lit) const
        {
            return lit.hash();
        }
    };
}
#endif // PROOF_ENGINE_LITERAL_H
