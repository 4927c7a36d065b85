#include "Literal.h"
#include "KnowledgeBase.h"

namespace ProofEngine
{
    Literal::Literal(const Term &atom, bool negated)
        : atom(atom), negated(negated) {}

    const Term &Literal::getAtom() const
    {
        return atom;
    }

    bool Literal::isNegated() const
    {
        return negated;
    }

    Literal Literal::complement() const
    {
        return Literal(atom, !negated);
    }

    std::string Literal::toString(const KnowledgeBase &kb) const
    {
        std::string result = negated ? "¬" : "";
        return result + atom.toString(kb);
    }

    bool Literal::operator==(const Literal &other) const
    {
        // 极性相同且原子结构完全一致（包括变量编号）
        return negated == other.negated && atom == other.atom;
    }

    bool Literal::operator!=(const Literal &other) const
    {
        return !(*this == other);
    }
}
