#include "Unifier.h"
#include "KnowledgeBase.h"
#include <stdexcept>

namespace ProofEngine
{
    std::string toString(UnifyErrorKind kind)
    {
        switch (kind)
        {
        case UnifyErrorKind::SYMBOL_CLASH:
            return "symbol clash";
        case UnifyErrorKind::ARITY_MISMATCH:
            return "arity mismatch";
        case UnifyErrorKind::OCCURS_CHECK:
            return "occurs check";
        case UnifyErrorKind::POLARITY_MISMATCH:
            return "polarity mismatch";
        }
        return "unknown";
    }

    std::string UnifyError::toString(const KnowledgeBase &kb) const
    {
        return ProofEngine::toString(kind) + ": cannot unify " + left.toString(kb) + " with " + right.toString(kb);
    }

    UnifyResult UnifyResult::success(Substitution subst)
    {
        UnifyResult result;
        result.subst = std::move(subst);
        return result;
    }

    UnifyResult UnifyResult::failure(UnifyErrorKind kind, const Term &left, const Term &right)
    {
        UnifyResult result;
        result.err = UnifyError{kind, left, right};
        return result;
    }

    const Substitution &UnifyResult::substitution() const
    {
        if (!subst)
        {
            throw std::logic_error("UnifyResult::substitution called on a failed unification");
        }
        return *subst;
    }

    const UnifyError &UnifyResult::error() const
    {
        if (!err)
        {
            throw std::logic_error("UnifyResult::error called on a successful unification");
        }
        return *err;
    }

    UnifyResult Unifier::unify(const Term &term1, const Term &term2, const Substitution &subst)
    {
        // 在副本上工作，失败时部分绑定随副本一起丢弃
        Substitution working = subst;
        if (auto error = unifyTerms(term1, term2, working))
        {
            return UnifyResult::failure(error->kind, error->left, error->right);
        }
        return UnifyResult::success(std::move(working));
    }

    UnifyResult Unifier::findMGU(const Literal &lit1, const Literal &lit2, const Substitution &subst)
    {
        if (lit1.isNegated() != lit2.isNegated())
        {
            return UnifyResult::failure(UnifyErrorKind::POLARITY_MISMATCH, lit1.getAtom(), lit2.getAtom());
        }
        return unify(lit1.getAtom(), lit2.getAtom(), subst);
    }

    std::optional<UnifyError> Unifier::unifyTerms(const Term &term1, const Term &term2, Substitution &subst)
    {
        Term left = subst.walk(term1);
        Term right = subst.walk(term2);

        if (left == right)
            return std::nullopt;

        if (left.isVariable())
            return bindVariable(left, right, subst);
        if (right.isVariable())
            return bindVariable(right, left, subst);

        if (left.isCompound() && right.isCompound())
        {
            if (left.getHead() != right.getHead())
                return UnifyError{UnifyErrorKind::SYMBOL_CLASH, left, right};
            if (left.arity() != right.arity())
                return UnifyError{UnifyErrorKind::ARITY_MISMATCH, left, right};

            // 从左到右逐个参数合一，遇到第一个失败就停止
            for (size_t i = 0; i < left.arity(); ++i)
            {
                if (auto error = unifyTerms(left.getArguments()[i], right.getArguments()[i], subst))
                    return error;
            }
            return std::nullopt;
        }

        return UnifyError{UnifyErrorKind::SYMBOL_CLASH, left, right};
    }

    std::optional<UnifyError> Unifier::bindVariable(const Term &var, const Term &term, Substitution &subst)
    {
        if (occursCheck(var.getHead(), term, subst))
        {
            return UnifyError{UnifyErrorKind::OCCURS_CHECK, var, term};
        }
        subst.bind(var.getHead(), term);
        return std::nullopt;
    }

    bool Unifier::occursCheck(const SymbolId &varId, const Term &term, const Substitution &subst)
    {
        Term current = subst.walk(term);
        if (current.isVariable())
            return current.getHead() == varId;

        for (const auto &arg : current.getArguments())
        {
            if (occursCheck(varId, arg, subst))
                return true;
        }
        return false;
    }
}
