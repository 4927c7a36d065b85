#include "Resolver.h"
#include "VariableRenamer.h"
#include <unordered_set>

namespace ProofEngine
{
    namespace
    {
        void addUnique(std::vector<Clause> &clauses, Clause clause)
        {
            for (const auto &existing : clauses)
            {
                if (existing == clause)
                    return;
            }
            clauses.push_back(std::move(clause));
        }

        // clause 本身加上它的全部因子
        std::vector<Clause> withFactors(const Clause &clause)
        {
            std::vector<Clause> result = {clause};
            for (auto &factor : Resolver::factors(clause))
            {
                result.push_back(std::move(factor));
            }
            return result;
        }
    }

    std::vector<Clause> Resolver::resolve(const Clause &c1, const Clause &c2, KnowledgeBase &kb)
    {
        std::vector<Clause> resolvents;
        Clause renamed = VariableRenamer::standardizeApart(c2, c1, kb);

        // 因子只是对各自子句的变量做替换，两侧仍然没有公共变量
        std::vector<Clause> left = withFactors(c1);
        std::vector<Clause> right = withFactors(renamed);

        for (const auto &a : left)
        {
            for (const auto &b : right)
            {
                const auto &lits1 = a.getLiterals();
                const auto &lits2 = b.getLiterals();
                for (size_t i = 0; i < lits1.size(); ++i)
                {
                    for (size_t j = 0; j < lits2.size(); ++j)
                    {
                        if (!isComplementary(lits1[i], lits2[j]))
                            continue;

                        auto resolvent = resolvePair(a, b, static_cast<int>(i), static_cast<int>(j));
                        if (resolvent)
                        {
                            addUnique(resolvents, std::move(*resolvent));
                        }
                    }
                }
            }
        }
        return resolvents;
    }

    std::optional<Clause> Resolver::resolvePair(const Clause &c1, const Clause &c2, int l1, int l2)
    {
        if (l1 < 0 || l1 >= static_cast<int>(c1.size()) || l2 < 0 || l2 >= static_cast<int>(c2.size()))
        {
            return std::nullopt;
        }

        auto mgu = complementaryUnifier(c1.getLiterals()[l1], c2.getLiterals()[l2]);
        if (!mgu)
        {
            return std::nullopt;
        }
        const Substitution &subst = mgu.substitution();

        Clause resolvent;
        for (int i = 0; i < static_cast<int>(c1.size()); ++i)
        {
            if (i != l1)
            {
                resolvent.addLiteral(subst.apply(c1.getLiterals()[i]));
            }
        }
        for (int j = 0; j < static_cast<int>(c2.size()); ++j)
        {
            if (j != l2)
            {
                resolvent.addLiteral(subst.apply(c2.getLiterals()[j]));
            }
        }
        return resolvent;
    }

    std::vector<Clause> Resolver::factors(const Clause &clause)
    {
        std::vector<Clause> result;
        std::unordered_set<std::string> seen = {clause.variantKey()};

        // 每个因子都比来源少至少一个文字，队列必然耗尽
        std::vector<Clause> pending = {clause};
        while (!pending.empty())
        {
            Clause current = std::move(pending.back());
            pending.pop_back();

            const auto &lits = current.getLiterals();
            for (size_t i = 0; i < lits.size(); ++i)
            {
                for (size_t j = i + 1; j < lits.size(); ++j)
                {
                    const Term &a = lits[i].getAtom();
                    const Term &b = lits[j].getAtom();
                    if (lits[i].isNegated() != lits[j].isNegated() || a.getHead() != b.getHead() || a.arity() != b.arity())
                        continue;

                    auto mgu = Unifier::findMGU(lits[i], lits[j]);
                    if (!mgu)
                        continue;

                    Clause factor = mgu.substitution().apply(current);
                    if (seen.insert(factor.variantKey()).second)
                    {
                        pending.push_back(factor);
                        result.push_back(std::move(factor));
                    }
                }
            }
        }
        return result;
    }

    UnifyResult Resolver::complementaryUnifier(const Literal &lit1, const Literal &lit2)
    {
        if (lit1.isNegated() == lit2.isNegated())
        {
            return UnifyResult::failure(UnifyErrorKind::POLARITY_MISMATCH, lit1.getAtom(), lit2.getAtom());
        }
        if (lit1.getAtom().isVariable() || lit2.getAtom().isVariable())
        {
            return UnifyResult::failure(UnifyErrorKind::SYMBOL_CLASH, lit1.getAtom(), lit2.getAtom());
        }
        return Unifier::unify(lit1.getAtom(), lit2.getAtom());
    }

    bool Resolver::isComplementary(const Literal &lit1, const Literal &lit2)
    {
        if (lit1.isNegated() == lit2.isNegated())
            return false;

        const Term &a = lit1.getAtom();
        const Term &b = lit2.getAtom();
        if (a.isVariable() || b.isVariable())
            return false;
        return a.getHead() == b.getHead() && a.arity() == b.arity();
    }
}
