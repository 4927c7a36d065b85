#include "Clause.h"
#include "KnowledgeBase.h"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace ProofEngine
{
    namespace
    {
        // 用编号而不是名字输出项；variableIndex 为空时所有变量输出为 "?"
        void appendTermKey(const Term &term, std::unordered_map<SymbolId, int> *variableIndex, std::string &out)
        {
            const SymbolId &head = term.getHead();
            if (term.isVariable())
            {
                if (variableIndex == nullptr)
                {
                    out += "?";
                    return;
                }
                auto it = variableIndex->find(head);
                if (it == variableIndex->end())
                {
                    int next = static_cast<int>(variableIndex->size());
                    it = variableIndex->emplace(head, next).first;
                }
                out += "V" + std::to_string(it->second);
                return;
            }

            out += (term.isConstant() ? "C" : "F") + std::to_string(head.id);
            if (term.isCompound())
            {
                out += "(";
                for (size_t i = 0; i < term.getArguments().size(); ++i)
                {
                    if (i > 0)
                        out += ",";
                    appendTermKey(term.getArguments()[i], variableIndex, out);
                }
                out += ")";
            }
        }

        std::string literalKey(const Literal &lit, std::unordered_map<SymbolId, int> *variableIndex)
        {
            std::string key = lit.isNegated() ? "-" : "+";
            appendTermKey(lit.getAtom(), variableIndex, key);
            return key;
        }
    }

    Clause::Clause(const std::vector<Literal> &lits)
    {
        for (const auto &lit : lits)
        {
            addLiteral(lit);
        }
    }

    void Clause::addLiteral(const Literal &lit)
    {
        if (contains(lit))
        {
            return;
        }
        literals.push_back(lit);
        hashComputed = false;
    }

    const std::vector<Literal> &Clause::getLiterals() const
    {
        return literals;
    }

    bool Clause::isEmpty() const
    {
        return literals.empty();
    }

    bool Clause::contains(const Literal &lit) const
    {
        return findLiteralIndex(lit) != -1;
    }

    int Clause::findLiteralIndex(const Literal &lit) const
    {
        for (size_t i = 0; i < literals.size(); ++i)
        {
            if (literals[i] == lit)
            {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    bool Clause::isTautology() const
    {
        for (const auto &lit : literals)
        {
            if (!lit.isNegated() && contains(lit.complement()))
            {
                return true;
            }
        }
        return false;
    }

    std::set<SymbolId> Clause::collectVariables() const
    {
        std::set<SymbolId> variables;
        for (const auto &lit : literals)
        {
            lit.getAtom().collectVariables(variables);
        }
        return variables;
    }

    std::string Clause::toString(const KnowledgeBase &kb) const
    {
        if (literals.empty())
        {
            return "□";
        }
        std::string result;
        for (size_t i = 0; i < literals.size(); ++i)
        {
            result += literals[i].toString(kb);
            if (i < literals.size() - 1)
            {
                result += " ∨ ";
            }
        }
        return result;
    }

    std::string Clause::variantKey() const
    {
        // 先按屏蔽变量后的形状排序，再按排好的顺序给变量编号
        std::vector<std::pair<std::string, size_t>> order;
        order.reserve(literals.size());
        for (size_t i = 0; i < literals.size(); ++i)
        {
            order.emplace_back(literalKey(literals[i], nullptr), i);
        }
        std::sort(order.begin(), order.end());

        std::unordered_map<SymbolId, int> variableIndex;
        std::string key;
        for (const auto &entry : order)
        {
            key += literalKey(literals[entry.second], &variableIndex);
            key += "|";
        }
        return key;
    }

    size_t Clause::hash() const
    {
        if (!hashComputed)
        {
            std::vector<size_t> literalHashes;
            for (const auto &lit : literals)
            {
                literalHashes.push_back(lit.hash());
            }
            std::sort(literalHashes.begin(), literalHashes.end());

            hashValue = 0;
            for (const auto &h : literalHashes)
            {
                hashValue ^= h + 0x9e3779b9 + (hashValue << 6) + (hashValue >> 2);
            }
            hashComputed = true;
        }
        return hashValue;
    }

    bool Clause::operator==(const Clause &other) const
    {
        if (literals.size() != other.literals.size())
            return false;

        std::unordered_set<Literal> thisLiterals(literals.begin(), literals.end());
        for (const auto &lit : other.literals)
        {
            if (thisLiterals.find(lit) == thisLiterals.end())
                return false;
        }
        return true;
    }
}
