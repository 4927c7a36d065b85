#include "KnowledgeBase.h"
#include "VariableRenamer.h"
#include <iostream>

namespace ProofEngine
{
    int KnowledgeBase::addFunctor(const std::string &functor)
    {
        return functorTable.insert(functor);
    }

    SymbolId KnowledgeBase::addVariable(const std::string &variable)
    {
        return {SymbolType::VARIABLE, variableTable.insert(variable)};
    }

    SymbolId KnowledgeBase::addConstant(const std::string &constant)
    {
        return {SymbolType::CONSTANT, constantTable.insert(constant)};
    }

    SymbolId KnowledgeBase::freshVariable(const SymbolId &variable, const std::set<SymbolId> &avoid)
    {
        std::string baseName = VariableRenamer::normalizeVariableName(variableTable.get(variable.id));
        for (int n = 1;; ++n)
        {
            std::string candidate = baseName + "_" + std::to_string(n);
            int id = variableTable.getId(candidate);
            if (id == -1)
            {
                return {SymbolType::VARIABLE, variableTable.insert(candidate)};
            }
            SymbolId existing{SymbolType::VARIABLE, id};
            if (avoid.find(existing) == avoid.end())
            {
                return existing;
            }
        }
    }

    void KnowledgeBase::addClause(const Clause &clause)
    {
        clauses.push_back(clause);
    }

    const std::vector<Clause> &KnowledgeBase::getClauses() const
    {
        return clauses;
    }

    std::string KnowledgeBase::getFunctorName(int id) const
    {
        return functorTable.get(id);
    }

    std::string KnowledgeBase::getSymbolName(const SymbolId &symbolId) const
    {
        switch (symbolId.type)
        {
        case SymbolType::VARIABLE:
            return variableTable.get(symbolId.id);
        case SymbolType::FUNCTOR:
            return functorTable.get(symbolId.id);
        default:
            return constantTable.get(symbolId.id);
        }
    }

    std::optional<int> KnowledgeBase::getFunctorId(const std::string &functorName) const
    {
        int id = functorTable.getId(functorName);
        if (id == -1)
        {
            return std::nullopt;
        }
        return id;
    }

    std::optional<SymbolId> KnowledgeBase::getSymbolId(const std::string &symbolName) const
    {
        // 首先在变量表中查找
        int varId = variableTable.getId(symbolName);
        if (varId != -1)
        {
            return SymbolId{SymbolType::VARIABLE, varId};
        }

        // 然后在常量表中查找
        int constId = constantTable.getId(symbolName);
        if (constId != -1)
        {
            return SymbolId{SymbolType::CONSTANT, constId};
        }

        return std::nullopt;
    }

    bool KnowledgeBase::isVariable(const SymbolId &symbolId) const
    {
        return symbolId.type == SymbolType::VARIABLE;
    }

    void KnowledgeBase::print(std::ostream &out) const
    {
        out << "Knowledge Base:\n";
        out << "Clauses:\n";
        for (const auto &clause : clauses)
        {
            out << "  " << clause.toString(*this) << "\n";
        }
    }
}
