#ifndef PROOF_ENGINE_KNOWLEDGE_BASE_H
#define PROOF_ENGINE_KNOWLEDGE_BASE_H

#include <iostream>
#include <vector>
#include <string>
#include <optional>
#include <set>
#include "SymbolTable.h"
#include "SymbolType.h"
#include "Clause.h"

namespace ProofEngine
{
    class KnowledgeBase
    {
    public:
        int addFunctor(const std::string &functor);
        SymbolId addVariable(const std::string &variable);
        SymbolId addConstant(const std::string &constant);

        // 与 variable 同前缀、且不在 avoid 中的变量 x_N，N 取最小值。
        // 表里已有的名字会被复用，变量表只随单个子句需要的变量数增长。
        SymbolId freshVariable(const SymbolId &variable, const std::set<SymbolId> &avoid);

        void addClause(const Clause &clause);
        const std::vector<Clause> &getClauses() const;

        size_t getVariableCount() const { return variableTable.size(); }

        std::string getFunctorName(int id) const;
        std::string getSymbolName(const SymbolId &symbolId) const;

        bool isVariable(const SymbolId &symbolId) const;

        std::optional<int> getFunctorId(const std::string &functorName) const;
        std::optional<SymbolId> getSymbolId(const std::string &symbolName) const;

        void print(std::ostream &out = std::cout) const;

    private:
        SymbolTable functorTable;
        SymbolTable variableTable;
        SymbolTable constantTable;
        std::vector<Clause> clauses;
    };
}

#endif // PROOF_ENGINE_KNOWLEDGE_BASE_H
