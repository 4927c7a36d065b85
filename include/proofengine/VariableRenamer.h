// VariableRenamer.h
#ifndef PROOF_ENGINE_VARIABLE_RENAMER_H
#define PROOF_ENGINE_VARIABLE_RENAMER_H

#include "Clause.h"
#include "KnowledgeBase.h"
#include <set>
#include <string>

namespace ProofEngine
{
    class VariableRenamer
    {
    public:
        // 把 clause 中出现在 usedVariables 里的变量换成 x_N 形式的变量，
        // 新变量与 usedVariables 和 clause 原有的变量都不相同
        static Clause renameClauseVariables(const Clause &clause, const std::set<SymbolId> &usedVariables, KnowledgeBase &kb);

        // 让 clause 与 other 没有公共变量
        static Clause standardizeApart(const Clause &clause, const Clause &other, KnowledgeBase &kb);

        // x_12 -> x，其余名字原样返回
        static std::string normalizeVariableName(const std::string &name);
    };
}

#endif // PROOF_ENGINE_VARIABLE_RENAMER_H
