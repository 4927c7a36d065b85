// VariableRenamer.cpp
#include "VariableRenamer.h"
#include "Substitution.h"
#include <algorithm>
#include <cctype>

namespace ProofEngine
{
    Clause VariableRenamer::renameClauseVariables(const Clause &clause, const std::set<SymbolId> &usedVariables, KnowledgeBase &kb)
    {
        // 新名字既不能和 usedVariables 冲突，也不能和 clause 自己的变量冲突
        std::set<SymbolId> clauseVariables = clause.collectVariables();
        std::set<SymbolId> avoid = usedVariables;
        avoid.insert(clauseVariables.begin(), clauseVariables.end());

        Substitution renaming;
        for (const SymbolId &varId : clauseVariables)
        {
            if (usedVariables.find(varId) != usedVariables.end())
            {
                SymbolId newVarId = kb.freshVariable(varId, avoid);
                avoid.insert(newVarId);
                renaming.bind(varId, Term(newVarId));
            }
        }

        if (renaming.empty())
        {
            return clause;
        }
        return renaming.apply(clause);
    }

    Clause VariableRenamer::standardizeApart(const Clause &clause, const Clause &other, KnowledgeBase &kb)
    {
        return renameClauseVariables(clause, other.collectVariables(), kb);
    }

    std::string VariableRenamer::normalizeVariableName(const std::string &name)
    {
        size_t pos = name.find_last_of('_');
        if (pos == std::string::npos || pos == 0 || pos + 1 == name.size())
            return name;

        // 检查下划线后是否都是数字
        std::string suffix = name.substr(pos + 1);
        if (std::all_of(suffix.begin(), suffix.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
        {
            return name.substr(0, pos);
        }
        return name;
    }
}
