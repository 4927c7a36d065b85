#include "Inference.h"
#include "KnowledgeBaseBuilder.h"

namespace ProofEngine
{
    UnifyResult Inference::unify(KnowledgeBase &kb, const std::string &lit1, const std::string &lit2)
    {
        Literal left = KnowledgeBaseBuilder::parseLiteral(lit1, kb);
        Literal right = KnowledgeBaseBuilder::parseLiteral(lit2, kb);
        return Unifier::findMGU(left, right);
    }

    ProofResult Inference::entails(const std::vector<std::vector<std::string>> &kbClauses,
                                   const std::vector<std::string> &query,
                                   const ProverConfig &config)
    {
        KnowledgeBase kb;
        for (const auto &clause : kbClauses)
        {
            kb.addClause(KnowledgeBaseBuilder::parseClause(clause, kb));
        }
        Clause goal = KnowledgeBaseBuilder::parseClause(query, kb);
        return Resolution::prove(kb, goal, config);
    }
}
