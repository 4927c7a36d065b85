#ifndef PROOF_ENGINE_KNOWLEDGE_BASE_BUILDER_H
#define PROOF_ENGINE_KNOWLEDGE_BASE_BUILDER_H

#include <string>
#include <vector>
#include "KnowledgeBase.h"
#include "ParseError.h"
#include "ProverConfig.h"
#include "AllNodes.h"

namespace ProofEngine
{
    class KnowledgeBaseBuilder
    {
    public:
        // 解析失败抛出 ParseError
        static Literal parseLiteral(const std::string &text, KnowledgeBase &kb);
        static Clause parseClause(const std::vector<std::string> &literals, KnowledgeBase &kb);

        // 每行一个文字，整个文件构成一个子句
        static bool readClause(const std::string &filename, KnowledgeBase &kb);
        static bool parseDirectory(const std::string &input_dir, KnowledgeBase &kb);

        // {"clauses": [[...], ...], "query": [...], "prover": {...}}
        // 子句加入 kb，返回查询子句；config 非空时读取 "prover" 字段
        static Clause loadProblem(const json &problem, KnowledgeBase &kb, ProverConfig *config = nullptr);
        static Clause readProblemFile(const std::string &filename, KnowledgeBase &kb, ProverConfig *config = nullptr);

    private:
        static Literal buildLiteral(const AST::Node *node, KnowledgeBase &kb);
        static Term buildTerm(const AST::Node *node, KnowledgeBase &kb);
        static std::vector<Term> buildArguments(const AST::TermListNode *termList, KnowledgeBase &kb);
        static std::vector<std::string> readLiteralList(const json &list, const std::string &what);
    };
}

#endif // PROOF_ENGINE_KNOWLEDGE_BASE_BUILDER_H
