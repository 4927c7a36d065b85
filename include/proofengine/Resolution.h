// Resolution.h
#ifndef PROOF_ENGINE_RESOLUTION_H
#define PROOF_ENGINE_RESOLUTION_H

#include "KnowledgeBase.h"
#include "ProverConfig.h"
#include <string>
#include <vector>

namespace ProofEngine
{
    enum class ProofStatus
    {
        RUNNING,
        PROVED,       // 推出了空子句
        NOT_ENTAILED, // 到达不动点，没有新子句
        INCONCLUSIVE  // 触发了迭代/子句数/时间限制
    };

    std::string toString(ProofStatus status);

    struct ProofResult
    {
        ProofStatus status = ProofStatus::RUNNING;
        int iterations = 0;
        size_t generatedClauses = 0; // 加入工作集的新消解式个数
        size_t workingSetSize = 0;
        double durationMs = 0;

        bool entailed() const { return status == ProofStatus::PROVED; }
    };

    class Resolution
    {
    public:
        // 反证法：KB ∪ ¬query 饱和消解，直到空子句、不动点或触发限制
        static ProofResult prove(KnowledgeBase &kb, const Clause &query, const ProverConfig &config = ProverConfig());

        // 查询子句每个文字取反，各自成为一个单元子句
        static std::vector<Clause> negateQuery(const Clause &query);
    };
}

#endif // PROOF_ENGINE_RESOLUTION_H
