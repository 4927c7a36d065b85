#ifndef PROOF_ENGINE_INFERENCE_H
#define PROOF_ENGINE_INFERENCE_H

#include <string>
#include <vector>
#include "KnowledgeBase.h"
#include "ProverConfig.h"
#include "Resolution.h"
#include "Unifier.h"

namespace ProofEngine
{
    // 以文字串为输入的入口。文本不合法时抛出 ParseError。
    class Inference
    {
    public:
        static UnifyResult unify(KnowledgeBase &kb, const std::string &lit1, const std::string &lit2);

        // 所有文本先解析再开始推理：文本不合法时在推理开始之前抛出 ParseError，
        // 推理本身（Resolution::prove）不抛异常，失败都体现在 ProofResult 里
        static ProofResult entails(const std::vector<std::vector<std::string>> &kbClauses,
                                   const std::vector<std::string> &query,
                                   const ProverConfig &config = ProverConfig());
    };
}

#endif // PROOF_ENGINE_INFERENCE_H
