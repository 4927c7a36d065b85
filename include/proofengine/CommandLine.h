#ifndef PROOF_ENGINE_COMMAND_LINE_H
#define PROOF_ENGINE_COMMAND_LINE_H

#include <iostream>
#include "Resolution.h"

namespace ProofEngine
{
    // proofengine <problem.json> [config.json]
    // 退出码：0 已证明，1 不蕴含，2 无结论（触发限制），3 输入错误
    class CommandLine
    {
    public:
        static int run(int argc, const char *const *argv, std::ostream &out = std::cout, std::ostream &err = std::cerr);

        static int exitCode(ProofStatus status);
    };
}

#endif // PROOF_ENGINE_COMMAND_LINE_H
