#ifndef PROOF_ENGINE_PARSE_ERROR_H
#define PROOF_ENGINE_PARSE_ERROR_H

#include <stdexcept>
#include <string>

namespace ProofEngine
{
    class ParseError : public std::runtime_error
    {
    public:
        ParseError(const std::string &input, const std::string &detail)
            : std::runtime_error("cannot parse literal '" + input + "': " + detail), input(input) {}

        const std::string &getInput() const { return input; }

    private:
        std::string input;
    };
}

#endif // PROOF_ENGINE_PARSE_ERROR_H
