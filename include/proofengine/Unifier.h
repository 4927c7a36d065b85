#ifndef PROOF_ENGINE_UNIFIER_H
#define PROOF_ENGINE_UNIFIER_H

#include <optional>
#include <string>
#include "Literal.h"
#include "Substitution.h"

namespace ProofEngine
{
    class KnowledgeBase;

    enum class UnifyErrorKind
    {
        SYMBOL_CLASH,     // 常量/函数符号不同，或项的种类不同
        ARITY_MISMATCH,   // 函数符号相同但参数个数不同
        OCCURS_CHECK,     // 变量会被绑定到包含它自身的项
        POLARITY_MISMATCH // 两个文字极性不同
    };

    std::string toString(UnifyErrorKind kind);

    struct UnifyError
    {
        UnifyErrorKind kind;
        Term left;
        Term right;

        std::string toString(const KnowledgeBase &kb) const;
    };

    // 合一结果：成功时带替换（可能为空替换），失败时带 UnifyError。
    // 空替换表示"无需绑定即可合一"，与失败是两回事。
    class UnifyResult
    {
    public:
        static UnifyResult success(Substitution subst);
        static UnifyResult failure(UnifyErrorKind kind, const Term &left, const Term &right);

        bool ok() const { return subst.has_value(); }
        explicit operator bool() const { return ok(); }

        // 失败时调用会抛出 std::logic_error
        const Substitution &substitution() const;
        // 成功时调用会抛出 std::logic_error
        const UnifyError &error() const;

    private:
        std::optional<Substitution> subst;
        std::optional<UnifyError> err;
    };

    class Unifier
    {
    public:
        // 在已有替换 subst 的基础上合一两个项，返回扩展后的替换
        static UnifyResult unify(const Term &term1, const Term &term2, const Substitution &subst = Substitution());

        // 两个同极性文字的最一般合一子
        static UnifyResult findMGU(const Literal &lit1, const Literal &lit2, const Substitution &subst = Substitution());

    private:
        static std::optional<UnifyError> unifyTerms(const Term &term1, const Term &term2, Substitution &subst);
        static std::optional<UnifyError> bindVariable(const Term &var, const Term &term, Substitution &subst);
        static bool occursCheck(const SymbolId &varId, const Term &term, const Substitution &subst);
    };
}

#endif // PROOF_ENGINE_UNIFIER_H
