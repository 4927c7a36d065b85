#include <gtest/gtest.h>
#include "KnowledgeBase.h"
#include "KnowledgeBaseBuilder.h"
#include "Resolver.h"

namespace ProofEngine
{
    class ResolverTest : public ::testing::Test
    {
    protected:
        KnowledgeBase kb;

        Literal lit(const std::string &text)
        {
            return KnowledgeBaseBuilder::parseLiteral(text, kb);
        }

        Clause clause(const std::vector<std::string> &literals)
        {
            return KnowledgeBaseBuilder::parseClause(literals, kb);
        }
    };

    TEST_F(ResolverTest, PropositionalResolvent)
    {
        auto resolvents = Resolver::resolve(clause({"A"}), clause({"¬A", "C"}), kb);
        ASSERT_EQ(resolvents.size(), 1);
        EXPECT_EQ(resolvents[0], clause({"C"}));
    }

    TEST_F(ResolverTest, UnitComplementsGiveEmptyClause)
    {
        auto resolvents = Resolver::resolve(clause({"P(John)"}), clause({"¬P(John)"}), kb);
        ASSERT_EQ(resolvents.size(), 1);
        EXPECT_TRUE(resolvents[0].isEmpty());
    }

    TEST_F(ResolverTest, EveryComplementaryPairIsTried)
    {
        // 每对互补文字各产生一个（重言式）消解式
        auto resolvents = Resolver::resolve(clause({"P", "Q"}), clause({"¬P", "¬Q"}), kb);
        ASSERT_EQ(resolvents.size(), 2);
        EXPECT_TRUE(resolvents[0].isTautology());
        EXPECT_TRUE(resolvents[1].isTautology());
        EXPECT_NE(resolvents[0], resolvents[1]);
    }

    TEST_F(ResolverTest, DuplicateResolventsRemoved)
    {
        // 在两个 P 文字上各消解一次得到同一个子句，只保留一份；
        // 第二个来自因子 P(Ann,Ann)
        auto resolvents = Resolver::resolve(clause({"P(x, Ann)", "P(Ann, x)"}), clause({"¬P(Ann, Ann)", "Q(Bob)"}), kb);
        ASSERT_EQ(resolvents.size(), 2);
        EXPECT_EQ(resolvents[0], clause({"P(Ann, Ann)", "Q(Bob)"}));
        EXPECT_EQ(resolvents[1], clause({"Q(Bob)"}));
    }

    TEST_F(ResolverTest, Factors)
    {
        auto factors = Resolver::factors(clause({"P(x)", "P(y)", "Q(x)"}));
        ASSERT_EQ(factors.size(), 1);
        EXPECT_EQ(factors[0].size(), 2);

        // 三个文字两两合一，因子的因子也要列出
        auto collapsed = Resolver::factors(clause({"R(x, y)", "R(y, z)", "R(Ann, Ann)"}));
        bool hasUnit = false;
        for (const auto &factor : collapsed)
        {
            if (factor == clause({"R(Ann, Ann)"}))
                hasUnit = true;
        }
        EXPECT_TRUE(hasUnit);

        EXPECT_TRUE(Resolver::factors(clause({"P(Ann)", "P(Bob)"})).empty());
        EXPECT_TRUE(Resolver::factors(clause({"P(x)", "¬P(y)"})).empty());
    }

    TEST_F(ResolverTest, FactorsTakePartInResolution)
    {
        // 只有先把两边各自因子化成单元子句才能得到空子句
        auto resolvents = Resolver::resolve(clause({"P(x)", "P(y)"}), clause({"¬P(u)", "¬P(v)"}), kb);
        bool hasEmpty = false;
        for (const auto &resolvent : resolvents)
        {
            if (resolvent.isEmpty())
                hasEmpty = true;
        }
        EXPECT_TRUE(hasEmpty);
    }

    TEST_F(ResolverTest, PropositionalLettersAreNotWildcards)
    {
        // 小写的命题字母是常量，只和自己的补互补
        EXPECT_TRUE(Resolver::resolve(clause({"p"}), clause({"¬q"}), kb).empty());
        EXPECT_TRUE(Resolver::resolve(clause({"b"}), clause({"¬P(Ann)"}), kb).empty());

        auto resolvents = Resolver::resolve(clause({"p", "Q"}), clause({"¬p"}), kb);
        ASSERT_EQ(resolvents.size(), 1);
        EXPECT_EQ(resolvents[0], clause({"Q"}));
    }

    TEST_F(ResolverTest, VariableAtomNeverComplementary)
    {
        Literal varAtom(Term(kb.addVariable("x")), false);
        EXPECT_FALSE(Resolver::isComplementary(varAtom, lit("¬P(Ann)")));
        auto result = Resolver::complementaryUnifier(varAtom, lit("¬P(Ann)"));
        EXPECT_FALSE(result.ok());
    }

    TEST_F(ResolverTest, RenamingDoesNotGrowVariableTable)
    {
        Clause c1 = clause({"P(x, y)", "Q(x)"});
        Clause c2 = clause({"¬P(Ann, x)", "R(x, y)"});

        Resolver::resolve(c1, c2, kb);
        size_t count = kb.getVariableCount();
        for (int i = 0; i < 50; ++i)
        {
            Resolver::resolve(c1, c2, kb);
        }
        EXPECT_EQ(kb.getVariableCount(), count);
    }

    TEST_F(ResolverTest, ResolvesThroughUnification)
    {
        auto resolvents = Resolver::resolve(clause({"¬King(x)", "¬Greedy(x)", "Evil(x)"}), clause({"King(John)"}), kb);
        ASSERT_EQ(resolvents.size(), 1);
        EXPECT_EQ(resolvents[0].toString(kb), "¬Greedy(John) ∨ Evil(John)");
    }

    TEST_F(ResolverTest, NoResolventWhenAtomsDoNotUnify)
    {
        EXPECT_TRUE(Resolver::resolve(clause({"P(Ann)"}), clause({"¬P(Bob)"}), kb).empty());
        EXPECT_TRUE(Resolver::resolve(clause({"P(Ann)"}), clause({"P(Ann)"}), kb).empty());
    }

    TEST_F(ResolverTest, SecondClauseRenamedApart)
    {
        Clause c1 = clause({"P(x)", "Q(x)"});
        Clause c2 = clause({"¬P(Ann)", "R(x)"});

        auto resolvents = Resolver::resolve(c1, c2, kb);
        ASSERT_EQ(resolvents.size(), 1);
        // c2 的 x 与 c1 的 x 无关，不能被绑定为 Ann
        EXPECT_EQ(resolvents[0].toString(kb), "Q(Ann) ∨ R(x_1)");
    }

    TEST_F(ResolverTest, SharedVariableNeedsRenaming)
    {
        // 不做变量分离时 P(x) 与 P(f(x)) 会因 occurs check 失败
        auto resolvents = Resolver::resolve(clause({"P(x)"}), clause({"¬P(f(x))"}), kb);
        ASSERT_EQ(resolvents.size(), 1);
        EXPECT_TRUE(resolvents[0].isEmpty());
    }

    TEST_F(ResolverTest, ResolvePairOnChosenLiterals)
    {
        Clause c1 = clause({"P(x)", "Q(x)"});
        Clause c2 = clause({"¬Q(Ann)", "¬P(Bob)"});

        auto onQ = Resolver::resolvePair(c1, c2, 1, 0);
        ASSERT_TRUE(onQ.has_value());
        EXPECT_EQ(*onQ, clause({"P(Ann)", "¬P(Bob)"}));

        auto onP = Resolver::resolvePair(c1, c2, 0, 1);
        ASSERT_TRUE(onP.has_value());
        EXPECT_EQ(*onP, clause({"Q(Bob)", "¬Q(Ann)"}));

        // 谓词不同
        EXPECT_FALSE(Resolver::resolvePair(c1, c2, 0, 0).has_value());
    }

    TEST_F(ResolverTest, ResolvePairOutOfRange)
    {
        Clause c1 = clause({"P(Ann)"});
        Clause c2 = clause({"¬P(Ann)"});

        EXPECT_FALSE(Resolver::resolvePair(c1, c2, 1, 0).has_value());
        EXPECT_FALSE(Resolver::resolvePair(c1, c2, 0, -1).has_value());
        EXPECT_TRUE(Resolver::resolvePair(c1, c2, 0, 0).has_value());
    }

    TEST_F(ResolverTest, ExactComplementHasEmptyUnifier)
    {
        auto result = Resolver::complementaryUnifier(lit("Loves(John, Mary)"), lit("¬Loves(John, Mary)"));
        ASSERT_TRUE(result.ok());
        EXPECT_TRUE(result.substitution().empty());

        auto samePolarity = Resolver::complementaryUnifier(lit("Loves(John, Mary)"), lit("Loves(John, Mary)"));
        ASSERT_FALSE(samePolarity.ok());
        EXPECT_EQ(samePolarity.error().kind, UnifyErrorKind::POLARITY_MISMATCH);

        auto unified = Resolver::complementaryUnifier(lit("Loves(x, Mary)"), lit("¬Loves(John, y)"));
        ASSERT_TRUE(unified.ok());
        EXPECT_EQ(unified.substitution().size(), 2);
    }

    TEST_F(ResolverTest, ComplementaryPrefilter)
    {
        EXPECT_TRUE(Resolver::isComplementary(lit("P(Ann)"), lit("¬P(Bob)")));
        EXPECT_FALSE(Resolver::isComplementary(lit("P(Ann)"), lit("¬Q(Ann)")));
        EXPECT_FALSE(Resolver::isComplementary(lit("P(Ann)"), lit("¬P(Ann, Bob)")));
        EXPECT_FALSE(Resolver::isComplementary(lit("P(Ann)"), lit("P(Ann)")));
    }
}
